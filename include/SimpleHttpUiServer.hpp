#pragma once

#include <atomic>
#include <functional>
#include <string>
#include <thread>

namespace gridflow
{
    class SimpleHttpUiServer
    {
    public:
        struct HttpResponse
        {
            int status_code = 200;
            std::string content_type = "text/plain";
            std::string body;
        };

        struct ConfigMutationResult
        {
            int status_code = 200;
            std::string body;
        };

        using SnapshotProvider = std::function<std::string()>;
        // Returns false for an unknown command name
        using CommandHandler = std::function<bool(const std::string &)>;
        using ConfigProvider = std::function<std::string()>;
        using ConfigMutationHandler = std::function<ConfigMutationResult(const std::string &)>;

        SimpleHttpUiServer(int port,
                           SnapshotProvider snapshot_provider,
                           CommandHandler command_handler,
                           ConfigProvider config_provider,
                           ConfigMutationHandler config_mutation_handler);
        ~SimpleHttpUiServer();

        SimpleHttpUiServer(const SimpleHttpUiServer &) = delete;
        SimpleHttpUiServer &operator=(const SimpleHttpUiServer &) = delete;

        bool start();
        void stop();

        // Routes one request without touching sockets.
        HttpResponse handleRequest(const std::string &method,
                                   const std::string &target,
                                   const std::string &body) const;

        static std::string serialize(const HttpResponse &response);

    private:
        void acceptLoop();
        void serveClient(int client_fd) const;

        int port;
        int server_fd;
        std::atomic<bool> running;
        std::thread accept_thread;
        SnapshotProvider snapshot_provider;
        CommandHandler command_handler;
        ConfigProvider config_provider;
        ConfigMutationHandler config_mutation_handler;
    };
} // namespace gridflow
