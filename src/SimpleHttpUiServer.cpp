#include "SimpleHttpUiServer.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cctype>
#include <cstdlib>
#include <iostream>
#include <sstream>

namespace gridflow
{
    namespace
    {
        constexpr std::size_t MAX_REQUEST_BYTES = 1 << 20;

        enum class Route
        {
            Index,
            Snapshot,
            Command,
            ConfigApi,
            Unknown
        };

        Route routeFor(const std::string &path)
        {
            if (path == "/" || path == "/index.html")
            {
                return Route::Index;
            }
            if (path == "/snapshot")
            {
                return Route::Snapshot;
            }
            if (path == "/command")
            {
                return Route::Command;
            }
            if (path == "/config/api" || path == "/config.json")
            {
                return Route::ConfigApi;
            }
            return Route::Unknown;
        }

        std::string statusText(int status_code)
        {
            switch (status_code)
            {
            case 200:
                return "OK";
            case 400:
                return "Bad Request";
            case 404:
                return "Not Found";
            case 405:
                return "Method Not Allowed";
            case 500:
                return "Internal Server Error";
            default:
                return "Unknown";
            }
        }

        std::string queryValue(const std::string &query, const std::string &key)
        {
            std::istringstream pairs(query);
            std::string pair;
            while (std::getline(pairs, pair, '&'))
            {
                const std::size_t eq = pair.find('=');
                if (eq != std::string::npos && pair.compare(0, eq, key) == 0)
                {
                    return pair.substr(eq + 1);
                }
            }
            return "";
        }

        // Content-Length of a header block, 0 when absent
        std::size_t contentLength(const std::string &headers)
        {
            std::istringstream lines(headers);
            std::string line;
            while (std::getline(lines, line))
            {
                const std::size_t colon = line.find(':');
                if (colon == std::string::npos)
                {
                    continue;
                }
                std::string name = line.substr(0, colon);
                for (char &c : name)
                {
                    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
                }
                if (name == "content-length")
                {
                    return static_cast<std::size_t>(std::strtoul(line.c_str() + colon + 1, nullptr, 10));
                }
            }
            return 0;
        }

        SimpleHttpUiServer::HttpResponse methodNotAllowed()
        {
            return {405, "application/json", "{\"ok\":false,\"error\":\"method not allowed\"}"};
        }

        const char *kIndexHtml = R"HTML(
<!doctype html>
<html lang="en"><head><meta charset="UTF-8" /><title>GridFlow</title></head>
<body>
<h1>GridFlow traffic simulator</h1>
<p>Snapshot: <a href="/snapshot">/snapshot</a>. Commands: /command?cmd=start|stop|reset|step.
Configuration: GET or POST /config/api.</p>
</body></html>
)HTML";
    } // namespace

    SimpleHttpUiServer::SimpleHttpUiServer(int port,
                                           SnapshotProvider snapshot_provider,
                                           CommandHandler command_handler,
                                           ConfigProvider config_provider,
                                           ConfigMutationHandler config_mutation_handler)
        : port(port),
          server_fd(-1),
          running(false),
          snapshot_provider(std::move(snapshot_provider)),
          command_handler(std::move(command_handler)),
          config_provider(std::move(config_provider)),
          config_mutation_handler(std::move(config_mutation_handler))
    {
    }

    SimpleHttpUiServer::~SimpleHttpUiServer()
    {
        stop();
    }

    bool SimpleHttpUiServer::start()
    {
        server_fd = socket(AF_INET, SOCK_STREAM, 0);
        if (server_fd < 0)
        {
            std::cerr << "UI server: failed to create socket\n";
            return false;
        }

        int opt = 1;
        if (setsockopt(server_fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0)
        {
            std::cerr << "UI server: could not set SO_REUSEADDR\n";
        }

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_ANY);
        addr.sin_port = htons(static_cast<uint16_t>(port));

        if (bind(server_fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) < 0)
        {
            std::cerr << "UI server: bind failed on port " << port << "\n";
            close(server_fd);
            server_fd = -1;
            return false;
        }

        if (listen(server_fd, 16) < 0)
        {
            std::cerr << "UI server: listen failed\n";
            close(server_fd);
            server_fd = -1;
            return false;
        }

        running = true;
        accept_thread = std::thread(&SimpleHttpUiServer::acceptLoop, this);
        return true;
    }

    void SimpleHttpUiServer::stop()
    {
        if (!running)
        {
            return;
        }

        running = false;
        if (server_fd >= 0)
        {
            shutdown(server_fd, SHUT_RDWR);
            close(server_fd);
            server_fd = -1;
        }

        if (accept_thread.joinable())
        {
            accept_thread.join();
        }
    }

    void SimpleHttpUiServer::acceptLoop()
    {
        while (running)
        {
            sockaddr_in client_addr{};
            socklen_t len = sizeof(client_addr);
            int client_fd = accept(server_fd, reinterpret_cast<sockaddr *>(&client_addr), &len);
            if (client_fd < 0)
            {
                if (running)
                {
                    continue;
                }
                break;
            }

            serveClient(client_fd);
            close(client_fd);
        }
    }

    void SimpleHttpUiServer::serveClient(int client_fd) const
    {
        std::string request;
        std::size_t header_end = std::string::npos;
        std::size_t expected_total = 0;
        char buffer[8192];

        // Read the header block, then as much body as Content-Length announces
        while (request.size() < MAX_REQUEST_BYTES)
        {
            const ssize_t n = recv(client_fd, buffer, sizeof(buffer), 0);
            if (n <= 0)
            {
                break;
            }
            request.append(buffer, static_cast<std::size_t>(n));

            if (header_end == std::string::npos)
            {
                header_end = request.find("\r\n\r\n");
                if (header_end != std::string::npos)
                {
                    expected_total = header_end + 4 + contentLength(request.substr(0, header_end));
                }
            }
            if (header_end != std::string::npos && request.size() >= expected_total)
            {
                break;
            }
        }

        if (header_end == std::string::npos)
        {
            return;
        }

        std::istringstream request_line(request.substr(0, request.find("\r\n")));
        std::string method, target, version;
        request_line >> method >> target >> version;
        const std::string body = request.substr(header_end + 4);

        const std::string wire = serialize(handleRequest(method, target, body));
        std::size_t sent = 0;
        while (sent < wire.size())
        {
            const ssize_t n = send(client_fd, wire.data() + sent, wire.size() - sent, MSG_NOSIGNAL);
            if (n <= 0)
            {
                std::cerr << "UI server: client disconnected before response was sent\n";
                return;
            }
            sent += static_cast<std::size_t>(n);
        }
    }

    SimpleHttpUiServer::HttpResponse SimpleHttpUiServer::handleRequest(const std::string &method,
                                                                       const std::string &target,
                                                                       const std::string &body) const
    {
        const std::size_t qmark = target.find('?');
        const std::string path = target.substr(0, qmark);
        const std::string query = qmark == std::string::npos ? "" : target.substr(qmark + 1);

        switch (routeFor(path))
        {
        case Route::Index:
            if (method != "GET")
            {
                return methodNotAllowed();
            }
            return {200, "text/html; charset=utf-8", kIndexHtml};

        case Route::Snapshot:
            if (method != "GET")
            {
                return methodNotAllowed();
            }
            return {200, "application/json", snapshot_provider()};

        case Route::Command:
        {
            const std::string cmd = queryValue(query, "cmd");
            if (!command_handler(cmd))
            {
                return {400, "text/plain", "unknown command"};
            }
            return {200, "text/plain", "ok"};
        }

        case Route::ConfigApi:
            if (method == "GET")
            {
                return {200, "application/json", config_provider()};
            }
            if (method == "POST")
            {
                const ConfigMutationResult result = config_mutation_handler(body);
                return {result.status_code, "application/json", result.body};
            }
            return methodNotAllowed();

        case Route::Unknown:
            break;
        }

        return {404, "text/plain", "not found"};
    }

    std::string SimpleHttpUiServer::serialize(const HttpResponse &response)
    {
        std::ostringstream out;
        out << "HTTP/1.1 " << response.status_code << " " << statusText(response.status_code) << "\r\n";
        out << "Content-Type: " << response.content_type << "\r\n";
        out << "Cache-Control: no-store\r\n";
        out << "Content-Length: " << response.body.size() << "\r\n";
        out << "Connection: close\r\n\r\n";
        out << response.body;
        return out.str();
    }
} // namespace gridflow
