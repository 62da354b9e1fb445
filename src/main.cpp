#include <iostream>
#include <atomic>
#include <csignal>
#include <chrono>
#include <thread>
#include "SimulationService.hpp"
#include "SimpleHttpUiServer.hpp"
#include "db/Database.hpp"

namespace
{
    std::atomic<bool> g_keep_running{true};

    void handleSignal(int)
    {
        g_keep_running = false;
    }

    constexpr int kUiPort = 8080;
    constexpr auto kFrameInterval = std::chrono::milliseconds(16);
}

int main()
{
    std::signal(SIGINT, handleSignal);
    std::signal(SIGTERM, handleSignal);

    std::cout << "=== GridFlow Traffic Simulator ===" << std::endl;
    std::cout << std::endl;

    gridflow::db::Database database(gridflow::db::Database::defaultFileName());
    std::string db_error;
    if (!database.initialize(&db_error))
    {
        std::cerr << "Warning: failed to initialize config database: " << db_error << std::endl;
    }

    const gridflow::GridConfig initial_config = gridflow::loadStartupConfig(database);
    std::cout << "Grid " << initial_config.network.grid_size << "x" << initial_config.network.grid_size
              << ", " << initial_config.traffic.car_count << " cars, physics at "
              << initial_config.timing.physics_hz << " Hz" << std::endl;

    gridflow::SimulationService service(database, initial_config);

    gridflow::SimpleHttpUiServer server(
        kUiPort,
        [&]()
        { return service.snapshotJson(); },
        [&](const std::string &cmd)
        { return service.handleCommand(cmd); },
        [&]()
        { return service.configJson(); },
        [&](const std::string &body)
        { return service.submitConfig(body); });

    if (!server.start())
    {
        std::cerr << "Failed to start UI server on port " << kUiPort << std::endl;
        return 1;
    }

    std::atomic<bool> app_running{true};
    std::thread frame_thread([&]()
                             {
        using clock = std::chrono::steady_clock;
        auto last_frame = clock::now();
        while (app_running)
        {
            const auto now = clock::now();
            const double frame_seconds = std::chrono::duration<double>(now - last_frame).count();
            last_frame = now;
            service.advanceFrame(frame_seconds);
            std::this_thread::sleep_for(kFrameInterval);
        } });

    std::cout << "Snapshot API at: http://localhost:" << kUiPort << "/snapshot" << std::endl;
    std::cout << "Send /command?cmd=start to begin. Press Ctrl+C to stop..." << std::endl;

    while (g_keep_running)
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    app_running = false;
    if (frame_thread.joinable())
    {
        frame_thread.join();
    }
    server.stop();

    const gridflow::SimulatorMetrics metrics = service.metrics();
    std::cout << "Simulated " << metrics.total_time << " s in " << metrics.ticks << " ticks, "
              << metrics.safety_violations << " safety violations." << std::endl;
    std::cout << "UI server stopped." << std::endl;
    return 0;
}
