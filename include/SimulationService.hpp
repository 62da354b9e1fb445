#pragma once

#include "GridConfig.hpp"
#include "SimpleHttpUiServer.hpp"
#include "SimulatorEngine.hpp"

#include <mutex>
#include <optional>
#include <string>

namespace gridflow
{
    namespace db
    {
        class Database;
    }

    // Thread-safe front for the engine shared by the frame loop and the UI
    // server. A posted configuration is persisted right away and takes effect
    // on the next start (from stopped) or reset.
    class SimulationService
    {
    public:
        SimulationService(const db::Database &database, const GridConfig &initial_config);

        std::string snapshotJson() const;
        bool handleCommand(const std::string &cmd);
        std::string configJson() const;
        SimpleHttpUiServer::ConfigMutationResult submitConfig(const std::string &body);

        int advanceFrame(double frame_seconds);

        bool hasPendingConfig() const;
        SimulatorMetrics metrics() const;

    private:
        void applyPendingConfig();

        const db::Database &database;
        mutable std::mutex engine_mutex;
        SimulatorEngine engine;
        std::optional<GridConfig> pending_config;
    };

    // Stored configuration if it parses and validates, defaults otherwise.
    // Writes the defaults back when nothing was stored yet.
    GridConfig loadStartupConfig(const db::Database &database);
} // namespace gridflow
