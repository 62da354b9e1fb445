#include "SimulationService.hpp"

#include "GridConfigJson.hpp"
#include "SafetyChecker.hpp"
#include "db/Database.hpp"

#include <iostream>

namespace gridflow
{
    SimulationService::SimulationService(const db::Database &database, const GridConfig &initial_config)
        : database(database), engine(initial_config)
    {
    }

    std::string SimulationService::snapshotJson() const
    {
        std::lock_guard<std::mutex> lock(engine_mutex);
        return engine.getSnapshotJson();
    }

    void SimulationService::applyPendingConfig()
    {
        if (!pending_config.has_value())
        {
            return;
        }
        engine = SimulatorEngine(*pending_config);
        pending_config.reset();
    }

    bool SimulationService::handleCommand(const std::string &cmd)
    {
        std::lock_guard<std::mutex> lock(engine_mutex);

        if (cmd == "start")
        {
            if (!engine.isRunning())
            {
                applyPendingConfig();
            }
            engine.handleCommand(SimulatorEngine::UICommand::Start);
        }
        else if (cmd == "stop")
        {
            engine.handleCommand(SimulatorEngine::UICommand::Stop);
        }
        else if (cmd == "reset")
        {
            applyPendingConfig();
            engine.handleCommand(SimulatorEngine::UICommand::Reset);
        }
        else if (cmd == "step")
        {
            engine.handleCommand(SimulatorEngine::UICommand::Step);
        }
        else
        {
            return false;
        }
        return true;
    }

    std::string SimulationService::configJson() const
    {
        std::lock_guard<std::mutex> lock(engine_mutex);
        if (pending_config.has_value())
        {
            return gridConfigToJson(*pending_config);
        }
        return gridConfigToJson(engine.getConfig());
    }

    SimpleHttpUiServer::ConfigMutationResult SimulationService::submitConfig(const std::string &body)
    {
        const ConfigParseResult parsed = gridConfigFromJson(body);
        if (!parsed.ok)
        {
            return {400, validationErrorsToJson(parsed.errors)};
        }

        const SafetyChecker checker(parsed.config);
        if (!checker.isConfigValid())
        {
            return {400, validationErrorsToJson(checker.configErrors())};
        }

        std::string error;
        if (!database.saveActiveGridConfigJson(gridConfigToJson(parsed.config), &error))
        {
            std::cerr << "Config store: save failed: " << error << std::endl;
            return {500, validationErrorsToJson({"database error: " + error})};
        }

        std::lock_guard<std::mutex> lock(engine_mutex);
        pending_config = parsed.config;
        return {200, "{\"ok\":true,\"state\":\"pending\",\"apply_on\":\"start_or_reset\"}"};
    }

    int SimulationService::advanceFrame(double frame_seconds)
    {
        std::lock_guard<std::mutex> lock(engine_mutex);
        return engine.advanceFrame(frame_seconds);
    }

    bool SimulationService::hasPendingConfig() const
    {
        std::lock_guard<std::mutex> lock(engine_mutex);
        return pending_config.has_value();
    }

    SimulatorMetrics SimulationService::metrics() const
    {
        std::lock_guard<std::mutex> lock(engine_mutex);
        return engine.getMetrics();
    }

    GridConfig loadStartupConfig(const db::Database &database)
    {
        const GridConfig defaults = makeDefaultGridConfig();

        std::string error;
        const std::optional<std::string> stored = database.loadActiveGridConfigJson(&error);
        if (!stored.has_value())
        {
            if (!error.empty())
            {
                std::cerr << "Warning: failed to load config from database: " << error << std::endl;
                return defaults;
            }
            if (!database.saveActiveGridConfigJson(gridConfigToJson(defaults), &error))
            {
                std::cerr << "Warning: failed to store default config: " << error << std::endl;
            }
            return defaults;
        }

        const ConfigParseResult parsed = gridConfigFromJson(*stored);
        const SafetyChecker checker(parsed.config);
        if (!parsed.ok || !checker.isConfigValid())
        {
            std::cerr << "Warning: stored config is invalid, using defaults" << std::endl;
            return defaults;
        }
        return parsed.config;
    }
} // namespace gridflow
