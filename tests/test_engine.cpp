#include <catch2/catch.hpp>
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <string>
#include "GridConfigJson.hpp"
#include "SimpleHttpUiServer.hpp"
#include "SimulationService.hpp"
#include "SimulatorEngine.hpp"
#include "db/Database.hpp"

using namespace gridflow;

namespace
{
    GridConfig smallConfig(uint32_t cars = 30)
    {
        GridConfig config = makeDefaultGridConfig();
        config.traffic.car_count = cars;
        return config;
    }

    std::string freshDatabasePath(const std::string &name)
    {
        const auto path = std::filesystem::temp_directory_path() / db::Database::defaultFileName("gridflow_test_" + name);
        std::filesystem::remove(path);
        return path.string();
    }
}

TEST_CASE("SimulatorEngine starts stopped with a populated world", "[engine]")
{
    SimulatorEngine engine(smallConfig());
    REQUIRE_FALSE(engine.isRunning());
    REQUIRE(engine.getNetwork().nodeCount() == 9);
    REQUIRE(engine.getSignals().size() == 9);
    REQUIRE(engine.getTraffic().carCount() == 30);

    engine.tick(0.1); // ignored while stopped
    REQUIRE(engine.getMetrics().ticks == 0);
    REQUIRE(engine.getMetrics().total_time == 0.0);
}

TEST_CASE("Accumulator runs whole physics steps and clamps stalls", "[engine][timing]")
{
    GridConfig config = smallConfig(10);
    config.timing.physics_hz = 8.0;
    config.timing.max_frame_seconds = 0.5;
    SimulatorEngine engine(config);

    REQUIRE(engine.advanceFrame(1.0) == 0); // stopped

    engine.start();
    REQUIRE(engine.advanceFrame(2.0) == 4); // clamped to 0.5 s
    REQUIRE(engine.accumulatedTime() == 0.0);

    REQUIRE(engine.advanceFrame(0.0625) == 0);
    REQUIRE(engine.accumulatedTime() == Approx(0.0625));
    REQUIRE(engine.advanceFrame(0.0625) == 1);
    REQUIRE(engine.accumulatedTime() == 0.0);

    REQUIRE(engine.advanceFrame(-1.0) == 0);

    const SimulatorMetrics metrics = engine.getMetrics();
    REQUIRE(metrics.ticks == 5);
    REQUIRE(metrics.total_time == Approx(0.625));
}

TEST_CASE("Engine commands", "[engine]")
{
    SimulatorEngine engine(smallConfig());

    engine.handleCommand(SimulatorEngine::UICommand::Step);
    REQUIRE_FALSE(engine.isRunning());
    REQUIRE(engine.getMetrics().ticks == 1);
    REQUIRE(engine.getMetrics().total_time == Approx(engine.physicsStep()));

    engine.handleCommand(SimulatorEngine::UICommand::Start);
    REQUIRE(engine.isRunning());
    engine.handleCommand(SimulatorEngine::UICommand::Step);
    REQUIRE(engine.isRunning());
    REQUIRE(engine.getMetrics().ticks == 2);

    engine.handleCommand(SimulatorEngine::UICommand::Stop);
    REQUIRE_FALSE(engine.isRunning());

    engine.handleCommand(SimulatorEngine::UICommand::Reset);
    REQUIRE_FALSE(engine.isRunning());
    REQUIRE(engine.getMetrics().ticks == 0);
    REQUIRE(engine.getTraffic().carCount() == 30);
}

TEST_CASE("A minute of traffic keeps signals safe", "[engine][safety]")
{
    SimulatorEngine engine(smallConfig(100));
    engine.simulate(60.0);

    const SimulatorMetrics metrics = engine.getMetrics();
    REQUIRE_FALSE(engine.isRunning());
    REQUIRE(metrics.total_time >= 60.0);
    REQUIRE(metrics.ticks >= 3600);
    REQUIRE(metrics.safety_violations == 0);
    REQUIRE(metrics.car_count == 100);
    REQUIRE(metrics.free_flow_cars + metrics.braking_cars + metrics.low_speed_cars == 100);
    REQUIRE(metrics.lane_transitions > 0);
    REQUIRE(metrics.average_speed >= 0.0);
}

TEST_CASE("Same seed gives the same run", "[engine][random]")
{
    SimulatorEngine first(smallConfig(50));
    SimulatorEngine second(smallConfig(50));
    first.simulate(5.0);
    second.simulate(5.0);
    REQUIRE(first.getSnapshotJson() == second.getSnapshotJson());

    // reset replays from the seed as well
    const std::string before = first.getSnapshotJson();
    first.simulate(5.0);
    REQUIRE(first.getSnapshotJson() == before);
}

TEST_CASE("Snapshot exposes cars and signals", "[engine][snapshot]")
{
    SimulatorEngine engine(smallConfig());
    engine.handleCommand(SimulatorEngine::UICommand::Step);

    const SimulatorSnapshot snapshot = engine.getSnapshot();
    REQUIRE(snapshot.cars.size() == 30);
    REQUIRE(snapshot.intersections.size() == 9);
    for (const auto &car : snapshot.cars)
    {
        REQUIRE(car.u >= 0.0);
        REQUIRE(car.u <= 0.999);
        REQUIRE(car.lane.rfind("R_", 0) == 0);
        REQUIRE(car.heading.length() == Approx(1.0));
    }

    const auto root = nlohmann::json::parse(engine.getSnapshotJson());
    REQUIRE(root["running"] == false);
    REQUIRE(root["cars"].size() == 30);
    REQUIRE(root["metrics"]["ticks"] == 1);
    REQUIRE(root["metrics"].contains("flow"));
    REQUIRE(root["cars"][0]["position"].size() == 3);
    REQUIRE(root["intersections"].size() == 9);
    for (const auto &entry : root["intersections"])
    {
        const std::string ns = entry["ns"];
        const std::string ew = entry["ew"];
        REQUIRE((ns == "red" || ew == "red"));
    }
}

TEST_CASE("Database stores the active grid config", "[db]")
{
    db::Database database(freshDatabasePath("store"));
    std::string error;
    REQUIRE(database.initialize(&error));

    REQUIRE_FALSE(database.loadActiveGridConfigJson(&error).has_value());
    REQUIRE(error.empty());

    REQUIRE(database.saveActiveGridConfigJson("{\"seed\":5}", &error));
    REQUIRE(database.saveActiveGridConfigJson("{\"seed\":6}", &error));
    REQUIRE(database.saveValue("ui_theme", "dark", &error));

    auto stored = database.loadActiveGridConfigJson(&error);
    REQUIRE(stored.has_value());
    REQUIRE(*stored == "{\"seed\":6}");
    REQUIRE(database.loadValue("ui_theme", &error) == std::optional<std::string>("dark"));
}

TEST_CASE("Store file name follows the backend", "[db]")
{
    const std::string name = db::Database::defaultFileName();
    REQUIRE(db::Database::defaultFileName("other").rfind("other.", 0) == 0);
#ifdef GRIDFLOW_USE_SQLITE
    REQUIRE(name == "gridflow.db");
#else
    REQUIRE(name == "gridflow.json");
#endif

    // the file written is the kind the name promises
    db::Database database(freshDatabasePath("backend"));
    REQUIRE(database.initialize());
    REQUIRE(database.saveValue("ui_theme", "1"));
    std::ifstream file(database.path(), std::ios::binary);
    REQUIRE(file.good());
    std::string head(16, '\0');
    file.read(&head[0], static_cast<std::streamsize>(head.size()));
#ifdef GRIDFLOW_USE_SQLITE
    REQUIRE(head.rfind("SQLite format 3", 0) == 0);
#else
    REQUIRE(head.front() == '{');
#endif
}

TEST_CASE("Startup config falls back to defaults", "[db][config]")
{
    db::Database database(freshDatabasePath("startup"));
    REQUIRE(database.initialize());

    SECTION("nothing stored writes the defaults back")
    {
        GridConfig config = loadStartupConfig(database);
        REQUIRE(config.network.grid_size == 3);
        REQUIRE(database.loadActiveGridConfigJson().has_value());
    }

    SECTION("stored config is used when valid")
    {
        REQUIRE(database.saveActiveGridConfigJson(R"({"network":{"grid_size":4}})"));
        REQUIRE(loadStartupConfig(database).network.grid_size == 4);
    }

    SECTION("corrupt or unsafe config is ignored")
    {
        REQUIRE(database.saveActiveGridConfigJson("not json"));
        REQUIRE(loadStartupConfig(database).network.grid_size == 3);

        REQUIRE(database.saveActiveGridConfigJson(R"({"network":{"grid_size":1}})"));
        REQUIRE(loadStartupConfig(database).network.grid_size == 3);

        REQUIRE(database.saveActiveGridConfigJson(R"({"traffic":{"car_count":4000000000}})"));
        REQUIRE(loadStartupConfig(database).traffic.car_count == makeDefaultGridConfig().traffic.car_count);
    }
}

TEST_CASE("Posted config is validated, stored and applied on reset", "[service][config]")
{
    db::Database database(freshDatabasePath("service"));
    REQUIRE(database.initialize());
    SimulationService service(database, smallConfig(10));

    auto rejected = service.submitConfig(R"({"network":{"grid_size":1}})");
    REQUIRE(rejected.status_code == 400);
    REQUIRE(rejected.body.find("network.grid_size") != std::string::npos);
    REQUIRE(service.submitConfig("{").status_code == 400);
    REQUIRE_FALSE(service.hasPendingConfig());

    auto oversized = service.submitConfig(R"({"traffic":{"car_count":4000000000}})");
    REQUIRE(oversized.status_code == 400);
    REQUIRE(oversized.body.find("traffic.car_count") != std::string::npos);
    REQUIRE(service.submitConfig(R"({"network":{"grid_size":60000}})").status_code == 400);
    REQUIRE_FALSE(service.hasPendingConfig());
    REQUIRE_FALSE(database.loadActiveGridConfigJson().has_value());

    auto accepted = service.submitConfig(R"({"traffic":{"car_count":20}})");
    REQUIRE(accepted.status_code == 200);
    REQUIRE(service.hasPendingConfig());
    REQUIRE(nlohmann::json::parse(service.configJson())["traffic"]["car_count"] == 20);
    REQUIRE(service.metrics().car_count == 10);

    auto stored = database.loadActiveGridConfigJson();
    REQUIRE(stored.has_value());
    REQUIRE(gridConfigFromJson(*stored).config.traffic.car_count == 20);

    REQUIRE(service.handleCommand("reset"));
    REQUIRE_FALSE(service.hasPendingConfig());
    REQUIRE(service.metrics().car_count == 20);
}

TEST_CASE("Service commands drive the engine", "[service]")
{
    db::Database database(freshDatabasePath("commands"));
    REQUIRE(database.initialize());
    SimulationService service(database, smallConfig(10));

    REQUIRE(service.handleCommand("step"));
    REQUIRE(service.metrics().ticks == 1);

    REQUIRE(service.advanceFrame(0.05) == 0); // stopped
    REQUIRE(service.handleCommand("start"));
    REQUIRE(service.advanceFrame(0.05) >= 2);
    REQUIRE(service.handleCommand("stop"));

    REQUIRE_FALSE(service.handleCommand("launch"));
    REQUIRE(nlohmann::json::parse(service.snapshotJson())["cars"].size() == 10);
}

TEST_CASE("UI server routes requests", "[server]")
{
    std::string last_command;
    std::string last_body;
    SimpleHttpUiServer server(
        0,
        []()
        { return std::string("{\"sim_time\":0}"); },
        [&](const std::string &cmd)
        {
            last_command = cmd;
            return cmd == "start";
        },
        []()
        { return std::string("{\"seed\":1}"); },
        [&](const std::string &body)
        {
            last_body = body;
            return SimpleHttpUiServer::ConfigMutationResult{400, "{\"ok\":false}"};
        });

    auto snapshot = server.handleRequest("GET", "/snapshot", "");
    REQUIRE(snapshot.status_code == 200);
    REQUIRE(snapshot.body == "{\"sim_time\":0}");
    REQUIRE(snapshot.content_type == "application/json");

    auto command = server.handleRequest("GET", "/command?cmd=start&x=1", "");
    REQUIRE(command.status_code == 200);
    REQUIRE(last_command == "start");
    REQUIRE(server.handleRequest("GET", "/command?cmd=fly", "").status_code == 400);

    REQUIRE(server.handleRequest("GET", "/config/api", "").body == "{\"seed\":1}");
    auto posted = server.handleRequest("POST", "/config/api", "{\"seed\":2}");
    REQUIRE(posted.status_code == 400);
    REQUIRE(last_body == "{\"seed\":2}");
    REQUIRE(server.handleRequest("PUT", "/config/api", "").status_code == 405);

    REQUIRE(server.handleRequest("GET", "/", "").status_code == 200);
    REQUIRE(server.handleRequest("GET", "/missing", "").status_code == 404);

    const std::string wire = SimpleHttpUiServer::serialize(snapshot);
    REQUIRE(wire.rfind("HTTP/1.1 200 OK\r\n", 0) == 0);
    REQUIRE(wire.find("Content-Length: 14\r\n") != std::string::npos);
}
