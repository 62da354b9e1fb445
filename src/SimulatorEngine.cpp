#include "SimulatorEngine.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <utility>

namespace gridflow
{
    namespace
    {
        constexpr double MAX_SNAPSHOT_U = 0.999;

        nlohmann::json vecToJson(const Vec3 &v)
        {
            return nlohmann::json::array({v.x, v.y, v.z});
        }
    }

    SimulatorEngine::SimulatorEngine(const GridConfig &config)
        : SimulatorEngine(config, std::make_unique<MersenneRandomSource>(config.seed))
    {
    }

    SimulatorEngine::SimulatorEngine(const GridConfig &config, std::unique_ptr<IRandomSource> random_source)
        : grid_config(config),
          random(std::move(random_source)),
          checker(config),
          traffic(config)
    {
        initializeWorld();
    }

    void SimulatorEngine::initializeWorld()
    {
        random->reseed(grid_config.seed);

        network = buildGridNetwork(grid_config.network);
        signals = SignalController::withRandomOffsets(grid_config.signals, network.nodeCount(), *random);
        traffic = CarFlowSimulator(grid_config);
        traffic.populate(network, *random);

        current_time = 0.0;
        accumulator = 0.0;
        tick_count = 0;
        lane_transitions = 0;
        recycled_cars = 0;
        emergency_stops = 0;
        safety_violations = 0;

        last_states.clear();
        state_entered_at.assign(network.nodeCount(), std::nullopt);
        for (NodeId node = 0; node < network.nodeCount(); ++node)
        {
            last_states.push_back(signals.stateOf(node));
        }
    }

    void SimulatorEngine::simulate(double duration_seconds)
    {
        reset();
        start();
        const double step = physicsStep();
        while (current_time < duration_seconds)
            tick(step);
        stop();
    }

    void SimulatorEngine::tick(double dt)
    {
        if (!running)
        {
            return;
        }

        signals.tick(dt);
        checkSignalSafety(current_time + dt);

        FlowTickStats stats = traffic.step(network, signals, dt, *random);
        lane_transitions += stats.lane_transitions;
        recycled_cars += stats.recycled;
        emergency_stops += stats.emergency_stops;

        current_time += dt;
        tick_count++;
    }

    int SimulatorEngine::advanceFrame(double frame_seconds)
    {
        if (!running)
        {
            return 0;
        }

        // Clamp stalls so one slow frame cannot trigger an unbounded catch-up
        const double frame = std::max(0.0, std::min(frame_seconds, grid_config.timing.max_frame_seconds));
        accumulator += frame;

        const double step = physicsStep();
        int steps = 0;
        while (accumulator >= step)
        {
            tick(step);
            accumulator -= step;
            steps++;
        }
        return steps;
    }

    void SimulatorEngine::checkSignalSafety(double now)
    {
        for (NodeId node = 0; node < signals.size(); ++node)
        {
            const IntersectionState state = signals.stateOf(node);
            if (!checker.isSafe(state))
            {
                safety_violations++;
            }

            if (state == last_states[node])
            {
                continue;
            }

            // The previous state may have begun up to one step before it was observed
            if (state_entered_at[node].has_value())
            {
                const double upper_bound = now - *state_entered_at[node] + physicsStep();
                if (!checker.isValidTransition(last_states[node], state, upper_bound))
                {
                    safety_violations++;
                }
            }

            last_states[node] = state;
            state_entered_at[node] = now;
        }
    }

    SimulatorMetrics SimulatorEngine::getMetrics() const
    {
        SimulatorMetrics metrics;
        metrics.total_time = current_time;
        metrics.ticks = tick_count;
        metrics.car_count = traffic.carCount();
        metrics.average_speed = traffic.averageSpeed();
        metrics.free_flow_cars = traffic.countInState(FlowState::FreeFlow);
        metrics.braking_cars = traffic.countInState(FlowState::Braking);
        metrics.low_speed_cars = traffic.countInState(FlowState::LowSpeed);
        metrics.lane_transitions = lane_transitions;
        metrics.recycled_cars = recycled_cars;
        metrics.emergency_stops = emergency_stops;
        metrics.safety_violations = safety_violations;
        return metrics;
    }

    SimulatorSnapshot SimulatorEngine::getSnapshot() const
    {
        SimulatorSnapshot snapshot;
        snapshot.sim_time = current_time;
        snapshot.running = running;
        snapshot.metrics = getMetrics();

        snapshot.cars.reserve(traffic.carCount());
        for (const auto &car : traffic.cars())
        {
            const Lane &lane = network.lane(car.lane);
            CarSnapshot entry;
            entry.id = car.id;
            entry.lane = lane.name;
            entry.u = lane.length() > 0.0 ? std::max(0.0, std::min(MAX_SNAPSHOT_U, car.t / lane.length())) : 0.0;
            entry.position = lane.curve.pointAt(entry.u);
            entry.heading = lane.curve.tangentAt(entry.u);
            entry.speed = car.v;
            entry.acceleration = car.a;
            entry.flow = car.flow_state;
            snapshot.cars.push_back(entry);
        }

        snapshot.intersections.reserve(network.nodeCount());
        for (const auto &node : network.nodes())
        {
            snapshot.intersections.push_back({node.id, node.name, node.position, signals.stateOf(node.id)});
        }
        return snapshot;
    }

    std::string SimulatorEngine::getSnapshotJson() const
    {
        const SimulatorSnapshot snapshot = getSnapshot();

        nlohmann::json root;
        root["sim_time"] = snapshot.sim_time;
        root["running"] = snapshot.running;

        const SimulatorMetrics &m = snapshot.metrics;
        root["metrics"] = {
            {"ticks", m.ticks},
            {"car_count", m.car_count},
            {"average_speed", m.average_speed},
            {"flow", {{"free_flow", m.free_flow_cars}, {"braking", m.braking_cars}, {"low_speed", m.low_speed_cars}}},
            {"lane_transitions", m.lane_transitions},
            {"recycled_cars", m.recycled_cars},
            {"emergency_stops", m.emergency_stops},
            {"safety_violations", m.safety_violations}};

        root["cars"] = nlohmann::json::array();
        for (const auto &car : snapshot.cars)
        {
            root["cars"].push_back({{"id", car.id},
                                    {"lane", car.lane},
                                    {"u", car.u},
                                    {"position", vecToJson(car.position)},
                                    {"heading", vecToJson(car.heading)},
                                    {"speed", car.speed},
                                    {"acceleration", car.acceleration},
                                    {"flow", toString(car.flow)}});
        }

        root["intersections"] = nlohmann::json::array();
        for (const auto &entry : snapshot.intersections)
        {
            root["intersections"].push_back({{"id", entry.name},
                                             {"position", vecToJson(entry.position)},
                                             {"ns", toString(entry.lights.ns)},
                                             {"ew", toString(entry.lights.ew)}});
        }

        return root.dump();
    }

    void SimulatorEngine::reset()
    {
        running = false;
        initializeWorld();
    }

    void SimulatorEngine::start()
    {
        running = true;
    }

    void SimulatorEngine::stop()
    {
        running = false;
    }

    bool SimulatorEngine::isRunning() const
    {
        return running;
    }

    void SimulatorEngine::handleCommand(UICommand command)
    {
        switch (command)
        {
        case UICommand::Start:
            start();
            break;
        case UICommand::Stop:
            stop();
            break;
        case UICommand::Reset:
            reset();
            break;
        case UICommand::Step:
            if (!running)
            {
                start();
                tick(physicsStep());
                stop();
            }
            else
            {
                tick(physicsStep());
            }
            break;
        }
    }

    double SimulatorEngine::physicsStep() const
    {
        return grid_config.timing.physicsStep();
    }

    double SimulatorEngine::accumulatedTime() const
    {
        return accumulator;
    }

    const GridConfig &SimulatorEngine::getConfig() const
    {
        return grid_config;
    }

    const RoadNetwork &SimulatorEngine::getNetwork() const
    {
        return network;
    }

    const SignalController &SimulatorEngine::getSignals() const
    {
        return signals;
    }

    const CarFlowSimulator &SimulatorEngine::getTraffic() const
    {
        return traffic;
    }

} // namespace gridflow
