#pragma once

#include "CarFlowSimulator.hpp"
#include "GridConfig.hpp"
#include "RandomSource.hpp"
#include "RoadNetwork.hpp"
#include "SafetyChecker.hpp"
#include "SignalController.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace gridflow
{
    struct SimulatorMetrics
    {
        double total_time = 0.0;
        uint64_t ticks = 0;
        size_t car_count = 0;
        double average_speed = 0.0;
        size_t free_flow_cars = 0;
        size_t braking_cars = 0;
        size_t low_speed_cars = 0;
        uint64_t lane_transitions = 0;
        uint64_t recycled_cars = 0;
        uint64_t emergency_stops = 0;
        size_t safety_violations = 0;
    };

    struct CarSnapshot
    {
        uint32_t id = 0;
        std::string lane;
        double u = 0.0; // t / length, clamped to [0, 0.999]
        Vec3 position;
        Vec3 heading;
        double speed = 0.0;
        double acceleration = 0.0;
        FlowState flow = FlowState::FreeFlow;
    };

    struct IntersectionSnapshot
    {
        NodeId id = 0;
        std::string name;
        Vec3 position;
        IntersectionState lights;
    };

    struct SimulatorSnapshot
    {
        double sim_time = 0.0;
        bool running = false;
        SimulatorMetrics metrics;
        std::vector<CarSnapshot> cars;
        std::vector<IntersectionSnapshot> intersections;
    };

    class SimulatorEngine
    {
    public:
        enum class UICommand
        {
            Start,
            Stop,
            Reset,
            Step
        };

        explicit SimulatorEngine(const GridConfig &config = makeDefaultGridConfig());
        SimulatorEngine(const GridConfig &config, std::unique_ptr<IRandomSource> random_source);

        // Runs fixed physics steps until duration_seconds of simulated time have passed
        void simulate(double duration_seconds);

        // One physics step; ignored while stopped
        void tick(double dt);

        // Feeds one presentation frame's wall-clock delta into the accumulator and
        // returns the number of physics steps that ran.
        int advanceFrame(double frame_seconds);

        SimulatorMetrics getMetrics() const;
        SimulatorSnapshot getSnapshot() const;
        std::string getSnapshotJson() const;

        void reset();
        void start();
        void stop();
        bool isRunning() const;
        void handleCommand(UICommand command);

        double physicsStep() const;
        double accumulatedTime() const;
        const GridConfig &getConfig() const;
        const RoadNetwork &getNetwork() const;
        const SignalController &getSignals() const;
        const CarFlowSimulator &getTraffic() const;

    private:
        void initializeWorld();
        void checkSignalSafety(double now);

        GridConfig grid_config;
        std::unique_ptr<IRandomSource> random;
        SafetyChecker checker;
        RoadNetwork network;
        SignalController signals;
        CarFlowSimulator traffic;

        double current_time = 0.0;
        double accumulator = 0.0;
        bool running = false;
        uint64_t tick_count = 0;
        uint64_t lane_transitions = 0;
        uint64_t recycled_cars = 0;
        uint64_t emergency_stops = 0;
        size_t safety_violations = 0;

        std::vector<IntersectionState> last_states;
        std::vector<std::optional<double>> state_entered_at;
    };

} // namespace gridflow
