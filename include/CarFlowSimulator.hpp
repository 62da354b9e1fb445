#pragma once

#include <cstdint>
#include <optional>
#include <unordered_map>
#include <vector>
#include "GridConfig.hpp"
#include "RandomSource.hpp"
#include "RoadNetwork.hpp"
#include "SignalController.hpp"
#include "Vehicle.hpp"

namespace gridflow
{
    // Result of the perception pass for one car. Nothing in here has been applied
    // to the car yet.
    struct CarDecision
    {
        double acceleration = 0.0;
        double gap = 0.0;
        double approach_rate = 0.0;
        bool emergency_stop = false;
        std::optional<LaneId> target_lane; // set when this tick commits a successor
    };

    struct FlowTickStats
    {
        size_t lane_transitions = 0;
        size_t recycled = 0;
        size_t emergency_stops = 0;
    };

    class CarFlowSimulator
    {
    public:
        explicit CarFlowSimulator(const GridConfig &config = makeDefaultGridConfig());

        // Places traffic.car_count cars on random road lanes
        void populate(const RoadNetwork &network, IRandomSource &random);

        // Adds one car; returns its id
        uint32_t addCar(LaneId lane, double t, double v);

        // Pass 1: every decision is computed from the same frozen car state
        std::vector<CarDecision> perceive(const RoadNetwork &network,
                                          const SignalController &signals,
                                          IRandomSource &random) const;

        // Pass 2: apply decisions and move cars, handling lane ends
        FlowTickStats integrate(const RoadNetwork &network,
                                const std::vector<CarDecision> &decisions,
                                double dt_seconds,
                                IRandomSource &random);

        FlowTickStats step(const RoadNetwork &network,
                           const SignalController &signals,
                           double dt_seconds,
                           IRandomSource &random);

        const std::vector<Car> &cars() const { return car_list; }
        size_t carCount() const { return car_list.size(); }

        // Statistics
        double averageSpeed() const;
        size_t countInState(FlowState state) const;

        void clear();

    private:
        // Indices into car_list per lane, front-most (largest t) first
        using LaneOccupancy = std::unordered_map<LaneId, std::vector<size_t>>;

        LaneOccupancy buildOccupancy() const;
        CarDecision decide(size_t car_index,
                           const LaneOccupancy &occupancy,
                           const RoadNetwork &network,
                           const SignalController &signals,
                           IRandomSource &random) const;
        const Car *rearmostOccupant(LaneId lane, const LaneOccupancy &occupancy) const;
        void advanceAcrossLaneEnds(Car &car, const RoadNetwork &network, IRandomSource &random, FlowTickStats &stats) const;
        void recycle(Car &car, const RoadNetwork &network, IRandomSource &random) const;

        GridConfig config;
        std::vector<Car> car_list;
        uint32_t next_car_id;
    };

} // namespace gridflow
