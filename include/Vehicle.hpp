#pragma once

#include "GridConfig.hpp"
#include "RoadNetwork.hpp"

#include <cstdint>
#include <optional>

namespace gridflow
{
    // Colour hint for the presentation layer; never read back by the physics
    enum class FlowState : uint8_t
    {
        FreeFlow,
        Braking,
        LowSpeed
    };

    struct Car
    {
        uint32_t id = 0;
        LaneId lane = 0;
        double t = 0.0; // distance along the lane, [0, length)
        double v = 0.0; // speed, >= 0
        double a = 0.0; // last computed acceleration
        std::optional<LaneId> target_lane;
        FlowState flow_state = FlowState::FreeFlow;

        Car() = default;
        Car(uint32_t car_id, LaneId lane_id, double position, double speed)
            : id(car_id), lane(lane_id), t(position), v(speed) {}

        bool isStopped() const { return v <= 0.0; }
    };

    inline FlowState classifyFlow(double acceleration, double speed, const TrafficConfig &traffic, double desired_speed)
    {
        if (acceleration < traffic.braking_threshold)
            return FlowState::Braking;
        if (speed < desired_speed * traffic.low_speed_ratio)
            return FlowState::LowSpeed;
        return FlowState::FreeFlow;
    }

    inline const char *toString(FlowState state)
    {
        switch (state)
        {
        case FlowState::FreeFlow:
            return "free_flow";
        case FlowState::Braking:
            return "braking";
        case FlowState::LowSpeed:
            return "low_speed";
        }
        return "free_flow";
    }

} // namespace gridflow
