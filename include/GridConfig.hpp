#pragma once

#include <cstdint>

namespace gridflow
{
    struct NetworkConfig
    {
        uint16_t grid_size = 3;              // nodes per side
        double block_size = 160.0;           // node spacing
        double road_width = 12.0;            // setback of lane ends from the node centre
        double lane_offset = 3.0;            // lateral offset from the road centreline
        double junction_control_scale = 1.5; // bezier control distance = road_width * scale
        double max_turn_angle_ratio = 0.8;   // connections turning more than ratio * pi are dropped
    };

    struct SignalPlan
    {
        double green_seconds = 10.0;
        double yellow_seconds = 4.0;
        double all_red_seconds = 2.0;

        double cycleSeconds() const
        {
            return 2.0 * (green_seconds + yellow_seconds + all_red_seconds);
        }
    };

    // Intelligent Driver Model calibration
    struct DriverModelConfig
    {
        double desired_speed = 14.0;
        double time_headway = 1.6;
        double max_acceleration = 1.5;
        double comfortable_braking = 2.5;
        double jam_distance = 3.0;
        double emergency_brake_factor = 4.0;
        double gap_floor = 0.1;
    };

    struct TrafficConfig
    {
        uint32_t car_count = 500;
        double car_length = 4.6;
        double min_gap = 2.0;             // below this the car is stopped outright
        double stop_margin = 2.0;         // distance kept before the stop line
        double lookahead_distance = 50.0; // virtual gaps into the next lane only count below this
        double free_gap = 500.0;
        double braking_threshold = -0.5;
        double low_speed_ratio = 0.3;
    };

    struct TimingConfig
    {
        double physics_hz = 60.0;
        double max_frame_seconds = 0.1;

        double physicsStep() const
        {
            return 1.0 / physics_hz;
        }
    };

    struct GridConfig
    {
        NetworkConfig network;
        SignalPlan signals;
        DriverModelConfig driver;
        TrafficConfig traffic;
        TimingConfig timing;
        uint32_t seed = 1;
    };

    inline GridConfig makeDefaultGridConfig()
    {
        return GridConfig{};
    }

} // namespace gridflow
