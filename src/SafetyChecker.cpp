#include "SafetyChecker.hpp"

#include <cmath>
#include <cstdint>
#include <string>

namespace gridflow
{
    namespace
    {
        constexpr double TIMING_TOLERANCE = 1e-9;

        // Largest world the engine builds and steps within one frame budget
        constexpr uint16_t MAX_GRID_SIZE = 64;
        constexpr uint32_t MAX_CAR_COUNT = 100000;

        bool isPositive(double value)
        {
            return std::isfinite(value) && value > 0.0;
        }
    }

    SafetyChecker::SafetyChecker()
        : SafetyChecker(makeDefaultGridConfig())
    {
    }

    SafetyChecker::SafetyChecker(const GridConfig &config)
        : yellow_seconds(config.signals.yellow_seconds),
          config_errors(validateConfig(config))
    {
    }

    bool SafetyChecker::isConfigValid() const
    {
        return config_errors.empty();
    }

    const std::vector<std::string> &SafetyChecker::configErrors() const
    {
        return config_errors;
    }

    std::vector<std::string> SafetyChecker::validateConfig(const GridConfig &config) const
    {
        std::vector<std::string> errors;

        const NetworkConfig &network = config.network;
        if (network.grid_size < 2)
            errors.push_back("network.grid_size must be at least 2");
        if (network.grid_size > MAX_GRID_SIZE)
            errors.push_back("network.grid_size must be at most " + std::to_string(MAX_GRID_SIZE));
        if (!isPositive(network.block_size))
            errors.push_back("network.block_size must be positive");
        if (!isPositive(network.road_width))
            errors.push_back("network.road_width must be positive");
        if (!std::isfinite(network.lane_offset) || network.lane_offset < 0.0)
            errors.push_back("network.lane_offset must not be negative");
        if (isPositive(network.block_size) && 2.0 * network.road_width >= network.block_size)
            errors.push_back("network.road_width leaves no room for roads between nodes");
        if (!isPositive(network.junction_control_scale))
            errors.push_back("network.junction_control_scale must be positive");
        if (!(network.max_turn_angle_ratio > 0.0 && network.max_turn_angle_ratio < 1.0))
            errors.push_back("network.max_turn_angle_ratio must be in (0, 1)");

        // Green and yellow must have real duration; the all-red clearance keeps
        // conflicting greens apart and may not be skipped either.
        const SignalPlan &signals = config.signals;
        if (!isPositive(signals.green_seconds))
            errors.push_back("signals.green_seconds must be positive");
        if (!isPositive(signals.yellow_seconds))
            errors.push_back("signals.yellow_seconds must be positive");
        if (!isPositive(signals.all_red_seconds))
            errors.push_back("signals.all_red_seconds must be positive");

        const DriverModelConfig &driver = config.driver;
        if (!isPositive(driver.desired_speed))
            errors.push_back("driver.desired_speed must be positive");
        if (!std::isfinite(driver.time_headway) || driver.time_headway < 0.0)
            errors.push_back("driver.time_headway must not be negative");
        if (!isPositive(driver.max_acceleration))
            errors.push_back("driver.max_acceleration must be positive");
        if (!isPositive(driver.comfortable_braking))
            errors.push_back("driver.comfortable_braking must be positive");
        if (!std::isfinite(driver.jam_distance) || driver.jam_distance < 0.0)
            errors.push_back("driver.jam_distance must not be negative");
        if (!isPositive(driver.emergency_brake_factor))
            errors.push_back("driver.emergency_brake_factor must be positive");
        if (!isPositive(driver.gap_floor))
            errors.push_back("driver.gap_floor must be positive");

        const TrafficConfig &traffic = config.traffic;
        if (traffic.car_count > MAX_CAR_COUNT)
            errors.push_back("traffic.car_count must be at most " + std::to_string(MAX_CAR_COUNT));
        if (!isPositive(traffic.car_length))
            errors.push_back("traffic.car_length must be positive");
        if (!std::isfinite(traffic.min_gap) || traffic.min_gap < 0.0)
            errors.push_back("traffic.min_gap must not be negative");
        if (!std::isfinite(traffic.stop_margin) || traffic.stop_margin < 0.0)
            errors.push_back("traffic.stop_margin must not be negative");
        if (!(traffic.lookahead_distance > traffic.min_gap))
            errors.push_back("traffic.lookahead_distance must exceed traffic.min_gap");
        if (!(traffic.free_gap >= traffic.lookahead_distance))
            errors.push_back("traffic.free_gap must not be below traffic.lookahead_distance");
        if (!(traffic.low_speed_ratio >= 0.0 && traffic.low_speed_ratio <= 1.0))
            errors.push_back("traffic.low_speed_ratio must be in [0, 1]");

        const TimingConfig &timing = config.timing;
        if (!isPositive(timing.physics_hz))
            errors.push_back("timing.physics_hz must be positive");
        if (!isPositive(timing.max_frame_seconds))
            errors.push_back("timing.max_frame_seconds must be positive");

        return errors;
    }

    bool SafetyChecker::isActive(LightState state)
    {
        return state == LightState::Green || state == LightState::Yellow;
    }

    bool SafetyChecker::isSafe(const IntersectionState &state) const
    {
        // NS and EW cross each other; at most one axis may hold right-of-way
        return !(isActive(state.ns) && isActive(state.ew));
    }

    bool SafetyChecker::checkPerLightTransition(LightState prev, LightState next) const
    {
        if (prev == next)
        {
            return true;
        }

        switch (prev)
        {
        case LightState::Green:
            return next == LightState::Yellow;
        case LightState::Yellow:
            return next == LightState::Red;
        case LightState::Red:
            return next == LightState::Green;
        }
        return false;
    }

    bool SafetyChecker::checkYellowTiming(LightState prev, LightState next, double prev_state_seconds) const
    {
        if (prev == LightState::Yellow && next == LightState::Red)
        {
            return prev_state_seconds + TIMING_TOLERANCE >= yellow_seconds;
        }
        return true;
    }

    bool SafetyChecker::checkCrossingLightSafety(const IntersectionState &prev, const IntersectionState &next) const
    {
        // An axis may only turn green when the crossing axis was and stays red
        if (prev.ns == LightState::Red && next.ns == LightState::Green)
        {
            if (prev.ew != LightState::Red || next.ew != LightState::Red)
            {
                return false;
            }
        }
        if (prev.ew == LightState::Red && next.ew == LightState::Green)
        {
            if (prev.ns != LightState::Red || next.ns != LightState::Red)
            {
                return false;
            }
        }
        return true;
    }

    bool SafetyChecker::isValidTransition(const IntersectionState &prev, const IntersectionState &next, double prev_state_seconds) const
    {
        if (!isSafe(next))
        {
            return false;
        }

        if (!checkPerLightTransition(prev.ns, next.ns) || !checkPerLightTransition(prev.ew, next.ew))
        {
            return false;
        }

        if (!checkYellowTiming(prev.ns, next.ns, prev_state_seconds) ||
            !checkYellowTiming(prev.ew, next.ew, prev_state_seconds))
        {
            return false;
        }

        return checkCrossingLightSafety(prev, next);
    }

} // namespace gridflow
