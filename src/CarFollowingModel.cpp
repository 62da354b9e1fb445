#include "CarFollowingModel.hpp"

#include <algorithm>
#include <cmath>

namespace gridflow
{
    double desiredGap(const DriverModelConfig &model, double speed, double approach_rate)
    {
        const double braking_term = (speed * approach_rate) /
                                    (2.0 * std::sqrt(model.max_acceleration * model.comfortable_braking));
        return model.jam_distance + std::max(0.0, speed * model.time_headway + braking_term);
    }

    double idmAcceleration(const DriverModelConfig &model, double speed, double approach_rate, double gap)
    {
        const double s_star = desiredGap(model, speed, approach_rate);
        const double free_term = std::pow(speed / model.desired_speed, 4);
        const double interaction_term = std::pow(s_star / std::max(model.gap_floor, gap), 2);
        return model.max_acceleration * (1.0 - free_term - interaction_term);
    }

    double emergencyBrakeAcceleration(const DriverModelConfig &model)
    {
        return -model.comfortable_braking * model.emergency_brake_factor;
    }

} // namespace gridflow
