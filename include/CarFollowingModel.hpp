#pragma once

#include "GridConfig.hpp"

namespace gridflow
{
    // Intelligent Driver Model.
    //   s* = s0 + max(0, v*T + v*dv / (2*sqrt(a*b)))
    //   acc = a * (1 - (v/v0)^4 - (s*/gap)^2)
    // dv is the closing speed (own speed minus the speed of whatever is ahead).
    double desiredGap(const DriverModelConfig &model, double speed, double approach_rate);
    double idmAcceleration(const DriverModelConfig &model, double speed, double approach_rate, double gap);

    // Fixed deceleration reported when a car is stopped outright inside the minimum gap
    double emergencyBrakeAcceleration(const DriverModelConfig &model);

} // namespace gridflow
