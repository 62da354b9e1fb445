#pragma once

#include "GridConfig.hpp"
#include "Intersection.hpp"

#include <string>
#include <vector>

namespace gridflow
{

    class SafetyChecker
    {
    public:
        SafetyChecker();
        explicit SafetyChecker(const GridConfig &config);

        bool isConfigValid() const;
        const std::vector<std::string> &configErrors() const;

        // Public validation methods
        bool isSafe(const IntersectionState &state) const;
        bool isValidTransition(const IntersectionState &prev, const IntersectionState &next, double prev_state_seconds) const;

        static bool isActive(LightState state);

    private:
        std::vector<std::string> validateConfig(const GridConfig &config) const;

        // Helper methods for isValidTransition()
        bool checkPerLightTransition(LightState prev, LightState next) const;
        bool checkYellowTiming(LightState prev, LightState next, double prev_state_seconds) const;
        bool checkCrossingLightSafety(const IntersectionState &prev, const IntersectionState &next) const;

        double yellow_seconds;
        std::vector<std::string> config_errors;
    };

} // namespace gridflow
