#pragma once

#include "GridConfig.hpp"
#include "Intersection.hpp"
#include "RandomSource.hpp"
#include "RoadNetwork.hpp"

#include <cstdint>
#include <vector>

namespace gridflow
{
    enum class SignalPhase : uint8_t
    {
        NsGreen = 0,
        NsYellow = 1,
        NsClearance = 2,
        EwGreen = 3,
        EwYellow = 4,
        EwClearance = 5
    };

    constexpr std::size_t SIGNAL_PHASE_COUNT = 6;

    // Offset of the phase window inside the cycle, and its length
    double phaseStartSeconds(const SignalPlan &plan, SignalPhase phase);
    double phaseDurationSeconds(const SignalPlan &plan, SignalPhase phase);

    // Table lookup on elapsed mod cycle length
    SignalPhase phaseAt(const SignalPlan &plan, double elapsed_seconds);
    IntersectionState stateForPhase(SignalPhase phase);

    // One fixed-time cycle per intersection. The timer is the only state; the
    // phase is always derived from it.
    class SignalController
    {
    public:
        SignalController() = default;
        SignalController(const SignalPlan &plan, std::vector<double> initial_timers);

        // Picks a uniformly random phase per node and a random point inside it
        static SignalController withRandomOffsets(const SignalPlan &plan, std::size_t node_count, IRandomSource &random);

        void tick(double dt_seconds);

        std::size_t size() const { return timers.size(); }
        const SignalPlan &plan() const { return signal_plan; }

        double timer(NodeId node) const;
        SignalPhase phaseOf(NodeId node) const;
        IntersectionState stateOf(NodeId node) const;
        LightState permissionFor(NodeId node, ApproachAxis axis) const;

    private:
        SignalPlan signal_plan;
        std::vector<double> timers;
    };

} // namespace gridflow
