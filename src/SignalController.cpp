#include "SignalController.hpp"

#include <cmath>
#include <utility>

namespace gridflow
{
    namespace
    {
        double wrapIntoCycle(double elapsed, double cycle)
        {
            if (cycle <= 0.0)
            {
                return 0.0;
            }
            double wrapped = std::fmod(elapsed, cycle);
            if (wrapped < 0.0)
            {
                wrapped += cycle;
            }
            return wrapped;
        }
    }

    double phaseDurationSeconds(const SignalPlan &plan, SignalPhase phase)
    {
        switch (phase)
        {
        case SignalPhase::NsGreen:
        case SignalPhase::EwGreen:
            return plan.green_seconds;
        case SignalPhase::NsYellow:
        case SignalPhase::EwYellow:
            return plan.yellow_seconds;
        case SignalPhase::NsClearance:
        case SignalPhase::EwClearance:
            return plan.all_red_seconds;
        }
        return 0.0;
    }

    double phaseStartSeconds(const SignalPlan &plan, SignalPhase phase)
    {
        double start = 0.0;
        for (std::size_t i = 0; i < static_cast<std::size_t>(phase); ++i)
        {
            start += phaseDurationSeconds(plan, static_cast<SignalPhase>(i));
        }
        return start;
    }

    SignalPhase phaseAt(const SignalPlan &plan, double elapsed_seconds)
    {
        const double t = wrapIntoCycle(elapsed_seconds, plan.cycleSeconds());
        const double g = plan.green_seconds;
        const double y = plan.yellow_seconds;
        const double r = plan.all_red_seconds;

        if (t < g)
            return SignalPhase::NsGreen;
        if (t < g + y)
            return SignalPhase::NsYellow;
        if (t < g + y + r)
            return SignalPhase::NsClearance;
        if (t < 2.0 * g + y + r)
            return SignalPhase::EwGreen;
        if (t < 2.0 * g + 2.0 * y + r)
            return SignalPhase::EwYellow;
        return SignalPhase::EwClearance;
    }

    IntersectionState stateForPhase(SignalPhase phase)
    {
        IntersectionState state;
        switch (phase)
        {
        case SignalPhase::NsGreen:
            state.ns = LightState::Green;
            break;
        case SignalPhase::NsYellow:
            state.ns = LightState::Yellow;
            break;
        case SignalPhase::EwGreen:
            state.ew = LightState::Green;
            break;
        case SignalPhase::EwYellow:
            state.ew = LightState::Yellow;
            break;
        case SignalPhase::NsClearance:
        case SignalPhase::EwClearance:
            break;
        }
        return state;
    }

    SignalController::SignalController(const SignalPlan &plan, std::vector<double> initial_timers)
        : signal_plan(plan), timers(std::move(initial_timers))
    {
        for (double &value : timers)
        {
            value = wrapIntoCycle(value, signal_plan.cycleSeconds());
        }
    }

    SignalController SignalController::withRandomOffsets(const SignalPlan &plan, std::size_t node_count, IRandomSource &random)
    {
        std::vector<double> offsets;
        offsets.reserve(node_count);
        for (std::size_t i = 0; i < node_count; ++i)
        {
            const auto phase = static_cast<SignalPhase>(random.pickIndex(SIGNAL_PHASE_COUNT));
            const double start = phaseStartSeconds(plan, phase);
            offsets.push_back(start + random.uniform(0.0, phaseDurationSeconds(plan, phase)));
        }
        return SignalController(plan, std::move(offsets));
    }

    void SignalController::tick(double dt_seconds)
    {
        const double cycle = signal_plan.cycleSeconds();
        for (double &value : timers)
        {
            value = wrapIntoCycle(value + dt_seconds, cycle);
        }
    }

    double SignalController::timer(NodeId node) const
    {
        return timers.at(node);
    }

    SignalPhase SignalController::phaseOf(NodeId node) const
    {
        return phaseAt(signal_plan, timers.at(node));
    }

    IntersectionState SignalController::stateOf(NodeId node) const
    {
        return stateForPhase(phaseOf(node));
    }

    LightState SignalController::permissionFor(NodeId node, ApproachAxis axis) const
    {
        return stateOf(node).forAxis(axis);
    }

} // namespace gridflow
