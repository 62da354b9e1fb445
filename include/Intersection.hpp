#pragma once

#include <cstdint>

namespace gridflow
{

    enum class LightState
    {
        Red,
        Yellow,
        Green
    };

    // Axis a road runs along; NS roads run along Z, EW roads along X
    enum class ApproachAxis : uint8_t
    {
        NS,
        EW
    };

    struct IntersectionState
    {
        LightState ns{LightState::Red};
        LightState ew{LightState::Red};

        LightState forAxis(ApproachAxis axis) const
        {
            return axis == ApproachAxis::NS ? ns : ew;
        }

        bool operator==(const IntersectionState &other) const
        {
            return ns == other.ns && ew == other.ew;
        }

        bool operator!=(const IntersectionState &other) const
        {
            return !(*this == other);
        }
    };

    inline const char *toString(LightState state)
    {
        switch (state)
        {
        case LightState::Red:
            return "red";
        case LightState::Yellow:
            return "yellow";
        case LightState::Green:
            return "green";
        }
        return "red";
    }

    inline const char *toString(ApproachAxis axis)
    {
        return axis == ApproachAxis::NS ? "ns" : "ew";
    }

} // namespace gridflow
