#include "Geometry.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>

namespace gridflow
{
    double Vec3::length() const
    {
        return std::sqrt(x * x + y * y + z * z);
    }

    Vec3 Vec3::normalized() const
    {
        const double len = length();
        if (len <= 0.0)
        {
            return {};
        }
        return {x / len, y / len, z / len};
    }

    double angleBetween(const Vec3 &a, const Vec3 &b)
    {
        const double denominator = a.length() * b.length();
        if (denominator <= 0.0)
        {
            return 0.0;
        }
        const double cosine = std::max(-1.0, std::min(1.0, a.dot(b) / denominator));
        return std::acos(cosine);
    }

    LaneCurve::LaneCurve()
        : curve_shape(Shape::Line), total_length(0.0)
    {
    }

    LaneCurve::LaneCurve(Shape shape, const Vec3 &start, const Vec3 &control, const Vec3 &end)
        : curve_shape(shape), p0(start), p1(control), p2(end), total_length(0.0)
    {
        buildArcLengthTable();
    }

    LaneCurve LaneCurve::line(const Vec3 &start, const Vec3 &end)
    {
        return LaneCurve(Shape::Line, start, (start + end) * 0.5, end);
    }

    LaneCurve LaneCurve::quadraticBezier(const Vec3 &start, const Vec3 &control, const Vec3 &end)
    {
        return LaneCurve(Shape::QuadraticBezier, start, control, end);
    }

    Vec3 LaneCurve::evaluate(double s) const
    {
        if (curve_shape == Shape::Line)
        {
            return p0 + (p2 - p0) * s;
        }

        const double inv = 1.0 - s;
        return p0 * (inv * inv) + p1 * (2.0 * inv * s) + p2 * (s * s);
    }

    Vec3 LaneCurve::derivative(double s) const
    {
        if (curve_shape == Shape::Line)
        {
            return p2 - p0;
        }

        Vec3 d = (p1 - p0) * (2.0 * (1.0 - s)) + (p2 - p1) * (2.0 * s);
        if (d.length() <= 0.0)
        {
            // Control point coincides with an endpoint
            return p2 - p0;
        }
        return d;
    }

    void LaneCurve::buildArcLengthTable()
    {
        arc_lengths.assign(ARC_LENGTH_DIVISIONS + 1, 0.0);

        if (curve_shape == Shape::Line)
        {
            total_length = (p2 - p0).length();
            for (std::size_t i = 0; i <= ARC_LENGTH_DIVISIONS; ++i)
            {
                arc_lengths[i] = total_length * static_cast<double>(i) / ARC_LENGTH_DIVISIONS;
            }
            return;
        }

        Vec3 previous = evaluate(0.0);
        double accumulated = 0.0;
        for (std::size_t i = 1; i <= ARC_LENGTH_DIVISIONS; ++i)
        {
            Vec3 current = evaluate(static_cast<double>(i) / ARC_LENGTH_DIVISIONS);
            accumulated += (current - previous).length();
            arc_lengths[i] = accumulated;
            previous = current;
        }
        total_length = accumulated;
    }

    double LaneCurve::parameterForDistance(double distance) const
    {
        if (total_length <= 0.0 || distance <= 0.0)
        {
            return 0.0;
        }
        if (distance >= total_length)
        {
            return 1.0;
        }

        auto it = std::lower_bound(arc_lengths.begin(), arc_lengths.end(), distance);
        const std::size_t upper = static_cast<std::size_t>(std::distance(arc_lengths.begin(), it));
        if (upper == 0)
        {
            return 0.0;
        }

        const std::size_t lower = upper - 1;
        const double segment = arc_lengths[upper] - arc_lengths[lower];
        const double fraction = segment > 0.0 ? (distance - arc_lengths[lower]) / segment : 0.0;
        return (static_cast<double>(lower) + fraction) / ARC_LENGTH_DIVISIONS;
    }

    Vec3 LaneCurve::pointAt(double u) const
    {
        u = std::max(0.0, std::min(1.0, u));
        return evaluate(parameterForDistance(u * total_length));
    }

    Vec3 LaneCurve::tangentAt(double u) const
    {
        u = std::max(0.0, std::min(1.0, u));
        return derivative(parameterForDistance(u * total_length)).normalized();
    }

} // namespace gridflow
