#pragma once

#include <cstddef>
#include <vector>

namespace gridflow
{
    struct Vec3
    {
        double x = 0.0;
        double y = 0.0;
        double z = 0.0;

        Vec3 operator+(const Vec3 &other) const { return {x + other.x, y + other.y, z + other.z}; }
        Vec3 operator-(const Vec3 &other) const { return {x - other.x, y - other.y, z - other.z}; }
        Vec3 operator*(double scale) const { return {x * scale, y * scale, z * scale}; }

        double dot(const Vec3 &other) const { return x * other.x + y * other.y + z * other.z; }
        double length() const;
        Vec3 normalized() const;
    };

    // Angle in radians between two directions, in [0, pi]
    double angleBetween(const Vec3 &a, const Vec3 &b);

    // Lane geometry. Positions passed to pointAt/tangentAt are normalised by arc
    // length, so u = 0.5 is halfway along the lane regardless of curvature.
    class LaneCurve
    {
    public:
        enum class Shape
        {
            Line,
            QuadraticBezier
        };

        static constexpr std::size_t ARC_LENGTH_DIVISIONS = 200;

        LaneCurve();

        static LaneCurve line(const Vec3 &start, const Vec3 &end);
        static LaneCurve quadraticBezier(const Vec3 &start, const Vec3 &control, const Vec3 &end);

        Shape shape() const { return curve_shape; }
        double length() const { return total_length; }

        Vec3 startPoint() const { return p0; }
        Vec3 endPoint() const { return p2; }
        Vec3 controlPoint() const { return p1; }

        Vec3 pointAt(double u) const;
        Vec3 tangentAt(double u) const;
        Vec3 startTangent() const { return tangentAt(0.0); }
        Vec3 endTangent() const { return tangentAt(1.0); }

    private:
        LaneCurve(Shape shape, const Vec3 &start, const Vec3 &control, const Vec3 &end);

        Vec3 evaluate(double s) const;
        Vec3 derivative(double s) const;
        double parameterForDistance(double distance) const;
        void buildArcLengthTable();

        Shape curve_shape;
        Vec3 p0;
        Vec3 p1;
        Vec3 p2;
        std::vector<double> arc_lengths; // cumulative length at s = i / ARC_LENGTH_DIVISIONS
        double total_length;
    };

} // namespace gridflow
