#pragma once

#include <algorithm>
#include <array>
#include <cmath>
#include <cstdint>

namespace spritebake {

/* World-space vector / point (Z up, as in the host scene). */
struct Vec3 {
    double x{0.0}, y{0.0}, z{0.0};

    friend Vec3 operator+(const Vec3& a, const Vec3& b) { return {a.x + b.x, a.y + b.y, a.z + b.z}; }
    friend Vec3 operator-(const Vec3& a, const Vec3& b) { return {a.x - b.x, a.y - b.y, a.z - b.z}; }
    friend Vec3 operator*(const Vec3& a, double s)      { return {a.x * s, a.y * s, a.z * s}; }
    friend Vec3 operator-(const Vec3& a)                { return {-a.x, -a.y, -a.z}; }
    friend bool operator==(const Vec3&, const Vec3&) = default;
};

inline double dot(const Vec3& a, const Vec3& b) { return a.x * b.x + a.y * b.y + a.z * b.z; }

inline Vec3 cross(const Vec3& a, const Vec3& b) {
    return {a.y * b.z - a.z * b.y,
            a.z * b.x - a.x * b.z,
            a.x * b.y - a.y * b.x};
}

inline double length(const Vec3& v) { return std::sqrt(dot(v, v)); }

inline bool isFinite(const Vec3& v) {
    return std::isfinite(v.x) && std::isfinite(v.y) && std::isfinite(v.z);
}

/* Unit vector along v; v must be non-zero. */
inline Vec3 normalized(const Vec3& v) {
    const double len = length(v);
    return {v.x / len, v.y / len, v.z / len};
}

/* Axis-aligned bounding box in world space. */
struct Aabb {
    Vec3 min{};
    Vec3 max{};

    [[nodiscard]] Vec3 size() const { return max - min; }
    [[nodiscard]] Vec3 center() const { return (min + max) * 0.5; }

    [[nodiscard]] double volume() const {
        const Vec3 s = size();
        if (s.x <= 0.0 || s.y <= 0.0 || s.z <= 0.0) return 0.0;
        return s.x * s.y * s.z;
    }

    [[nodiscard]] bool valid() const {
        return isFinite(min) && isFinite(max) &&
               min.x <= max.x && min.y <= max.y && min.z <= max.z;
    }

    [[nodiscard]] std::array<Vec3, 8> corners() const {
        return {Vec3{min.x, min.y, min.z}, Vec3{max.x, min.y, min.z},
                Vec3{min.x, max.y, min.z}, Vec3{max.x, max.y, min.z},
                Vec3{min.x, min.y, max.z}, Vec3{max.x, min.y, max.z},
                Vec3{min.x, max.y, max.z}, Vec3{max.x, max.y, max.z}};
    }

    friend bool operator==(const Aabb&, const Aabb&) = default;
};

/* Smallest box containing both a and b (component-wise min/max). */
inline Aabb unite(const Aabb& a, const Aabb& b) {
    return Aabb{
        Vec3{std::min(a.min.x, b.min.x), std::min(a.min.y, b.min.y), std::min(a.min.z, b.min.z)},
        Vec3{std::max(a.max.x, b.max.x), std::max(a.max.y, b.max.y), std::max(a.max.z, b.max.z)}};
}

/* Camera placement: position plus an orthonormal basis.
   'forward' points from the camera towards the subject. */
struct CameraPose {
    Vec3 position{};
    Vec3 right{1.0, 0.0, 0.0};
    Vec3 up{0.0, 0.0, 1.0};
    Vec3 forward{0.0, 1.0, 0.0};

    friend bool operator==(const CameraPose&, const CameraPose&) = default;
};

enum class ProjectionType : std::uint8_t {
    Orthographic = 0,
    Perspective  = 1
};

/* Camera lens. For orthographic, 'scale' is the world span covered by the
   image width. For perspective, 'fovYDeg' is the vertical field of view.
   Pixels are square in both cases. */
struct Projection {
    ProjectionType type{ProjectionType::Orthographic};
    double scale{1.0};
    double fovYDeg{40.0};
    double clipStart{0.01};
    double clipEnd{1000.0};

    friend bool operator==(const Projection&, const Projection&) = default;
};

/* Full camera state as stored by a renderer. */
struct CameraState {
    CameraPose pose{};
    Projection projection{};

    friend bool operator==(const CameraState&, const CameraState&) = default;
};

} // namespace spritebake
