#include "spritebake/framing/CameraPlanner.hpp"
#include "spritebake/core/Errors.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numbers>
#include <string>

namespace spritebake {

/*
  Camera framing.

  Method:
    1) Union box of every sampled box: one framing box for the whole
       animation, so the camera never moves between frames.
    2) Offset direction from a fixed table (or the custom vector); the camera
       looks at the union center, world +Z is up.
    3) Project the 8 corners of the union box on the camera right/up axes;
       the larger span is the extent that must fit the shorter image side.
    4) Orthographic: scale = extent * (1 + padding), expressed across the
       image width. Perspective: distance chosen so the padded extent fits
       the shorter side at the nearest depth of the box.
*/

namespace {

constexpr double kDirEps = 1e-12;
constexpr double kDistanceFactor = 2.5;

struct Basis { Vec3 right, up, forward; };

Basis lookBasis(const Vec3& offsetDir) {
    const Vec3 forward = -offsetDir;
    Vec3 worldUp{0.0, 0.0, 1.0};
    if (length(cross(forward, worldUp)) < 1e-9) worldUp = Vec3{0.0, 1.0, 0.0};
    const Vec3 right = normalized(cross(forward, worldUp));
    const Vec3 up    = cross(right, forward);
    return {right, up, forward};
}

} // namespace

Aabb unionBounds(const std::vector<TimeSample>& samples) {
    if (samples.empty()) {
        throw ExportError(ErrorCode::NoAnimationData, "no bounds samples");
    }
    Aabb u = samples.front().bounds;
    for (const auto& s : samples) u = unite(u, s.bounds);
    return u;
}

Vec3 viewDirection(CameraAngle angle, const Vec3& custom) {
    switch (angle) {
        case CameraAngle::Front:     return Vec3{0.0, -1.0, 0.0};
        case CameraAngle::Isometric: return normalized(Vec3{1.0, -1.0, 1.0});
        case CameraAngle::Side:      return Vec3{1.0, 0.0, 0.0};
        case CameraAngle::Custom:
            if (!isFinite(custom) || length(custom) < kDirEps) {
                throw ExportError(ErrorCode::InvalidCameraAngle,
                                  "custom view direction must be a non-zero vector");
            }
            return normalized(custom);
    }
    throw ExportError(ErrorCode::InvalidCameraAngle, "unknown camera angle");
}

CameraPlan planCamera(const std::vector<TimeSample>& samples,
                      const CameraRequest& request,
                      std::uint32_t frameWidth,
                      std::uint32_t frameHeight)
{
    // NaN fails both comparisons, so it is rejected too
    if (!(request.padding >= 0.0 && request.padding <= 1.0)) {
        throw ExportError(ErrorCode::InvalidPadding,
                          "padding " + std::to_string(request.padding) + " outside [0,1]");
    }
    const Vec3 dir = viewDirection(request.angle, request.customDirection);
    if (frameWidth == 0 || frameHeight == 0) {
        throw ExportError(ErrorCode::InvalidFrameSize, "frame size must be non-zero");
    }

    const Aabb box = unionBounds(samples);
    if (!box.valid() || box.volume() <= 0.0) {
        throw ExportError(ErrorCode::DegenerateBounds, "union bounding box has zero volume");
    }

    const Vec3 center = box.center();
    const Basis b = lookBasis(dir);

    double minR =  std::numeric_limits<double>::infinity(), maxR = -minR;
    double minU =  minR, maxU = -minR;
    double halfDepth = 0.0;
    for (const Vec3& c : box.corners()) {
        const Vec3 d = c - center;
        minR = std::min(minR, dot(d, b.right));
        maxR = std::max(maxR, dot(d, b.right));
        minU = std::min(minU, dot(d, b.up));
        maxU = std::max(maxU, dot(d, b.up));
        halfDepth = std::max(halfDepth, std::abs(dot(d, b.forward)));
    }
    const double extent = std::max(maxR - minR, maxU - minU);
    const double framed = extent * (1.0 + request.padding);
    const double diag   = length(box.size());

    // framed extent covers the shorter side; the longer side sees more
    const double w = frameWidth, h = frameHeight;
    const double shortSide = std::min(w, h);

    CameraPlan plan{};
    plan.angle      = request.angle;
    plan.padding    = request.padding;
    plan.mirror     = request.mirror;
    plan.framingBox = box;
    plan.extent     = extent;

    double distance = kDistanceFactor * diag;
    Projection proj{};
    proj.type = request.projection;

    if (request.projection == ProjectionType::Orthographic) {
        proj.scale   = framed * (w / shortSide);
        proj.fovYDeg = 0.0;
    } else {
        const double fovShort = std::clamp(request.fovYDeg, 1.0, 170.0) * std::numbers::pi / 180.0;
        const double tanHalfShort = std::tan(fovShort * 0.5);
        distance = (framed * 0.5) / tanHalfShort + halfDepth;

        // vertical fov from the fov across the shorter side
        const double tanHalfY = tanHalfShort * (h / shortSide);
        proj.fovYDeg = 2.0 * std::atan(tanHalfY) * 180.0 / std::numbers::pi;
        proj.scale   = framed;
    }
    proj.clipStart = std::max(distance * 1e-3, distance - diag);
    proj.clipEnd   = distance + diag;

    plan.pose.position = center + dir * distance;
    plan.pose.right    = b.right;
    plan.pose.up       = b.up;
    plan.pose.forward  = b.forward;
    plan.projection    = proj;
    return plan;
}

} // namespace spritebake
