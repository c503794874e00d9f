#pragma once

#include "spritebake/core/Config.hpp"
#include "spritebake/core/Geometry.hpp"
#include "spritebake/framing/BoundsSampler.hpp"

#include <cstdint>
#include <vector>

namespace spritebake {

/** What the caller wants from the framing. */
struct CameraRequest {
    CameraAngle    angle{CameraAngle::Side};
    Vec3           customDirection{};     // only for Custom
    double         padding{0.2};          // 0..1
    bool           mirror{false};
    ProjectionType projection{ProjectionType::Orthographic};
    double         fovYDeg{40.0};         // perspective only
};

/** Fixed camera for a whole export job. */
struct CameraPlan {
    CameraAngle angle{CameraAngle::Side};
    CameraPose  pose{};
    Projection  projection{};
    double      padding{0.0};
    bool        mirror{false};            // applied at composition, not here

    Aabb   framingBox{};                  // union of all sampled boxes
    double extent{0.0};                   // largest span on the view plane (unpadded)

    friend bool operator==(const CameraPlan&, const CameraPlan&) = default;
};

/** Union of all sample boxes. Requires a non-empty sequence. */
Aabb unionBounds(const std::vector<TimeSample>& samples);

/** Unit offset direction (subject -> camera) for an angle.
 *  Throws InvalidCameraAngle for a zero / non-finite custom vector. */
Vec3 viewDirection(CameraAngle angle, const Vec3& custom = {});

/**
 * Compute one stable camera for all frames.
 *
 * Errors:
 *   - NoAnimationData    : samples is empty
 *   - InvalidPadding     : padding outside [0,1]
 *   - InvalidCameraAngle : custom direction is zero
 *   - DegenerateBounds   : union box has zero volume
 *
 * Pure: the same input always yields the same plan.
 */
CameraPlan planCamera(const std::vector<TimeSample>& samples,
                      const CameraRequest& request,
                      std::uint32_t frameWidth,
                      std::uint32_t frameHeight);

} // namespace spritebake
