#pragma once
#include "spritebake/core/Scene.hpp"

#include <array>
#include <vector>

namespace spritebake {

/**
 * Procedural host scene: a small articulated figure (torso, head, two arms,
 * two legs) built from boxes. Limbs swing around their joints with a sine
 * cycle, the whole figure can walk along +Y.
 *
 * Rendering is a flat-shaded rasterizer on top of OpenCV polygon fill:
 * back faces are culled, remaining faces are drawn far to near. The
 * background stays fully transparent (alpha 0), geometry is opaque.
 *
 * Everything is a pure function of the frame number, so renders are
 * deterministic.
 */
class SyntheticScene final : public IScene {
public:
    struct Options {
        int    cycleFrames = 24;     // frames per walk cycle
        double swingDeg    = 35.0;   // limb swing amplitude
        double walkSpeed   = 0.0;    // world units per frame along +Y
        double size        = 1.0;    // overall scale (figure is ~2*size tall)
        bool   empty       = false;  // no visible geometry at all
        int    startTime   = 1;      // initial scene time
    };

    SyntheticScene();
    explicit SyntheticScene(const Options& opt);

    // IAnimationSystem
    [[nodiscard]] int currentTime() const override { return time_; }
    void setTime(int frame) override { time_ = frame; }
    [[nodiscard]] std::optional<Aabb> getWorldBounds(int frame) override;

    // IRenderer
    [[nodiscard]] CameraState camera() const override { return camera_; }
    void setCamera(const CameraPose& pose, const Projection& projection) override;
    [[nodiscard]] RenderStatus render(std::uint32_t width, std::uint32_t height,
                                      FrameBuffer& out) override;

    [[nodiscard]] const Options& options() const noexcept { return opt_; }

private:
    struct Part {
        Vec3   pivot;      // joint in body space
        Vec3   offset;     // box center relative to pivot
        Vec3   half;       // half extents
        double phase;      // swing phase (radians)
        double swing;      // swing factor (0 = rigid)
        std::array<std::uint8_t, 3> rgb;
    };

    /* World-space corners of every part at 'frame'. */
    [[nodiscard]] std::vector<std::array<Vec3, 8>> pose(int frame) const;

    Options opt_;
    std::vector<Part> parts_;
    int time_{1};
    CameraState camera_{};
};

} // namespace spritebake
