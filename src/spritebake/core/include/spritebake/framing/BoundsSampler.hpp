#pragma once

#include "spritebake/core/Geometry.hpp"
#include "spritebake/core/Scene.hpp"

#include <vector>

namespace spritebake {

/** Subject bounds at one animation frame. */
struct TimeSample {
    int  frame{0};
    Aabb bounds{};
};

/**
 * Restores the scene time on scope exit (success or exception).
 */
class ScopedSceneTime {
public:
    explicit ScopedSceneTime(IAnimationSystem& anim);
    ~ScopedSceneTime();

    ScopedSceneTime(const ScopedSceneTime&)            = delete;
    ScopedSceneTime& operator=(const ScopedSceneTime&) = delete;

private:
    IAnimationSystem& anim_;
    int saved_;
};

/**
 * Sample world bounds for frames start, start+stride, ... and always 'end'.
 * Fails with NoAnimationData if a sample has no bounds or zero-volume bounds.
 * stride < 1 is treated as 1. Scene time is restored before returning.
 */
std::vector<TimeSample> sampleBounds(IAnimationSystem& anim,
                                     int start, int end,
                                     int stride = 1);

} // namespace spritebake
