#include "spritebake/framing/BoundsSampler.hpp"
#include "spritebake/core/Errors.hpp"

#include <algorithm>
#include <iostream>
#include <string>

namespace spritebake {

ScopedSceneTime::ScopedSceneTime(IAnimationSystem& anim)
    : anim_{anim}, saved_{anim.currentTime()} {}

ScopedSceneTime::~ScopedSceneTime() {
    try {
        anim_.setTime(saved_);
    } catch (const std::exception& e) {
        std::cerr << "[sampler] failed to restore scene time " << saved_
                  << ": " << e.what() << "\n";
    }
}

std::vector<TimeSample> sampleBounds(IAnimationSystem& anim, int start, int end, int stride)
{
    if (end < start) {
        throw ExportError(ErrorCode::InvalidFrameRange,
                          "range [" + std::to_string(start) + "," + std::to_string(end) + "]");
    }
    stride = std::max(1, stride);

    ScopedSceneTime restore(anim);

    const long long span = static_cast<long long>(end) - start;
    std::vector<TimeSample> out;
    out.reserve(static_cast<std::size_t>(std::min(span / stride + 2, 1LL << 16)));

    // 64-bit cursor: start + k*stride may pass INT_MAX before reaching end
    for (long long t = start; ; t += stride) {
        // the last sample is always the range end, even if stride skips it
        const int f = t > end ? end : static_cast<int>(t);

        anim.setTime(f);
        const auto box = anim.getWorldBounds(f);
        if (!box || !box->valid() || box->volume() <= 0.0) {
            throw ExportError(ErrorCode::NoAnimationData,
                              "no animated geometry at frame " + std::to_string(f));
        }
        out.push_back(TimeSample{f, *box});

        if (f == end) break;
    }
    return out;
}

} // namespace spritebake
