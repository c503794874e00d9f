#pragma once

#include "spritebake/core/Config.hpp"

#include <opencv2/core.hpp>
#include <cstdint>
#include <vector>

namespace spritebake {

struct EncodeOptions {
    int pngCompression{3};   // zlib level 0..9 (lossless at any level)
    int webpQuality{101};    // 1..100 lossy, >100 lossless
};

/**
 * Encode an RGBA image (CV_8UC4, R first) to PNG or WEBP bytes.
 * Alpha is kept as-is, no premultiplication.
 * Throws EncodeFailed(format) for non-RGBA input or encoder failure.
 */
std::vector<std::uint8_t> encodeImage(const cv::Mat& rgba,
                                      OutputFormat format,
                                      const EncodeOptions& opt = {});

} // namespace spritebake
