#include "spritebake/io/ImageEncoder.hpp"
#include "spritebake/core/Errors.hpp"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <string>

namespace spritebake {

std::vector<std::uint8_t> encodeImage(const cv::Mat& rgba,
                                      OutputFormat format,
                                      const EncodeOptions& opt)
{
    if (rgba.empty() || rgba.type() != CV_8UC4) {
        throw ExportError::encodeFailed(format,
            "expected 8-bit RGBA input, got " + std::to_string(rgba.channels()) + " channel(s)");
    }

    // OpenCV codecs expect BGRA
    cv::Mat bgra;
    cv::cvtColor(rgba, bgra, cv::COLOR_RGBA2BGRA);

    std::vector<int> params;
    std::string ext;
    if (format == OutputFormat::PNG) {
        ext = ".png";
        params = {cv::IMWRITE_PNG_COMPRESSION, std::clamp(opt.pngCompression, 0, 9)};
    } else {
        ext = ".webp";
        params = {cv::IMWRITE_WEBP_QUALITY, std::clamp(opt.webpQuality, 1, 101)};
    }

    std::vector<std::uint8_t> out;
    bool ok = false;
    try {
        ok = cv::imencode(ext, bgra, out, params);
    } catch (const cv::Exception& e) {
        throw ExportError::encodeFailed(format, e.what());
    }
    if (!ok || out.empty()) {
        throw ExportError::encodeFailed(format, "encoder returned no data");
    }
    return out;
}

} // namespace spritebake
