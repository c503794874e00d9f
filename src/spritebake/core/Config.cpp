#include "spritebake/core/Config.hpp"

#include <algorithm>
#include <cctype>

namespace spritebake {

namespace {
std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return s;
}
} // namespace

const char* toString(CameraAngle a) noexcept {
    switch (a) {
        case CameraAngle::Front:     return "front";
        case CameraAngle::Isometric: return "isometric";
        case CameraAngle::Side:      return "side";
        case CameraAngle::Custom:    return "custom";
    }
    return "?";
}

const char* toString(OutputFormat f) noexcept {
    return f == OutputFormat::WEBP ? "WEBP" : "PNG";
}

const char* toString(OutputMode m) noexcept {
    return m == OutputMode::Frames ? "frames" : "sheet";
}

const char* toString(ProjectionType p) noexcept {
    return p == ProjectionType::Perspective ? "perspective" : "orthographic";
}

const char* extensionOf(OutputFormat f) noexcept {
    return f == OutputFormat::WEBP ? "webp" : "png";
}

std::optional<CameraAngle> parseCameraAngle(const std::string& s) {
    const std::string v = lower(s);
    if (v == "front")                  return CameraAngle::Front;
    if (v == "isometric" || v == "iso") return CameraAngle::Isometric;
    if (v == "side")                   return CameraAngle::Side;
    if (v == "custom")                 return CameraAngle::Custom;
    return std::nullopt;
}

std::optional<OutputFormat> parseOutputFormat(const std::string& s) {
    const std::string v = lower(s);
    if (v == "png")  return OutputFormat::PNG;
    if (v == "webp") return OutputFormat::WEBP;
    return std::nullopt;
}

std::optional<OutputMode> parseOutputMode(const std::string& s) {
    const std::string v = lower(s);
    if (v == "sheet" || v == "spritesheet") return OutputMode::Sheet;
    if (v == "frames")                      return OutputMode::Frames;
    return std::nullopt;
}

std::optional<ProjectionType> parseProjectionType(const std::string& s) {
    const std::string v = lower(s);
    if (v == "ortho" || v == "orthographic") return ProjectionType::Orthographic;
    if (v == "persp" || v == "perspective")  return ProjectionType::Perspective;
    return std::nullopt;
}

} // namespace spritebake
