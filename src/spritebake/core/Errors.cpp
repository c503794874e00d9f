#include "spritebake/core/Errors.hpp"

namespace spritebake {

const char* toString(ErrorCode c) noexcept {
    switch (c) {
        case ErrorCode::NoAnimationData:    return "NoAnimationData";
        case ErrorCode::DegenerateBounds:   return "DegenerateBounds";
        case ErrorCode::InvalidCameraAngle: return "InvalidCameraAngle";
        case ErrorCode::InvalidPadding:     return "InvalidPadding";
        case ErrorCode::RenderFailed:       return "RenderFailed";
        case ErrorCode::StorageExhausted:   return "StorageExhausted";
        case ErrorCode::GridTooSmall:       return "GridTooSmall";
        case ErrorCode::EncodeFailed:       return "EncodeFailed";
        case ErrorCode::JobAlreadyRunning:  return "JobAlreadyRunning";
        case ErrorCode::Cancelled:          return "Cancelled";
        case ErrorCode::InvalidFrameSize:   return "InvalidFrameSize";
        case ErrorCode::InvalidFrameRange:  return "InvalidFrameRange";
        case ErrorCode::Internal:           return "Internal";
    }
    return "Unknown";
}

ExportError::ExportError(ErrorCode code, const std::string& detail)
    : std::runtime_error(std::string(toString(code)) + ": " + detail)
    , code_{code} {}

ExportError ExportError::renderFailed(int frameIndex, const std::string& detail) {
    ExportError e(ErrorCode::RenderFailed,
                  "frame " + std::to_string(frameIndex) + ": " + detail);
    e.frameIndex_ = frameIndex;
    return e;
}

ExportError ExportError::encodeFailed(OutputFormat format, const std::string& detail) {
    ExportError e(ErrorCode::EncodeFailed, std::string(toString(format)) + ": " + detail);
    e.format_ = format;
    return e;
}

bool ExportError::isValidationError() const noexcept {
    switch (code_) {
        case ErrorCode::InvalidCameraAngle:
        case ErrorCode::InvalidPadding:
        case ErrorCode::GridTooSmall:
        case ErrorCode::InvalidFrameSize:
        case ErrorCode::InvalidFrameRange:
            return true;
        default:
            return false;
    }
}

} // namespace spritebake
