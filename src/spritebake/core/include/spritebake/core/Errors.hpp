#pragma once

#include "Config.hpp"

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace spritebake {

/* Failure taxonomy of an export job. */
enum class ErrorCode : std::uint8_t {
    NoAnimationData = 0,
    DegenerateBounds,
    InvalidCameraAngle,
    InvalidPadding,
    RenderFailed,
    StorageExhausted,
    GridTooSmall,
    EncodeFailed,
    JobAlreadyRunning,
    Cancelled,
    InvalidFrameSize,
    InvalidFrameRange,
    Internal
};

const char* toString(ErrorCode c) noexcept;

/*
  Tagged pipeline error.
    - RenderFailed carries the frame index (position in the export range).
    - EncodeFailed carries the target format.
*/
class ExportError : public std::runtime_error {
public:
    ExportError(ErrorCode code, const std::string& detail);

    static ExportError renderFailed(int frameIndex, const std::string& detail);
    static ExportError encodeFailed(OutputFormat format, const std::string& detail);

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }
    [[nodiscard]] std::optional<int> frameIndex() const noexcept { return frameIndex_; }
    [[nodiscard]] std::optional<OutputFormat> format() const noexcept { return format_; }

    /* Validation errors are raised before the scene is touched. */
    [[nodiscard]] bool isValidationError() const noexcept;

private:
    ErrorCode code_;
    std::optional<int> frameIndex_;
    std::optional<OutputFormat> format_;
};

} // namespace spritebake
