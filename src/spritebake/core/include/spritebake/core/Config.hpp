#pragma once

#include "Geometry.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace spritebake {

/* Fixed camera placements plus a caller-supplied direction. */
enum class CameraAngle : std::uint8_t {
    Front = 0,
    Isometric,
    Side,
    Custom
};

enum class OutputFormat : std::uint8_t {
    PNG = 0,
    WEBP
};

enum class OutputMode : std::uint8_t {
    Sheet = 0,   // one packed image
    Frames       // one file per frame
};

/* Manual grid override (rows x cols). */
struct GridOverride {
    int rows{1};
    int cols{1};
};

inline constexpr std::uint32_t kMinFrameSide = 64;
inline constexpr std::uint32_t kMaxFrameSide = 2048;

/* One user-triggered export. Immutable for the duration of the job. */
struct ExportJob {
    std::string name{"animation"};          // base name of the output files
    std::filesystem::path outputDir{"."};

    std::uint32_t frameWidth{512};          // 64..2048
    std::uint32_t frameHeight{512};         // 64..2048
    int frameStart{1};                      // inclusive
    int frameEnd{1};                        // inclusive
    int frameStep{1};                       // capture every frameStep-th frame

    CameraAngle angle{CameraAngle::Side};
    Vec3 customDirection{};                 // used when angle == Custom
    ProjectionType projection{ProjectionType::Orthographic};
    double padding{0.2};                    // fraction 0..1
    bool mirror{false};                     // horizontal flip at composition

    OutputFormat format{OutputFormat::PNG};
    OutputMode mode{OutputMode::Sheet};
    std::optional<GridOverride> manualGrid{}; // empty = auto layout

    int samplingStride{1};                  // bounds sampling step (frames)
    bool writeManifest{false};

    /* Frames captured: frameStart, frameStart + frameStep, ... up to frameEnd.
       0 for an empty range or a step < 1. Only meaningful once
       frameSpanCount() fits in an int (validateJob checks this). */
    [[nodiscard]] long long frameSpanCount() const noexcept {
        const long long span = static_cast<long long>(frameEnd) - frameStart;
        if (span < 0 || frameStep < 1) return 0;
        return span / frameStep + 1;
    }
    [[nodiscard]] int frameCount() const noexcept { return static_cast<int>(frameSpanCount()); }

    /* Animation time of captured frame i. */
    [[nodiscard]] int frameTime(int i) const noexcept {
        return static_cast<int>(frameStart + static_cast<long long>(i) * frameStep);
    }
};

/* Process-level knobs shared by all jobs of one exporter. */
struct PipelineConfig {
    std::filesystem::path tempRoot{std::filesystem::temp_directory_path()};
    std::uintmax_t tempBudgetBytes{std::uintmax_t{4} << 30}; // 4 GiB of raw frames

    int pngCompression{3};         // zlib level 0..9
    int webpQuality{101};          // >100 selects lossless WEBP
    double perspectiveFovDeg{40.0};

    bool log{true};                // tag-prefixed progress lines on stdout
};

/* Lower-case names used by the CLI, YAML files and logs. */
const char* toString(CameraAngle a) noexcept;
const char* toString(OutputFormat f) noexcept;
const char* toString(OutputMode m) noexcept;
const char* toString(ProjectionType p) noexcept;

/* File extension without the dot ("png", "webp"). */
const char* extensionOf(OutputFormat f) noexcept;

std::optional<CameraAngle>    parseCameraAngle(const std::string& s);
std::optional<OutputFormat>   parseOutputFormat(const std::string& s);
std::optional<OutputMode>     parseOutputMode(const std::string& s);
std::optional<ProjectionType> parseProjectionType(const std::string& s);

} // namespace spritebake
