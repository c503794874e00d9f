#pragma once

#include "spritebake/capture/CaptureDriver.hpp"
#include "spritebake/compose/GridLayout.hpp"
#include "spritebake/core/Config.hpp"
#include "spritebake/core/Errors.hpp"
#include "spritebake/core/Scene.hpp"

#include <atomic>
#include <filesystem>
#include <optional>
#include <vector>

namespace spritebake {

/// Terminal outcome of one export: outputs on success, a tagged error otherwise.
struct ExportResult {
    bool ok{false};
    std::vector<std::filesystem::path> outputs;   // sheet or frame files
    std::optional<std::filesystem::path> manifest;
    GridLayout layout{};
    int frameCount{0};
    std::optional<ExportError> error;
};

/// Check a job without touching any scene. Throws the matching validation
/// error (InvalidFrameSize, InvalidFrameRange, InvalidPadding,
/// InvalidCameraAngle, GridTooSmall).
void validateJob(const ExportJob& job);

/*
  Export pipeline for one host scene.

  run() executes Sampler -> Planner -> Grid -> Capture -> Compose/Encode and
  owns every resource of the job:
    - scene time and camera are restored to their pre-job values;
    - temporary frames are removed on success, failure and cancellation;
    - output files of a failed job are removed.
  Only one job may run per exporter (= per scene) at a time.
*/
class Exporter {
public:
    Exporter(IAnimationSystem& anim, IRenderer& renderer, PipelineConfig cfg = {});

    /// Never throws; every failure is reported in the result.
    ExportResult run(const ExportJob& job, const CancelToken* cancel = nullptr);

    [[nodiscard]] bool busy() const noexcept { return busy_.load(); }
    [[nodiscard]] const PipelineConfig& config() const noexcept { return cfg_; }

    Exporter(const Exporter&)            = delete;
    Exporter& operator=(const Exporter&) = delete;

private:
    ExportResult runLocked(const ExportJob& job, const CancelToken* cancel);

    IAnimationSystem& anim_;
    IRenderer&        renderer_;
    PipelineConfig    cfg_;
    std::atomic<bool> busy_{false};
};

} // namespace spritebake
