#include "spritebake/core/Exporter.hpp"
#include "spritebake/compose/SheetComposer.hpp"
#include "spritebake/framing/BoundsSampler.hpp"
#include "spritebake/framing/CameraPlanner.hpp"
#include "spritebake/io/FrameStore.hpp"
#include "spritebake/io/ImageEncoder.hpp"
#include "spritebake/io/Manifest.hpp"
#include "spritebake/io/OutputWriter.hpp"

#include <algorithm>
#include <iostream>
#include <limits>
#include <string>

namespace spritebake {

namespace {

/* Records scene time and camera, puts them back on scope exit. */
class SceneStateGuard {
public:
    SceneStateGuard(IAnimationSystem& anim, IRenderer& renderer)
        : anim_(anim), renderer_(renderer)
        , time_(anim.currentTime()), camera_(renderer.camera()) {}

    ~SceneStateGuard() {
        try {
            renderer_.setCamera(camera_.pose, camera_.projection);
            anim_.setTime(time_);
        } catch (const std::exception& e) {
            std::cerr << "[export] failed to restore scene state: " << e.what() << "\n";
        }
    }

    SceneStateGuard(const SceneStateGuard&)            = delete;
    SceneStateGuard& operator=(const SceneStateGuard&) = delete;

private:
    IAnimationSystem& anim_;
    IRenderer&        renderer_;
    int               time_;
    CameraState       camera_;
};

/* Removes the job's temporary frames on scope exit. Never throws. */
class TempAreaGuard {
public:
    TempAreaGuard(FrameStore& store, bool log) : store_(store), log_(log) {}
    ~TempAreaGuard() {
        const std::size_t n = store_.count();
        const int failures = store_.removeAll();
        if (log_) {
            std::cout << "[cleanup] removed " << n << " temporary frame(s)"
                      << (failures ? " with " + std::to_string(failures) + " error(s)" : std::string{})
                      << "\n";
        }
    }

    TempAreaGuard(const TempAreaGuard&)            = delete;
    TempAreaGuard& operator=(const TempAreaGuard&) = delete;

private:
    FrameStore& store_;
    bool log_;
};

void checkCancel(const CancelToken* cancel, const char* where) {
    if (cancel && cancel->load()) {
        throw ExportError(ErrorCode::Cancelled, std::string("cancelled during ") + where);
    }
}

} // namespace

void validateJob(const ExportJob& job) {
    auto sideOk = [](std::uint32_t s){ return s >= kMinFrameSide && s <= kMaxFrameSide; };
    if (!sideOk(job.frameWidth) || !sideOk(job.frameHeight)) {
        throw ExportError(ErrorCode::InvalidFrameSize,
                          std::to_string(job.frameWidth) + "x" + std::to_string(job.frameHeight) +
                          " outside " + std::to_string(kMinFrameSide) + ".." + std::to_string(kMaxFrameSide));
    }
    if (job.frameEnd < job.frameStart) {
        throw ExportError(ErrorCode::InvalidFrameRange,
                          "range [" + std::to_string(job.frameStart) + "," +
                          std::to_string(job.frameEnd) + "] is empty");
    }
    if (job.frameStep < 1) {
        throw ExportError(ErrorCode::InvalidFrameRange,
                          "frame step " + std::to_string(job.frameStep) + " < 1");
    }
    if (job.frameSpanCount() > std::numeric_limits<int>::max()) {
        throw ExportError(ErrorCode::InvalidFrameRange,
                          "range [" + std::to_string(job.frameStart) + "," +
                          std::to_string(job.frameEnd) + "] holds " +
                          std::to_string(job.frameSpanCount()) + " frames");
    }
    if (!(job.padding >= 0.0 && job.padding <= 1.0)) {
        throw ExportError(ErrorCode::InvalidPadding,
                          "padding " + std::to_string(job.padding) + " outside [0,1]");
    }
    (void)viewDirection(job.angle, job.customDirection);
    (void)solveGrid(job.frameCount(), job.manualGrid, job.frameWidth, job.frameHeight);
}

Exporter::Exporter(IAnimationSystem& anim, IRenderer& renderer, PipelineConfig cfg)
    : anim_(anim), renderer_(renderer), cfg_(std::move(cfg)) {}

ExportResult Exporter::run(const ExportJob& job, const CancelToken* cancel)
{
    bool expected = false;
    if (!busy_.compare_exchange_strong(expected, true)) {
        ExportResult r;
        r.error = ExportError(ErrorCode::JobAlreadyRunning, "an export is already running on this scene");
        return r;
    }
    struct Release {
        std::atomic<bool>& flag;
        ~Release() { flag.store(false); }
    } release{busy_};

    // guards inside runLocked() have already cleaned up when we get here
    try {
        return runLocked(job, cancel);
    } catch (const ExportError& e) {
        std::cerr << "[export] " << job.name << " failed: " << e.what() << "\n";
        ExportResult r;
        r.error = e;
        return r;
    } catch (const std::exception& e) {
        std::cerr << "[export] " << job.name << " failed: " << e.what() << "\n";
        ExportResult r;
        r.error = ExportError(ErrorCode::Internal, e.what());
        return r;
    }
}

ExportResult Exporter::runLocked(const ExportJob& job, const CancelToken* cancel)
{
    validateJob(job);

    const int n = job.frameCount();
    if (cfg_.log) {
        std::cout << "[export] " << job.name << ": frames " << job.frameStart << ".." << job.frameEnd
                  << " step " << job.frameStep << " (" << n << "), " << job.frameWidth << "x" << job.frameHeight
                  << ", angle=" << toString(job.angle) << ", padding=" << job.padding
                  << ", mirror=" << (job.mirror ? "on" : "off")
                  << ", " << toString(job.mode) << "/" << toString(job.format) << "\n";
    }

    SceneStateGuard sceneGuard(anim_, renderer_);

    // 1) framing
    // sample the captured frames only; a coarser stride skips some of them
    const long long stride = std::max(1LL, static_cast<long long>(job.samplingStride) * job.frameStep);
    const auto samples = sampleBounds(anim_, job.frameStart, job.frameTime(n - 1),
                                      static_cast<int>(std::min<long long>(stride, std::numeric_limits<int>::max())));

    CameraRequest req{};
    req.angle           = job.angle;
    req.customDirection = job.customDirection;
    req.padding         = job.padding;
    req.mirror          = job.mirror;
    req.projection      = job.projection;
    req.fovYDeg         = cfg_.perspectiveFovDeg;
    const CameraPlan plan = planCamera(samples, req, job.frameWidth, job.frameHeight);

    if (cfg_.log) {
        const Vec3 c = plan.framingBox.center();
        std::cout << "[planner] " << samples.size() << " sample(s), center=("
                  << c.x << ", " << c.y << ", " << c.z << "), extent=" << plan.extent
                  << ", scale=" << plan.projection.scale << "\n";
    }

    // 2) grid
    const GridLayout layout = solveGrid(n, job.manualGrid, job.frameWidth, job.frameHeight);

    // 3) capture into private temporary storage
    FrameStore store(cfg_.tempRoot, makeJobId(), cfg_.tempBudgetBytes);
    TempAreaGuard cleanup(store, cfg_.log);

    CaptureDriver driver(anim_, renderer_, store, plan, job);
    const int logEvery = std::max(1, n / 10);
    driver.run(cancel, [&](int done, int total) {
        if (cfg_.log && (done % logEvery == 0 || done == total)) {
            std::cout << "[capture] " << done << "/" << total << "\n";
        }
    });

    // 4) compose / encode / write
    OutputSet outputs(job.outputDir);
    const EncodeOptions eo{cfg_.pngCompression, cfg_.webpQuality};

    if (job.mode == OutputMode::Sheet) {
        SheetComposer sc(layout, job.mirror);
        for (int i = 0; i < n; ++i) {
            checkCancel(cancel, "composition");
            const FrameBuffer fb = store.load(i);
            sc.place(fb.view());
        }
        const auto bytes = encodeImage(sc.canvas(), job.format, eo);
        outputs.write(sheetFileName(job.name, job.format), bytes);
        if (cfg_.log) {
            std::cout << "[compose] sheet " << layout.cols << "x" << layout.rows
                      << " (" << layout.sheetWidth() << "x" << layout.sheetHeight() << " px)\n";
        }
    } else {
        for (int i = 0; i < n; ++i) {
            checkCancel(cancel, "frame output");
            const FrameBuffer fb = store.load(i);
            const cv::Mat img = job.mirror ? mirroredCopy(fb.view()) : asRgbaMat(fb.view());
            outputs.write(frameFileName(job.name, i, n - 1, job.format), encodeImage(img, job.format, eo));
        }
    }

    ExportResult result;
    result.outputs    = outputs.files();
    result.layout     = layout;
    result.frameCount = n;

    if (job.writeManifest) {
        std::vector<Artifact> artifacts;
        const char* kind = job.mode == OutputMode::Sheet ? "sheet" : "frame";
        for (const auto& p : result.outputs) artifacts.push_back(describeFile(p, kind));
        const std::string json = buildManifestJson(job, layout, n, artifacts);
        result.manifest = outputs.write(sanitizeName(job.name) + "_manifest.json",
                                        std::vector<std::uint8_t>(json.begin(), json.end()));
    }

    outputs.commit();
    result.ok = true;

    if (cfg_.log) {
        std::cout << "[export] " << job.name << ": wrote " << result.outputs.size() << " file(s) to "
                  << job.outputDir.string() << "\n";
    }
    return result;
}

} // namespace spritebake
