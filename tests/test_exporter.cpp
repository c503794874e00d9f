#include "spritebake/core/Exporter.hpp"
#include "FakeScene.hpp"
#include "TempDir.hpp"

#include <gtest/gtest.h>
#include <opencv2/imgcodecs.hpp>

#include <fstream>
#include <limits>
#include <sstream>
#include <utility>

using namespace spritebake;
using spritebake::test::FakeScene;
using spritebake::test::TempDir;

namespace {

struct Fixture {
    TempDir work;
    FakeScene scene;

    Fixture() {
        scene.cam.pose.position = Vec3{1.0, 2.0, 3.0};
        scene.cam.projection.scale = 9.0;
    }

    std::filesystem::path tempRoot() const { return work.path() / "tmp"; }
    std::filesystem::path outDir() const { return work.path() / "out"; }

    PipelineConfig pipeline() const {
        PipelineConfig cfg;
        cfg.tempRoot = tempRoot();
        cfg.log = false;
        return cfg;
    }

    ExportJob job(int start, int end) const {
        ExportJob j;
        j.name = "hero";
        j.outputDir = outDir();
        j.frameWidth = 64;
        j.frameHeight = 64;
        j.frameStart = start;
        j.frameEnd = end;
        j.angle = CameraAngle::Front;
        return j;
    }

    std::size_t filesIn(const std::filesystem::path& dir) const {
        if (!std::filesystem::exists(dir)) return 0;
        std::size_t n = 0;
        for (const auto& e : std::filesystem::recursive_directory_iterator(dir)) {
            if (e.is_regular_file()) ++n;
        }
        return n;
    }
};

} // namespace

TEST(Exporter, WritesSheetForTenFrames) {
    Fixture fx;
    Exporter ex(fx.scene, fx.scene, fx.pipeline());
    const ExportResult r = ex.run(fx.job(1, 10));

    ASSERT_TRUE(r.ok) << (r.error ? r.error->what() : "");
    EXPECT_EQ(r.frameCount, 10);
    EXPECT_EQ(r.layout.cols, 4);
    EXPECT_EQ(r.layout.rows, 3);
    ASSERT_EQ(r.outputs.size(), 1u);
    EXPECT_EQ(r.outputs[0].filename(), "hero_sheet.png");
    EXPECT_FALSE(r.manifest.has_value());

    const cv::Mat bgra = cv::imread(r.outputs[0].string(), cv::IMREAD_UNCHANGED);
    ASSERT_EQ(bgra.type(), CV_8UC4);
    EXPECT_EQ(bgra.cols, 256);
    EXPECT_EQ(bgra.rows, 192);

    // red channel holds the scene time each cell was rendered at
    for (int i = 0; i < 10; ++i) {
        const cv::Vec4b p = bgra.at<cv::Vec4b>((i / 4) * 64 + 10, (i % 4) * 64 + 10);
        EXPECT_EQ(p[2], 1 + i) << "cell " << i;
        EXPECT_EQ(p[3], 255) << "cell " << i;
    }
    // two unused cells stay transparent
    EXPECT_EQ(bgra.at<cv::Vec4b>(2 * 64 + 5, 3 * 64 + 5)[3], 0);
    EXPECT_EQ(bgra.at<cv::Vec4b>(2 * 64 + 5, 2 * 64 + 5)[3], 0);
}

TEST(Exporter, WritesFramesAndManifest) {
    Fixture fx;
    Exporter ex(fx.scene, fx.scene, fx.pipeline());
    ExportJob job = fx.job(5, 7);
    job.mode = OutputMode::Frames;
    job.format = OutputFormat::WEBP;
    job.writeManifest = true;
    const ExportResult r = ex.run(job);

    ASSERT_TRUE(r.ok) << (r.error ? r.error->what() : "");
    ASSERT_EQ(r.outputs.size(), 3u);
    EXPECT_EQ(r.outputs[0].filename(), "hero_0000.webp");
    EXPECT_EQ(r.outputs[2].filename(), "hero_0002.webp");
    for (const auto& p : r.outputs) EXPECT_TRUE(std::filesystem::exists(p)) << p;

    ASSERT_TRUE(r.manifest.has_value());
    EXPECT_EQ(r.manifest->filename(), "hero_manifest.json");
    std::ifstream f(*r.manifest);
    std::stringstream ss;
    ss << f.rdbuf();
    const std::string json = ss.str();
    EXPECT_NE(json.find("hero_0001.webp"), std::string::npos);
    EXPECT_NE(json.find("\"kind\":\"frame\""), std::string::npos);
    EXPECT_NE(json.find("\"frame_range\": [5, 7]"), std::string::npos);
}

TEST(Exporter, RestoresSceneStateAndRemovesTempFrames) {
    Fixture fx;
    const CameraState before = fx.scene.cam;
    Exporter ex(fx.scene, fx.scene, fx.pipeline());
    ASSERT_TRUE(ex.run(fx.job(1, 4)).ok);

    EXPECT_EQ(fx.scene.time, 7);
    EXPECT_EQ(fx.scene.cam, before);
    EXPECT_EQ(fx.scene.setCameraCalls, 2);   // framing camera, then the saved one
    EXPECT_EQ(fx.filesIn(fx.tempRoot()), 0u);
    EXPECT_FALSE(ex.busy());
}

TEST(Exporter, EmptySubjectFailsBeforeRendering) {
    Fixture fx;
    fx.scene.boundsAt = [](int) { return std::optional<Aabb>{}; };
    Exporter ex(fx.scene, fx.scene, fx.pipeline());
    const ExportResult r = ex.run(fx.job(1, 10));

    EXPECT_FALSE(r.ok);
    ASSERT_TRUE(r.error.has_value());
    EXPECT_EQ(r.error->code(), ErrorCode::NoAnimationData);
    EXPECT_EQ(fx.scene.renderCalls, 0);
    EXPECT_EQ(fx.filesIn(fx.outDir()), 0u);
    EXPECT_EQ(fx.scene.time, 7);
}

TEST(Exporter, RenderFailureCleansUpEverything) {
    Fixture fx;
    fx.scene.failAtTime = 5;
    Exporter ex(fx.scene, fx.scene, fx.pipeline());
    const ExportResult r = ex.run(fx.job(0, 19));   // frames 0..4 are stored first

    EXPECT_FALSE(r.ok);
    ASSERT_TRUE(r.error.has_value());
    EXPECT_EQ(r.error->code(), ErrorCode::RenderFailed);
    ASSERT_TRUE(r.error->frameIndex().has_value());
    EXPECT_EQ(*r.error->frameIndex(), 5);
    EXPECT_EQ(fx.scene.renderCalls, 6);

    EXPECT_TRUE(r.outputs.empty());
    EXPECT_FALSE(std::filesystem::exists(fx.outDir() / "hero_sheet.png"));
    EXPECT_EQ(fx.filesIn(fx.tempRoot()), 0u);
    EXPECT_EQ(fx.scene.time, 7);
}

TEST(Exporter, InvalidJobsNeverTouchTheScene) {
    Fixture fx;
    Exporter ex(fx.scene, fx.scene, fx.pipeline());

    ExportJob tooSmall = fx.job(1, 4);
    tooSmall.frameWidth = 32;
    ExportJob reversed = fx.job(9, 4);
    ExportJob padded = fx.job(1, 4);
    padded.padding = 1.5;
    ExportJob noDir = fx.job(1, 4);
    noDir.angle = CameraAngle::Custom;
    ExportJob tinyGrid = fx.job(1, 10);
    tinyGrid.manualGrid = GridOverride{2, 2};
    ExportJob hugeRange = fx.job(-2000000000, 2000000000);
    ExportJob zeroStep = fx.job(1, 10);
    zeroStep.frameStep = 0;
    ExportJob wideSheet = fx.job(1, 2);
    wideSheet.frameWidth = 2048;
    wideSheet.manualGrid = GridOverride{1, 2097153};

    const std::pair<ExportJob, ErrorCode> cases[] = {
        {tooSmall, ErrorCode::InvalidFrameSize},
        {reversed, ErrorCode::InvalidFrameRange},
        {padded,   ErrorCode::InvalidPadding},
        {noDir,    ErrorCode::InvalidCameraAngle},
        {tinyGrid, ErrorCode::GridTooSmall},
        {hugeRange, ErrorCode::InvalidFrameRange},
        {zeroStep, ErrorCode::InvalidFrameRange},
        {wideSheet, ErrorCode::InvalidFrameSize},
    };
    for (const auto& [job, code] : cases) {
        const ExportResult r = ex.run(job);
        EXPECT_FALSE(r.ok);
        ASSERT_TRUE(r.error.has_value());
        EXPECT_EQ(r.error->code(), code) << toString(code);
        EXPECT_TRUE(r.error->isValidationError()) << toString(code);
    }
    EXPECT_EQ(fx.scene.renderCalls, 0);
    EXPECT_EQ(fx.scene.setCameraCalls, 0);
    EXPECT_TRUE(fx.scene.timesSet.empty());
    EXPECT_TRUE(fx.scene.boundsQueries.empty());
}

TEST(Exporter, SecondJobOnSameSceneIsRejected) {
    Fixture fx;
    Exporter ex(fx.scene, fx.scene, fx.pipeline());
    std::optional<ExportResult> nested;
    fx.scene.onRender = [&](int) {
        if (!nested) nested = ex.run(fx.job(1, 2));
    };

    const ExportResult r = ex.run(fx.job(1, 3));
    EXPECT_TRUE(r.ok);
    ASSERT_TRUE(nested.has_value());
    EXPECT_FALSE(nested->ok);
    ASSERT_TRUE(nested->error.has_value());
    EXPECT_EQ(nested->error->code(), ErrorCode::JobAlreadyRunning);
    // the rejected job did not render anything itself
    EXPECT_EQ(fx.scene.renderCalls, 3);
}

TEST(Exporter, CancelStopsBetweenFrames) {
    Fixture fx;
    Exporter ex(fx.scene, fx.scene, fx.pipeline());
    CancelToken cancel{false};
    fx.scene.onRender = [&](int t) { if (t == 2) cancel = true; };

    const ExportResult r = ex.run(fx.job(1, 10), &cancel);
    EXPECT_FALSE(r.ok);
    ASSERT_TRUE(r.error.has_value());
    EXPECT_EQ(r.error->code(), ErrorCode::Cancelled);
    EXPECT_EQ(fx.scene.renderCalls, 2);
    EXPECT_EQ(fx.filesIn(fx.tempRoot()), 0u);
    EXPECT_EQ(fx.filesIn(fx.outDir()), 0u);
    EXPECT_EQ(fx.scene.time, 7);
}

TEST(Exporter, CanRunAgainAfterFailure) {
    Fixture fx;
    fx.scene.failAtTime = 2;
    Exporter ex(fx.scene, fx.scene, fx.pipeline());
    EXPECT_FALSE(ex.run(fx.job(1, 3)).ok);

    fx.scene.failAtTime.reset();
    EXPECT_TRUE(ex.run(fx.job(1, 3)).ok);
}

TEST(Exporter, ValidateJobAcceptsDefaults) {
    ExportJob job;
    EXPECT_NO_THROW(validateJob(job));
}

TEST(Exporter, RangeOfExactlyIntMaxFramesPassesTheCountCheck) {
    ExportJob job;
    job.frameStart = 0;
    job.frameEnd = std::numeric_limits<int>::max() - 1;
    EXPECT_EQ(job.frameCount(), std::numeric_limits<int>::max());
    // the count fits, the auto grid for it does not
    try {
        validateJob(job);
        FAIL() << "expected InvalidFrameSize";
    } catch (const ExportError& e) {
        EXPECT_EQ(e.code(), ErrorCode::InvalidFrameSize);
    }
}

TEST(Exporter, FrameStepCapturesEveryNthFrame) {
    Fixture fx;
    Exporter ex(fx.scene, fx.scene, fx.pipeline());
    ExportJob job = fx.job(1, 10);
    job.frameStep = 3;
    job.writeManifest = true;
    const ExportResult r = ex.run(job);

    ASSERT_TRUE(r.ok) << (r.error ? r.error->what() : "");
    EXPECT_EQ(r.frameCount, 4);
    EXPECT_EQ(r.layout.cols, 2);
    EXPECT_EQ(r.layout.rows, 2);
    // sampling visits the captured frames only, rendering follows the step
    EXPECT_EQ(fx.scene.boundsQueries, (std::vector<int>{1, 4, 7, 10}));
    EXPECT_EQ(fx.scene.renderCalls, 4);

    const cv::Mat bgra = cv::imread(r.outputs[0].string(), cv::IMREAD_UNCHANGED);
    ASSERT_EQ(bgra.type(), CV_8UC4);
    const int want[] = {1, 4, 7, 10};
    for (int i = 0; i < 4; ++i) {
        EXPECT_EQ(bgra.at<cv::Vec4b>((i / 2) * 64 + 3, (i % 2) * 64 + 3)[2], want[i]) << "cell " << i;
    }

    ASSERT_TRUE(r.manifest.has_value());
    std::ifstream f(*r.manifest);
    std::stringstream ss;
    ss << f.rdbuf();
    EXPECT_NE(ss.str().find("\"frame_step\": 3"), std::string::npos);
}
