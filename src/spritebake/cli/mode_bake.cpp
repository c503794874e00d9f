#include "modes.hpp"
#include "args.hpp"
#include "utils.hpp"

#include "spritebake/core/Exporter.hpp"
#include "spritebake/io/JobConfig.hpp"
#include "synthetic/SyntheticScene.hpp"

#include <iostream>
#include <memory>
#include <string>

using namespace spritebake;

namespace {

/* Command line overrides on top of the job file (or the defaults). */
bool applyOverrides(int argc, char** argv, JobFile& jf) {
    ExportJob& j = jf.job;
    PipelineConfig& p = jf.pipeline;

    j.name      = argValue(argc, argv, "name", j.name);
    j.outputDir = argValue(argc, argv, "out", j.outputDir.string());

    if (argGiven(argc, argv, "size")) {
        int w = 0, h = 0;
        if (!parsePair(argValue(argc, argv, "size"), 'x', w, h) || w <= 0 || h <= 0) {
            std::cerr << "[bake] --size expects WxH\n";
            return false;
        }
        j.frameWidth  = static_cast<std::uint32_t>(w);
        j.frameHeight = static_cast<std::uint32_t>(h);
    }
    if (argGiven(argc, argv, "frames")) {
        if (!parsePair(argValue(argc, argv, "frames"), ':', j.frameStart, j.frameEnd)) {
            std::cerr << "[bake] --frames expects START:END\n";
            return false;
        }
    }
    if (argGiven(argc, argv, "angle")) {
        const auto a = parseCameraAngle(argValue(argc, argv, "angle"));
        if (!a) { std::cerr << "[bake] unknown --angle\n"; return false; }
        j.angle = *a;
    }
    if (argGiven(argc, argv, "dir")) {
        const auto d = parseVec3(argValue(argc, argv, "dir"));
        if (!d) { std::cerr << "[bake] --dir expects x,y,z\n"; return false; }
        j.customDirection = *d;
        j.angle = CameraAngle::Custom;
    }
    if (argGiven(argc, argv, "projection")) {
        const auto pt = parseProjectionType(argValue(argc, argv, "projection"));
        if (!pt) { std::cerr << "[bake] unknown --projection\n"; return false; }
        j.projection = *pt;
    }
    j.padding = argValueDouble(argc, argv, "padding", j.padding);
    if (argHas(argc, argv, "mirror")) j.mirror = true;

    if (argGiven(argc, argv, "format")) {
        const auto f = parseOutputFormat(argValue(argc, argv, "format"));
        if (!f) { std::cerr << "[bake] unknown --format\n"; return false; }
        j.format = *f;
    }
    if (argGiven(argc, argv, "mode")) {
        const auto m = parseOutputMode(argValue(argc, argv, "mode"));
        if (!m) { std::cerr << "[bake] unknown --mode\n"; return false; }
        j.mode = *m;
    }
    if (argGiven(argc, argv, "grid")) {
        GridOverride g{};
        if (!parsePair(argValue(argc, argv, "grid"), 'x', g.rows, g.cols)) {
            std::cerr << "[bake] --grid expects ROWSxCOLS\n";
            return false;
        }
        j.manualGrid = g;
    }
    j.frameStep      = argValueInt(argc, argv, "step", j.frameStep);
    j.samplingStride = argValueInt(argc, argv, "stride", j.samplingStride);
    if (argHas(argc, argv, "manifest")) j.writeManifest = true;

    if (argGiven(argc, argv, "tmp")) p.tempRoot = argValue(argc, argv, "tmp");
    const int budgetMb = argValueInt(argc, argv, "budget-mb", -1);
    if (budgetMb > 0) p.tempBudgetBytes = static_cast<std::uintmax_t>(budgetMb) << 20;
    p.pngCompression    = argValueInt(argc, argv, "png-level", p.pngCompression);
    p.webpQuality       = argValueInt(argc, argv, "webp-quality", p.webpQuality);
    p.perspectiveFovDeg = argValueDouble(argc, argv, "fov", p.perspectiveFovDeg);
    if (argHas(argc, argv, "quiet")) p.log = false;
    return true;
}

} // namespace

int run_bake(int argc, char** argv) {
    JobFile jf{};
    try {
        const std::string cfgPath = argValue(argc, argv, "config");
        if (!cfgPath.empty()) jf = loadJobYaml(cfgPath);
    } catch (const std::exception& e) {
        std::cerr << "[bake] " << e.what() << "\n";
        return kExitInvalid;
    }
    if (!applyOverrides(argc, argv, jf)) return kExitInvalid;

    const std::string sceneKind = argValue(argc, argv, "scene", "synthetic");
    std::unique_ptr<IScene> scene;
    try {
        if (sceneKind == "remote") {
            scene = makeScene(SceneType::Remote, argValue(argc, argv, "host", "localhost:50051"));
        } else if (sceneKind == "synthetic") {
            SyntheticScene::Options so{};
            so.cycleFrames = argValueInt(argc, argv, "cycle", so.cycleFrames);
            so.walkSpeed   = argValueDouble(argc, argv, "walk", so.walkSpeed);
            so.swingDeg    = argValueDouble(argc, argv, "swing", so.swingDeg);
            so.empty       = argHas(argc, argv, "empty-scene");
            so.startTime   = jf.job.frameStart;
            scene = std::make_unique<SyntheticScene>(so);
        } else {
            std::cerr << "[bake] unknown --scene=" << sceneKind << " (synthetic|remote)\n";
            return kExitInvalid;
        }
    } catch (const std::exception& e) {
        std::cerr << "[bake] cannot open scene: " << e.what() << "\n";
        return kExitFailed;
    }

    installInterruptHandler();

    Exporter exporter(*scene, *scene, jf.pipeline);
    const ExportResult r = exporter.run(jf.job, &interruptFlag());

    if (!r.ok) {
        const ExportError& e = *r.error;
        std::cerr << "[bake] export failed: " << e.what() << "\n";
        return exitCodeFor(e);
    }

    for (const auto& f : r.outputs) std::cout << f.string() << "\n";
    if (r.manifest) std::cout << r.manifest->string() << "\n";
    return kExitOk;
}
