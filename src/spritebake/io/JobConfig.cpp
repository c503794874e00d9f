#include "spritebake/io/JobConfig.hpp"

#include <yaml-cpp/yaml.h>

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace spritebake {

namespace {

template <class T>
T scalar(const YAML::Node& n, const char* key) {
    try {
        return n.as<T>();
    } catch (const YAML::BadConversion& e) {
        throw std::runtime_error(std::string("job file: bad value for '") + key + "': " + e.what());
    }
}

template <class E>
E enumValue(const YAML::Node& n, const char* key, std::optional<E> (*parse)(const std::string&)) {
    const auto s = scalar<std::string>(n, key);
    const auto v = parse(s);
    if (!v) throw std::runtime_error(std::string("job file: unknown ") + key + " '" + s + "'");
    return *v;
}

void expectSequence(const YAML::Node& n, const char* key, std::size_t size) {
    if (!n.IsSequence() || n.size() != size) {
        throw std::runtime_error(std::string("job file: '") + key + "' must be a list of " +
                                 std::to_string(size) + " numbers");
    }
}

void readPipeline(const YAML::Node& p, PipelineConfig& cfg) {
    if (auto n = p["temp_dir"])        cfg.tempRoot = scalar<std::string>(n, "temp_dir");
    if (auto n = p["temp_budget_mb"])  cfg.tempBudgetBytes = scalar<std::uintmax_t>(n, "temp_budget_mb") << 20;
    if (auto n = p["png_compression"]) cfg.pngCompression = scalar<int>(n, "png_compression");
    if (auto n = p["webp_quality"])    cfg.webpQuality = scalar<int>(n, "webp_quality");
    if (auto n = p["fov_deg"])         cfg.perspectiveFovDeg = scalar<double>(n, "fov_deg");
    if (auto n = p["log"])             cfg.log = scalar<bool>(n, "log");
}

JobFile readRoot(const YAML::Node& y, JobFile out) {
    if (!y.IsMap()) {
        if (y.IsNull()) return out;
        throw std::runtime_error("job file: top level must be a map");
    }
    ExportJob& j = out.job;

    if (auto n = y["name"])       j.name = scalar<std::string>(n, "name");
    if (auto n = y["output_dir"]) j.outputDir = scalar<std::string>(n, "output_dir");

    if (auto n = y["frame_size"]) {
        expectSequence(n, "frame_size", 2);
        j.frameWidth  = scalar<std::uint32_t>(n[0], "frame_size");
        j.frameHeight = scalar<std::uint32_t>(n[1], "frame_size");
    }
    if (auto n = y["frames"]) {
        expectSequence(n, "frames", 2);
        j.frameStart = scalar<int>(n[0], "frames");
        j.frameEnd   = scalar<int>(n[1], "frames");
    }

    if (auto n = y["angle"])      j.angle = enumValue<CameraAngle>(n, "angle", &parseCameraAngle);
    if (auto n = y["direction"]) {
        expectSequence(n, "direction", 3);
        j.customDirection = Vec3{scalar<double>(n[0], "direction"),
                                 scalar<double>(n[1], "direction"),
                                 scalar<double>(n[2], "direction")};
    }
    if (auto n = y["projection"]) j.projection = enumValue<ProjectionType>(n, "projection", &parseProjectionType);
    if (auto n = y["padding"])    j.padding = scalar<double>(n, "padding");
    if (auto n = y["mirror"])     j.mirror = scalar<bool>(n, "mirror");
    if (auto n = y["format"])     j.format = enumValue<OutputFormat>(n, "format", &parseOutputFormat);
    if (auto n = y["mode"])       j.mode = enumValue<OutputMode>(n, "mode", &parseOutputMode);

    if (auto n = y["grid"]) {
        if (!n.IsMap() || !n["rows"] || !n["cols"]) {
            throw std::runtime_error("job file: 'grid' needs rows and cols");
        }
        j.manualGrid = GridOverride{scalar<int>(n["rows"], "grid.rows"),
                                    scalar<int>(n["cols"], "grid.cols")};
    }
    if (auto n = y["frame_step"])      j.frameStep = scalar<int>(n, "frame_step");
    if (auto n = y["sampling_stride"]) j.samplingStride = scalar<int>(n, "sampling_stride");
    if (auto n = y["manifest"])        j.writeManifest = scalar<bool>(n, "manifest");

    if (auto p = y["pipeline"]) readPipeline(p, out.pipeline);
    return out;
}

} // namespace

JobFile parseJobYaml(const std::string& text, JobFile defaults)
{
    YAML::Node y;
    try {
        y = YAML::Load(text);
    } catch (const YAML::ParserException& e) {
        throw std::runtime_error(std::string("job file: ") + e.what());
    }
    return readRoot(y, std::move(defaults));
}

JobFile loadJobYaml(const std::filesystem::path& path, JobFile defaults)
{
    std::ifstream f(path);
    if (!f) throw std::runtime_error("cannot open job file " + path.string());
    std::ostringstream ss;
    ss << f.rdbuf();
    try {
        return parseJobYaml(ss.str(), std::move(defaults));
    } catch (const std::runtime_error& e) {
        throw std::runtime_error(path.string() + ": " + e.what());
    }
}

} // namespace spritebake
