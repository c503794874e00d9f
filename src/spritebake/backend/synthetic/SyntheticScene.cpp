#include "SyntheticScene.hpp"

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cmath>
#include <limits>
#include <numbers>

namespace spritebake {

namespace {
constexpr int    kSubBits  = 4;          // fixed-point bits for fillConvexPoly
constexpr double kMaxCoord = 1.0e6;      // keeps shifted coords inside int range

// quads of Aabb::corners() indices, one per box face
constexpr int kFaces[6][4] = {
    {0, 2, 6, 4}, {1, 3, 7, 5},   // -X, +X
    {0, 1, 5, 4}, {2, 3, 7, 6},   // -Y, +Y
    {0, 1, 3, 2}, {4, 5, 7, 6}    // -Z, +Z
};

const Vec3 kLight = normalized(Vec3{0.3, -0.5, 0.8});

Vec3 rotateX(const Vec3& p, const Vec3& pivot, double a) {
    const Vec3 d = p - pivot;
    const double c = std::cos(a), s = std::sin(a);
    return pivot + Vec3{d.x, d.y * c - d.z * s, d.y * s + d.z * c};
}

inline std::uint8_t shade(std::uint8_t v, double k) {
    return static_cast<std::uint8_t>(std::clamp(std::lround(v * k), 0L, 255L));
}
} // namespace

SyntheticScene::SyntheticScene()
    : SyntheticScene(Options{}) {}

SyntheticScene::SyntheticScene(const Options& opt)
    : opt_(opt), time_(opt.startTime)
{
    const double s  = opt_.size;
    const double pi = std::numbers::pi;
    //            pivot                     offset               half extents             phase swing  color
    parts_ = {
        {{ 0.00, 0.0, 1.00}, {0, 0,  0.35}, {0.25, 0.15, 0.35}, 0.0, 0.0, {200,  90,  60}},  // torso
        {{ 0.00, 0.0, 1.70}, {0, 0,  0.15}, {0.13, 0.13, 0.13}, 0.0, 0.0, {235, 190, 150}},  // head
        {{-0.13, 0.0, 1.00}, {0, 0, -0.50}, {0.09, 0.09, 0.50}, 0.0, 1.0, { 60,  80, 160}},  // left leg
        {{ 0.13, 0.0, 1.00}, {0, 0, -0.50}, {0.09, 0.09, 0.50}, pi,  1.0, { 60,  80, 160}},  // right leg
        {{-0.34, 0.0, 1.65}, {0, 0, -0.35}, {0.07, 0.07, 0.35}, pi,  0.8, {210, 120,  80}},  // left arm
        {{ 0.34, 0.0, 1.65}, {0, 0, -0.35}, {0.07, 0.07, 0.35}, 0.0, 0.8, {210, 120,  80}},  // right arm
    };
    for (auto& p : parts_) {
        p.pivot  = p.pivot * s;
        p.offset = p.offset * s;
        p.half   = p.half * s;
    }
}

std::vector<std::array<Vec3, 8>> SyntheticScene::pose(int frame) const {
    std::vector<std::array<Vec3, 8>> out;
    if (opt_.empty) return out;

    const int cycle = std::max(1, opt_.cycleFrames);
    const double t = 2.0 * std::numbers::pi * static_cast<double>(frame) / cycle;
    const double amp = opt_.swingDeg * std::numbers::pi / 180.0;
    const Vec3 walk{0.0, opt_.walkSpeed * frame, 0.0};

    out.reserve(parts_.size());
    for (const auto& p : parts_) {
        const Vec3 c = p.pivot + p.offset;
        const Aabb rest{c - p.half, c + p.half};
        const double a = amp * p.swing * std::sin(t + p.phase);

        std::array<Vec3, 8> corners = rest.corners();
        for (auto& v : corners) v = rotateX(v, p.pivot, a) + walk;
        out.push_back(corners);
    }
    return out;
}

std::optional<Aabb> SyntheticScene::getWorldBounds(int frame) {
    const auto boxes = pose(frame);
    if (boxes.empty()) return std::nullopt;

    constexpr double inf = std::numeric_limits<double>::infinity();
    Aabb b{Vec3{inf, inf, inf}, Vec3{-inf, -inf, -inf}};
    for (const auto& corners : boxes) {
        for (const Vec3& v : corners) b = unite(b, Aabb{v, v});
    }
    return b;
}

void SyntheticScene::setCamera(const CameraPose& pose, const Projection& projection) {
    camera_.pose       = pose;
    camera_.projection = projection;
}

RenderStatus SyntheticScene::render(std::uint32_t width, std::uint32_t height, FrameBuffer& out)
{
    if (width == 0 || height == 0) {
        return RenderStatus::failure("zero-sized render target");
    }
    const Projection& proj = camera_.projection;
    const CameraPose& cam  = camera_.pose;
    const bool ortho = proj.type == ProjectionType::Orthographic;
    if (ortho && !(proj.scale > 0.0)) {
        return RenderStatus::failure("orthographic scale must be positive");
    }
    if (!ortho && !(proj.fovYDeg > 0.0 && proj.fovYDeg < 180.0)) {
        return RenderStatus::failure("perspective fov out of range");
    }

    out = FrameBuffer(out.index, width, height);
    cv::Mat canvas(static_cast<int>(height), static_cast<int>(width), CV_8UC4, out.rgba.data());

    const double W = width, H = height;
    const double pxPerUnit = ortho ? W / proj.scale : 0.0;
    const double focal = ortho ? 0.0
                               : (H * 0.5) / std::tan(proj.fovYDeg * std::numbers::pi / 360.0);
    const double sub = static_cast<double>(1 << kSubBits);

    struct Face {
        double depth;
        std::array<cv::Point, 4> pts;
        cv::Scalar color;
    };
    std::vector<Face> faces;

    const auto boxes = pose(time_);
    for (std::size_t bi = 0; bi < boxes.size(); ++bi) {
        const auto& c = boxes[bi];
        const Vec3 boxCenter = (c[0] + c[7]) * 0.5;
        const auto& rgb = parts_[bi].rgb;

        for (const auto& f : kFaces) {
            const Vec3 fc = (c[f[0]] + c[f[1]] + c[f[2]] + c[f[3]]) * 0.25;
            const Vec3 n  = normalized(fc - boxCenter);
            const Vec3 view = ortho ? cam.forward : fc - cam.position;
            if (dot(n, view) >= 0.0) continue;   // back face

            Face face{};
            face.depth = dot(fc - cam.position, cam.forward);

            bool clipped = false;
            for (int k = 0; k < 4; ++k) {
                const Vec3 d = c[f[k]] - cam.position;
                const double x = dot(d, cam.right);
                const double y = dot(d, cam.up);
                const double z = dot(d, cam.forward);
                double px, py;
                if (ortho) {
                    px = W * 0.5 + x * pxPerUnit;
                    py = H * 0.5 - y * pxPerUnit;
                } else {
                    if (z <= proj.clipStart) { clipped = true; break; }
                    px = W * 0.5 + x * focal / z;
                    py = H * 0.5 - y * focal / z;
                }
                px = std::clamp(px, -kMaxCoord, kMaxCoord);
                py = std::clamp(py, -kMaxCoord, kMaxCoord);
                face.pts[k] = cv::Point(static_cast<int>(std::lround(px * sub)),
                                        static_cast<int>(std::lround(py * sub)));
            }
            if (clipped) continue;

            const double k = 0.35 + 0.65 * std::max(0.0, dot(n, kLight));
            // buffer is RGBA, so channels go in R,G,B,A order
            face.color = cv::Scalar(shade(rgb[0], k), shade(rgb[1], k), shade(rgb[2], k), 255);
            faces.push_back(face);
        }
    }

    // painter's order: far to near
    std::stable_sort(faces.begin(), faces.end(),
                     [](const Face& a, const Face& b){ return a.depth > b.depth; });

    for (const auto& f : faces) {
        cv::fillConvexPoly(canvas, f.pts.data(), 4, f.color, cv::LINE_8, kSubBits);
    }
    return {};
}

} // namespace spritebake
