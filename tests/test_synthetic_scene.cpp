#include "synthetic/SyntheticScene.hpp"
#include "spritebake/framing/BoundsSampler.hpp"
#include "spritebake/framing/CameraPlanner.hpp"

#include <gtest/gtest.h>

using namespace spritebake;

namespace {

std::uint8_t alphaAt(const FrameBuffer& fb, std::uint32_t x, std::uint32_t y) {
    return fb.rgba[(static_cast<std::size_t>(y) * fb.width + x) * kRgbaChannels + 3];
}

void frameSubject(SyntheticScene& scene, CameraAngle angle, ProjectionType proj) {
    CameraRequest req;
    req.angle = angle;
    req.projection = proj;
    req.padding = 0.2;
    const auto plan = planCamera(sampleBounds(scene, 1, 24), req, 128, 128);
    scene.setCamera(plan.pose, plan.projection);
}

} // namespace

TEST(SyntheticScene, BoundsAreDeterministicAndAnimated) {
    SyntheticScene a, b;
    ASSERT_TRUE(a.getWorldBounds(6).has_value());
    EXPECT_EQ(*a.getWorldBounds(6), *b.getWorldBounds(6));

    const Aabb rest  = *a.getWorldBounds(0);
    const Aabb swing = *a.getWorldBounds(6);
    EXPECT_GT(swing.size().y, rest.size().y);
    EXPECT_GT(rest.volume(), 0.0);
    EXPECT_NEAR(rest.min.z, 0.0, 1e-9);
    EXPECT_NEAR(rest.max.z, 1.98, 1e-9);   // top of the head
}

TEST(SyntheticScene, WalkMovesTheSubject) {
    SyntheticScene::Options opt;
    opt.walkSpeed = 0.5;
    SyntheticScene scene(opt);
    const Aabb f0 = *scene.getWorldBounds(0);
    const Aabb f24 = *scene.getWorldBounds(24);   // same phase, one cycle later
    EXPECT_NEAR(f24.min.y - f0.min.y, 12.0, 1e-9);
    EXPECT_NEAR(f24.size().y, f0.size().y, 1e-9);
}

TEST(SyntheticScene, EmptySceneHasNoBounds) {
    SyntheticScene::Options opt;
    opt.empty = true;
    SyntheticScene scene(opt);
    EXPECT_FALSE(scene.getWorldBounds(1).has_value());
    EXPECT_THROW((void)sampleBounds(scene, 1, 4), std::exception);
}

TEST(SyntheticScene, TimeAndCameraAreStored) {
    SyntheticScene::Options opt;
    opt.startTime = 12;
    SyntheticScene scene(opt);
    EXPECT_EQ(scene.currentTime(), 12);
    scene.setTime(3);
    EXPECT_EQ(scene.currentTime(), 3);

    CameraPose pose;
    pose.position = Vec3{0, -5, 1};
    Projection proj;
    proj.scale = 4.0;
    scene.setCamera(pose, proj);
    EXPECT_EQ(scene.camera().pose, pose);
    EXPECT_EQ(scene.camera().projection, proj);
}

TEST(SyntheticScene, FramedRenderHasOpaqueSubjectOnTransparentBackground) {
    for (auto proj : {ProjectionType::Orthographic, ProjectionType::Perspective}) {
        SyntheticScene scene;
        frameSubject(scene, CameraAngle::Front, proj);
        scene.setTime(1);

        FrameBuffer fb;
        ASSERT_TRUE(scene.render(128, 128, fb).ok);
        ASSERT_TRUE(fb.consistent());
        EXPECT_EQ(alphaAt(fb, 0, 0), 0) << toString(proj);
        EXPECT_EQ(alphaAt(fb, 127, 127), 0) << toString(proj);
        EXPECT_EQ(alphaAt(fb, 64, 64), 255) << toString(proj);

        // nothing is drawn outside the padded box: the border rows stay empty
        for (std::uint32_t x = 0; x < 128; ++x) {
            ASSERT_EQ(alphaAt(fb, x, 0), 0) << toString(proj) << " x=" << x;
            ASSERT_EQ(alphaAt(fb, x, 127), 0) << toString(proj) << " x=" << x;
        }
    }
}

TEST(SyntheticScene, RenderIsDeterministic) {
    SyntheticScene a, b;
    frameSubject(a, CameraAngle::Isometric, ProjectionType::Orthographic);
    frameSubject(b, CameraAngle::Isometric, ProjectionType::Orthographic);
    a.setTime(9);
    b.setTime(9);

    FrameBuffer fa, fb;
    ASSERT_TRUE(a.render(96, 64, fa).ok);
    ASSERT_TRUE(b.render(96, 64, fb).ok);
    EXPECT_EQ(fa.width, 96u);
    EXPECT_EQ(fa.height, 64u);
    EXPECT_EQ(fa.rgba, fb.rgba);

    a.setTime(15);
    FrameBuffer other;
    ASSERT_TRUE(a.render(96, 64, other).ok);
    EXPECT_NE(other.rgba, fa.rgba);
}

TEST(SyntheticScene, BadLensIsARenderFailure) {
    SyntheticScene scene;
    FrameBuffer fb;

    Projection ortho;
    ortho.scale = 0.0;
    scene.setCamera(CameraPose{}, ortho);
    EXPECT_FALSE(scene.render(64, 64, fb).ok);

    Projection persp;
    persp.type = ProjectionType::Perspective;
    persp.fovYDeg = 180.0;
    scene.setCamera(CameraPose{}, persp);
    EXPECT_FALSE(scene.render(64, 64, fb).ok);

    EXPECT_FALSE(scene.render(0, 64, fb).ok);
}
