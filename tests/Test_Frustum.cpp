#include <gtest/gtest.h>

#include <array>
#include <cstdint>
#include <limits>
#include <vector>

#include <glm/glm.hpp>

import GraphScale;

namespace
{
    GraphScale::ViewFrustum MakeDefaultFrustum()
    {
        auto frustum = GraphScale::ViewFrustum::Create(GraphScale::CameraParams{});
        EXPECT_TRUE(frustum.has_value());
        return *frustum;
    }
}

TEST(ViewFrustum, RejectsInvalidCameras)
{
    using GraphScale::CameraParams;
    using GraphScale::ViewFrustum;

    CameraParams camera{};
    camera.FovY = 0.0f;
    auto zeroFov = ViewFrustum::Create(camera);
    ASSERT_FALSE(zeroFov.has_value());
    EXPECT_EQ(zeroFov.error(), Core::ErrorCode::InvalidConfiguration);

    camera = {};
    camera.FovY = 3.2f;
    EXPECT_FALSE(ViewFrustum::Create(camera).has_value());

    camera = {};
    camera.Aspect = 0.0f;
    EXPECT_FALSE(ViewFrustum::Create(camera).has_value());

    camera = {};
    camera.Near = 0.0f;
    EXPECT_FALSE(ViewFrustum::Create(camera).has_value());

    camera = {};
    camera.Far = camera.Near;
    EXPECT_FALSE(ViewFrustum::Create(camera).has_value());

    camera = {};
    camera.Forward = glm::vec3(0.0f);
    EXPECT_FALSE(ViewFrustum::Create(camera).has_value());

    camera = {};
    camera.Forward = glm::vec3(0.0f, 2.0f, 0.0f);
    EXPECT_FALSE(ViewFrustum::Create(camera).has_value());

    camera = {};
    camera.Position.x = std::numeric_limits<float>::quiet_NaN();
    EXPECT_FALSE(ViewFrustum::Create(camera).has_value());
}

TEST(ViewFrustum, PlaneNormalsPointInward)
{
    const auto frustum = MakeDefaultFrustum();
    const glm::vec3 onAxis{0.0f, 0.0f, -10.0f};

    for (const auto& plane : frustum.Planes())
    {
        EXPECT_NEAR(glm::length(plane.Normal), 1.0f, 1e-5f);
        EXPECT_GT(plane.SignedDistance(onAxis), 0.0f);
    }

    EXPECT_NEAR(frustum.GetPlane(GraphScale::FrustumPlane::Near).Normal.z, -1.0f, 1e-6f);
    EXPECT_NEAR(frustum.GetPlane(GraphScale::FrustumPlane::Far).Normal.z, 1.0f, 1e-6f);
    EXPECT_GT(frustum.GetPlane(GraphScale::FrustumPlane::Left).Normal.x, 0.0f);
    EXPECT_LT(frustum.GetPlane(GraphScale::FrustumPlane::Right).Normal.x, 0.0f);
    EXPECT_LT(frustum.GetPlane(GraphScale::FrustumPlane::Top).Normal.y, 0.0f);
    EXPECT_GT(frustum.GetPlane(GraphScale::FrustumPlane::Bottom).Normal.y, 0.0f);
}

TEST(ViewFrustum, ContainsPointAlongDefaultView)
{
    const auto frustum = MakeDefaultFrustum();

    EXPECT_TRUE(frustum.ContainsPoint({0.0f, 0.0f, -10.0f}));
    EXPECT_TRUE(frustum.ContainsPoint({5.0f, 3.0f, -100.0f}));

    EXPECT_FALSE(frustum.ContainsPoint({0.0f, 0.0f, 10.0f}));    // behind
    EXPECT_FALSE(frustum.ContainsPoint({0.0f, 0.0f, -0.05f}));   // before near
    EXPECT_FALSE(frustum.ContainsPoint({0.0f, 0.0f, -2000.0f})); // beyond far
    EXPECT_FALSE(frustum.ContainsPoint({1000.0f, 0.0f, -10.0f}));
    EXPECT_FALSE(frustum.ContainsPoint({-1000.0f, 0.0f, -10.0f}));
    EXPECT_FALSE(frustum.ContainsPoint({0.0f, 1000.0f, -10.0f}));
    EXPECT_FALSE(frustum.ContainsPoint({0.0f, -1000.0f, -10.0f}));
}

TEST(ViewFrustum, ContainsPointIsTranslationInvariant)
{
    const glm::vec3 offset{500.0f, -200.0f, 30.0f};

    GraphScale::CameraParams moved{};
    moved.Position += offset;
    auto shifted = GraphScale::ViewFrustum::Create(moved);
    ASSERT_TRUE(shifted.has_value());
    const auto base = MakeDefaultFrustum();

    const std::vector<glm::vec3> probes{
        {0.0f, 0.0f, -10.0f}, {0.0f, 0.0f, 10.0f}, {40.0f, 10.0f, -60.0f}, {300.0f, 0.0f, -20.0f},
        {0.0f, 0.0f, -999.0f}, {0.0f, 0.0f, -1001.0f}, {-7.0f, 4.0f, -1.0f},
    };
    for (const glm::vec3& p : probes)
    {
        EXPECT_EQ(base.ContainsPoint(p), shifted->ContainsPoint(p + offset))
            << p.x << "," << p.y << "," << p.z;
    }
}

TEST(ViewFrustum, RotatedCameraFollowsForward)
{
    GraphScale::CameraParams camera{};
    camera.Forward = glm::vec3(1.0f, 0.0f, 0.0f);
    camera.Up = glm::vec3(0.0f, 0.0f, 1.0f);
    auto frustum = GraphScale::ViewFrustum::Create(camera);
    ASSERT_TRUE(frustum.has_value());

    EXPECT_TRUE(frustum->ContainsPoint({10.0f, 0.0f, 0.0f}));
    EXPECT_FALSE(frustum->ContainsPoint({-10.0f, 0.0f, 0.0f}));
    EXPECT_FALSE(frustum->ContainsPoint({10.0f, 0.0f, 100.0f}));
    EXPECT_NEAR(glm::dot(frustum->Camera().Up, frustum->Camera().Forward), 0.0f, 1e-6f);
}

TEST(ViewFrustum, SphereCountsPartialOverlap)
{
    const auto frustum = MakeDefaultFrustum();

    // Center sits just behind the camera, but the sphere reaches into the view.
    EXPECT_FALSE(frustum.ContainsPoint({0.0f, 0.0f, 5.0f}));
    EXPECT_TRUE(frustum.ContainsSphere({0.0f, 0.0f, 5.0f}, 10.0f));
    EXPECT_FALSE(frustum.ContainsSphere({0.0f, 0.0f, 50.0f}, 10.0f));
}

TEST(ViewFrustum, AabbPositiveVertexTest)
{
    const auto frustum = MakeDefaultFrustum();

    EXPECT_TRUE(frustum.IntersectsAABB(glm::vec3(-1.0f, -1.0f, -51.0f), glm::vec3(1.0f, 1.0f, -49.0f)));
    EXPECT_FALSE(frustum.IntersectsAABB(glm::vec3(-1.0f, -1.0f, 49.0f), glm::vec3(1.0f, 1.0f, 51.0f)));
    // A box surrounding the whole frustum is visible.
    EXPECT_TRUE(frustum.IntersectsAABB(glm::vec3(-5000.0f), glm::vec3(5000.0f)));

    GraphScale::AABB box{};
    box.Expand(glm::vec3(2000.0f, 0.0f, -10.0f));
    box.Expand(glm::vec3(2001.0f, 1.0f, -11.0f));
    EXPECT_FALSE(frustum.IntersectsAABB(box));
}

TEST(ViewFrustum, CornersAreSymmetric)
{
    const auto frustum = MakeDefaultFrustum();
    const auto& corners = frustum.Corners();

    EXPECT_NEAR(corners[0].z, -0.1f, 1e-6f);
    EXPECT_NEAR(corners[4].z, -1000.0f, 1e-3f);
    EXPECT_NEAR(corners[2].x, -corners[0].x, 1e-4f);
    EXPECT_NEAR(corners[2].y, -corners[0].y, 1e-4f);
    EXPECT_GT(corners[6].x, corners[2].x);

    // Far half-height follows tan(fovY / 2) * far.
    EXPECT_NEAR(corners[6].y, 1000.0f * 0.57735027f, 0.05f);
}

TEST(ViewFrustum, CullSpheresReportsCounts)
{
    const auto frustum = MakeDefaultFrustum();

    const std::vector<glm::vec3> positions{
        {0.0f, 0.0f, -10.0f}, {0.0f, 0.0f, 100.0f}, {0.0f, 0.0f, -500.0f}, {5000.0f, 0.0f, -10.0f},
    };
    std::vector<std::uint8_t> visible(positions.size(), 0);

    const auto stats = frustum.CullSpheres(positions, GraphScale::kDefaultNodeCullRadius, visible);
    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(stats->Total, 4u);
    EXPECT_EQ(stats->Visible, 2u);
    EXPECT_EQ(stats->Culled, 2u);
    EXPECT_EQ(visible, (std::vector<std::uint8_t>{1, 0, 1, 0}));

    std::array<std::uint8_t, 1> tooSmall{};
    auto rejected = frustum.CullSpheres(positions, 1.0f, tooSmall);
    ASSERT_FALSE(rejected.has_value());
    EXPECT_EQ(rejected.error(), Core::ErrorCode::InvalidArgument);
}

TEST(ViewFrustum, SetCameraKeepsPreviousStateOnRejection)
{
    auto frustum = MakeDefaultFrustum();

    GraphScale::CameraParams bad{};
    bad.Near = -1.0f;
    EXPECT_FALSE(frustum.SetCamera(bad).has_value());
    EXPECT_TRUE(frustum.ContainsPoint({0.0f, 0.0f, -10.0f}));

    GraphScale::CameraParams behind{};
    behind.Forward = glm::vec3(0.0f, 0.0f, 1.0f);
    ASSERT_TRUE(frustum.SetCamera(behind).has_value());
    EXPECT_TRUE(frustum.ContainsPoint({0.0f, 0.0f, 10.0f}));
    EXPECT_FALSE(frustum.ContainsPoint({0.0f, 0.0f, -10.0f}));
}
