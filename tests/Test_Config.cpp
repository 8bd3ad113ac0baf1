#include <gtest/gtest.h>

#include <limits>

import GraphScale;

TEST(EngineConfig, DefaultsAreValid)
{
    const GraphScale::EngineConfig config{};
    EXPECT_TRUE(GraphScale::Validate(config).has_value());

    EXPECT_TRUE(config.FrustumCulling);
    EXPECT_TRUE(config.LevelOfDetail);
    EXPECT_TRUE(config.SpatialAcceleration);
    EXPECT_TRUE(config.IncrementalLayout);
    EXPECT_EQ(config.MaxNodesPerFrame, 5000u);
    EXPECT_FLOAT_EQ(config.NodeCullRadius, 10.0f);
    EXPECT_FLOAT_EQ(config.Changes.FullRelayoutFraction, 0.10f);
    EXPECT_FLOAT_EQ(config.Lod.Distances[0], 100.0f);
    EXPECT_FLOAT_EQ(config.Lod.Distances[3], 2000.0f);
}

TEST(EngineConfig, ScalarLimitsAreOutOfRange)
{
    GraphScale::EngineConfig config{};
    config.MaxNodesPerFrame = 0;
    auto frame = GraphScale::Validate(config);
    ASSERT_FALSE(frame.has_value());
    EXPECT_EQ(frame.error(), Core::ErrorCode::OutOfRange);

    config = {};
    config.NodeCullRadius = std::numeric_limits<float>::infinity();
    auto radius = GraphScale::Validate(config);
    ASSERT_FALSE(radius.has_value());
    EXPECT_EQ(radius.error(), Core::ErrorCode::OutOfRange);
}

TEST(EngineConfig, ComponentSectionsAreInvalidConfiguration)
{
    GraphScale::EngineConfig config{};
    config.GridCellSize = 0.0f;
    EXPECT_EQ(GraphScale::Validate(config).error(), Core::ErrorCode::InvalidConfiguration);

    config = {};
    config.Forces.Theta = -1.0f;
    EXPECT_EQ(GraphScale::Validate(config).error(), Core::ErrorCode::InvalidConfiguration);

    config = {};
    config.Camera.Far = 0.01f;
    EXPECT_EQ(GraphScale::Validate(config).error(), Core::ErrorCode::InvalidConfiguration);

    config = {};
    config.Lod.Hysteresis = 0.9f;
    EXPECT_EQ(GraphScale::Validate(config).error(), Core::ErrorCode::InvalidConfiguration);

    config = {};
    config.Partitioning.MaxSize = 0;
    EXPECT_EQ(GraphScale::Validate(config).error(), Core::ErrorCode::InvalidConfiguration);

    config = {};
    config.Changes.FullRelayoutFraction = 2.0f;
    EXPECT_EQ(GraphScale::Validate(config).error(), Core::ErrorCode::InvalidConfiguration);
}

TEST(EngineConfig, SectionsBuildComponents)
{
    const GraphScale::EngineConfig config{};

    EXPECT_TRUE(GraphScale::BarnesHutTree::Create(config.Forces).has_value());
    EXPECT_TRUE(GraphScale::SpatialHashGrid::Create(config.GridCellSize).has_value());
    EXPECT_TRUE(GraphScale::ViewFrustum::Create(config.Camera).has_value());
    EXPECT_TRUE(GraphScale::LodSelector::Create(config.Lod).has_value());
    EXPECT_TRUE(GraphScale::GraphPartitioner::Create(config.Partitioning).has_value());
    EXPECT_TRUE(GraphScale::GraphChangeTracker::Create(config.Changes).has_value());
}

TEST(EngineConfig, FrameCountSplitsByNodeBudget)
{
    GraphScale::EngineConfig config{};
    EXPECT_EQ(GraphScale::FrameCount(config, 0), 0u);
    EXPECT_EQ(GraphScale::FrameCount(config, 1), 1u);
    EXPECT_EQ(GraphScale::FrameCount(config, 5000), 1u);
    EXPECT_EQ(GraphScale::FrameCount(config, 10000), 2u);
    EXPECT_EQ(GraphScale::FrameCount(config, 10001), 3u);

    config.MaxNodesPerFrame = 3;
    EXPECT_EQ(GraphScale::FrameCount(config, 7), 3u);

    config.MaxNodesPerFrame = 0;
    EXPECT_EQ(GraphScale::FrameCount(config, 7), 0u);
}
