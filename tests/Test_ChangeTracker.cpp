#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <unordered_map>
#include <vector>

#include <glm/glm.hpp>

import GraphScale;

using GraphScale::Edge;
using GraphScale::NodeId;

namespace
{
    std::vector<Edge> MakePath(std::uint64_t count)
    {
        std::vector<Edge> edges;
        for (std::uint64_t i = 0; i + 1 < count; ++i) edges.push_back(Edge{NodeId{i}, NodeId{i + 1}});
        return edges;
    }

    std::vector<std::uint64_t> Sorted(const std::vector<NodeId>& ids)
    {
        std::vector<std::uint64_t> out;
        for (const NodeId id : ids) out.push_back(id.Value);
        std::sort(out.begin(), out.end());
        return out;
    }
}

TEST(LayoutCache, AdjacencyAndDegrees)
{
    GraphScale::LayoutCache cache;
    const std::vector<Edge> edges{Edge{NodeId{1}, NodeId{2}}, Edge{NodeId{2}, NodeId{3}}, Edge{NodeId{3}, NodeId{3}}};
    cache.UpdateAdjacency(edges);

    EXPECT_EQ(cache.Neighbors(NodeId{1}).size(), 1u);
    EXPECT_EQ(cache.Neighbors(NodeId{2}).size(), 2u);
    EXPECT_EQ(cache.Neighbors(NodeId{3}).size(), 1u);
    EXPECT_TRUE(cache.Neighbors(NodeId{99}).empty());

    EXPECT_EQ(cache.Degree(NodeId{1}), 1u);
    EXPECT_EQ(cache.Degree(NodeId{2}), 2u);
    EXPECT_EQ(cache.Degree(NodeId{3}), 3u);
    EXPECT_EQ(cache.Degree(NodeId{99}), 0u);
    EXPECT_EQ(cache.NodeCount(), 3u);

    cache.Pin(NodeId{1});
    EXPECT_TRUE(cache.IsPinned(NodeId{1}));
    EXPECT_FALSE(cache.IsPinned(NodeId{2}));
    cache.Unpin(NodeId{1});
    EXPECT_FALSE(cache.IsPinned(NodeId{1}));
}

TEST(GraphChangeTracker, RejectsInvalidFraction)
{
    auto negative = GraphScale::GraphChangeTracker::Create(GraphScale::ChangeTrackerConfig{.FullRelayoutFraction = -0.1f});
    ASSERT_FALSE(negative.has_value());
    EXPECT_EQ(negative.error(), Core::ErrorCode::InvalidConfiguration);

    EXPECT_FALSE(GraphScale::GraphChangeTracker::Create(
        GraphScale::ChangeTrackerConfig{.FullRelayoutFraction = std::numeric_limits<float>::quiet_NaN()}).has_value());
    EXPECT_TRUE(GraphScale::GraphChangeTracker::Create().has_value());
}

TEST(GraphChangeTracker, TracksAndResets)
{
    auto tracker = GraphScale::GraphChangeTracker::Create();
    ASSERT_TRUE(tracker.has_value());
    EXPECT_FALSE(tracker->HasChanges());

    tracker->MarkAdded(NodeId{1});
    tracker->MarkMoved(NodeId{2});
    tracker->MarkRemoved(NodeId{3});
    EXPECT_TRUE(tracker->HasChanges());
    EXPECT_EQ(tracker->AffectedCount(), 3u);

    tracker->Reset();
    EXPECT_FALSE(tracker->HasChanges());
    EXPECT_EQ(tracker->AffectedCount(), 0u);
    EXPECT_FALSE(tracker->ShouldFullRelayout(100));
}

TEST(GraphChangeTracker, AffectedIncludesDirectNeighbors)
{
    GraphScale::LayoutCache cache;
    cache.UpdateAdjacency(MakePath(10));

    auto tracker = GraphScale::GraphChangeTracker::Create();
    ASSERT_TRUE(tracker.has_value());
    tracker->MarkMoved(NodeId{5});
    tracker->RebuildAffected(cache);

    const auto& affected = tracker->Affected();
    EXPECT_EQ(affected.size(), 3u);
    EXPECT_TRUE(affected.contains(NodeId{4}));
    EXPECT_TRUE(affected.contains(NodeId{5}));
    EXPECT_TRUE(affected.contains(NodeId{6}));

    tracker->MarkEdgeAdded(NodeId{0}, NodeId{9});
    tracker->RebuildAffected(cache);
    EXPECT_EQ(tracker->AffectedCount(), 7u); // {4,5,6} + {0,1} + {8,9}
    EXPECT_EQ(tracker->EdgeChangeCount(), 1u);
}

TEST(GraphChangeTracker, FullRelayoutThreshold)
{
    GraphScale::LayoutCache cache;
    auto tracker = GraphScale::GraphChangeTracker::Create();
    ASSERT_TRUE(tracker.has_value());

    for (std::uint64_t i = 0; i < 10; ++i) tracker->MarkMoved(NodeId{i});
    tracker->RebuildAffected(cache);

    // 10 of 100 is exactly the default fraction: not above it.
    EXPECT_FALSE(tracker->ShouldFullRelayout(100));
    EXPECT_TRUE(tracker->ShouldFullRelayout(99));
    // Empty graph: the denominator is clamped to one.
    EXPECT_TRUE(tracker->ShouldFullRelayout(0));

    tracker->Reset();
    tracker->RequestFullRelayout();
    EXPECT_TRUE(tracker->HasChanges());
    EXPECT_TRUE(tracker->ShouldFullRelayout(1000000));
}

TEST(GraphChangeTracker, LocalRegionUsesPropagationHops)
{
    GraphScale::LayoutCache cache;
    cache.UpdateAdjacency(MakePath(20));

    auto tracker = GraphScale::GraphChangeTracker::Create(GraphScale::ChangeTrackerConfig{.PropagationHops = 2});
    ASSERT_TRUE(tracker.has_value());
    tracker->MarkMoved(NodeId{10});

    EXPECT_EQ(Sorted(tracker->LocalRegion(cache)), (std::vector<std::uint64_t>{8, 9, 10, 11, 12}));
}

TEST(GraphChangeTracker, NeighborsCountOnlyAfterRebuild)
{
    GraphScale::LayoutCache cache;
    cache.UpdateAdjacency(MakePath(10));

    auto tracker = GraphScale::GraphChangeTracker::Create();
    ASSERT_TRUE(tracker.has_value());
    tracker->MarkMoved(NodeId{5});

    EXPECT_EQ(tracker->AffectedCount(), 1u);
    EXPECT_FALSE(tracker->ShouldFullRelayout(20)); // 1 / 20

    tracker->RebuildAffected(cache);
    EXPECT_EQ(tracker->AffectedCount(), 3u);
    EXPECT_TRUE(tracker->ShouldFullRelayout(20)); // 3 / 20
}

TEST(GraphChangeTracker, LocalRegionOrderIgnoresMarkOrder)
{
    GraphScale::LayoutCache cache;
    cache.UpdateAdjacency(MakePath(20));

    const GraphScale::ChangeTrackerConfig config{.PropagationHops = 1};
    auto forward = GraphScale::GraphChangeTracker::Create(config);
    auto backward = GraphScale::GraphChangeTracker::Create(config);
    ASSERT_TRUE(forward.has_value());
    ASSERT_TRUE(backward.has_value());

    for (std::uint64_t id : {15ull, 3ull, 9ull}) forward->MarkMoved(NodeId{id});
    for (std::uint64_t id : {9ull, 15ull, 3ull}) backward->MarkMoved(NodeId{id});

    const std::vector<NodeId> region = forward->LocalRegion(cache);
    EXPECT_EQ(region, backward->LocalRegion(cache));

    std::vector<std::uint64_t> values;
    for (const NodeId id : region) values.push_back(id.Value);
    EXPECT_EQ(values, (std::vector<std::uint64_t>{3, 9, 15, 2, 4, 8, 10, 14, 16}));
}

TEST(ExpandRegion, StopsAtHopLimitAndPinnedNodes)
{
    GraphScale::LayoutCache cache;
    cache.UpdateAdjacency(MakePath(10));

    const std::vector<NodeId> seeds{NodeId{5}};
    EXPECT_EQ(Sorted(GraphScale::ExpandRegion(seeds, cache, 0)), (std::vector<std::uint64_t>{5}));
    EXPECT_EQ(Sorted(GraphScale::ExpandRegion(seeds, cache, 1)), (std::vector<std::uint64_t>{4, 5, 6}));

    cache.Pin(NodeId{4});
    EXPECT_EQ(Sorted(GraphScale::ExpandRegion(seeds, cache, 3)), (std::vector<std::uint64_t>{5, 6, 7, 8}));

    // A pinned seed stays in the region but does not spread.
    const std::vector<NodeId> pinnedSeed{NodeId{4}};
    EXPECT_EQ(Sorted(GraphScale::ExpandRegion(pinnedSeed, cache, 3)), (std::vector<std::uint64_t>{4}));
}

TEST(SuggestInitialPosition, NearPlacedNeighbors)
{
    GraphScale::LayoutCache cache;
    const std::vector<Edge> edges{Edge{NodeId{1}, NodeId{2}}, Edge{NodeId{1}, NodeId{3}}};
    cache.UpdateAdjacency(edges);

    const std::unordered_map<NodeId, glm::vec3> positions{
        {NodeId{2}, glm::vec3(100.0f, 0.0f, 0.0f)},
        {NodeId{3}, glm::vec3(300.0f, 0.0f, 0.0f)},
    };

    const glm::vec3 p = GraphScale::SuggestInitialPosition(NodeId{1}, cache, positions);
    const glm::vec3 centroid{200.0f, 0.0f, 0.0f};
    EXPECT_LE(std::abs(p.x - centroid.x), 25.0f);
    EXPECT_LE(std::abs(p.y - centroid.y), 25.0f);
    EXPECT_LE(std::abs(p.z - centroid.z), 25.0f);

    // Deterministic for the same id.
    EXPECT_EQ(p, GraphScale::SuggestInitialPosition(NodeId{1}, cache, positions));
}

TEST(SuggestInitialPosition, IsolatedNodeStaysInBounds)
{
    GraphScale::LayoutCache cache;
    const std::unordered_map<NodeId, glm::vec3> positions;

    const glm::vec3 a = GraphScale::SuggestInitialPosition(NodeId{7}, cache, positions);
    const glm::vec3 b = GraphScale::SuggestInitialPosition(NodeId{8}, cache, positions);
    for (const glm::vec3& p : {a, b})
    {
        EXPECT_LE(std::abs(p.x), 500.0f);
        EXPECT_LE(std::abs(p.y), 500.0f);
        EXPECT_LE(std::abs(p.z), 500.0f);
    }
    EXPECT_NE(a, b);
}
