#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <span>
#include <unordered_map>
#include <vector>

#include <glm/glm.hpp>

import GraphScale;
import Core.Logging;

using namespace GraphScale;

namespace
{
    using Clock = std::chrono::steady_clock;

    double ElapsedMs(Clock::time_point start)
    {
        return std::chrono::duration<double, std::milli>(Clock::now() - start).count();
    }

    struct DemoGraph
    {
        std::vector<NodeId> Ids;
        std::vector<glm::vec3> Positions;
        std::vector<Edge> Edges;
    };

    // Clusters of nodes scattered on a sphere shell, each cluster a ring with a few chords,
    // neighbouring clusters joined by one bridge. Fully deterministic.
    DemoGraph MakeClusteredGraph(std::uint64_t clusterCount, std::uint64_t clusterSize)
    {
        DemoGraph graph;
        const std::uint64_t total = clusterCount * clusterSize;
        graph.Ids.reserve(total);
        graph.Positions.reserve(total);

        for (std::uint64_t c = 0; c < clusterCount; ++c)
        {
            const float phi = static_cast<float>(c) * 2.399963f; // golden angle
            const float y = 1.0f - 2.0f * (static_cast<float>(c) + 0.5f) / static_cast<float>(clusterCount);
            const float r = std::sqrt(std::max(0.0f, 1.0f - y * y));
            const glm::vec3 center = glm::vec3(r * std::cos(phi), y, r * std::sin(phi)) * 1500.0f;

            const std::uint64_t base = c * clusterSize;
            for (std::uint64_t i = 0; i < clusterSize; ++i)
            {
                const std::uint64_t h = Core::MixBits(base + i + 1);
                const glm::vec3 jitter{
                    static_cast<float>(h & 0xFFFF) / 65535.0f - 0.5f,
                    static_cast<float>((h >> 16) & 0xFFFF) / 65535.0f - 0.5f,
                    static_cast<float>((h >> 32) & 0xFFFF) / 65535.0f - 0.5f};

                graph.Ids.emplace_back(base + i);
                graph.Positions.push_back(center + jitter * 120.0f);

                graph.Edges.push_back(Edge{NodeId{base + i}, NodeId{base + (i + 1) % clusterSize}});
                if (i % 5 == 0) graph.Edges.push_back(Edge{NodeId{base + i}, NodeId{base + (i + 7) % clusterSize}});
            }
            if (c + 1 < clusterCount) graph.Edges.push_back(Edge{NodeId{base}, NodeId{base + clusterSize}});
        }
        return graph;
    }
}

int main()
{
    EngineConfig config{};
    config.Camera.Position = glm::vec3(0.0f, 0.0f, 2500.0f);
    config.Camera.Forward = glm::vec3(0.0f, 0.0f, -1.0f);
    config.Camera.Far = 5000.0f;
    config.Lod.CameraPosition = config.Camera.Position;
    config.Lod.Distances = {1200.0f, 2000.0f, 3000.0f, 4000.0f};
    config.Partitioning.MaxSize = 500;

    if (auto valid = Validate(config); !valid)
    {
        Core::Log::Error("Demo: configuration rejected ({})", Core::ErrorCodeToString(valid.error()));
        return EXIT_FAILURE;
    }

    const DemoGraph graph = MakeClusteredGraph(100, 100);
    const std::size_t nodeCount = graph.Ids.size();
    Core::Log::Info("Demo: generated {} nodes, {} edges", nodeCount, graph.Edges.size());

    auto frustum = ViewFrustum::Create(config.Camera);
    auto selector = LodSelector::Create(config.Lod);
    if (!frustum || !selector)
    {
        Core::Log::Error("Demo: camera or LOD settings rejected");
        return EXIT_FAILURE;
    }

    // --- Visibility and LOD, MaxNodesPerFrame nodes per frame -------------------
    std::vector<std::uint8_t> visible(nodeCount, 1);
    std::vector<LodLevel> levels(nodeCount, LodLevel::Culled);
    const std::span<const glm::vec3> allPositions(graph.Positions);

    FrameStats last{};
    const std::size_t frameCount = FrameCount(config, nodeCount);
    for (std::size_t frameIndex = 0; frameIndex < frameCount; ++frameIndex)
    {
        const std::size_t offset = frameIndex * config.MaxNodesPerFrame;
        const std::size_t count = std::min(config.MaxNodesPerFrame, nodeCount - offset);
        const auto positions = allPositions.subspan(offset, count);
        const auto sliceVisible = std::span<std::uint8_t>(visible).subspan(offset, count);
        const auto sliceLevels = std::span<LodLevel>(levels).subspan(offset, count);

        FrameStats frame{};
        frame.TotalNodes = count;
        frame.VisibleNodes = count;

        auto start = Clock::now();
        if (config.FrustumCulling)
        {
            auto culled = frustum->CullSpheres(positions, config.NodeCullRadius, sliceVisible);
            if (!culled)
            {
                Core::Log::Error("Demo: culling failed ({})", Core::ErrorCodeToString(culled.error()));
                return EXIT_FAILURE;
            }
            frame.VisibleNodes = culled->Visible;
        }
        frame.CullTimeMs = ElapsedMs(start);

        start = Clock::now();
        if (config.LevelOfDetail)
        {
            if (auto lod = selector->UpdateLevels(positions, sliceLevels); !lod)
            {
                Core::Log::Error("Demo: LOD update failed ({})", Core::ErrorCodeToString(lod.error()));
                return EXIT_FAILURE;
            }
        }
        else
        {
            std::fill(sliceLevels.begin(), sliceLevels.end(), LodLevel::High);
        }
        // Frustum-culled nodes override whatever band distance alone would give them.
        for (std::size_t i = 0; i < count; ++i)
        {
            if (!sliceVisible[i]) sliceLevels[i] = LodLevel::Culled;
        }
        frame.Lod = CountLevels(sliceLevels);
        frame.LodTimeMs = ElapsedMs(start);

        Core::Log::Info("Demo: frame {} covers nodes [{}, {})", frameIndex, offset, offset + count);
        LogFrameStats(frame);
        last = frame;
    }

    // --- Repulsion and neighbourhood queries --------------------------------------
    FrameStats layout = last;
    if (config.SpatialAcceleration)
    {
        auto tree = BarnesHutTree::Create(config.Forces);
        if (!tree)
        {
            Core::Log::Error("Demo: force params rejected ({})", Core::ErrorCodeToString(tree.error()));
            return EXIT_FAILURE;
        }

        std::vector<glm::vec3> forces(nodeCount, glm::vec3(0.0f));
        const auto start = Clock::now();
        auto built = tree->Build(graph.Ids, graph.Positions);
        if (!built)
        {
            Core::Log::Error("Demo: octree build failed ({})", Core::ErrorCodeToString(built.error()));
            return EXIT_FAILURE;
        }
        if (auto pass = tree->CalculateForces(graph.Ids, graph.Positions, 100.0f, forces); !pass)
        {
            Core::Log::Error("Demo: force pass failed ({})", Core::ErrorCodeToString(pass.error()));
            return EXIT_FAILURE;
        }
        layout.LayoutTimeMs = ElapsedMs(start);
        Core::Log::Info("Demo: octree {} nodes, {} leaves, depth {}", built->NodeCount, built->LeafCount,
            built->MaxDepthReached);

        auto grid = SpatialHashGrid::Create(config.GridCellSize);
        if (!grid || !grid->Build(graph.Ids, graph.Positions))
        {
            Core::Log::Error("Demo: spatial hash unavailable");
            return EXIT_FAILURE;
        }
        std::size_t neighbourTotal = 0;
        for (std::size_t i = 0; i < nodeCount; i += 100)
            neighbourTotal += grid->FindNeighborsWithin(graph.Positions[i], 40.0f).size();
        Core::Log::Info("Demo: {} cells, {} neighbours found around cluster anchors", grid->CellCount(),
            neighbourTotal);
    }
    else
    {
        Core::Log::Info("Demo: spatial acceleration disabled, skipping octree and grid");
    }

    // --- Partitioning -----------------------------------------------------------
    auto partitioner = GraphPartitioner::Create(config.Partitioning);
    if (!partitioner)
    {
        Core::Log::Error("Demo: partition config rejected ({})", Core::ErrorCodeToString(partitioner.error()));
        return EXIT_FAILURE;
    }
    const auto partitionStart = Clock::now();
    auto partitions = partitioner->Partition(graph.Ids, graph.Edges);
    if (!partitions)
    {
        Core::Log::Error("Demo: partitioning failed ({})", Core::ErrorCodeToString(partitions.error()));
        return EXIT_FAILURE;
    }
    const PartitionMetrics& metrics = partitions->Metrics;
    Core::Log::Info("Demo: {} partitions (avg {:.1f}, stddev {:.1f}), cut {}, modularity {:.3f}, balance {:.2f} in {:.2f} ms",
        metrics.PartitionCount, metrics.AverageSize, metrics.SizeStdDev, metrics.EdgeCut, metrics.Modularity,
        metrics.BalanceFactor, ElapsedMs(partitionStart));

    // --- Incremental edits ------------------------------------------------------
    if (!config.IncrementalLayout)
    {
        layout.FullRelayout = true;
        Core::Log::Info("Demo: incremental layout disabled, every edit relayouts the whole graph");
        LogFrameStats(layout);
        return EXIT_SUCCESS;
    }

    LayoutCache cache;
    auto tracker = GraphChangeTracker::Create(config.Changes);
    if (!tracker)
    {
        Core::Log::Error("Demo: change tracker config rejected ({})", Core::ErrorCodeToString(tracker.error()));
        return EXIT_FAILURE;
    }

    std::unordered_map<NodeId, glm::vec3> placed;
    placed.reserve(nodeCount);
    for (std::size_t i = 0; i < nodeCount; ++i) placed.emplace(graph.Ids[i], graph.Positions[i]);

    const NodeId newcomer{nodeCount};
    const NodeId anchor = graph.Ids[42];
    tracker->MarkAdded(newcomer);
    tracker->MarkEdgeAdded(newcomer, anchor);
    for (std::uint64_t i = 0; i < 20; ++i) tracker->MarkMoved(NodeId{i * 37});

    std::vector<Edge> edited = graph.Edges;
    edited.push_back(Edge{newcomer, anchor});
    cache.UpdateAdjacency(edited);
    tracker->RebuildAffected(cache);

    const glm::vec3 seed = SuggestInitialPosition(newcomer, cache, placed);
    layout.FullRelayout = tracker->ShouldFullRelayout(nodeCount + 1);
    const std::vector<NodeId> region = tracker->LocalRegion(cache);
    Core::Log::Info("Demo: {} affected, local region {} nodes, newcomer at ({:.1f}, {:.1f}, {:.1f})",
        tracker->AffectedCount(), region.size(), seed.x, seed.y, seed.z);
    tracker->Reset();

    LogFrameStats(layout);
    return EXIT_SUCCESS;
}
