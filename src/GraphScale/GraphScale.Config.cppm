module;

#include <cstddef>

export module GraphScale:Config;

import Core.Error;
import :BarnesHut;
import :Frustum;
import :LevelOfDetail;
import :Partitioning;
import :ChangeTracker;

export namespace GraphScale
{
    // Everything a host needs to drive one graph view. Feature toggles let the host switch a
    // stage off without rebuilding its parameters.
    struct EngineConfig
    {
        bool FrustumCulling = true;
        bool LevelOfDetail = true;
        bool SpatialAcceleration = true;
        bool IncrementalLayout = true;

        // Upper bound on nodes a host should push through culling + LOD in one frame.
        std::size_t MaxNodesPerFrame = 5000;
        float NodeCullRadius = kDefaultNodeCullRadius;
        float GridCellSize = 50.0f;

        BarnesHutParams Forces{};
        CameraParams Camera{};
        LodConfig Lod{};
        PartitionConfig Partitioning{};
        ChangeTrackerConfig Changes{};
    };

    struct FrameStats
    {
        std::size_t TotalNodes{0};
        std::size_t VisibleNodes{0};
        LodStats Lod{};
        double CullTimeMs{0.0};
        double LodTimeMs{0.0};
        double LayoutTimeMs{0.0};
        bool FullRelayout{false};
    };

    // Checks every section; reports the first failure. Component sections fail with
    // InvalidConfiguration, scalar limits with OutOfRange.
    [[nodiscard]] Core::Result Validate(const EngineConfig& config);

    // Frames needed to push nodeCount nodes through culling + LOD at MaxNodesPerFrame each.
    [[nodiscard]] std::size_t FrameCount(const EngineConfig& config, std::size_t nodeCount) noexcept;

    void LogFrameStats(const FrameStats& stats);
}
