module;

#include <cmath>
#include <cstddef>
#include <string_view>

module GraphScale:Config.Impl;

import Core.Error;
import Core.Logging;
import :Config;
import :BarnesHut;
import :Frustum;
import :LevelOfDetail;
import :Partitioning;
import :ChangeTracker;

namespace GraphScale
{
    namespace
    {
        [[nodiscard]] Core::Result Reject(std::string_view field, Core::ErrorCode code)
        {
            Core::Log::Warn("EngineConfig: invalid '{}' ({})", field, Core::ErrorCodeToString(code));
            return Core::Err(code);
        }
    }

    Core::Result Validate(const EngineConfig& config)
    {
        if (config.MaxNodesPerFrame == 0)
            return Reject("MaxNodesPerFrame", Core::ErrorCode::OutOfRange);
        if (!std::isfinite(config.NodeCullRadius) || config.NodeCullRadius < 0.0f)
            return Reject("NodeCullRadius", Core::ErrorCode::OutOfRange);
        if (!std::isfinite(config.GridCellSize) || config.GridCellSize <= 0.0f)
            return Reject("GridCellSize", Core::ErrorCode::InvalidConfiguration);

        if (!IsValid(config.Forces)) return Reject("Forces", Core::ErrorCode::InvalidConfiguration);
        if (!IsValid(config.Camera)) return Reject("Camera", Core::ErrorCode::InvalidConfiguration);
        if (!IsValid(config.Lod)) return Reject("Lod", Core::ErrorCode::InvalidConfiguration);
        if (!IsValid(config.Partitioning)) return Reject("Partitioning", Core::ErrorCode::InvalidConfiguration);
        if (!IsValid(config.Changes)) return Reject("Changes", Core::ErrorCode::InvalidConfiguration);

        return Core::Ok();
    }

    std::size_t FrameCount(const EngineConfig& config, std::size_t nodeCount) noexcept
    {
        if (nodeCount == 0 || config.MaxNodesPerFrame == 0) return 0;
        return (nodeCount + config.MaxNodesPerFrame - 1) / config.MaxNodesPerFrame;
    }

    void LogFrameStats(const FrameStats& stats)
    {
        Core::Log::Info("Frame: {} nodes, {} visible | LOD H/M/L/Min/C = {}/{}/{}/{}/{}",
            stats.TotalNodes, stats.VisibleNodes,
            stats.Lod.Count(LodLevel::High), stats.Lod.Count(LodLevel::Medium), stats.Lod.Count(LodLevel::Low),
            stats.Lod.Count(LodLevel::Minimal), stats.Lod.Count(LodLevel::Culled));
        Core::Log::Info("Frame: cull {:.3f} ms, lod {:.3f} ms, layout {:.3f} ms ({})",
            stats.CullTimeMs, stats.LodTimeMs, stats.LayoutTimeMs, stats.FullRelayout ? "full" : "incremental");
    }
}
