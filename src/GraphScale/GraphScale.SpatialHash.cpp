module;

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <span>
#include <utility>
#include <vector>
#include <glm/glm.hpp>

module GraphScale:SpatialHash.Impl;

import Core.Error;
import Core.Logging;
import :SpatialHash;
import :Types;

namespace GraphScale
{
    namespace
    {
        // Keeps cell coordinates far enough from the int limits that window offsets cannot overflow.
        constexpr double kCellLimit = static_cast<double>(std::numeric_limits<std::int32_t>::max() / 4);

        [[nodiscard]] std::int32_t ToCell(float coordinate, float cellSize)
        {
            const double cell = std::floor(static_cast<double>(coordinate) / static_cast<double>(cellSize));
            return static_cast<std::int32_t>(std::clamp(cell, -kCellLimit, kCellLimit));
        }
    }

    Core::Expected<SpatialHashGrid> SpatialHashGrid::Create(float cellSize)
    {
        if (!std::isfinite(cellSize) || cellSize <= 0.0f)
        {
            Core::Log::Warn("SpatialHashGrid: rejected cell size {}", cellSize);
            return Core::Err<SpatialHashGrid>(Core::ErrorCode::InvalidConfiguration);
        }
        return SpatialHashGrid(cellSize);
    }

    CellCoord SpatialHashGrid::CellOf(const glm::vec3& position) const
    {
        return CellCoord(ToCell(position.x, m_CellSize), ToCell(position.y, m_CellSize), ToCell(position.z, m_CellSize));
    }

    SpatialHashGrid::Cell& SpatialHashGrid::GetOrCreateCell(const CellCoord& coord)
    {
        return m_Cells.try_emplace(coord).first->second;
    }

    void SpatialHashGrid::Clear()
    {
        m_Cells.clear();
        m_NodeCount = 0;
    }

    Core::Result SpatialHashGrid::Build(std::span<const NodeId> ids, std::span<const glm::vec3> positions)
    {
        Clear();

        if (ids.size() != positions.size())
        {
            Core::Log::Warn("SpatialHashGrid::Build: {} ids but {} positions", ids.size(), positions.size());
            return Core::Err(Core::ErrorCode::InvalidArgument);
        }
        if (!AllFinite(positions))
        {
            Core::Log::Warn("SpatialHashGrid::Build: rejected snapshot with non-finite positions");
            return Core::Err(Core::ErrorCode::NonFiniteInput);
        }

        m_Cells.reserve(positions.size());
        for (std::size_t i = 0; i < positions.size(); ++i)
        {
            GetOrCreateCell(CellOf(positions[i])).push_back(GridEntry{.Id = ids[i], .Position = positions[i]});
        }
        m_NodeCount = positions.size();

        Core::Log::Debug("SpatialHashGrid: {} nodes in {} cells (cell size {})", m_NodeCount, m_Cells.size(),
            m_CellSize);
        return Core::Ok();
    }

    template <typename Visitor>
    void SpatialHashGrid::VisitCandidates(const glm::vec3& point, float radius, Visitor&& visit) const
    {
        if (m_Cells.empty() || !std::isfinite(radius) || radius <= 0.0f || !IsFinite(point)) return;

        const double cellRadiusD = std::min(std::ceil(static_cast<double>(radius) / m_CellSize), 1.0e15);
        const std::int64_t r = static_cast<std::int64_t>(cellRadiusD);
        const CellCoord center = CellOf(point);

        const double side = 2.0 * cellRadiusD + 1.0;
        if (side * side * side > static_cast<double>(m_Cells.size()))
        {
            // Window is larger than the occupied set: scanning occupied cells is cheaper.
            for (const auto& [coord, cell] : m_Cells)
            {
                if (std::abs(static_cast<std::int64_t>(coord.x) - center.x) > r) continue;
                if (std::abs(static_cast<std::int64_t>(coord.y) - center.y) > r) continue;
                if (std::abs(static_cast<std::int64_t>(coord.z) - center.z) > r) continue;
                for (const GridEntry& entry : cell) visit(entry);
            }
            return;
        }

        const std::int32_t ri = static_cast<std::int32_t>(r);
        for (std::int32_t dx = -ri; dx <= ri; ++dx)
        {
            for (std::int32_t dy = -ri; dy <= ri; ++dy)
            {
                for (std::int32_t dz = -ri; dz <= ri; ++dz)
                {
                    const auto it = m_Cells.find(CellCoord(center.x + dx, center.y + dy, center.z + dz));
                    if (it == m_Cells.end()) continue;
                    for (const GridEntry& entry : it->second) visit(entry);
                }
            }
        }
    }

    std::vector<NodeId> SpatialHashGrid::FindNeighbors(const glm::vec3& point, float radius) const
    {
        std::vector<NodeId> neighbors;
        VisitCandidates(point, radius, [&](const GridEntry& entry)
        {
            neighbors.push_back(entry.Id);
        });
        return neighbors;
    }

    std::vector<NodeId> SpatialHashGrid::FindNeighborsWithin(const glm::vec3& point, float radius) const
    {
        std::vector<NodeId> neighbors;
        const float radiusSq = radius * radius;
        VisitCandidates(point, radius, [&](const GridEntry& entry)
        {
            const glm::vec3 d = entry.Position - point;
            if (glm::dot(d, d) <= radiusSq) neighbors.push_back(entry.Id);
        });
        return neighbors;
    }
}
