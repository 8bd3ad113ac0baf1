module;

#include <cstddef>
#include <cstdint>
#include <span>
#include <unordered_map>
#include <vector>
#include <glm/glm.hpp>

export module GraphScale:SpatialHash;

import Core.Error;
import Core;
import :Types;

export namespace GraphScale
{
    using CellCoord = glm::ivec3;

    struct CellCoordHash
    {
        std::size_t operator()(const CellCoord& c) const noexcept
        {
            std::uint64_t key = static_cast<std::uint32_t>(c.x);
            key = Core::MixBits(key ^ (static_cast<std::uint64_t>(static_cast<std::uint32_t>(c.y)) << 21));
            key = Core::MixBits(key ^ (static_cast<std::uint64_t>(static_cast<std::uint32_t>(c.z)) << 42));
            return static_cast<std::size_t>(key);
        }
    };

    struct GridEntry
    {
        NodeId Id{};
        glm::vec3 Position{0.0f};
    };

    // Uniform hash grid for conservative radius queries. Rebuilt wholesale from a snapshot;
    // cells are never patched incrementally.
    class SpatialHashGrid
    {
    public:
        using Cell = std::vector<GridEntry>;

        [[nodiscard]] static Core::Expected<SpatialHashGrid> Create(float cellSize);

        [[nodiscard]] Core::Result Build(std::span<const NodeId> ids, std::span<const glm::vec3> positions);

        // Every node whose cell lies within ceil(radius / cellSize) cells of the query cell.
        // Never misses a node within `radius`. Extra nodes come from the cubic cell window, so each
        // axis of their offset stays within radius + 2 * cellSize.
        [[nodiscard]] std::vector<NodeId> FindNeighbors(const glm::vec3& point, float radius) const;

        // FindNeighbors() post-filtered to the exact sphere.
        [[nodiscard]] std::vector<NodeId> FindNeighborsWithin(const glm::vec3& point, float radius) const;

        [[nodiscard]] CellCoord CellOf(const glm::vec3& position) const;

        void Clear();

        [[nodiscard]] float CellSize() const noexcept { return m_CellSize; }
        [[nodiscard]] std::size_t CellCount() const noexcept { return m_Cells.size(); }
        [[nodiscard]] std::size_t NodeCount() const noexcept { return m_NodeCount; }

    private:
        explicit SpatialHashGrid(float cellSize) : m_CellSize(cellSize) {}

        [[nodiscard]] Cell& GetOrCreateCell(const CellCoord& coord);

        template <typename Visitor>
        void VisitCandidates(const glm::vec3& point, float radius, Visitor&& visit) const;

        float m_CellSize{1.0f};
        std::size_t m_NodeCount{0};
        std::unordered_map<CellCoord, Cell, CellCoordHash> m_Cells{};
    };
}
