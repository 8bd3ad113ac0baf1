module;

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <deque>
#include <span>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>
#include <glm/glm.hpp>

module GraphScale:ChangeTracker.Impl;

import Core.Error;
import Core;
import Core.Logging;
import :ChangeTracker;
import :Types;

namespace GraphScale
{
    namespace
    {
        constexpr float kNeighborJitter = 50.0f;
        constexpr float kIsolatedExtent = 1000.0f;

        // Three 21-bit lanes of the mixed id mapped to [-0.5, 0.5].
        [[nodiscard]] glm::vec3 UnitCubeOffset(NodeId id)
        {
            const std::uint64_t bits = Core::MixBits(id.Value);
            constexpr std::uint64_t mask = (1ull << 21) - 1ull;
            constexpr float scale = 1.0f / static_cast<float>(mask);
            return glm::vec3(static_cast<float>(bits & mask) * scale - 0.5f,
                             static_cast<float>((bits >> 21) & mask) * scale - 0.5f,
                             static_cast<float>((bits >> 42) & mask) * scale - 0.5f);
        }
    }

    // --- LayoutCache ---

    void LayoutCache::UpdateAdjacency(std::span<const Edge> edges)
    {
        m_Adjacency.clear();
        m_Degrees.clear();

        for (const Edge& edge : edges)
        {
            m_Degrees[edge.Source] += 1;
            m_Degrees[edge.Target] += 1;
            if (edge.Source == edge.Target) continue;
            m_Adjacency[edge.Source].push_back(edge.Target);
            m_Adjacency[edge.Target].push_back(edge.Source);
        }
    }

    std::span<const NodeId> LayoutCache::Neighbors(NodeId id) const
    {
        const auto it = m_Adjacency.find(id);
        if (it == m_Adjacency.end()) return {};
        return it->second;
    }

    std::size_t LayoutCache::Degree(NodeId id) const
    {
        const auto it = m_Degrees.find(id);
        return it != m_Degrees.end() ? it->second : 0;
    }

    void LayoutCache::Clear()
    {
        m_Adjacency.clear();
        m_Degrees.clear();
        m_Pinned.clear();
    }

    // --- GraphChangeTracker ---

    bool IsValid(const ChangeTrackerConfig& config)
    {
        return std::isfinite(config.FullRelayoutFraction) &&
               config.FullRelayoutFraction >= 0.0f && config.FullRelayoutFraction <= 1.0f;
    }

    Core::Expected<GraphChangeTracker> GraphChangeTracker::Create(const ChangeTrackerConfig& config)
    {
        if (!IsValid(config))
        {
            Core::Log::Warn("GraphChangeTracker: rejected full-relayout fraction {}", config.FullRelayoutFraction);
            return Core::Err<GraphChangeTracker>(Core::ErrorCode::InvalidConfiguration);
        }
        return GraphChangeTracker(config);
    }

    void GraphChangeTracker::MarkAdded(NodeId id)
    {
        m_Added.insert(id);
        m_Affected.insert(id);
    }

    void GraphChangeTracker::MarkRemoved(NodeId id)
    {
        m_Removed.insert(id);
        m_Affected.insert(id);
    }

    void GraphChangeTracker::MarkMoved(NodeId id)
    {
        m_Moved.insert(id);
        m_Affected.insert(id);
    }

    void GraphChangeTracker::MarkEdgeAdded(NodeId a, NodeId b)
    {
        ++m_EdgeChanges;
        m_EdgeEndpoints.insert(a);
        m_EdgeEndpoints.insert(b);
        m_Affected.insert(a);
        m_Affected.insert(b);
    }

    void GraphChangeTracker::MarkEdgeRemoved(NodeId a, NodeId b)
    {
        MarkEdgeAdded(a, b);
    }

    void GraphChangeTracker::RebuildAffected(const LayoutCache& cache)
    {
        m_Affected.clear();

        auto addWithNeighbors = [&](const std::unordered_set<NodeId>& marked)
        {
            for (const NodeId id : marked)
            {
                m_Affected.insert(id);
                for (const NodeId neighbor : cache.Neighbors(id)) m_Affected.insert(neighbor);
            }
        };
        addWithNeighbors(m_Added);
        addWithNeighbors(m_Removed);
        addWithNeighbors(m_Moved);
        addWithNeighbors(m_EdgeEndpoints);
    }

    bool GraphChangeTracker::ShouldFullRelayout(std::size_t totalNodeCount) const
    {
        if (m_ForceFullRelayout) return true;

        const double denominator = static_cast<double>(totalNodeCount > 0 ? totalNodeCount : 1);
        const double ratio = static_cast<double>(m_Affected.size()) / denominator;
        return ratio > static_cast<double>(m_Config.FullRelayoutFraction);
    }

    std::vector<NodeId> GraphChangeTracker::LocalRegion(const LayoutCache& cache) const
    {
        std::vector<NodeId> seeds(m_Affected.begin(), m_Affected.end());
        std::sort(seeds.begin(), seeds.end());
        return ExpandRegion(seeds, cache, m_Config.PropagationHops);
    }

    void GraphChangeTracker::Reset()
    {
        m_Added.clear();
        m_Removed.clear();
        m_Moved.clear();
        m_EdgeEndpoints.clear();
        m_Affected.clear();
        m_EdgeChanges = 0;
        m_ForceFullRelayout = false;
    }

    bool GraphChangeTracker::HasChanges() const noexcept
    {
        return !m_Added.empty() || !m_Removed.empty() || !m_Moved.empty() || m_EdgeChanges > 0 ||
               m_ForceFullRelayout;
    }

    // --- Free helpers ---

    std::vector<NodeId> ExpandRegion(std::span<const NodeId> seeds, const LayoutCache& cache, std::uint32_t hops)
    {
        std::vector<NodeId> region;
        std::unordered_set<NodeId> visited;
        std::deque<std::pair<NodeId, std::uint32_t>> queue;

        for (const NodeId seed : seeds)
        {
            if (!visited.insert(seed).second) continue;
            region.push_back(seed);
            queue.emplace_back(seed, 0u);
        }

        while (!queue.empty())
        {
            const auto [node, depth] = queue.front();
            queue.pop_front();
            if (depth >= hops || cache.IsPinned(node)) continue;

            for (const NodeId neighbor : cache.Neighbors(node))
            {
                if (cache.IsPinned(neighbor) || !visited.insert(neighbor).second) continue;
                region.push_back(neighbor);
                queue.emplace_back(neighbor, depth + 1);
            }
        }
        return region;
    }

    glm::vec3 SuggestInitialPosition(NodeId id, const LayoutCache& cache,
        const std::unordered_map<NodeId, glm::vec3>& positions)
    {
        glm::vec3 center{0.0f};
        std::size_t placed = 0;
        for (const NodeId neighbor : cache.Neighbors(id))
        {
            const auto it = positions.find(neighbor);
            if (it == positions.end()) continue;
            center += it->second;
            ++placed;
        }

        const glm::vec3 offset = UnitCubeOffset(id);
        if (placed == 0) return offset * kIsolatedExtent;
        return center / static_cast<float>(placed) + offset * kNeighborJitter;
    }
}
