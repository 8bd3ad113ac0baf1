module;

#include <cstddef>
#include <cstdint>
#include <span>
#include <unordered_map>
#include <unordered_set>
#include <vector>
#include <glm/glm.hpp>

export module GraphScale:ChangeTracker;

import Core.Error;
import Core;
import :Types;

export namespace GraphScale
{
    // Adjacency snapshot and pinned set consulted between full layouts.
    class LayoutCache
    {
    public:
        // Replaces adjacency and degrees. Self loops add 2 to the degree but no neighbor entry.
        void UpdateAdjacency(std::span<const Edge> edges);

        [[nodiscard]] std::span<const NodeId> Neighbors(NodeId id) const;
        [[nodiscard]] std::size_t Degree(NodeId id) const;

        void Pin(NodeId id) { m_Pinned.insert(id); }
        void Unpin(NodeId id) { m_Pinned.erase(id); }
        [[nodiscard]] bool IsPinned(NodeId id) const { return m_Pinned.contains(id); }
        [[nodiscard]] std::size_t PinnedCount() const noexcept { return m_Pinned.size(); }

        [[nodiscard]] std::size_t NodeCount() const noexcept { return m_Degrees.size(); }

        void Clear();

    private:
        std::unordered_map<NodeId, std::vector<NodeId>> m_Adjacency{};
        std::unordered_map<NodeId, std::size_t> m_Degrees{};
        std::unordered_set<NodeId> m_Pinned{};
    };

    struct ChangeTrackerConfig
    {
        // Affected share of the graph above which a full relayout beats a local pass.
        float FullRelayoutFraction = 0.10f;
        // Hop radius of the local pass around the affected set.
        std::uint32_t PropagationHops = 3;
    };

    // Accumulates structural deltas between relayout passes. Owned by the host; the layout pass
    // reads the affected set and calls Reset() once it has consumed it.
    class GraphChangeTracker
    {
    public:
        [[nodiscard]] static Core::Expected<GraphChangeTracker> Create(const ChangeTrackerConfig& config = {});

        void MarkAdded(NodeId id);
        void MarkRemoved(NodeId id);
        void MarkMoved(NodeId id);
        void MarkEdgeAdded(NodeId a, NodeId b);
        void MarkEdgeRemoved(NodeId a, NodeId b);
        void RequestFullRelayout() noexcept { m_ForceFullRelayout = true; }

        // Recomputes the affected set: every marked node plus its direct neighbors in `cache`.
        void RebuildAffected(const LayoutCache& cache);

        // Compares the current affected set against FullRelayoutFraction. Mark*() only records
        // the marked ids; call RebuildAffected() first to count their neighbors as well.
        [[nodiscard]] bool ShouldFullRelayout(std::size_t totalNodeCount) const;

        // Nodes within PropagationHops of the affected set. The affected ids come first in
        // ascending id order, followed by the rest in BFS discovery order.
        [[nodiscard]] std::vector<NodeId> LocalRegion(const LayoutCache& cache) const;

        void Reset();

        [[nodiscard]] bool HasChanges() const noexcept;
        [[nodiscard]] std::size_t AffectedCount() const noexcept { return m_Affected.size(); }

        [[nodiscard]] const std::unordered_set<NodeId>& Added() const noexcept { return m_Added; }
        [[nodiscard]] const std::unordered_set<NodeId>& Removed() const noexcept { return m_Removed; }
        [[nodiscard]] const std::unordered_set<NodeId>& Moved() const noexcept { return m_Moved; }
        [[nodiscard]] const std::unordered_set<NodeId>& Affected() const noexcept { return m_Affected; }
        [[nodiscard]] std::size_t EdgeChangeCount() const noexcept { return m_EdgeChanges; }
        [[nodiscard]] const ChangeTrackerConfig& Config() const noexcept { return m_Config; }

    private:
        explicit GraphChangeTracker(const ChangeTrackerConfig& config) : m_Config(config) {}

        ChangeTrackerConfig m_Config{};
        std::unordered_set<NodeId> m_Added{};
        std::unordered_set<NodeId> m_Removed{};
        std::unordered_set<NodeId> m_Moved{};
        // Endpoints of added/removed edges.
        std::unordered_set<NodeId> m_EdgeEndpoints{};
        std::unordered_set<NodeId> m_Affected{};
        std::size_t m_EdgeChanges{0};
        bool m_ForceFullRelayout{false};
    };

    [[nodiscard]] bool IsValid(const ChangeTrackerConfig& config);

    // Breadth-first closure of `seeds` up to `hops` edges away, in discovery order. Pinned
    // neighbors are left out and pinned seeds are not expanded.
    [[nodiscard]] std::vector<NodeId> ExpandRegion(std::span<const NodeId> seeds, const LayoutCache& cache,
        std::uint32_t hops);

    // Placement for a newly added node: centroid of its placed neighbors plus a small offset, or
    // a point inside a 1000-unit cube when none is placed. Deterministic in the node id.
    [[nodiscard]] glm::vec3 SuggestInitialPosition(NodeId id, const LayoutCache& cache,
        const std::unordered_map<NodeId, glm::vec3>& positions);
}
