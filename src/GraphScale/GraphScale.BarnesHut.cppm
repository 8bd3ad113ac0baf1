module;

#include <array>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <span>
#include <vector>
#include <glm/glm.hpp>

export module GraphScale:BarnesHut;

import Core.Error;
import :Types;

export namespace GraphScale
{
    struct BarnesHutParams
    {
        // Opening criterion: a cell is approximated when size / distance < Theta.
        // Typical range 0.5-1.0; lower is more accurate and slower.
        float Theta{0.5f};
        // Floor applied to every body distance before the inverse-square falloff.
        float MinDistance{0.01f};
        // Subdivision stops here; deeper bodies share a leaf bucket (coincident points).
        std::uint32_t MaxDepth{32};
    };

    struct BarnesHutBuildResult
    {
        std::size_t BodyCount{0};
        std::size_t NodeCount{0};
        std::size_t LeafCount{0};
        std::uint32_t MaxDepthReached{0};
    };

    // Barnes-Hut octree over a snapshot of node positions. The tree is rebuilt wholesale
    // by Build(); there is no incremental insert or delete. Const queries on a built tree
    // may run concurrently; Build() must not overlap them.
    class BarnesHutTree
    {
    public:
        using NodeIndex = std::uint32_t;
        using BodyIndex = std::uint32_t;
        static constexpr std::uint32_t kInvalidIndex = std::numeric_limits<std::uint32_t>::max();

        struct Body
        {
            NodeId Id{};
            glm::vec3 Position{0.0f};
            float Mass{1.0f};
            BodyIndex Next{kInvalidIndex}; // next body in the same leaf bucket
        };

        // Leaf: IsLeaf, FirstBody heads a bucket chain (a single body unless MaxDepth was hit).
        // Internal: up to 8 children; CenterOfMass / TotalMass aggregate all descendants.
        struct Node
        {
            AABB Bounds{};
            glm::vec3 CenterOfMass{0.0f};
            float TotalMass{0.0f};
            std::array<NodeIndex, 8> Children{};
            BodyIndex FirstBody{kInvalidIndex};
            std::uint32_t Depth{0};
            bool IsLeaf{false};

            Node()
            {
                Children.fill(kInvalidIndex);
            }
        };

        [[nodiscard]] static Core::Expected<BarnesHutTree> Create(const BarnesHutParams& params = {});

        [[nodiscard]] Core::Expected<BarnesHutBuildResult> Build(std::span<const NodeId> ids,
            std::span<const glm::vec3> positions);

        [[nodiscard]] Core::Expected<BarnesHutBuildResult> Build(std::span<const NodeId> ids,
            std::span<const glm::vec3> positions, std::span<const float> masses);

        // Net repulsive force acting on `targetPosition`. A body whose id equals `targetId`
        // is skipped; an id that was never inserted gets no self-exclusion.
        [[nodiscard]] glm::vec3 CalculateForce(NodeId targetId, const glm::vec3& targetPosition,
            float strength) const;

        // Full force pass: outForces[i] = CalculateForce(ids[i], positions[i], strength).
        [[nodiscard]] Core::Result CalculateForces(std::span<const NodeId> ids, std::span<const glm::vec3> positions,
            float strength, std::span<glm::vec3> outForces) const;

        [[nodiscard]] Core::Result SetTheta(float theta);

        void Clear();

        [[nodiscard]] bool Empty() const noexcept { return m_Bodies.empty(); }
        [[nodiscard]] const BarnesHutParams& Params() const noexcept { return m_Params; }
        [[nodiscard]] const BarnesHutBuildResult& Stats() const noexcept { return m_Stats; }
        [[nodiscard]] const std::vector<Node>& Nodes() const noexcept { return m_Nodes; }
        [[nodiscard]] const std::vector<Body>& Bodies() const noexcept { return m_Bodies; }

    private:
        explicit BarnesHutTree(const BarnesHutParams& params);

        void ResetRoot(const AABB& bounds);
        [[nodiscard]] NodeIndex NewLeaf(const AABB& bounds, std::uint32_t depth, BodyIndex body);
        void Insert(BodyIndex body);
        void ComputeMassDistribution();

        BarnesHutParams m_Params{};
        std::vector<Node> m_Nodes{};
        std::vector<Body> m_Bodies{};
        BarnesHutBuildResult m_Stats{};
    };

    [[nodiscard]] bool IsValid(const BarnesHutParams& params);
}
