module;

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <span>
#include <utility>
#include <vector>
#include <glm/glm.hpp>

module GraphScale:BarnesHut.Impl;

import Core.Error;
import Core;
import Core.Logging;
import :BarnesHut;
import :Types;

namespace GraphScale
{
    namespace
    {
        // Deterministic direction for two bodies that sit on the same point, so coincident
        // nodes still push apart instead of producing a NaN direction.
        [[nodiscard]] glm::vec3 UnitDirectionFromPair(NodeId a, NodeId b)
        {
            const std::uint64_t h = Core::MixBits(a.Value ^ Core::MixBits(b.Value + 0x9e3779b97f4a7c15ULL));
            const float u = static_cast<float>(h & 0xFFFFu) * (1.0f / 65535.0f);
            const float v = static_cast<float>((h >> 16) & 0xFFFFu) * (1.0f / 65535.0f);
            const float z = 2.0f * u - 1.0f;
            const float phi = v * 6.28318530718f;
            const float r = std::sqrt(std::max(0.0f, 1.0f - z * z));
            return glm::vec3(r * std::cos(phi), r * std::sin(phi), z);
        }

        [[nodiscard]] glm::vec3 PairForce(NodeId targetId, const glm::vec3& targetPosition, NodeId sourceId,
            const glm::vec3& sourcePosition, float strengthTimesMass, float minDistance)
        {
            const glm::vec3 delta = targetPosition - sourcePosition;
            const float length = glm::length(delta);
            const glm::vec3 dir = length > 0.0f ? delta / length : UnitDirectionFromPair(targetId, sourceId);
            const float distance = std::max(length, minDistance);
            return dir * (strengthTimesMass / (distance * distance));
        }

        [[nodiscard]] AABB PaddedBounds(std::span<const glm::vec3> positions)
        {
            AABB bounds{};
            for (const glm::vec3& p : positions) bounds.Expand(p);

            const float maxAbs = glm::max(glm::max(glm::abs(bounds.Min.x), glm::abs(bounds.Max.x)),
                glm::max(glm::max(glm::abs(bounds.Min.y), glm::abs(bounds.Max.y)),
                    glm::max(glm::abs(bounds.Min.z), glm::abs(bounds.Max.z))));

            // 1% of the diagonal, with a floor so coincident points still get a non-empty box.
            const float padding = std::max(glm::length(bounds.Max - bounds.Min) * 0.01f,
                1.0e-3f * std::max(1.0f, maxAbs));
            bounds.Min -= glm::vec3(padding);
            bounds.Max += glm::vec3(padding);
            return bounds;
        }
    }

    bool IsValid(const BarnesHutParams& params)
    {
        return std::isfinite(params.Theta) && params.Theta > 0.0f &&
               std::isfinite(params.MinDistance) && params.MinDistance > 0.0f &&
               params.MaxDepth > 0;
    }

    BarnesHutTree::BarnesHutTree(const BarnesHutParams& params)
        : m_Params(params)
    {
        ResetRoot(AABB{.Min = glm::vec3(0.0f), .Max = glm::vec3(1.0f)});
    }

    Core::Expected<BarnesHutTree> BarnesHutTree::Create(const BarnesHutParams& params)
    {
        if (!IsValid(params))
        {
            Core::Log::Warn("BarnesHutTree: rejected configuration (theta={}, minDistance={}, maxDepth={})",
                params.Theta, params.MinDistance, params.MaxDepth);
            return Core::Err<BarnesHutTree>(Core::ErrorCode::InvalidConfiguration);
        }
        return BarnesHutTree(params);
    }

    Core::Result BarnesHutTree::SetTheta(float theta)
    {
        if (!std::isfinite(theta) || theta <= 0.0f)
        {
            Core::Log::Warn("BarnesHutTree: rejected theta {}", theta);
            return Core::Err(Core::ErrorCode::InvalidConfiguration);
        }
        m_Params.Theta = theta;
        return Core::Ok();
    }

    void BarnesHutTree::Clear()
    {
        m_Bodies.clear();
        m_Stats = {};
        ResetRoot(AABB{.Min = glm::vec3(0.0f), .Max = glm::vec3(1.0f)});
    }

    void BarnesHutTree::ResetRoot(const AABB& bounds)
    {
        m_Nodes.clear();
        Node root{};
        root.Bounds = bounds;
        root.IsLeaf = false;
        m_Nodes.push_back(root);
    }

    Core::Expected<BarnesHutBuildResult> BarnesHutTree::Build(std::span<const NodeId> ids,
        std::span<const glm::vec3> positions)
    {
        return Build(ids, positions, {});
    }

    Core::Expected<BarnesHutBuildResult> BarnesHutTree::Build(std::span<const NodeId> ids,
        std::span<const glm::vec3> positions, std::span<const float> masses)
    {
        Clear();

        if (ids.size() != positions.size() || (!masses.empty() && masses.size() != positions.size()))
        {
            Core::Log::Warn("BarnesHutTree::Build: {} ids, {} positions, {} masses", ids.size(), positions.size(),
                masses.size());
            return Core::Err<BarnesHutBuildResult>(Core::ErrorCode::InvalidArgument);
        }

        if (!AllFinite(positions))
        {
            Core::Log::Warn("BarnesHutTree::Build: rejected snapshot with non-finite positions");
            return Core::Err<BarnesHutBuildResult>(Core::ErrorCode::NonFiniteInput);
        }

        for (const float mass : masses)
        {
            if (!std::isfinite(mass) || mass < 0.0f)
            {
                Core::Log::Warn("BarnesHutTree::Build: rejected mass {}", mass);
                return Core::Err<BarnesHutBuildResult>(Core::ErrorCode::NonFiniteInput);
            }
        }

        if (positions.empty())
        {
            return m_Stats;
        }

        ResetRoot(PaddedBounds(positions));
        m_Bodies.reserve(positions.size());
        m_Nodes.reserve(positions.size() * 2);

        for (std::size_t i = 0; i < positions.size(); ++i)
        {
            m_Bodies.push_back(Body{
                .Id = ids[i],
                .Position = positions[i],
                .Mass = masses.empty() ? 1.0f : masses[i],
                .Next = kInvalidIndex});
            Insert(static_cast<BodyIndex>(i));
        }

        ComputeMassDistribution();

        m_Stats.BodyCount = m_Bodies.size();
        m_Stats.NodeCount = m_Nodes.size();
        m_Stats.LeafCount = 0;
        m_Stats.MaxDepthReached = 0;
        for (const Node& node : m_Nodes)
        {
            if (node.IsLeaf) ++m_Stats.LeafCount;
            m_Stats.MaxDepthReached = std::max(m_Stats.MaxDepthReached, node.Depth);
        }

        Core::Log::Debug("BarnesHutTree: {} bodies, {} nodes, {} leaves, depth {}", m_Stats.BodyCount,
            m_Stats.NodeCount, m_Stats.LeafCount, m_Stats.MaxDepthReached);
        return m_Stats;
    }

    BarnesHutTree::NodeIndex BarnesHutTree::NewLeaf(const AABB& bounds, std::uint32_t depth, BodyIndex body)
    {
        Node leaf{};
        leaf.Bounds = bounds;
        leaf.Depth = depth;
        leaf.IsLeaf = true;
        leaf.FirstBody = body;
        m_Bodies[body].Next = kInvalidIndex;
        m_Nodes.push_back(leaf);
        return static_cast<NodeIndex>(m_Nodes.size() - 1);
    }

    void BarnesHutTree::Insert(BodyIndex body)
    {
        const glm::vec3 position = m_Bodies[body].Position;
        NodeIndex current = 0;

        // m_Nodes may grow inside the loop, so nodes are re-fetched by index after every NewLeaf.
        while (true)
        {
            if (!m_Nodes[current].IsLeaf)
            {
                const std::uint32_t octant = m_Nodes[current].Bounds.Octant(position);
                const NodeIndex child = m_Nodes[current].Children[octant];
                if (child == kInvalidIndex)
                {
                    const AABB childBounds = m_Nodes[current].Bounds.ChildBounds(octant);
                    const NodeIndex leaf = NewLeaf(childBounds, m_Nodes[current].Depth + 1, body);
                    m_Nodes[current].Children[octant] = leaf;
                    return;
                }
                current = child;
                continue;
            }

            Node& leaf = m_Nodes[current];
            if (leaf.Depth >= m_Params.MaxDepth || leaf.Bounds.MaxExtent() <= 0.0f)
            {
                m_Bodies[body].Next = leaf.FirstBody;
                leaf.FirstBody = body;
                return;
            }

            // Occupied leaf: convert to internal and push the dislodged body one level down,
            // then retry the new body against the same (now internal) node.
            const BodyIndex dislodged = leaf.FirstBody;
            leaf.FirstBody = kInvalidIndex;
            leaf.IsLeaf = false;

            const std::uint32_t octant = leaf.Bounds.Octant(m_Bodies[dislodged].Position);
            const AABB childBounds = leaf.Bounds.ChildBounds(octant);
            const std::uint32_t childDepth = leaf.Depth + 1;
            const NodeIndex child = NewLeaf(childBounds, childDepth, dislodged);
            m_Nodes[current].Children[octant] = child;
        }
    }

    void BarnesHutTree::ComputeMassDistribution()
    {
        // Children are always appended after their parent, so a reverse sweep is post-order.
        for (std::size_t i = m_Nodes.size(); i-- > 0;)
        {
            Node& node = m_Nodes[i];
            glm::vec3 weighted(0.0f);
            float mass = 0.0f;

            if (node.IsLeaf)
            {
                for (BodyIndex b = node.FirstBody; b != kInvalidIndex; b = m_Bodies[b].Next)
                {
                    weighted += m_Bodies[b].Position * m_Bodies[b].Mass;
                    mass += m_Bodies[b].Mass;
                }
            }
            else
            {
                for (const NodeIndex child : node.Children)
                {
                    if (child == kInvalidIndex) continue;
                    weighted += m_Nodes[child].CenterOfMass * m_Nodes[child].TotalMass;
                    mass += m_Nodes[child].TotalMass;
                }
            }

            node.TotalMass = mass;
            node.CenterOfMass = mass > 0.0f ? weighted / mass : glm::vec3(0.0f);
        }
    }

    glm::vec3 BarnesHutTree::CalculateForce(NodeId targetId, const glm::vec3& targetPosition, float strength) const
    {
        glm::vec3 force(0.0f);
        if (m_Bodies.empty()) return force;

        const float theta = m_Params.Theta;
        const float minDistance = m_Params.MinDistance;

        std::vector<NodeIndex> stack;
        stack.reserve(64);
        stack.push_back(0u);

        while (!stack.empty())
        {
            const Node& node = m_Nodes[stack.back()];
            stack.pop_back();

            if (node.TotalMass <= 0.0f) continue;

            if (node.IsLeaf)
            {
                for (BodyIndex b = node.FirstBody; b != kInvalidIndex; b = m_Bodies[b].Next)
                {
                    const Body& body = m_Bodies[b];
                    if (body.Id == targetId) continue;
                    force += PairForce(targetId, targetPosition, body.Id, body.Position, strength * body.Mass,
                        minDistance);
                }
                continue;
            }

            // A cell that contains the target is always opened, so a body never feels itself.
            if (!node.Bounds.Contains(targetPosition))
            {
                const glm::vec3 delta = targetPosition - node.CenterOfMass;
                const float distance = glm::length(delta);
                if (distance > 0.0f && node.Bounds.MaxExtent() / distance < theta)
                {
                    const float clamped = std::max(distance, minDistance);
                    force += (delta / distance) * (strength * node.TotalMass / (clamped * clamped));
                    continue;
                }
            }

            for (const NodeIndex child : node.Children)
            {
                if (child != kInvalidIndex) stack.push_back(child);
            }
        }

        return force;
    }

    Core::Result BarnesHutTree::CalculateForces(std::span<const NodeId> ids, std::span<const glm::vec3> positions,
        float strength, std::span<glm::vec3> outForces) const
    {
        if (ids.size() != positions.size() || outForces.size() < positions.size())
        {
            return Core::Err(Core::ErrorCode::InvalidArgument);
        }

        for (std::size_t i = 0; i < positions.size(); ++i)
        {
            outForces[i] = CalculateForce(ids[i], positions[i], strength);
        }
        return Core::Ok();
    }
}
