module;

#include <cfloat>
#include <cmath>
#include <cstdint>
#include <span>
#include <glm/glm.hpp>

export module GraphScale:Types;

import Core;

export namespace GraphScale
{
    struct NodeTag {};

    using NodeId = Core::StrongId<NodeTag>;

    // Undirected connection between two host nodes. Orientation carries no meaning here.
    struct Edge
    {
        NodeId Source{};
        NodeId Target{};
    };

    struct AABB
    {
        glm::vec3 Min = glm::vec3(FLT_MAX);
        glm::vec3 Max = glm::vec3(-FLT_MAX);

        [[nodiscard]] bool IsValid() const
        {
            return (Min.x <= Max.x) && (Min.y <= Max.y) && (Min.z <= Max.z);
        }

        [[nodiscard]] glm::vec3 GetCenter() const
        {
            return (Min + Max) * 0.5f;
        }

        [[nodiscard]] glm::vec3 GetExtents() const
        {
            return Max - Min;
        }

        // Largest edge length. Used as the cell size in the Barnes-Hut opening criterion.
        [[nodiscard]] float MaxExtent() const
        {
            const glm::vec3 e = GetExtents();
            return glm::max(e.x, glm::max(e.y, e.z));
        }

        [[nodiscard]] bool Contains(const glm::vec3& p) const
        {
            return p.x >= Min.x && p.x <= Max.x &&
                   p.y >= Min.y && p.y <= Max.y &&
                   p.z >= Min.z && p.z <= Max.z;
        }

        void Expand(const glm::vec3& p)
        {
            Min = glm::min(Min, p);
            Max = glm::max(Max, p);
        }

        // Octant index of p relative to the box center: bit 0 = x, bit 1 = y, bit 2 = z.
        // Strict greater-than selects the upper half, so points on the split plane go low.
        [[nodiscard]] std::uint32_t Octant(const glm::vec3& p) const
        {
            const glm::vec3 c = GetCenter();
            std::uint32_t octant = 0;
            if (p.x > c.x) octant |= 1u;
            if (p.y > c.y) octant |= 2u;
            if (p.z > c.z) octant |= 4u;
            return octant;
        }

        [[nodiscard]] AABB ChildBounds(std::uint32_t octant) const
        {
            const glm::vec3 c = GetCenter();
            AABB child;
            child.Min = glm::vec3((octant & 1u) ? c.x : Min.x, (octant & 2u) ? c.y : Min.y, (octant & 4u) ? c.z : Min.z);
            child.Max = glm::vec3((octant & 1u) ? Max.x : c.x, (octant & 2u) ? Max.y : c.y, (octant & 4u) ? Max.z : c.z);
            return child;
        }
    };

    struct Plane
    {
        glm::vec3 Normal{0.0f, 1.0f, 0.0f};
        float Distance{0.0f};

        [[nodiscard]] float SignedDistance(const glm::vec3& p) const
        {
            return glm::dot(Normal, p) + Distance;
        }
    };

    [[nodiscard]] inline bool IsFinite(const glm::vec3& v)
    {
        return std::isfinite(v.x) && std::isfinite(v.y) && std::isfinite(v.z);
    }

    [[nodiscard]] inline bool AllFinite(std::span<const glm::vec3> points)
    {
        for (const glm::vec3& p : points)
        {
            if (!IsFinite(p)) return false;
        }
        return true;
    }
}
