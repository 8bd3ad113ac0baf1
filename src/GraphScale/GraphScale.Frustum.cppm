module;

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <glm/glm.hpp>

export module GraphScale:Frustum;

import Core.Error;
import :Types;

export namespace GraphScale
{
    struct CameraParams
    {
        glm::vec3 Position{0.0f};
        glm::vec3 Forward{0.0f, 0.0f, -1.0f};
        glm::vec3 Up{0.0f, 1.0f, 0.0f};
        float FovY{1.04719755f}; // vertical field of view in radians (60 degrees)
        float Aspect{16.0f / 9.0f}; // width / height
        float Near{0.1f};
        float Far{1000.0f};
    };

    enum class FrustumPlane : std::uint8_t
    {
        Near = 0,
        Far,
        Left,
        Right,
        Top,
        Bottom
    };

    struct CullingStats
    {
        std::size_t Total{0};
        std::size_t Visible{0};
        std::size_t Culled{0};
    };

    // Radius used for node bounding spheres when the host does not supply one.
    inline constexpr float kDefaultNodeCullRadius = 10.0f;

    // Six-plane view volume derived from camera parameters. All plane normals point into the
    // visible half-space, so "inside" means a non-negative signed distance to every plane.
    // Planes are recomputed only by Create() / SetCamera(); the caller refreshes them when the
    // camera moves.
    class ViewFrustum
    {
    public:
        [[nodiscard]] static Core::Expected<ViewFrustum> Create(const CameraParams& camera);

        [[nodiscard]] Core::Result SetCamera(const CameraParams& camera);

        [[nodiscard]] bool ContainsPoint(const glm::vec3& point) const;

        // Partial overlap counts as visible.
        [[nodiscard]] bool ContainsSphere(const glm::vec3& center, float radius) const;

        // Conservative positive-vertex test: may report boxes near frustum corners as visible.
        [[nodiscard]] bool IntersectsAABB(const glm::vec3& min, const glm::vec3& max) const;
        [[nodiscard]] bool IntersectsAABB(const AABB& box) const { return IntersectsAABB(box.Min, box.Max); }

        // Sphere test for every position; outVisible[i] is 1 when node i is visible.
        [[nodiscard]] Core::Expected<CullingStats> CullSpheres(std::span<const glm::vec3> positions, float radius,
            std::span<std::uint8_t> outVisible) const;

        [[nodiscard]] const CameraParams& Camera() const noexcept { return m_Camera; }
        [[nodiscard]] const std::array<Plane, 6>& Planes() const noexcept { return m_Planes; }
        [[nodiscard]] const Plane& GetPlane(FrustumPlane which) const { return m_Planes[static_cast<std::size_t>(which)]; }
        // Near corners first (bottom-left, bottom-right, top-right, top-left), then far corners.
        [[nodiscard]] const std::array<glm::vec3, 8>& Corners() const noexcept { return m_Corners; }
        [[nodiscard]] const glm::vec3& Right() const noexcept { return m_Right; }

    private:
        ViewFrustum() = default;

        void UpdatePlanes();

        CameraParams m_Camera{};
        glm::vec3 m_Right{1.0f, 0.0f, 0.0f};
        std::array<Plane, 6> m_Planes{};
        std::array<glm::vec3, 8> m_Corners{};
    };

    [[nodiscard]] bool IsValid(const CameraParams& camera);
}
