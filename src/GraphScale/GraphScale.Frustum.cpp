module;

#include <array>
#include <cmath>
#include <cstdint>
#include <span>
#include <glm/glm.hpp>

module GraphScale:Frustum.Impl;

import Core.Error;
import Core.Logging;
import :Frustum;
import :Types;

namespace GraphScale
{
    namespace
    {
        constexpr float kDirectionEpsilon = 1.0e-6f;
        constexpr float kPi = 3.14159265358979f;

        [[nodiscard]] Plane MakePlane(const glm::vec3& normal, const glm::vec3& pointOnPlane)
        {
            const glm::vec3 n = glm::normalize(normal);
            return Plane{.Normal = n, .Distance = -glm::dot(n, pointOnPlane)};
        }
    }

    bool IsValid(const CameraParams& camera)
    {
        if (!IsFinite(camera.Position) || !IsFinite(camera.Forward) || !IsFinite(camera.Up)) return false;
        if (!std::isfinite(camera.FovY) || !std::isfinite(camera.Aspect) ||
            !std::isfinite(camera.Near) || !std::isfinite(camera.Far))
        {
            return false;
        }

        const float forwardLength = glm::length(camera.Forward);
        if (forwardLength <= kDirectionEpsilon || glm::length(camera.Up) <= kDirectionEpsilon) return false;
        if (glm::length(glm::cross(camera.Forward / forwardLength, glm::normalize(camera.Up))) <= kDirectionEpsilon)
        {
            return false;
        }

        return camera.FovY > 0.0f && camera.FovY < kPi &&
               camera.Aspect > 0.0f &&
               camera.Near > 0.0f && camera.Far > camera.Near;
    }

    Core::Expected<ViewFrustum> ViewFrustum::Create(const CameraParams& camera)
    {
        ViewFrustum frustum;
        if (auto result = frustum.SetCamera(camera); !result)
        {
            return std::unexpected(result.error());
        }
        return frustum;
    }

    Core::Result ViewFrustum::SetCamera(const CameraParams& camera)
    {
        if (!IsValid(camera))
        {
            Core::Log::Warn("ViewFrustum: rejected camera (fovY={}, aspect={}, near={}, far={})",
                camera.FovY, camera.Aspect, camera.Near, camera.Far);
            return Core::Err(Core::ErrorCode::InvalidConfiguration);
        }

        m_Camera = camera;
        UpdatePlanes();
        return Core::Ok();
    }

    void ViewFrustum::UpdatePlanes()
    {
        const glm::vec3 position = m_Camera.Position;
        const glm::vec3 forward = glm::normalize(m_Camera.Forward);
        const glm::vec3 right = glm::normalize(glm::cross(forward, m_Camera.Up));
        const glm::vec3 up = glm::cross(right, forward);

        m_Camera.Forward = forward;
        m_Camera.Up = up;
        m_Right = right;

        const float tanV = std::tan(m_Camera.FovY * 0.5f);
        const float tanH = tanV * m_Camera.Aspect;

        const glm::vec3 nearCenter = position + forward * m_Camera.Near;
        const glm::vec3 farCenter = position + forward * m_Camera.Far;

        m_Planes[static_cast<std::size_t>(FrustumPlane::Near)] = MakePlane(forward, nearCenter);
        m_Planes[static_cast<std::size_t>(FrustumPlane::Far)] = MakePlane(-forward, farCenter);

        // Side planes pass through the eye. Each normal is the cross product of the edge
        // direction and the in-plane axis, ordered so it points toward the view axis.
        const glm::vec3 leftEdge = forward - right * tanH;
        const glm::vec3 rightEdge = forward + right * tanH;
        const glm::vec3 topEdge = forward + up * tanV;
        const glm::vec3 bottomEdge = forward - up * tanV;

        m_Planes[static_cast<std::size_t>(FrustumPlane::Left)] = MakePlane(glm::cross(leftEdge, up), position);
        m_Planes[static_cast<std::size_t>(FrustumPlane::Right)] = MakePlane(glm::cross(up, rightEdge), position);
        m_Planes[static_cast<std::size_t>(FrustumPlane::Top)] = MakePlane(glm::cross(topEdge, right), position);
        m_Planes[static_cast<std::size_t>(FrustumPlane::Bottom)] = MakePlane(glm::cross(right, bottomEdge), position);

        auto writeCorners = [&](std::size_t base, const glm::vec3& center, float distance)
        {
            const glm::vec3 h = right * (tanH * distance);
            const glm::vec3 v = up * (tanV * distance);
            m_Corners[base + 0] = center - h - v;
            m_Corners[base + 1] = center + h - v;
            m_Corners[base + 2] = center + h + v;
            m_Corners[base + 3] = center - h + v;
        };
        writeCorners(0, nearCenter, m_Camera.Near);
        writeCorners(4, farCenter, m_Camera.Far);
    }

    bool ViewFrustum::ContainsPoint(const glm::vec3& point) const
    {
        for (const Plane& plane : m_Planes)
        {
            if (plane.SignedDistance(point) < 0.0f) return false;
        }
        return true;
    }

    bool ViewFrustum::ContainsSphere(const glm::vec3& center, float radius) const
    {
        for (const Plane& plane : m_Planes)
        {
            if (plane.SignedDistance(center) < -radius) return false;
        }
        return true;
    }

    bool ViewFrustum::IntersectsAABB(const glm::vec3& min, const glm::vec3& max) const
    {
        // If the box is completely BEHIND any single plane, it is culled.
        for (const Plane& plane : m_Planes)
        {
            // The vertex furthest along the normal; if even that one is outside, the whole box is.
            glm::vec3 positiveVertex = min;
            if (plane.Normal.x >= 0.0f) positiveVertex.x = max.x;
            if (plane.Normal.y >= 0.0f) positiveVertex.y = max.y;
            if (plane.Normal.z >= 0.0f) positiveVertex.z = max.z;

            if (plane.SignedDistance(positiveVertex) < 0.0f) return false;
        }
        return true;
    }

    Core::Expected<CullingStats> ViewFrustum::CullSpheres(std::span<const glm::vec3> positions, float radius,
        std::span<std::uint8_t> outVisible) const
    {
        if (outVisible.size() < positions.size())
        {
            return Core::Err<CullingStats>(Core::ErrorCode::InvalidArgument);
        }

        CullingStats stats{};
        stats.Total = positions.size();
        for (std::size_t i = 0; i < positions.size(); ++i)
        {
            const bool visible = ContainsSphere(positions[i], radius);
            outVisible[i] = visible ? 1u : 0u;
            if (visible) ++stats.Visible;
        }
        stats.Culled = stats.Total - stats.Visible;
        return stats;
    }
}
