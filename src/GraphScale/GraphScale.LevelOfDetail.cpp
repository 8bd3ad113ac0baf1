module;

#include <array>
#include <cmath>
#include <span>
#include <glm/glm.hpp>

module GraphScale:LevelOfDetail.Impl;

import Core.Error;
import Core.Logging;
import :LevelOfDetail;

namespace GraphScale
{
    bool IsValid(const LodConfig& config)
    {
        if (!std::isfinite(config.Hysteresis) || config.Hysteresis <= 1.0f) return false;

        float previous = 0.0f;
        for (const float distance : config.Distances)
        {
            if (!std::isfinite(distance) || distance <= previous) return false;
            previous = distance;
        }
        return std::isfinite(config.CameraPosition.x) && std::isfinite(config.CameraPosition.y) &&
               std::isfinite(config.CameraPosition.z);
    }

    LodStats CountLevels(std::span<const LodLevel> levels)
    {
        LodStats stats{};
        for (const LodLevel level : levels) ++stats.Counts[ToIndex(level)];
        stats.Total = levels.size();
        return stats;
    }

    Core::Expected<LodSelector> LodSelector::Create(const LodConfig& config)
    {
        if (!IsValid(config))
        {
            Core::Log::Warn("LodSelector: rejected thresholds [{}, {}, {}, {}] with hysteresis {}",
                config.Distances[0], config.Distances[1], config.Distances[2], config.Distances[3],
                config.Hysteresis);
            return Core::Err<LodSelector>(Core::ErrorCode::InvalidConfiguration);
        }
        return LodSelector(config);
    }

    LodSelector::LodSelector(const LodConfig& config)
        : m_Config(config)
    {
        for (std::size_t i = 0; i < m_Thresholds.size(); ++i)
        {
            const float d = config.Distances[i];
            const float restore = d / config.Hysteresis;
            m_Thresholds[i] = config.UseSquaredDistances ? d * d : d;
            m_RestoreThresholds[i] = config.UseSquaredDistances ? restore * restore : restore;
        }
    }

    float LodSelector::MeasureDistance(const glm::vec3& position) const
    {
        const glm::vec3 d = position - m_Config.CameraPosition;
        const float distanceSq = glm::dot(d, d);
        return m_Config.UseSquaredDistances ? distanceSq : std::sqrt(distanceSq);
    }

    LodLevel LodSelector::Bucket(float distance) const
    {
        for (std::size_t i = 0; i < m_Thresholds.size(); ++i)
        {
            if (distance < m_Thresholds[i]) return static_cast<LodLevel>(i);
        }
        return LodLevel::Culled;
    }

    LodLevel LodSelector::Classify(const glm::vec3& position) const
    {
        return Bucket(MeasureDistance(position));
    }

    LodLevel LodSelector::Update(const glm::vec3& position, LodLevel current) const
    {
        const float distance = MeasureDistance(position);
        const LodLevel candidate = Bucket(distance);

        const std::size_t currentIndex = ToIndex(current);
        const std::size_t candidateIndex = ToIndex(candidate);

        if (candidateIndex >= currentIndex)
        {
            // Same band or farther: no margin needed.
            return candidate;
        }

        // Nearer: the node must be well inside the boundary it last crossed.
        if (distance < m_RestoreThresholds[currentIndex - 1])
        {
            return candidate;
        }
        return current;
    }

    Core::Expected<LodStats> LodSelector::UpdateLevels(std::span<const glm::vec3> positions,
        std::span<LodLevel> ioLevels) const
    {
        if (ioLevels.size() < positions.size())
        {
            return Core::Err<LodStats>(Core::ErrorCode::InvalidArgument);
        }

        LodStats stats{};
        for (std::size_t i = 0; i < positions.size(); ++i)
        {
            ioLevels[i] = Update(positions[i], ioLevels[i]);
            ++stats.Counts[ToIndex(ioLevels[i])];
        }
        stats.Total = positions.size();
        return stats;
    }
}
