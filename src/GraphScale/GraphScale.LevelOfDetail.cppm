module;

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <glm/glm.hpp>

export module GraphScale:LevelOfDetail;

import Core.Error;

export namespace GraphScale
{
    // Ordered from most to least detail. The numeric value doubles as the band index.
    enum class LodLevel : std::uint8_t
    {
        High = 0,
        Medium = 1,
        Low = 2,
        Minimal = 3,
        Culled = 4
    };

    inline constexpr std::size_t kLodLevelCount = 5;

    [[nodiscard]] constexpr std::size_t ToIndex(LodLevel level) noexcept
    {
        return static_cast<std::size_t>(level);
    }

    [[nodiscard]] constexpr const char* LodLevelToString(LodLevel level) noexcept
    {
        switch (level)
        {
        case LodLevel::High: return "High";
        case LodLevel::Medium: return "Medium";
        case LodLevel::Low: return "Low";
        case LodLevel::Minimal: return "Minimal";
        case LodLevel::Culled: return "Culled";
        }
        return "Unknown";
    }

    // --- Per-band rendering policy ---

    [[nodiscard]] constexpr float ComplexityFactor(LodLevel level) noexcept
    {
        switch (level)
        {
        case LodLevel::High: return 1.0f;
        case LodLevel::Medium: return 0.5f;
        case LodLevel::Low: return 0.25f;
        case LodLevel::Minimal: return 0.1f;
        case LodLevel::Culled: return 0.0f;
        }
        return 0.0f;
    }

    [[nodiscard]] constexpr float VertexMultiplier(LodLevel level) noexcept
    {
        switch (level)
        {
        case LodLevel::High: return 1.0f;
        case LodLevel::Medium: return 0.3f;
        case LodLevel::Low: return 0.1f;
        case LodLevel::Minimal: return 0.05f;
        case LodLevel::Culled: return 0.0f;
        }
        return 0.0f;
    }

    [[nodiscard]] constexpr bool RendersEdges(LodLevel level) noexcept
    {
        return level == LodLevel::High || level == LodLevel::Medium;
    }

    [[nodiscard]] constexpr bool RendersLabels(LodLevel level) noexcept
    {
        return level == LodLevel::High;
    }

    struct LodConfig
    {
        glm::vec3 CameraPosition{0.0f};
        // Band boundaries High|Medium|Low|Minimal|Culled, in world units, strictly ascending.
        std::array<float, 4> Distances{100.0f, 500.0f, 1000.0f, 2000.0f};
        bool UseSquaredDistances = true;
        float Hysteresis = 1.1f;
    };

    struct LodStats
    {
        std::array<std::size_t, kLodLevelCount> Counts{};
        std::size_t Total{0};

        [[nodiscard]] std::size_t Count(LodLevel level) const { return Counts[ToIndex(level)]; }
    };

    // Distance-banded detail selection. The per-node LodLevel is owned by the caller; Update()
    // is a pure function of (previous level, position), so distinct nodes may be updated from
    // different threads.
    class LodSelector
    {
    public:
        [[nodiscard]] static Core::Expected<LodSelector> Create(const LodConfig& config = {});

        // Returns the level the node should carry next. Moving to a farther band applies at
        // once; moving nearer requires crossing threshold[current - 1] / Hysteresis.
        [[nodiscard]] LodLevel Update(const glm::vec3& position, LodLevel current) const;

        // Band for a position ignoring hysteresis.
        [[nodiscard]] LodLevel Classify(const glm::vec3& position) const;

        // Applies Update() in place to every node. ioLevels must be as long as positions.
        [[nodiscard]] Core::Expected<LodStats> UpdateLevels(std::span<const glm::vec3> positions,
            std::span<LodLevel> ioLevels) const;

        void SetCameraPosition(const glm::vec3& position) noexcept { m_Config.CameraPosition = position; }

        [[nodiscard]] const LodConfig& Config() const noexcept { return m_Config; }

    private:
        explicit LodSelector(const LodConfig& config);

        [[nodiscard]] float MeasureDistance(const glm::vec3& position) const;
        [[nodiscard]] LodLevel Bucket(float distance) const;

        LodConfig m_Config{};
        // Distances, squared when UseSquaredDistances is set.
        std::array<float, 4> m_Thresholds{};
        // Distances / Hysteresis, in the same space as m_Thresholds.
        std::array<float, 4> m_RestoreThresholds{};
    };

    [[nodiscard]] bool IsValid(const LodConfig& config);

    [[nodiscard]] LodStats CountLevels(std::span<const LodLevel> levels);
}
