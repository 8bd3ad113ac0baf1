module;
#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>

export module Core:Handle;

export namespace Core
{
    // -------------------------------------------------------------------------
    // StrongId - Type-safe opaque identifier
    // -------------------------------------------------------------------------
    // Wraps a host-assigned 64-bit key. The Tag parameter keeps identifiers of
    // different entity kinds from being mixed up at compile time:
    //
    //   struct NodeTag {};
    //   using NodeId = Core::StrongId<NodeTag>;
    //
    // Identifiers are stable across frames; the engine never allocates them.
    // -------------------------------------------------------------------------
    template <typename Tag>
    struct StrongId
    {
        static constexpr uint64_t INVALID_VALUE = std::numeric_limits<uint64_t>::max();

        uint64_t Value = INVALID_VALUE;

        constexpr StrongId() = default;

        constexpr explicit StrongId(uint64_t value) : Value(value)
        {
        }

        [[nodiscard]] constexpr bool IsValid() const noexcept
        {
            return Value != INVALID_VALUE;
        }

        [[nodiscard]] constexpr explicit operator bool() const noexcept
        {
            return IsValid();
        }

        auto operator<=>(const StrongId&) const = default;
    };

    // MurmurHash3 finalizer (fast, high avalanche)
    [[nodiscard]] constexpr uint64_t MixBits(uint64_t val) noexcept
    {
        val ^= val >> 33;
        val *= 0xff51afd7ed558ccdULL;
        val ^= val >> 33;
        val *= 0xc4ceb9fe1a85ec53ULL;
        val ^= val >> 33;
        return val;
    }
}

// Allow StrongId to be used in unordered containers
namespace std
{
    template <typename Tag>
    struct hash<Core::StrongId<Tag>>
    {
        std::size_t operator()(const Core::StrongId<Tag>& id) const noexcept
        {
            return static_cast<std::size_t>(Core::MixBits(id.Value));
        }
    };
}
