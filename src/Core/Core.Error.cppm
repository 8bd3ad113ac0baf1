module;

#include <cstdint>
#include <string_view>
#include <expected>
#include <utility>

export module Core.Error;

export namespace Core
{
    // -------------------------------------------------------------------------
    // Error Handling Strategy
    // -------------------------------------------------------------------------
    // 1. std::expected<T, E>  - For FALLIBLE operations where failure is expected
    //                          and the caller MUST handle it. Use when:
    //                          - Validating configuration at construction time
    //                          - Ingesting host snapshots that may carry NaN/Inf
    //
    // 2. std::optional<T>    - For QUERIES where "not found" is a valid outcome,
    //                          not an error (e.g. looking up a node's partition).
    //
    // 3. Raw pointers (T*)   - ONLY for non-owning observation of existing objects
    //                          where nullptr means "no reference".
    //
    // 4. Assertions          - For INVARIANTS that should never be violated.
    //                          If violated, indicates a bug, not a runtime error.
    //
    // Empty input is never an error: every structure degrades to an empty result.
    // -------------------------------------------------------------------------

    enum class ErrorCode : uint32_t
    {
        Success = 0,

        // Validation errors (300-399)
        InvalidArgument = 300,
        InvalidConfiguration = 301,
        NonFiniteInput = 302,
        OutOfRange = 303,

        // Generic
        Unknown = 999
    };

    // Convert error code to string for logging
    constexpr std::string_view ErrorCodeToString(ErrorCode code)
    {
        switch (code)
        {
            case ErrorCode::Success:              return "Success";
            case ErrorCode::InvalidArgument:      return "InvalidArgument";
            case ErrorCode::InvalidConfiguration: return "InvalidConfiguration";
            case ErrorCode::NonFiniteInput:       return "NonFiniteInput";
            case ErrorCode::OutOfRange:           return "OutOfRange";
            default:                              return "Unknown";
        }
    }

    // Type alias for common expected patterns
    template <typename T>
    using Expected = std::expected<T, ErrorCode>;

    // Helper to create success result
    template <typename T>
    constexpr Expected<T> Ok(T&& value)
    {
        return Expected<T>(std::forward<T>(value));
    }

    // Helper to create error result
    template <typename T>
    constexpr Expected<T> Err(ErrorCode code)
    {
        return std::unexpected(code);
    }

    // Void success type for operations that don't return a value
    struct Unit {};
    inline constexpr Unit unit{};

    using Result = Expected<Unit>;

    constexpr Result Ok()
    {
        return Result(unit);
    }

    constexpr Result Err(ErrorCode code)
    {
        return std::unexpected(code);
    }
}
