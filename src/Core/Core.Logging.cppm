module;
#include <format>
#include <string_view>
#include <utility>

export module Core.Logging;

export namespace Core::Log
{
    enum class Level
    {
        Debug,
        Info,
        Warning,
        Error
    };

    // Messages below this level are dropped. Debug is additionally compiled out in release builds.
    void SetMinLevel(Level level) noexcept;
    [[nodiscard]] Level GetMinLevel() noexcept;
}

namespace Core::Log
{
    // Internal helper to print color codes
    void PrintColored(Level level, std::string_view msg);

    [[nodiscard]] bool IsEnabled(Level level) noexcept;

    // -------------------------------------------------------------------------
    // Public API
    // -------------------------------------------------------------------------

    export template <typename... Args>
    void Info(std::format_string<Args...> fmt, Args&&... args)
    {
        if (!IsEnabled(Level::Info)) return;
        PrintColored(Level::Info, std::format(fmt, std::forward<Args>(args)...));
    }

    export template <typename... Args>
    void Warn(std::format_string<Args...> fmt, Args&&... args)
    {
        if (!IsEnabled(Level::Warning)) return;
        PrintColored(Level::Warning, std::format(fmt, std::forward<Args>(args)...));
    }

    export template <typename... Args>
    void Error(std::format_string<Args...> fmt, Args&&... args)
    {
        if (!IsEnabled(Level::Error)) return;
        PrintColored(Level::Error, std::format(fmt, std::forward<Args>(args)...));
    }

    // Only prints in Debug builds
    export template <typename... Args>
    void Debug([[maybe_unused]] std::format_string<Args...> fmt, [[maybe_unused]] Args&&... args)
    {
#ifndef NDEBUG
        if (!IsEnabled(Level::Debug)) return;
        PrintColored(Level::Debug, std::format(fmt, std::forward<Args>(args)...));
#endif
    }
}
