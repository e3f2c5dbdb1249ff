module;
#include <cstdint>
#include <format>
#include <string_view>
#include <utility>

export module Core.Logging;

namespace Core::Log {

    enum class Level {
        Info,
        Warning,
        Error,
        Debug
    };

    // Serialized, colored write to stdout. Defined in Core.Logging.cpp.
    void PrintColored(Level level, std::string_view msg);

    // -------------------------------------------------------------------------
    // Public API
    // -------------------------------------------------------------------------

    export template<typename... Args>
    void Info(std::format_string<Args...> fmt, Args&&... args) {
        PrintColored(Level::Info, std::format(fmt, std::forward<Args>(args)...));
    }

    export template<typename... Args>
    void Warn(std::format_string<Args...> fmt, Args&&... args) {
        PrintColored(Level::Warning, std::format(fmt, std::forward<Args>(args)...));
    }

    export template<typename... Args>
    void Error(std::format_string<Args...> fmt, Args&&... args) {
        PrintColored(Level::Error, std::format(fmt, std::forward<Args>(args)...));
    }

    // Only prints in Debug builds
    export template<typename... Args>
    void Debug(std::format_string<Args...> fmt, Args&&... args) {
#ifndef NDEBUG
        PrintColored(Level::Debug, std::format(fmt, std::forward<Args>(args)...));
#endif
    }

    // Process-wide counters of emitted warnings/errors.
    // Used by the shader editor status line and by tests that expect a diagnostic.
    export [[nodiscard]] uint64_t GetWarningCount();
    export [[nodiscard]] uint64_t GetErrorCount();
}
