module;

#include <atomic>
#include <cstdint>
#include <iostream>
#include <mutex>
#include <string_view>

module Core.Logging;

namespace Core::Log
{
    // Global lock to prevent scrambled output from multiple threads
    std::mutex s_LogMutex;

    std::atomic<uint64_t> s_WarningCount{0};
    std::atomic<uint64_t> s_ErrorCount{0};

    void PrintColored(Level level, std::string_view msg)
    {
        if (level == Level::Warning) s_WarningCount.fetch_add(1, std::memory_order_relaxed);
        if (level == Level::Error) s_ErrorCount.fetch_add(1, std::memory_order_relaxed);

        std::lock_guard lock(s_LogMutex);

        // ANSI Color Codes
        const char* color = "\033[0m";
        const char* label = "[INFO]";

        switch (level) {
        case Level::Info:    color = "\033[32m"; label = "[INFO] "; break; // Green
        case Level::Warning: color = "\033[33m"; label = "[WARN] "; break; // Yellow
        case Level::Error:   color = "\033[31m"; label = "[ERR]  "; break; // Red
        case Level::Debug:   color = "\033[36m"; label = "[DBG]  "; break; // Cyan
        }

        std::cout << color << label << msg << "\033[0m" << std::endl;
    }

    uint64_t GetWarningCount()
    {
        return s_WarningCount.load(std::memory_order_relaxed);
    }

    uint64_t GetErrorCount()
    {
        return s_ErrorCount.load(std::memory_order_relaxed);
    }
}
