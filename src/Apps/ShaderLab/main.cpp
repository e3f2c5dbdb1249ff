#include <charconv>
#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>

import Core;
import Runtime.ShaderLab;

using namespace Core;

namespace
{
    void PrintUsage()
    {
        Log::Info("Usage: ShaderLab [--shader <path>] [--frames <n>] [--watch] [--no-validation]");
    }

    bool ParseArgs(int argc, char** argv, Runtime::ShaderLabConfig& config)
    {
        for (int i = 1; i < argc; ++i)
        {
            const std::string_view arg = argv[i];
            if (arg == "--shader" && i + 1 < argc)
            {
                config.ShaderPath = std::string(argv[++i]);
            }
            else if (arg == "--frames" && i + 1 < argc)
            {
                const std::string_view value = argv[++i];
                uint32_t frames = 0;
                auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), frames);
                if (ec != std::errc{} || ptr != value.data() + value.size())
                {
                    Log::Error("Invalid frame count '{}'", value);
                    return false;
                }
                config.FrameCount = frames;
            }
            else if (arg == "--watch")
            {
                config.Watch = true;
            }
            else if (arg == "--no-validation")
            {
                config.EnableValidation = false;
            }
            else
            {
                Log::Error("Unknown argument '{}'", arg);
                return false;
            }
        }

        if (config.Watch && !config.ShaderPath)
            Log::Warn("--watch has no effect without --shader");
        return true;
    }
}

int main(int argc, char** argv)
{
    Runtime::ShaderLabConfig config;
#ifdef NDEBUG
    config.EnableValidation = false;
#endif
    if (!ParseArgs(argc, argv, config))
    {
        PrintUsage();
        return 2;
    }

    auto lab = Runtime::ShaderLab::Create(config);
    if (!lab)
    {
        Log::Error("ShaderLab failed to start: {}", ErrorCodeToString(lab.error()));
        return 1;
    }

    if (auto result = (*lab)->Run(); !result)
    {
        Log::Error("ShaderLab stopped: {}", ErrorCodeToString(result.error()));
        return 1;
    }
    return 0;
}
