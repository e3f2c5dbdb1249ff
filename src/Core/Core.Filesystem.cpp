module;
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <thread>
#include <mutex>
#include <vector>
#include <algorithm>
#include <chrono>

module Core.Filesystem;
import Core.Logging;

namespace Core::Filesystem
{
    Expected<std::string> ReadTextFile(const std::filesystem::path& path)
    {
        std::error_code ec;
        if (!std::filesystem::exists(path, ec))
        {
            Log::Error("ReadTextFile: '{}' does not exist", path.string());
            return std::unexpected(ErrorCode::FileNotFound);
        }

        std::ifstream file(path, std::ios::binary);
        if (!file.is_open())
        {
            Log::Error("ReadTextFile: failed to open '{}'", path.string());
            return std::unexpected(ErrorCode::FileReadError);
        }

        std::ostringstream contents;
        contents << file.rdbuf();
        if (file.bad())
        {
            Log::Error("ReadTextFile: read error on '{}'", path.string());
            return std::unexpected(ErrorCode::FileReadError);
        }
        return contents.str();
    }

    std::vector<FileWatcher::Entry> FileWatcher::s_Watches;
    std::mutex FileWatcher::s_Mutex;
    FileWatcher::WatchId FileWatcher::s_NextId = 1;
    std::atomic<bool> FileWatcher::s_Running = false;
    std::thread FileWatcher::s_Thread;

    void FileWatcher::Initialize()
    {
        if (s_Running) return;
        s_Running = true;
        s_Thread = std::thread(ThreadFunc);
        Log::Info("FileWatcher initialized.");
    }

    void FileWatcher::Shutdown()
    {
        s_Running = false;
        if (s_Thread.joinable()) s_Thread.join();

        std::lock_guard lock(s_Mutex);
        s_Watches.clear();
    }

    FileWatcher::WatchId FileWatcher::Watch(const std::string& path, ChangeCallback callback)
    {
        std::lock_guard lock(s_Mutex);

        std::error_code ec;
        auto time = std::filesystem::last_write_time(path, ec);
        if (ec) {
            Log::Warn("FileWatcher: Could not find file to watch '{}'", path);
            return InvalidWatch;
        }

        const WatchId id = s_NextId++;
        s_Watches.push_back({id, path, time, std::move(callback)});
        return id;
    }

    void FileWatcher::Unwatch(WatchId id)
    {
        if (id == InvalidWatch) return;

        std::lock_guard lock(s_Mutex);
        std::erase_if(s_Watches, [&](const Entry& e) { return e.Id == id; });
    }

    void FileWatcher::ThreadFunc()
    {
        while (s_Running)
        {
            std::this_thread::sleep_for(std::chrono::milliseconds(250));

            std::lock_guard lock(s_Mutex);
            for (auto& entry : s_Watches)
            {
                std::error_code ec;
                if (!std::filesystem::exists(entry.Path, ec)) continue;

                auto currentTime = std::filesystem::last_write_time(entry.Path, ec);
                if (ec) continue;

                if (currentTime > entry.LastTime)
                {
                    entry.LastTime = currentTime;
                    Log::Info("[HotReload] Detected change: {}", entry.Path.string());

                    if (entry.Callback) {
                        entry.Callback(entry.Path.string());
                    }
                }
            }
        }
    }
}
