module;
#include <cstdint>
#include <filesystem>
#include <string>
#include <functional>
#include <thread>
#include <vector>
#include <mutex>
#include <atomic>

export module Core.Filesystem;

import Core.Error;

export namespace Core::Filesystem {

    // Reads a whole file as text (shader sources are UTF-8, no decoding is done).
    [[nodiscard]] Expected<std::string> ReadTextFile(const std::filesystem::path& path);

    // Polls watched files on a background thread.
    // Callbacks run on the Watcher Thread while the watch list lock is held:
    // keep them short and hand the work over to the main thread.
    class FileWatcher
    {
    public:
        using ChangeCallback = std::function<void(const std::string&)>;
        using WatchId = uint64_t;
        static constexpr WatchId InvalidWatch = 0;

        static void Initialize();
        static void Shutdown();
        [[nodiscard]] static bool IsRunning() { return s_Running; }

        // Returns InvalidWatch if 'path' does not exist.
        [[nodiscard]] static WatchId Watch(const std::string& path, ChangeCallback callback);

        // Removes one watch; other watches on the same path keep firing.
        // Its callback does not run after this returns.
        static void Unwatch(WatchId id);

    private:
        struct Entry
        {
            WatchId Id = InvalidWatch;
            std::filesystem::path Path;
            std::filesystem::file_time_type LastTime;
            ChangeCallback Callback;
        };

        static void ThreadFunc();

        static std::vector<Entry> s_Watches;
        static std::mutex s_Mutex;
        static WatchId s_NextId;
        static std::atomic<bool> s_Running;
        static std::thread s_Thread;
    };
}
