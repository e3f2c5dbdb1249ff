#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <cstdint>
#include <string>
#include <thread>

import Core;

TEST(CoreFilesystem, ReadTextFile_ReturnsContents)
{
    const auto path = std::filesystem::temp_directory_path() / "shaderlab_read_text_file.glsl";
    {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out << "#version 450\r\nvoid main() {}\n";
    }

    auto text = Core::Filesystem::ReadTextFile(path);
    ASSERT_TRUE(text.has_value());
    EXPECT_EQ(*text, "#version 450\r\nvoid main() {}\n");

    std::filesystem::remove(path);
}

TEST(CoreFilesystem, ReadTextFile_MissingFile)
{
    auto text = Core::Filesystem::ReadTextFile("definitely/not/here.glsl");
    ASSERT_FALSE(text.has_value());
    EXPECT_EQ(text.error(), Core::ErrorCode::FileNotFound);
}

TEST(CoreFilesystem, WatchMissingFileWarns)
{
    const uint64_t before = Core::Log::GetWarningCount();
    const auto id = Core::Filesystem::FileWatcher::Watch("definitely/not/here.glsl", [](const std::string&) {});
    EXPECT_EQ(id, Core::Filesystem::FileWatcher::InvalidWatch);
    EXPECT_GT(Core::Log::GetWarningCount(), before);
}

TEST(CoreFilesystem, UnwatchRemovesOnlyThatWatch)
{
    using Core::Filesystem::FileWatcher;

    const auto path = std::filesystem::temp_directory_path() / "shaderlab_unwatch_one.glsl";
    {
        std::ofstream out(path, std::ios::trunc);
        out << "#version 450\n";
    }

    std::atomic<int> firstHits{0};
    std::atomic<int> secondHits{0};
    const auto first = FileWatcher::Watch(path.string(), [&](const std::string&) { ++firstHits; });
    const auto second = FileWatcher::Watch(path.string(), [&](const std::string&) { ++secondHits; });
    ASSERT_NE(first, FileWatcher::InvalidWatch);
    ASSERT_NE(second, FileWatcher::InvalidWatch);
    EXPECT_NE(first, second);

    FileWatcher::Unwatch(first);
    FileWatcher::Initialize();

    std::filesystem::last_write_time(path, std::filesystem::file_time_type::clock::now() + std::chrono::seconds(5));

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (secondHits.load() == 0 && std::chrono::steady_clock::now() < deadline)
        std::this_thread::sleep_for(std::chrono::milliseconds(50));

    FileWatcher::Unwatch(second);
    FileWatcher::Shutdown();
    std::filesystem::remove(path);

    EXPECT_EQ(firstHits.load(), 0);
    EXPECT_EQ(secondHits.load(), 1);
}

TEST(CoreError, ErrorCodeNames)
{
    EXPECT_EQ(Core::ErrorCodeToString(Core::ErrorCode::LayoutMismatch), "LayoutMismatch");
    EXPECT_EQ(Core::ErrorCodeToString(Core::ErrorCode::OutOfDeviceMemory), "OutOfDeviceMemory");

    Core::Result ok = Core::Ok();
    EXPECT_TRUE(ok.has_value());
    Core::Result err = Core::Err(Core::ErrorCode::InvalidState);
    EXPECT_EQ(err.error(), Core::ErrorCode::InvalidState);
}
