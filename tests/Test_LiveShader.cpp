#include <gtest/gtest.h>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>
#include <thread>
#include <utility>

import Graphics;
import RHI;
import Core;

#include "MockDevice.h"

using namespace Graphics;
using Status = LiveShader::ApplyResult::Status;

namespace
{
    constexpr std::string_view kFlatShader = R"glsl(#version 450

#pragma shader_stage(vertex)
layout(location = 0) in vec3 inPosition;
void main()
{
    gl_Position = vec4(inPosition, 1.0);
}

#pragma shader_stage(fragment)
layout(location = 0) out vec4 outColor;
void main()
{
    outColor = vec4(1.0, 0.0, 0.0, 1.0);
}
)glsl";

    constexpr std::string_view kTintedShader = R"glsl(#version 450

#pragma shader_stage(vertex)
layout(location = 0) in vec3 inPosition;
void main()
{
    gl_Position = vec4(inPosition * 2.0, 1.0);
}

#pragma shader_stage(fragment)
layout(location = 0) out vec4 outColor;
void main()
{
    outColor = vec4(0.0, 1.0, 0.0, 1.0);
}
)glsl";

    // Needs a camera group the flat contract does not have.
    constexpr std::string_view kUniformShader = R"glsl(#version 450
layout(set = 0, binding = 0) uniform Tint { vec4 color; } tint;

#pragma shader_stage(vertex)
layout(location = 0) in vec3 inPosition;
void main()
{
    gl_Position = vec4(inPosition, 1.0);
}

#pragma shader_stage(fragment)
layout(location = 0) out vec4 outColor;
void main()
{
    outColor = tint.color;
}
)glsl";

    constexpr std::string_view kBrokenShader = R"glsl(#version 450

#pragma shader_stage(vertex)
void main()
{
    gl_Position = vec4(undefinedThing, 1.0);
}

#pragma shader_stage(fragment)
layout(location = 0) out vec4 outColor;
void main() { outColor = vec4(1.0); }
)glsl";

    class LiveShaderTest : public ::testing::Test
    {
    protected:
        GraphicsPipelineHandle MakeHandle(std::string_view source)
        {
            auto compiled = Compiler.Compile(Device, "flat", source);
            EXPECT_TRUE(compiled.has_value());

            PipelineConfig config;
            config.Label = "Flat";
            auto handle = GraphicsPipelineHandle::Create(Device, compiled->GetInferredLayout(), *compiled, config);
            EXPECT_TRUE(handle.has_value());
            return std::move(*handle);
        }

        ShaderCompiler Compiler;
        Testing::MockDevice Device;
    };
}

// -----------------------------------------------------------------------------
// Apply
// -----------------------------------------------------------------------------

TEST_F(LiveShaderTest, CompatibleEditIsSwapped)
{
    LiveShader live(Compiler, Device, MakeHandle(kFlatShader), "flat");

    const auto result = live.Apply(kTintedShader);

    EXPECT_TRUE(result.Succeeded());
    EXPECT_EQ(result.State, Status::Swapped);
    EXPECT_TRUE(result.Diagnostic.empty());
    EXPECT_EQ(live.GetHandle().GetGeneration(), 1u);
    EXPECT_EQ(Testing::AsMock(live.GetHandle().GetPipeline()).Serial, 2u);
    EXPECT_EQ(Testing::AsMock(live.GetHandle().GetPipeline()).Label, "Flat");
}

TEST_F(LiveShaderTest, CompileErrorKeepsPipeline)
{
    LiveShader live(Compiler, Device, MakeHandle(kFlatShader), "flat");

    const auto result = live.Apply(kBrokenShader);

    EXPECT_EQ(result.State, Status::CompileFailed);
    EXPECT_NE(result.Diagnostic.find("undefinedThing"), std::string::npos);
    EXPECT_EQ(live.GetLastDiagnostic(), result.Diagnostic);
    EXPECT_EQ(live.GetHandle().GetGeneration(), 0u);
    EXPECT_EQ(Testing::AsMock(live.GetHandle().GetPipeline()).Serial, 1u);
    EXPECT_EQ(Device.PipelinesCreated, 1u);
}

TEST_F(LiveShaderTest, LayoutMismatchKeepsPipeline)
{
    LiveShader live(Compiler, Device, MakeHandle(kFlatShader), "flat");

    const auto result = live.Apply(kUniformShader);

    EXPECT_EQ(result.State, Status::LayoutMismatch);
    EXPECT_NE(result.Diagnostic.find("binding group"), std::string::npos);
    EXPECT_EQ(live.GetHandle().GetGeneration(), 0u);
    EXPECT_EQ(Device.PipelinesCreated, 1u);
}

TEST_F(LiveShaderTest, PipelineFailureKeepsPipeline)
{
    LiveShader live(Compiler, Device, MakeHandle(kFlatShader), "flat");
    Device.FailPipelines = true;

    const auto result = live.Apply(kTintedShader);

    EXPECT_EQ(result.State, Status::DeviceFailed);
    EXPECT_EQ(result.Diagnostic, "pipeline creation failed: PipelineCreationFailed");
    EXPECT_EQ(live.GetHandle().GetGeneration(), 0u);
    EXPECT_EQ(live.GetHandle().GetShaderName(), "flat");
}

TEST_F(LiveShaderTest, ShaderModuleFailureIsDeviceFailure)
{
    LiveShader live(Compiler, Device, MakeHandle(kFlatShader), "flat");
    Device.FailShaderModules = true;

    const auto result = live.Apply(kTintedShader);

    EXPECT_EQ(result.State, Status::DeviceFailed);
    EXPECT_FALSE(result.Diagnostic.empty());
    EXPECT_EQ(live.GetHandle().GetGeneration(), 0u);
}

TEST_F(LiveShaderTest, SuccessClearsPreviousDiagnostic)
{
    LiveShader live(Compiler, Device, MakeHandle(kFlatShader), "flat");

    ASSERT_FALSE(live.Apply(kBrokenShader).Succeeded());
    ASSERT_FALSE(live.GetLastDiagnostic().empty());

    ASSERT_TRUE(live.Apply(kTintedShader).Succeeded());
    EXPECT_TRUE(live.GetLastDiagnostic().empty());
    EXPECT_EQ(live.GetHandle().GetGeneration(), 1u);
}

TEST(LiveShaderStatus, ToString)
{
    EXPECT_EQ(ToString(Status::Swapped), "swapped");
    EXPECT_EQ(ToString(Status::CompileFailed), "compile failed");
    EXPECT_EQ(ToString(Status::LayoutMismatch), "layout mismatch");
    EXPECT_EQ(ToString(Status::DeviceFailed), "device failed");
}

// -----------------------------------------------------------------------------
// File watching
// -----------------------------------------------------------------------------

TEST_F(LiveShaderTest, UpdateWithoutChangesIsNoOp)
{
    LiveShader live(Compiler, Device, MakeHandle(kFlatShader), "flat");

    live.Update();

    EXPECT_EQ(live.GetHandle().GetGeneration(), 0u);
    EXPECT_EQ(Device.PipelinesCreated, 1u);
}

TEST_F(LiveShaderTest, WatchedFileEditIsAppliedOnUpdate)
{
    const auto path = std::filesystem::temp_directory_path() / "shaderlab_live_shader_test.glsl";
    {
        std::ofstream out(path, std::ios::trunc);
        out << kFlatShader;
    }

    {
        LiveShader live(Compiler, Device, MakeHandle(kFlatShader), "flat");
        live.WatchFile(path.string());
        live.WatchFile(path.string());
        Core::Filesystem::FileWatcher::Initialize();

        {
            std::ofstream out(path, std::ios::trunc);
            out << kTintedShader;
        }
        std::filesystem::last_write_time(path, std::filesystem::file_time_type::clock::now() + std::chrono::seconds(5));

        const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while (live.GetHandle().GetGeneration() == 0 && std::chrono::steady_clock::now() < deadline)
        {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            live.Update();
        }

        EXPECT_EQ(live.GetHandle().GetGeneration(), 1u);
        EXPECT_TRUE(live.GetLastDiagnostic().empty());

        Core::Filesystem::FileWatcher::Shutdown();
    }

    std::filesystem::remove(path);
}

TEST_F(LiveShaderTest, DestroyingOneWatcherKeepsTheOtherReloading)
{
    const auto path = std::filesystem::temp_directory_path() / "shaderlab_live_shader_shared.glsl";
    {
        std::ofstream out(path, std::ios::trunc);
        out << kFlatShader;
    }

    {
        LiveShader survivor(Compiler, Device, MakeHandle(kFlatShader), "survivor");
        survivor.WatchFile(path.string());
        {
            LiveShader transient(Compiler, Device, MakeHandle(kFlatShader), "transient");
            transient.WatchFile(path.string());
        }
        Core::Filesystem::FileWatcher::Initialize();

        {
            std::ofstream out(path, std::ios::trunc);
            out << kTintedShader;
        }
        std::filesystem::last_write_time(path, std::filesystem::file_time_type::clock::now() + std::chrono::seconds(5));

        const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while (survivor.GetHandle().GetGeneration() == 0 && std::chrono::steady_clock::now() < deadline)
        {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            survivor.Update();
        }

        EXPECT_EQ(survivor.GetHandle().GetGeneration(), 1u);

        Core::Filesystem::FileWatcher::Shutdown();
    }

    std::filesystem::remove(path);
}
