module;
#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <utility>

#include <entt/entity/registry.hpp>
#include <glm/glm.hpp>
#include <glm/gtc/constants.hpp>
#include <glm/gtc/matrix_transform.hpp>

module Runtime.ShaderLab;

import Core;
import RHI;
import Graphics;
import ECS;

namespace Runtime
{
    ShaderLab::ShaderLab(const ShaderLabConfig& config) : m_Config(config)
    {
    }

    Core::Expected<std::unique_ptr<ShaderLab>> ShaderLab::Create(const ShaderLabConfig& config)
    {
        Core::Log::Info("Initializing {}...", config.AppName);

        auto lab = std::make_unique<ShaderLab>(config);

        // 1. Vulkan Context & Device
        RHI::ContextConfig ctxConfig{.AppName = config.AppName, .EnableValidation = config.EnableValidation};
        auto context = RHI::VulkanContext::Create(ctxConfig);
        if (!context)
        {
            Core::Log::Error("FATAL: Vulkan context creation failed ({})", Core::ErrorCodeToString(context.error()));
            return std::unexpected(context.error());
        }
        lab->m_Context = std::move(*context);

        auto device = RHI::VulkanDevice::Create(*lab->m_Context);
        if (!device)
        {
            Core::Log::Error("FATAL: Vulkan device creation failed ({})", Core::ErrorCodeToString(device.error()));
            return std::unexpected(device.error());
        }
        lab->m_Device = std::move(*device);

        // 2. Shader & Pipeline
        if (auto pipeline = lab->InitPipeline(); !pipeline)
            return std::unexpected(pipeline.error());

        // 3. Scene
        lab->BuildScene();

        if (config.Watch && config.ShaderPath)
        {
            Core::Filesystem::FileWatcher::Initialize();
            lab->m_LiveShader->WatchFile(*config.ShaderPath);
            Core::Log::Info("Watching {} for changes", *config.ShaderPath);
        }

        return lab;
    }

    ShaderLab::~ShaderLab()
    {
        if (m_Device)
        {
            m_Device->WaitIdle();
        }

        // Order matters! Stop the watcher before the LiveShader unregisters its callbacks.
        if (Core::Filesystem::FileWatcher::IsRunning())
            Core::Filesystem::FileWatcher::Shutdown();

        m_Scene.GetRegistry().clear();
        m_Model.reset();
        m_LiveShader.reset();
        m_Compiler.reset();
        m_Device.reset();
        m_Context.reset();
    }

    Core::Result ShaderLab::InitPipeline()
    {
        std::string name = "viewer";
        std::string source(Graphics::ViewerContract::DefaultShaderSource());
        if (m_Config.ShaderPath)
        {
            auto text = Core::Filesystem::ReadTextFile(*m_Config.ShaderPath);
            if (!text)
            {
                Core::Log::Error("FATAL: Could not read shader {} ({})", *m_Config.ShaderPath,
                                 Core::ErrorCodeToString(text.error()));
                return Core::Err(text.error());
            }
            source = std::move(*text);
            name = *m_Config.ShaderPath;
        }

        m_Compiler = std::make_unique<Graphics::ShaderCompiler>(Graphics::ShaderCompilerConfig{
            .Optimize = false,
            .GenerateDebugInfo = true,
            .WarningsAsErrors = false,
        });

        auto shader = m_Compiler->Compile(*m_Device, name, source);
        if (!shader)
        {
            Core::Log::Error("FATAL: {}", shader.error().ToString());
            return Core::Err(Core::ErrorCode::ShaderCompilationFailed);
        }

        auto contract = Graphics::ViewerContract::ExpectedLayout();
        if (auto mismatches = Graphics::ValidateLayout(shader->GetInferredLayout(), contract); !mismatches.empty())
        {
            Core::Log::Error("FATAL: Shader '{}' does not fit the viewer contract:\n{}", name,
                             Graphics::FormatMismatches(mismatches));
            return Core::Err(Core::ErrorCode::LayoutMismatch);
        }

        Graphics::PipelineConfig pipelineConfig{
            .VertexBuffers = Graphics::ViewerContract::VertexBuffers(),
            .Topology = RHI::PrimitiveTopology::TriangleList,
            .ColorFormat = RHI::Format::B8G8R8A8_SRGB,
            .DepthFormat = RHI::Format::D32_SFLOAT,
            .Label = "Viewer",
        };

        auto handle = Graphics::GraphicsPipelineHandle::Create(*m_Device, std::move(contract), *shader, pipelineConfig);
        if (!handle)
        {
            Core::Log::Error("FATAL: Pipeline creation failed ({})", Core::ErrorCodeToString(handle.error()));
            return Core::Err(handle.error());
        }

        m_LiveShader = std::make_unique<Graphics::LiveShader>(*m_Compiler, *m_Device, std::move(*handle), name);
        return Core::Ok();
    }

    void ShaderLab::BuildScene()
    {
        m_Model = std::make_shared<Graphics::Model>("Orbiter");

        m_Root = m_Scene.NewNode();
        for (uint32_t i = 0; i < m_Config.InstanceCount; ++i)
        {
            const ECS::NodeHandle node = m_Scene.NewNode();
            if (auto parented = m_Scene.SetParent(node, m_Root); !parented)
            {
                Core::Log::Error("Could not attach orbiter {} ({})", i, Core::ErrorCodeToString(parented.error()));
                continue;
            }
            if (auto assigned = m_Scene.SetRenderable(node, m_Model); !assigned)
            {
                Core::Log::Error("Could not assign model to orbiter {} ({})", i,
                                 Core::ErrorCodeToString(assigned.error()));
                continue;
            }
            m_Orbiters.push_back(node);
        }

        Core::Log::Info("Scene built: {} nodes, {} instances of '{}'", m_Scene.Size(), m_Model->GetInstanceCount(),
                        m_Model->Name);
    }

    Core::Result ShaderLab::OnUpdate(float time)
    {
        m_Scene.UpdateLocalTransform(m_Root, glm::rotate(glm::mat4(1.0f), time * 0.5f, glm::vec3(0.0f, 1.0f, 0.0f)));

        const float step = glm::two_pi<float>() / static_cast<float>(std::max<size_t>(m_Orbiters.size(), 1));
        for (size_t i = 0; i < m_Orbiters.size(); ++i)
        {
            const float angle = step * static_cast<float>(i) + time;
            glm::mat4 local = glm::translate(glm::mat4(1.0f), glm::vec3(3.0f * std::cos(angle), 0.0f,
                                                                        3.0f * std::sin(angle)));
            local = glm::scale(local, glm::vec3(0.25f));
            m_Scene.UpdateLocalTransform(m_Orbiters[i], local);
        }

        m_Scene.UpdateTransforms();

        if (auto synced = Graphics::SyncInstanceBuffer(*m_Model, *m_Device); !synced)
        {
            Core::Log::Error("FATAL: Instance buffer sync failed ({})", Core::ErrorCodeToString(synced.error()));
            return synced;
        }

        m_LiveShader->Update();
        return Core::Ok();
    }

    Core::Result ShaderLab::Run()
    {
        using Clock = std::chrono::steady_clock;
        const auto start = Clock::now();

        for (uint32_t frame = 0; frame < m_Config.FrameCount; ++frame)
        {
            const float time = std::chrono::duration<float>(Clock::now() - start).count();
            if (auto updated = OnUpdate(time); !updated)
                return updated;

            if (m_Config.Watch)
                std::this_thread::sleep_for(m_Config.FrameInterval);
        }

        const auto& handle = m_LiveShader->GetHandle();
        Core::Log::Info("Ran {} frame(s). Pipeline '{}' at generation {}, {} instance(s), {} warning(s), {} error(s)",
                        m_Config.FrameCount, handle.GetShaderName(), handle.GetGeneration(),
                        m_Model->GetInstanceCount(), Core::Log::GetWarningCount(), Core::Log::GetErrorCount());
        if (!m_LiveShader->GetLastDiagnostic().empty())
            Core::Log::Warn("Last shader diagnostic:\n{}", m_LiveShader->GetLastDiagnostic());

        return Core::Ok();
    }
}
