module;
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <entt/entity/entity.hpp>

export module Runtime.ShaderLab;

import Core;
import RHI;
import Graphics;
import ECS;

export namespace Runtime
{
    struct ShaderLabConfig
    {
        std::string AppName = "ShaderLab";
        std::optional<std::string> ShaderPath; // empty: built-in viewer shader
        uint32_t FrameCount = 3;
        bool Watch = false;
        bool EnableValidation = true;
        uint32_t InstanceCount = 8;
        std::chrono::milliseconds FrameInterval{16};
    };

    // Headless viewer core: a shader bound to the viewer contract, a small scene of
    // instances of one shared model, and the per-frame update loop.
    class ShaderLab
    {
    public:
        explicit ShaderLab(const ShaderLabConfig& config);
        [[nodiscard]] static Core::Expected<std::unique_ptr<ShaderLab>> Create(const ShaderLabConfig& config);
        ~ShaderLab();

        ShaderLab(const ShaderLab&) = delete;
        ShaderLab& operator=(const ShaderLab&) = delete;

        // Runs the configured number of frames. Fails on the first device error.
        [[nodiscard]] Core::Result Run();

        [[nodiscard]] const Graphics::LiveShader& GetLiveShader() const { return *m_LiveShader; }
        [[nodiscard]] const ECS::SceneTree& GetScene() const { return m_Scene; }

    private:
        [[nodiscard]] Core::Result InitPipeline();
        void BuildScene();
        [[nodiscard]] Core::Result OnUpdate(float time);

        ShaderLabConfig m_Config;

        std::unique_ptr<RHI::VulkanContext> m_Context;
        std::unique_ptr<RHI::VulkanDevice> m_Device;
        std::unique_ptr<Graphics::ShaderCompiler> m_Compiler;
        std::unique_ptr<Graphics::LiveShader> m_LiveShader;

        std::shared_ptr<Graphics::Model> m_Model;
        ECS::SceneTree m_Scene;
        ECS::NodeHandle m_Root = entt::null;
        std::vector<ECS::NodeHandle> m_Orbiters;
    };
}
