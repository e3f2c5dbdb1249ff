module;
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

export module Graphics:PipelineManager;

import RHI;
import Core.Error;
import :BindingLayout;
import :ShaderCompiler;

export namespace Graphics
{
    // Fixed-function state captured at creation and reused by every Recreate().
    struct PipelineConfig
    {
        std::vector<RHI::VertexBufferLayout> VertexBuffers;
        RHI::PrimitiveTopology Topology = RHI::PrimitiveTopology::TriangleList;
        RHI::Format ColorFormat = RHI::Format::B8G8R8A8_SRGB;
        std::optional<RHI::Format> DepthFormat = RHI::Format::D32_SFLOAT;
        std::string Label = "Pipeline";
    };

    // A pipeline slot bound to a fixed binding-group contract.
    // The contract and the pipeline layout built from it never change; only the
    // pipeline object is swapped. Callers validate shaders against GetContract()
    // before Recreate(), nothing here checks them.
    class GraphicsPipelineHandle
    {
    public:
        GraphicsPipelineHandle(GraphicsPipelineHandle&&) noexcept = default;
        GraphicsPipelineHandle& operator=(GraphicsPipelineHandle&&) noexcept = default;
        GraphicsPipelineHandle(const GraphicsPipelineHandle&) = delete;
        GraphicsPipelineHandle& operator=(const GraphicsPipelineHandle&) = delete;

        [[nodiscard]] static Core::Expected<GraphicsPipelineHandle> Create(RHI::IDevice& device,
                                                                           std::vector<BindingGroupLayout> contract,
                                                                           const CompiledShader& shader,
                                                                           const PipelineConfig& config);

        // Replaces the pipeline object in place. On failure the previous pipeline stays bound.
        [[nodiscard]] Core::Result Recreate(RHI::IDevice& device, const CompiledShader& shader);

        [[nodiscard]] const std::vector<BindingGroupLayout>& GetContract() const { return m_Contract; }
        [[nodiscard]] const PipelineConfig& GetConfig() const { return m_Config; }
        [[nodiscard]] const RHI::PipelineLayout& GetLayout() const { return *m_Layout; }
        [[nodiscard]] const RHI::GraphicsPipeline& GetPipeline() const { return *m_Pipeline; }
        [[nodiscard]] const std::string& GetShaderName() const { return m_ShaderName; }

        // Incremented by every successful Recreate().
        [[nodiscard]] uint64_t GetGeneration() const { return m_Generation; }

    private:
        GraphicsPipelineHandle() = default;

        [[nodiscard]] Core::Expected<std::unique_ptr<RHI::GraphicsPipeline>> BuildPipeline(
            RHI::IDevice& device, const CompiledShader& shader) const;

        std::vector<BindingGroupLayout> m_Contract;
        PipelineConfig m_Config;
        std::unique_ptr<RHI::PipelineLayout> m_Layout;
        std::unique_ptr<RHI::GraphicsPipeline> m_Pipeline;
        std::string m_ShaderName;
        uint64_t m_Generation = 0;
    };
}
