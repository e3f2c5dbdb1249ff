module;
#include <memory>
#include <string>
#include <utility>
#include <vector>

module Graphics:PipelineManager.Impl;
import :PipelineManager;
import :BindingLayout;
import :ShaderCompiler;
import RHI;
import Core.Error;
import Core.Logging;

namespace Graphics
{
    Core::Expected<GraphicsPipelineHandle> GraphicsPipelineHandle::Create(RHI::IDevice& device,
                                                                          std::vector<BindingGroupLayout> contract,
                                                                          const CompiledShader& shader,
                                                                          const PipelineConfig& config)
    {
        GraphicsPipelineHandle handle;
        handle.m_Contract = std::move(contract);
        handle.m_Config = config;

        auto layout = device.CreatePipelineLayout(ToPipelineLayoutDesc(handle.m_Contract, config.Label + ".Layout"));
        if (!layout)
        {
            Core::Log::Error("Pipeline '{}': failed to create pipeline layout ({})", config.Label,
                             Core::ErrorCodeToString(layout.error()));
            return std::unexpected(layout.error());
        }
        handle.m_Layout = std::move(*layout);

        auto pipeline = handle.BuildPipeline(device, shader);
        if (!pipeline) return std::unexpected(pipeline.error());

        handle.m_Pipeline = std::move(*pipeline);
        handle.m_ShaderName = shader.GetName();
        Core::Log::Info("Pipeline created for shader {}", shader.GetName());
        return handle;
    }

    Core::Result GraphicsPipelineHandle::Recreate(RHI::IDevice& device, const CompiledShader& shader)
    {
        auto pipeline = BuildPipeline(device, shader);
        if (!pipeline)
        {
            Core::Log::Error("Pipeline '{}': recreation for shader {} rejected by the device, keeping {}",
                             m_Config.Label, shader.GetName(), m_ShaderName);
            return Core::Err(Core::ErrorCode::PipelineCreationFailed);
        }

        m_Pipeline = std::move(*pipeline);
        m_ShaderName = shader.GetName();
        ++m_Generation;
        Core::Log::Info("Pipeline recreated for shader {}", shader.GetName());
        return Core::Ok();
    }

    Core::Expected<std::unique_ptr<RHI::GraphicsPipeline>> GraphicsPipelineHandle::BuildPipeline(
        RHI::IDevice& device, const CompiledShader& shader) const
    {
        RHI::GraphicsPipelineDesc desc;
        desc.Layout = m_Layout.get();
        desc.VertexModule = shader.GetVertexModule().get();
        desc.VertexEntryPoint = shader.GetVertexEntryPoint();
        desc.FragmentModule = shader.GetFragmentModule().get();
        desc.FragmentEntryPoint = shader.GetFragmentEntryPoint();
        desc.VertexBuffers = m_Config.VertexBuffers;
        desc.Topology = m_Config.Topology;
        desc.ColorFormat = m_Config.ColorFormat;
        desc.DepthFormat = m_Config.DepthFormat;
        desc.Label = m_Config.Label;

        auto pipeline = device.CreateGraphicsPipeline(desc);
        if (!pipeline)
        {
            Core::Log::Error("Pipeline '{}': device rejected pipeline for shader {} ({})", m_Config.Label,
                             shader.GetName(), Core::ErrorCodeToString(pipeline.error()));
            return std::unexpected(Core::ErrorCode::PipelineCreationFailed);
        }
        return pipeline;
    }
}
