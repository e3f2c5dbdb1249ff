#pragma once

// =============================================================================
// Recording RHI::IDevice for tests that must not touch a GPU.
//
// Usage: #include "MockDevice.h" AFTER `import RHI;` and `import Core;`.
// Every created object is counted; buffers keep their bytes so tests can read
// back what was uploaded. Fail* switches make the next creations fail.
// =============================================================================

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace Testing
{
    class MockShaderModule final : public RHI::ShaderModule
    {
    public:
        MockShaderModule(RHI::ShaderStage stage, std::span<const uint32_t> code, std::string label)
            : Stage(stage), Code(code.begin(), code.end()), Label(std::move(label))
        {
        }

        [[nodiscard]] RHI::ShaderStage GetStage() const override { return Stage; }

        RHI::ShaderStage Stage;
        std::vector<uint32_t> Code;
        std::string Label;
    };

    class MockPipelineLayout final : public RHI::PipelineLayout
    {
    public:
        explicit MockPipelineLayout(RHI::PipelineLayoutDesc desc) : Desc(std::move(desc)) {}

        [[nodiscard]] uint32_t GetSetCount() const override { return static_cast<uint32_t>(Desc.Sets.size()); }

        RHI::PipelineLayoutDesc Desc;
    };

    class MockGraphicsPipeline final : public RHI::GraphicsPipeline
    {
    public:
        uint32_t Serial = 0;
        const RHI::PipelineLayout* Layout = nullptr;
        const RHI::ShaderModule* VertexModule = nullptr;
        const RHI::ShaderModule* FragmentModule = nullptr;
        std::string VertexEntryPoint;
        std::string FragmentEntryPoint;
        std::vector<RHI::VertexBufferLayout> VertexBuffers;
        RHI::PrimitiveTopology Topology = RHI::PrimitiveTopology::TriangleList;
        RHI::Format ColorFormat = RHI::Format::Undefined;
        std::optional<RHI::Format> DepthFormat;
        std::string Label;
    };

    class MockBuffer final : public RHI::Buffer
    {
    public:
        MockBuffer(uint32_t serial, size_t size, RHI::BufferUsage usage) : Serial(serial), Bytes(size), Usage(usage) {}

        [[nodiscard]] size_t GetSizeBytes() const override { return Bytes.size(); }
        [[nodiscard]] RHI::BufferUsage GetUsage() const override { return Usage; }

        uint32_t Serial = 0;
        std::vector<std::byte> Bytes;
        RHI::BufferUsage Usage;
    };

    class MockDevice final : public RHI::IDevice
    {
    public:
        MockDevice() = default;

        [[nodiscard]] Core::Expected<std::unique_ptr<RHI::ShaderModule>> CreateShaderModule(
            const RHI::ShaderModuleDesc& desc) override
        {
            if (FailShaderModules) return Core::Err<std::unique_ptr<RHI::ShaderModule>>(Core::ErrorCode::DeviceLost);
            ++ShaderModulesCreated;
            return std::make_unique<MockShaderModule>(desc.Stage, desc.Code, desc.Label);
        }

        [[nodiscard]] Core::Expected<std::unique_ptr<RHI::PipelineLayout>> CreatePipelineLayout(
            const RHI::PipelineLayoutDesc& desc) override
        {
            ++PipelineLayoutsCreated;
            return std::make_unique<MockPipelineLayout>(desc);
        }

        [[nodiscard]] Core::Expected<std::unique_ptr<RHI::GraphicsPipeline>> CreateGraphicsPipeline(
            const RHI::GraphicsPipelineDesc& desc) override
        {
            if (FailPipelines)
                return Core::Err<std::unique_ptr<RHI::GraphicsPipeline>>(Core::ErrorCode::PipelineCreationFailed);

            auto pipeline = std::make_unique<MockGraphicsPipeline>();
            pipeline->Serial = ++PipelinesCreated;
            pipeline->Layout = desc.Layout;
            pipeline->VertexModule = desc.VertexModule;
            pipeline->FragmentModule = desc.FragmentModule;
            pipeline->VertexEntryPoint = desc.VertexEntryPoint;
            pipeline->FragmentEntryPoint = desc.FragmentEntryPoint;
            pipeline->VertexBuffers.assign(desc.VertexBuffers.begin(), desc.VertexBuffers.end());
            pipeline->Topology = desc.Topology;
            pipeline->ColorFormat = desc.ColorFormat;
            pipeline->DepthFormat = desc.DepthFormat;
            pipeline->Label = desc.Label;
            return pipeline;
        }

        [[nodiscard]] Core::Expected<std::unique_ptr<RHI::Buffer>> CreateBuffer(const RHI::BufferDesc& desc) override
        {
            if (FailBuffers) return Core::Err<std::unique_ptr<RHI::Buffer>>(Core::ErrorCode::OutOfDeviceMemory);

            auto buffer = std::make_unique<MockBuffer>(++BuffersCreated, desc.SizeBytes, desc.Usage);
            if (!desc.InitialData.empty())
                std::memcpy(buffer->Bytes.data(), desc.InitialData.data(),
                            std::min(desc.InitialData.size(), buffer->Bytes.size()));
            return buffer;
        }

        [[nodiscard]] Core::Result WriteBuffer(RHI::Buffer& buffer, size_t offset,
                                               std::span<const std::byte> data) override
        {
            if (FailBuffers) return Core::Err(Core::ErrorCode::OutOfDeviceMemory);

            auto& mock = static_cast<MockBuffer&>(buffer);
            if (offset + data.size() > mock.Bytes.size()) return Core::Err(Core::ErrorCode::OutOfRange);

            std::memcpy(mock.Bytes.data() + offset, data.data(), data.size());
            ++BufferWrites;
            return Core::Ok();
        }

        [[nodiscard]] std::string_view GetName() const override { return "MockDevice"; }

        uint32_t ShaderModulesCreated = 0;
        uint32_t PipelineLayoutsCreated = 0;
        uint32_t PipelinesCreated = 0;
        uint32_t BuffersCreated = 0;
        uint32_t BufferWrites = 0;

        bool FailShaderModules = false;
        bool FailPipelines = false;
        bool FailBuffers = false;
    };

    inline const MockGraphicsPipeline& AsMock(const RHI::GraphicsPipeline& pipeline)
    {
        return static_cast<const MockGraphicsPipeline&>(pipeline);
    }

    inline const MockBuffer& AsMock(const RHI::Buffer& buffer)
    {
        return static_cast<const MockBuffer&>(buffer);
    }
}
