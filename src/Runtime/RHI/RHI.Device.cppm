module;
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

export module RHI:Device;

import :Types;
import Core.Error;

export namespace RHI
{
    // -------------------------------------------------------------------------
    // Opaque GPU objects. Owned by whoever asked the device for them.
    // -------------------------------------------------------------------------

    class ShaderModule
    {
    public:
        virtual ~ShaderModule() = default;
        ShaderModule(const ShaderModule&) = delete;
        ShaderModule& operator=(const ShaderModule&) = delete;

        [[nodiscard]] virtual ShaderStage GetStage() const = 0;

    protected:
        ShaderModule() = default;
    };

    class PipelineLayout
    {
    public:
        virtual ~PipelineLayout() = default;
        PipelineLayout(const PipelineLayout&) = delete;
        PipelineLayout& operator=(const PipelineLayout&) = delete;

        [[nodiscard]] virtual uint32_t GetSetCount() const = 0;

    protected:
        PipelineLayout() = default;
    };

    class GraphicsPipeline
    {
    public:
        virtual ~GraphicsPipeline() = default;
        GraphicsPipeline(const GraphicsPipeline&) = delete;
        GraphicsPipeline& operator=(const GraphicsPipeline&) = delete;

    protected:
        GraphicsPipeline() = default;
    };

    class Buffer
    {
    public:
        virtual ~Buffer() = default;
        Buffer(const Buffer&) = delete;
        Buffer& operator=(const Buffer&) = delete;

        [[nodiscard]] virtual size_t GetSizeBytes() const = 0;
        [[nodiscard]] virtual BufferUsage GetUsage() const = 0;

    protected:
        Buffer() = default;
    };

    // -------------------------------------------------------------------------
    // Creation descriptions
    // -------------------------------------------------------------------------

    struct ShaderModuleDesc
    {
        std::span<const uint32_t> Code; // SPIR-V words
        ShaderStage Stage = ShaderStage::Vertex;
        std::string Label;
    };

    struct DescriptorBindingDesc
    {
        uint32_t Binding = 0;
        DescriptorType Type = DescriptorType::UniformBuffer;
        uint32_t Count = 1;
        ShaderStageFlags Visibility = ShaderStageFlags::None;
    };

    struct DescriptorSetLayoutDesc
    {
        std::vector<DescriptorBindingDesc> Bindings;
    };

    // Set index == position in 'Sets'. Empty sets are legal placeholders.
    struct PipelineLayoutDesc
    {
        std::vector<DescriptorSetLayoutDesc> Sets;
        std::string Label;
    };

    struct GraphicsPipelineDesc
    {
        const PipelineLayout* Layout = nullptr;
        const ShaderModule* VertexModule = nullptr;
        std::string VertexEntryPoint;
        const ShaderModule* FragmentModule = nullptr;
        std::string FragmentEntryPoint;

        std::span<const VertexBufferLayout> VertexBuffers;
        PrimitiveTopology Topology = PrimitiveTopology::TriangleList;
        Format ColorFormat = Format::B8G8R8A8_SRGB;
        std::optional<Format> DepthFormat;
        std::string Label;
    };

    struct BufferDesc
    {
        size_t SizeBytes = 0;
        BufferUsage Usage = BufferUsage::Vertex;
        bool HostVisible = true;
        std::span<const std::byte> InitialData; // copied into the new buffer when non-empty
        std::string Label;
    };

    // -------------------------------------------------------------------------
    // Device seam. Everything above the RHI talks to the GPU through this.
    // Implementations: VulkanDevice (real GPU), test doubles.
    // -------------------------------------------------------------------------
    class IDevice
    {
    public:
        virtual ~IDevice() = default;
        IDevice(const IDevice&) = delete;
        IDevice& operator=(const IDevice&) = delete;
        IDevice(IDevice&&) = delete;
        IDevice& operator=(IDevice&&) = delete;

        [[nodiscard]] virtual Core::Expected<std::unique_ptr<ShaderModule>> CreateShaderModule(
            const ShaderModuleDesc& desc) = 0;

        [[nodiscard]] virtual Core::Expected<std::unique_ptr<PipelineLayout>> CreatePipelineLayout(
            const PipelineLayoutDesc& desc) = 0;

        [[nodiscard]] virtual Core::Expected<std::unique_ptr<GraphicsPipeline>> CreateGraphicsPipeline(
            const GraphicsPipelineDesc& desc) = 0;

        [[nodiscard]] virtual Core::Expected<std::unique_ptr<Buffer>> CreateBuffer(const BufferDesc& desc) = 0;

        // Overwrites [offset, offset + data.size()) of a host-visible buffer.
        [[nodiscard]] virtual Core::Result WriteBuffer(Buffer& buffer, size_t offset,
                                                       std::span<const std::byte> data) = 0;

        [[nodiscard]] virtual std::string_view GetName() const = 0;

    protected:
        IDevice() = default;
    };
}
