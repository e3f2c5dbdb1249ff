module;
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include "RHI.Vulkan.hpp"

export module RHI:VulkanDevice;

import :Types;
import :Device;
import :Context;
import Core.Error;

export namespace RHI
{
    struct QueueFamilyIndices
    {
        std::optional<uint32_t> GraphicsFamily;

        [[nodiscard]] bool IsComplete() const { return GraphicsFamily.has_value(); }
    };

    // IDevice backed by a Vulkan 1.3 logical device with dynamic rendering.
    // Rendering targets are offscreen; no swapchain is created.
    class VulkanDevice final : public IDevice
    {
    public:
        VulkanDevice() = default;
        ~VulkanDevice() override;

        [[nodiscard]] static Core::Expected<std::unique_ptr<VulkanDevice>> Create(VulkanContext& context);

        [[nodiscard]] Core::Expected<std::unique_ptr<ShaderModule>> CreateShaderModule(
            const ShaderModuleDesc& desc) override;
        [[nodiscard]] Core::Expected<std::unique_ptr<PipelineLayout>> CreatePipelineLayout(
            const PipelineLayoutDesc& desc) override;
        [[nodiscard]] Core::Expected<std::unique_ptr<GraphicsPipeline>> CreateGraphicsPipeline(
            const GraphicsPipelineDesc& desc) override;
        [[nodiscard]] Core::Expected<std::unique_ptr<Buffer>> CreateBuffer(const BufferDesc& desc) override;
        [[nodiscard]] Core::Result WriteBuffer(Buffer& buffer, size_t offset,
                                               std::span<const std::byte> data) override;

        [[nodiscard]] std::string_view GetName() const override { return m_DeviceName; }

        [[nodiscard]] VkDevice GetLogicalDevice() const { return m_Device; }
        [[nodiscard]] VkPhysicalDevice GetPhysicalDevice() const { return m_PhysicalDevice; }
        [[nodiscard]] VkQueue GetGraphicsQueue() const { return m_GraphicsQueue; }
        [[nodiscard]] QueueFamilyIndices GetQueueIndices() const { return m_Indices; }
        [[nodiscard]] VmaAllocator GetAllocator() const { return m_Allocator; }

        void WaitIdle() const;

    private:
        Core::Result PickPhysicalDevice(VkInstance instance);
        Core::Result CreateLogicalDevice(VulkanContext& context);

        [[nodiscard]] bool IsDeviceSuitable(VkPhysicalDevice device) const;
        [[nodiscard]] static QueueFamilyIndices FindQueueFamilies(VkPhysicalDevice device);

        VkPhysicalDevice m_PhysicalDevice = VK_NULL_HANDLE;
        VkDevice m_Device = VK_NULL_HANDLE;
        VkQueue m_GraphicsQueue = VK_NULL_HANDLE;
        QueueFamilyIndices m_Indices;
        VmaAllocator m_Allocator = VK_NULL_HANDLE;
        std::string m_DeviceName;
    };
}
