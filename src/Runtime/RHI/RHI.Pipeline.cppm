module;
#include <memory>
#include <vector>
#include "RHI.Vulkan.hpp"

export module RHI:Pipeline;

import :Types;
import :Device;
import :VulkanDevice;
import Core.Error;

export namespace RHI
{
    // One VkDescriptorSetLayout per set plus the VkPipelineLayout referencing them.
    class VulkanPipelineLayout final : public PipelineLayout
    {
    public:
        explicit VulkanPipelineLayout(VulkanDevice& device) : m_Device(device) {}
        ~VulkanPipelineLayout() override;

        [[nodiscard]] static Core::Expected<std::unique_ptr<VulkanPipelineLayout>> Create(
            VulkanDevice& device, const PipelineLayoutDesc& desc);

        [[nodiscard]] uint32_t GetSetCount() const override { return static_cast<uint32_t>(m_SetLayouts.size()); }
        [[nodiscard]] VkPipelineLayout GetHandle() const { return m_Layout; }
        [[nodiscard]] const std::vector<VkDescriptorSetLayout>& GetSetLayouts() const { return m_SetLayouts; }

    private:
        VulkanDevice& m_Device;
        std::vector<VkDescriptorSetLayout> m_SetLayouts;
        VkPipelineLayout m_Layout = VK_NULL_HANDLE;
    };

    class VulkanGraphicsPipeline final : public GraphicsPipeline
    {
    public:
        VulkanGraphicsPipeline(VulkanDevice& device, VkPipeline pipeline) : m_Device(device), m_Pipeline(pipeline) {}
        ~VulkanGraphicsPipeline() override;

        [[nodiscard]] static Core::Expected<std::unique_ptr<VulkanGraphicsPipeline>> Create(
            VulkanDevice& device, const GraphicsPipelineDesc& desc);

        [[nodiscard]] VkPipeline GetHandle() const { return m_Pipeline; }

    private:
        VulkanDevice& m_Device;
        VkPipeline m_Pipeline = VK_NULL_HANDLE;
    };

    [[nodiscard]] VkFormat ToVulkan(Format format);
    [[nodiscard]] VkPrimitiveTopology ToVulkan(PrimitiveTopology topology);
    [[nodiscard]] VkDescriptorType ToVulkan(DescriptorType type);
}
