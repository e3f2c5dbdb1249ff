module;
#include <memory>
#include "RHI.Vulkan.hpp"

export module RHI:Shader;

import :Types;
import :Device;
import :VulkanDevice;
import Core.Error;

export namespace RHI
{
    class VulkanShaderModule final : public ShaderModule
    {
    public:
        VulkanShaderModule(VulkanDevice& device, VkShaderModule handle, ShaderStage stage)
            : m_Device(device), m_Module(handle), m_Stage(stage)
        {
        }
        ~VulkanShaderModule() override;

        [[nodiscard]] static Core::Expected<std::unique_ptr<VulkanShaderModule>> Create(
            VulkanDevice& device, const ShaderModuleDesc& desc);

        [[nodiscard]] ShaderStage GetStage() const override { return m_Stage; }
        [[nodiscard]] VkShaderModule GetHandle() const { return m_Module; }

    private:
        VulkanDevice& m_Device;
        VkShaderModule m_Module = VK_NULL_HANDLE;
        ShaderStage m_Stage;
    };

    [[nodiscard]] VkShaderStageFlagBits ToVulkan(ShaderStage stage);
    [[nodiscard]] VkShaderStageFlags ToVulkan(ShaderStageFlags flags);
}
