module;
#include <memory>
#include "RHI.Vulkan.hpp"

module RHI:Shader.Impl;
import :Shader;
import Core.Error;
import Core.Logging;

namespace RHI
{
    VkShaderStageFlagBits ToVulkan(ShaderStage stage)
    {
        return stage == ShaderStage::Vertex ? VK_SHADER_STAGE_VERTEX_BIT : VK_SHADER_STAGE_FRAGMENT_BIT;
    }

    VkShaderStageFlags ToVulkan(ShaderStageFlags flags)
    {
        VkShaderStageFlags result = 0;
        if ((flags & ShaderStageFlags::Vertex) != ShaderStageFlags::None) result |= VK_SHADER_STAGE_VERTEX_BIT;
        if ((flags & ShaderStageFlags::Fragment) != ShaderStageFlags::None) result |= VK_SHADER_STAGE_FRAGMENT_BIT;
        return result;
    }

    Core::Expected<std::unique_ptr<VulkanShaderModule>> VulkanShaderModule::Create(
        VulkanDevice& device, const ShaderModuleDesc& desc)
    {
        if (desc.Code.empty())
        {
            Core::Log::Error("Cannot create shader module '{}' from empty SPIR-V", desc.Label);
            return std::unexpected(Core::ErrorCode::InvalidArgument);
        }

        VkShaderModuleCreateInfo createInfo{};
        createInfo.sType = VK_STRUCTURE_TYPE_SHADER_MODULE_CREATE_INFO;
        createInfo.codeSize = desc.Code.size_bytes();
        createInfo.pCode = desc.Code.data();

        VkShaderModule handle = VK_NULL_HANDLE;
        if (VkResult result = vkCreateShaderModule(device.GetLogicalDevice(), &createInfo, nullptr, &handle);
            result != VK_SUCCESS)
        {
            Core::Log::Error("Failed to create shader module '{}' (VkResult {})", desc.Label, static_cast<int>(result));
            return std::unexpected(result == VK_ERROR_DEVICE_LOST
                                       ? Core::ErrorCode::DeviceLost
                                       : Core::ErrorCode::OutOfDeviceMemory);
        }

        return std::make_unique<VulkanShaderModule>(device, handle, desc.Stage);
    }

    VulkanShaderModule::~VulkanShaderModule()
    {
        if (m_Module) vkDestroyShaderModule(m_Device.GetLogicalDevice(), m_Module, nullptr);
    }
}
