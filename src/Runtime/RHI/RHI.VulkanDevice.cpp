module;
#include <cstddef>
#include <memory>
#include <span>
#include <vector>
#include "RHI.Vulkan.hpp"

module RHI:VulkanDevice.Impl;
import :VulkanDevice;
import :Shader;
import :Pipeline;
import :Buffer;
import Core.Error;
import Core.Logging;

namespace RHI
{
    Core::Expected<std::unique_ptr<VulkanDevice>> VulkanDevice::Create(VulkanContext& context)
    {
        auto device = std::make_unique<VulkanDevice>();

        if (auto picked = device->PickPhysicalDevice(context.GetInstance()); !picked)
        {
            return std::unexpected(picked.error());
        }
        if (auto created = device->CreateLogicalDevice(context); !created)
        {
            return std::unexpected(created.error());
        }
        return device;
    }

    VulkanDevice::~VulkanDevice()
    {
        if (m_Device) vkDeviceWaitIdle(m_Device);
        if (m_Allocator) vmaDestroyAllocator(m_Allocator);
        if (m_Device) vkDestroyDevice(m_Device, nullptr);
    }

    void VulkanDevice::WaitIdle() const
    {
        if (m_Device) vkDeviceWaitIdle(m_Device);
    }

    // -------------------------------------------------------------------------
    // IDevice
    // -------------------------------------------------------------------------

    Core::Expected<std::unique_ptr<ShaderModule>> VulkanDevice::CreateShaderModule(const ShaderModuleDesc& desc)
    {
        auto shaderModule = VulkanShaderModule::Create(*this, desc);
        if (!shaderModule) return std::unexpected(shaderModule.error());
        return std::unique_ptr<ShaderModule>(std::move(*shaderModule));
    }

    Core::Expected<std::unique_ptr<PipelineLayout>> VulkanDevice::CreatePipelineLayout(const PipelineLayoutDesc& desc)
    {
        auto layout = VulkanPipelineLayout::Create(*this, desc);
        if (!layout) return std::unexpected(layout.error());
        return std::unique_ptr<PipelineLayout>(std::move(*layout));
    }

    Core::Expected<std::unique_ptr<GraphicsPipeline>> VulkanDevice::CreateGraphicsPipeline(
        const GraphicsPipelineDesc& desc)
    {
        auto pipeline = VulkanGraphicsPipeline::Create(*this, desc);
        if (!pipeline) return std::unexpected(pipeline.error());
        return std::unique_ptr<GraphicsPipeline>(std::move(*pipeline));
    }

    Core::Expected<std::unique_ptr<Buffer>> VulkanDevice::CreateBuffer(const BufferDesc& desc)
    {
        auto buffer = VulkanBuffer::Create(*this, desc);
        if (!buffer) return std::unexpected(buffer.error());
        return std::unique_ptr<Buffer>(std::move(*buffer));
    }

    Core::Result VulkanDevice::WriteBuffer(Buffer& buffer, size_t offset, std::span<const std::byte> data)
    {
        auto* vulkanBuffer = dynamic_cast<VulkanBuffer*>(&buffer);
        if (!vulkanBuffer)
        {
            Core::Log::Error("WriteBuffer: buffer was not created by this device");
            return Core::Err(Core::ErrorCode::InvalidArgument);
        }
        return vulkanBuffer->Write(offset, data);
    }

    // -------------------------------------------------------------------------
    // Initialization
    // -------------------------------------------------------------------------

    Core::Result VulkanDevice::PickPhysicalDevice(VkInstance instance)
    {
        uint32_t deviceCount = 0;
        vkEnumeratePhysicalDevices(instance, &deviceCount, nullptr);

        if (deviceCount == 0)
        {
            Core::Log::Error("Failed to find GPUs with Vulkan support!");
            return Core::Err(Core::ErrorCode::ResourceNotFound);
        }

        std::vector<VkPhysicalDevice> devices(deviceCount);
        vkEnumeratePhysicalDevices(instance, &deviceCount, devices.data());

        for (const auto& device : devices)
        {
            if (IsDeviceSuitable(device))
            {
                m_PhysicalDevice = device;
                break;
            }
        }

        if (m_PhysicalDevice == VK_NULL_HANDLE)
        {
            Core::Log::Error("Failed to find a suitable GPU! Checked {} devices.", deviceCount);
            return Core::Err(Core::ErrorCode::ResourceNotFound);
        }

        VkPhysicalDeviceProperties props;
        vkGetPhysicalDeviceProperties(m_PhysicalDevice, &props);
        m_DeviceName = props.deviceName;
        Core::Log::Info("Selected GPU: {}", m_DeviceName);
        return Core::Ok();
    }

    Core::Result VulkanDevice::CreateLogicalDevice(VulkanContext& context)
    {
        m_Indices = FindQueueFamilies(m_PhysicalDevice);

        float queuePriority = 1.0f;
        VkDeviceQueueCreateInfo queueCreateInfo{};
        queueCreateInfo.sType = VK_STRUCTURE_TYPE_DEVICE_QUEUE_CREATE_INFO;
        queueCreateInfo.queueFamilyIndex = m_Indices.GraphicsFamily.value();
        queueCreateInfo.queueCount = 1;
        queueCreateInfo.pQueuePriorities = &queuePriority;

        VkPhysicalDeviceVulkan13Features features13{};
        features13.sType = VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_VULKAN_1_3_FEATURES;
        features13.dynamicRendering = VK_TRUE;

        VkPhysicalDeviceFeatures2 features2{};
        features2.sType = VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_FEATURES_2;
        features2.pNext = &features13;

        VkDeviceCreateInfo createInfo{};
        createInfo.sType = VK_STRUCTURE_TYPE_DEVICE_CREATE_INFO;
        createInfo.pNext = &features2;
        createInfo.queueCreateInfoCount = 1;
        createInfo.pQueueCreateInfos = &queueCreateInfo;

        if (vkCreateDevice(m_PhysicalDevice, &createInfo, nullptr, &m_Device) != VK_SUCCESS)
        {
            Core::Log::Error("Failed to create logical device!");
            m_Device = VK_NULL_HANDLE;
            return Core::Err(Core::ErrorCode::DeviceLost);
        }

        volkLoadDevice(m_Device);

        VmaVulkanFunctions vulkanFunctions = {};
        vulkanFunctions.vkGetInstanceProcAddr = vkGetInstanceProcAddr;
        vulkanFunctions.vkGetDeviceProcAddr = vkGetDeviceProcAddr;

        VmaAllocatorCreateInfo allocatorInfo = {};
        allocatorInfo.vulkanApiVersion = VK_API_VERSION_1_3;
        allocatorInfo.physicalDevice = m_PhysicalDevice;
        allocatorInfo.device = m_Device;
        allocatorInfo.instance = context.GetInstance();
        allocatorInfo.pVulkanFunctions = &vulkanFunctions;

        if (vmaCreateAllocator(&allocatorInfo, &m_Allocator) != VK_SUCCESS)
        {
            Core::Log::Error("Failed to create VMA allocator!");
            m_Allocator = VK_NULL_HANDLE;
            return Core::Err(Core::ErrorCode::OutOfDeviceMemory);
        }

        vkGetDeviceQueue(m_Device, m_Indices.GraphicsFamily.value(), 0, &m_GraphicsQueue);
        return Core::Ok();
    }

    bool VulkanDevice::IsDeviceSuitable(VkPhysicalDevice device) const
    {
        VkPhysicalDeviceProperties props;
        vkGetPhysicalDeviceProperties(device, &props);

        if (props.apiVersion < VK_API_VERSION_1_3)
        {
            Core::Log::Warn("GPU '{}' rejected: Vulkan 1.3 not supported.", props.deviceName);
            return false;
        }

        VkPhysicalDeviceVulkan13Features features13{};
        features13.sType = VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_VULKAN_1_3_FEATURES;
        VkPhysicalDeviceFeatures2 features2{};
        features2.sType = VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_FEATURES_2;
        features2.pNext = &features13;
        vkGetPhysicalDeviceFeatures2(device, &features2);

        if (!features13.dynamicRendering)
        {
            Core::Log::Warn("GPU '{}' rejected: Dynamic Rendering not supported.", props.deviceName);
            return false;
        }

        if (!FindQueueFamilies(device).IsComplete())
        {
            Core::Log::Warn("GPU '{}' rejected: No Graphics Queue.", props.deviceName);
            return false;
        }
        return true;
    }

    QueueFamilyIndices VulkanDevice::FindQueueFamilies(VkPhysicalDevice device)
    {
        QueueFamilyIndices indices;
        uint32_t queueFamilyCount = 0;
        vkGetPhysicalDeviceQueueFamilyProperties(device, &queueFamilyCount, nullptr);

        std::vector<VkQueueFamilyProperties> queueFamilies(queueFamilyCount);
        vkGetPhysicalDeviceQueueFamilyProperties(device, &queueFamilyCount, queueFamilies.data());

        for (uint32_t i = 0; i < queueFamilyCount; ++i)
        {
            if (queueFamilies[i].queueFlags & VK_QUEUE_GRAPHICS_BIT)
            {
                indices.GraphicsFamily = i;
                break;
            }
        }
        return indices;
    }
}
