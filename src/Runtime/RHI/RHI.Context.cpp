module;
#include <cstring>
#include <memory>
#include <vector>

#include "RHI.Vulkan.hpp"

module RHI:Context.Impl;
import :Context;
import Core.Error;
import Core.Logging;

namespace RHI
{
    namespace
    {
        constexpr const char* VALIDATION_LAYER = "VK_LAYER_KHRONOS_validation";

        VKAPI_ATTR VkBool32 VKAPI_CALL DebugCallback(
            VkDebugUtilsMessageSeverityFlagBitsEXT severity,
            VkDebugUtilsMessageTypeFlagsEXT,
            const VkDebugUtilsMessengerCallbackDataEXT* pCallbackData,
            void*)
        {
            if (severity >= VK_DEBUG_UTILS_MESSAGE_SEVERITY_ERROR_BIT_EXT)
                Core::Log::Error("[Vulkan Validation]: {}", pCallbackData->pMessage);
            else if (severity >= VK_DEBUG_UTILS_MESSAGE_SEVERITY_WARNING_BIT_EXT)
                Core::Log::Warn("[Vulkan Validation]: {}", pCallbackData->pMessage);
            return VK_FALSE;
        }

        VkDebugUtilsMessengerCreateInfoEXT MakeMessengerInfo()
        {
            VkDebugUtilsMessengerCreateInfoEXT info{};
            info.sType = VK_STRUCTURE_TYPE_DEBUG_UTILS_MESSENGER_CREATE_INFO_EXT;
            info.messageSeverity = VK_DEBUG_UTILS_MESSAGE_SEVERITY_WARNING_BIT_EXT |
                VK_DEBUG_UTILS_MESSAGE_SEVERITY_ERROR_BIT_EXT;
            info.messageType = VK_DEBUG_UTILS_MESSAGE_TYPE_GENERAL_BIT_EXT |
                VK_DEBUG_UTILS_MESSAGE_TYPE_VALIDATION_BIT_EXT |
                VK_DEBUG_UTILS_MESSAGE_TYPE_PERFORMANCE_BIT_EXT;
            info.pfnUserCallback = DebugCallback;
            return info;
        }

        bool IsLayerAvailable(const char* name)
        {
            uint32_t count = 0;
            vkEnumerateInstanceLayerProperties(&count, nullptr);
            std::vector<VkLayerProperties> layers(count);
            vkEnumerateInstanceLayerProperties(&count, layers.data());

            for (const auto& layer : layers)
            {
                if (std::strcmp(layer.layerName, name) == 0) return true;
            }
            return false;
        }
    }

    Core::Expected<std::unique_ptr<VulkanContext>> VulkanContext::Create(const ContextConfig& config)
    {
        // 1. Load the loader entry points
        if (volkInitialize() != VK_SUCCESS)
        {
            Core::Log::Error("Failed to initialize Volk! Is Vulkan installed?");
            return std::unexpected(Core::ErrorCode::DeviceLost);
        }

        auto context = std::make_unique<VulkanContext>();
        if (auto result = context->CreateInstance(config); !result)
        {
            return std::unexpected(result.error());
        }

        // 2. Load instance-level functions
        volkLoadInstance(context->m_Instance);

        if (config.EnableValidation && IsLayerAvailable(VALIDATION_LAYER))
        {
            context->SetupDebugMessenger();
        }

        Core::Log::Info("Vulkan Instance Initialized.");
        return context;
    }

    VulkanContext::~VulkanContext()
    {
        if (m_DebugMessenger != VK_NULL_HANDLE)
        {
            vkDestroyDebugUtilsMessengerEXT(m_Instance, m_DebugMessenger, nullptr);
        }
        if (m_Instance != VK_NULL_HANDLE)
        {
            vkDestroyInstance(m_Instance, nullptr);
        }
    }

    Core::Result VulkanContext::CreateInstance(const ContextConfig& config)
    {
        VkApplicationInfo appInfo{};
        appInfo.sType = VK_STRUCTURE_TYPE_APPLICATION_INFO;
        appInfo.pApplicationName = config.AppName.c_str();
        appInfo.applicationVersion = VK_MAKE_VERSION(1, 0, 0);
        appInfo.pEngineName = "ShaderLab";
        appInfo.engineVersion = VK_MAKE_VERSION(1, 0, 0);
        appInfo.apiVersion = VK_API_VERSION_1_3;

        VkInstanceCreateInfo createInfo{};
        createInfo.sType = VK_STRUCTURE_TYPE_INSTANCE_CREATE_INFO;
        createInfo.pApplicationInfo = &appInfo;

        std::vector<const char*> extensions;
        const bool validation = config.EnableValidation && IsLayerAvailable(VALIDATION_LAYER);
        if (config.EnableValidation && !validation)
        {
            Core::Log::Warn("Validation requested but {} is not installed.", VALIDATION_LAYER);
        }

        VkDebugUtilsMessengerCreateInfoEXT debugCreateInfo = MakeMessengerInfo();
        if (validation)
        {
            extensions.push_back(VK_EXT_DEBUG_UTILS_EXTENSION_NAME);
            createInfo.enabledLayerCount = 1;
            createInfo.ppEnabledLayerNames = &VALIDATION_LAYER;
            // Also covers messages emitted by vkCreateInstance itself
            createInfo.pNext = &debugCreateInfo;
        }

        createInfo.enabledExtensionCount = static_cast<uint32_t>(extensions.size());
        createInfo.ppEnabledExtensionNames = extensions.data();

        VkResult result = vkCreateInstance(&createInfo, nullptr, &m_Instance);
        if (result != VK_SUCCESS)
        {
            Core::Log::Error("Failed to create Vulkan Instance! Error Code: {}", static_cast<int>(result));
            return Core::Err(Core::ErrorCode::DeviceLost);
        }
        return Core::Ok();
    }

    void VulkanContext::SetupDebugMessenger()
    {
        VkDebugUtilsMessengerCreateInfoEXT createInfo = MakeMessengerInfo();
        if (vkCreateDebugUtilsMessengerEXT(m_Instance, &createInfo, nullptr, &m_DebugMessenger) != VK_SUCCESS)
        {
            Core::Log::Warn("Failed to set up debug messenger, continuing without validation output.");
            m_DebugMessenger = VK_NULL_HANDLE;
        }
    }
}
