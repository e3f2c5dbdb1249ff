module;
#include <memory>
#include <string>
#include "RHI.Vulkan.hpp"

export module RHI:Context;

import Core.Error;

export namespace RHI
{
    struct ContextConfig
    {
        std::string AppName = "ShaderLab";
        bool EnableValidation = true;
    };

    // Owns the Vulkan instance. ShaderLab renders offscreen, so no surface
    // extensions are requested.
    class VulkanContext
    {
    public:
        VulkanContext() = default;
        ~VulkanContext();

        VulkanContext(const VulkanContext&) = delete;
        VulkanContext& operator=(const VulkanContext&) = delete;

        [[nodiscard]] static Core::Expected<std::unique_ptr<VulkanContext>> Create(const ContextConfig& config);

        [[nodiscard]] VkInstance GetInstance() const { return m_Instance; }
        [[nodiscard]] bool IsValidationEnabled() const { return m_DebugMessenger != VK_NULL_HANDLE; }

    private:
        Core::Result CreateInstance(const ContextConfig& config);
        void SetupDebugMessenger();

        VkInstance m_Instance = VK_NULL_HANDLE;
        VkDebugUtilsMessengerEXT m_DebugMessenger = VK_NULL_HANDLE;
    };
}
