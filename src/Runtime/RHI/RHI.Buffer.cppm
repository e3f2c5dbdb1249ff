module;
#include <cstddef>
#include <memory>
#include <span>
#include "RHI.Vulkan.hpp"

export module RHI:Buffer;

import :Types;
import :Device;
import :VulkanDevice;
import Core.Error;

export namespace RHI
{
    // VMA-backed buffer. Host-visible buffers are persistently mapped at creation.
    class VulkanBuffer final : public Buffer
    {
    public:
        VulkanBuffer(VulkanDevice& device, size_t size, BufferUsage usage)
            : m_Device(device), m_SizeBytes(size), m_Usage(usage)
        {
        }
        ~VulkanBuffer() override;

        [[nodiscard]] static Core::Expected<std::unique_ptr<VulkanBuffer>> Create(
            VulkanDevice& device, const BufferDesc& desc);

        [[nodiscard]] size_t GetSizeBytes() const override { return m_SizeBytes; }
        [[nodiscard]] BufferUsage GetUsage() const override { return m_Usage; }

        [[nodiscard]] VkBuffer GetHandle() const { return m_Buffer; }
        [[nodiscard]] bool IsHostVisible() const { return m_MappedData != nullptr; }

        // Copies 'data' at 'offset' and flushes the written range.
        [[nodiscard]] Core::Result Write(size_t offset, std::span<const std::byte> data);

    private:
        VulkanDevice& m_Device;
        VkBuffer m_Buffer = VK_NULL_HANDLE;
        VmaAllocation m_Allocation = VK_NULL_HANDLE;
        void* m_MappedData = nullptr;
        size_t m_SizeBytes = 0;
        BufferUsage m_Usage;
    };
}
