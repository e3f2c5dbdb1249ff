module;
#include <algorithm>
#include <cstring>
#include <memory>
#include <span>
#include "RHI.Vulkan.hpp"

module RHI:Buffer.Impl;
import :Buffer;
import Core.Error;
import Core.Logging;

namespace RHI
{
    namespace
    {
        VkBufferUsageFlags ToVulkan(BufferUsage usage)
        {
            switch (usage)
            {
            case BufferUsage::Vertex: return VK_BUFFER_USAGE_VERTEX_BUFFER_BIT;
            case BufferUsage::Index: return VK_BUFFER_USAGE_INDEX_BUFFER_BIT;
            case BufferUsage::Uniform: return VK_BUFFER_USAGE_UNIFORM_BUFFER_BIT;
            }
            return VK_BUFFER_USAGE_VERTEX_BUFFER_BIT;
        }
    }

    Core::Expected<std::unique_ptr<VulkanBuffer>> VulkanBuffer::Create(VulkanDevice& device, const BufferDesc& desc)
    {
        if (desc.InitialData.size() > desc.SizeBytes)
        {
            Core::Log::Error("Buffer '{}': initial data ({} bytes) exceeds buffer size ({} bytes)",
                             desc.Label, desc.InitialData.size(), desc.SizeBytes);
            return std::unexpected(Core::ErrorCode::InvalidArgument);
        }
        if (!desc.HostVisible && !desc.InitialData.empty())
        {
            Core::Log::Error("Buffer '{}': initial data requires a host-visible buffer", desc.Label);
            return std::unexpected(Core::ErrorCode::InvalidArgument);
        }

        auto buffer = std::make_unique<VulkanBuffer>(device, desc.SizeBytes, desc.Usage);

        VkBufferCreateInfo bufferInfo{};
        bufferInfo.sType = VK_STRUCTURE_TYPE_BUFFER_CREATE_INFO;
        bufferInfo.size = std::max<size_t>(desc.SizeBytes, 4); // Vulkan rejects zero-sized buffers
        bufferInfo.usage = ToVulkan(desc.Usage) | VK_BUFFER_USAGE_TRANSFER_DST_BIT;
        bufferInfo.sharingMode = VK_SHARING_MODE_EXCLUSIVE;

        VmaAllocationCreateInfo allocInfo{};
        allocInfo.usage = VMA_MEMORY_USAGE_AUTO;
        if (desc.HostVisible)
        {
            allocInfo.flags = VMA_ALLOCATION_CREATE_HOST_ACCESS_SEQUENTIAL_WRITE_BIT | VMA_ALLOCATION_CREATE_MAPPED_BIT;
        }

        VmaAllocationInfo resultInfo{};
        if (VkResult result = vmaCreateBuffer(device.GetAllocator(), &bufferInfo, &allocInfo, &buffer->m_Buffer,
                                              &buffer->m_Allocation, &resultInfo);
            result != VK_SUCCESS)
        {
            Core::Log::Error("Failed to create buffer '{}' ({} bytes, VkResult {})", desc.Label, desc.SizeBytes,
                             static_cast<int>(result));
            buffer->m_Buffer = VK_NULL_HANDLE;
            buffer->m_Allocation = VK_NULL_HANDLE;
            return std::unexpected(Core::ErrorCode::OutOfDeviceMemory);
        }

        buffer->m_MappedData = resultInfo.pMappedData;

        if (!desc.InitialData.empty())
        {
            if (auto written = buffer->Write(0, desc.InitialData); !written)
            {
                return std::unexpected(written.error());
            }
        }
        return buffer;
    }

    VulkanBuffer::~VulkanBuffer()
    {
        if (m_Buffer)
        {
            vmaDestroyBuffer(m_Device.GetAllocator(), m_Buffer, m_Allocation);
        }
    }

    Core::Result VulkanBuffer::Write(size_t offset, std::span<const std::byte> data)
    {
        if (data.empty()) return Core::Ok();
        if (offset + data.size() > m_SizeBytes)
        {
            Core::Log::Error("VulkanBuffer::Write(): out of bounds. size={} offset={} cap={}",
                             data.size(), offset, m_SizeBytes);
            return Core::Err(Core::ErrorCode::OutOfRange);
        }
        if (!m_MappedData)
        {
            Core::Log::Error("VulkanBuffer::Write(): buffer is not host-visible (GPU-only)");
            return Core::Err(Core::ErrorCode::InvalidState);
        }

        std::memcpy(static_cast<std::byte*>(m_MappedData) + offset, data.data(), data.size());

        // Safe for coherent memory too (no-op in driver/VMA).
        if (vmaFlushAllocation(m_Device.GetAllocator(), m_Allocation, offset, data.size()) != VK_SUCCESS)
        {
            Core::Log::Error("VulkanBuffer::Write(): flush failed");
            return Core::Err(Core::ErrorCode::DeviceLost);
        }
        return Core::Ok();
    }
}
