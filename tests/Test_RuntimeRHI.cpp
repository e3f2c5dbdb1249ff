#include <gtest/gtest.h>
#include <cstddef>
#include <memory>
#include <type_traits>

#include "RHI.Vulkan.hpp"

import RHI;

// Vulkan objects are built with std::make_unique from their factories, so their
// constructors must stay reachable from outside the class.
TEST(RuntimeRHI, VulkanObjectsAreMakeUniqueConstructible)
{
    static_assert(std::is_constructible_v<RHI::VulkanContext>);
    static_assert(std::is_constructible_v<RHI::VulkanDevice>);
    static_assert(std::is_constructible_v<RHI::VulkanBuffer, RHI::VulkanDevice&, size_t, RHI::BufferUsage>);
    static_assert(std::is_constructible_v<RHI::VulkanShaderModule, RHI::VulkanDevice&, VkShaderModule,
                                          RHI::ShaderStage>);
    static_assert(std::is_constructible_v<RHI::VulkanPipelineLayout, RHI::VulkanDevice&>);
    static_assert(std::is_constructible_v<RHI::VulkanGraphicsPipeline, RHI::VulkanDevice&, VkPipeline>);
    SUCCEED();
}

TEST(RuntimeRHI, VulkanObjectsImplementTheDeviceSeam)
{
    static_assert(std::is_base_of_v<RHI::IDevice, RHI::VulkanDevice>);
    static_assert(std::is_base_of_v<RHI::Buffer, RHI::VulkanBuffer>);
    static_assert(std::is_base_of_v<RHI::ShaderModule, RHI::VulkanShaderModule>);
    static_assert(std::is_base_of_v<RHI::PipelineLayout, RHI::VulkanPipelineLayout>);
    static_assert(std::is_base_of_v<RHI::GraphicsPipeline, RHI::VulkanGraphicsPipeline>);
    SUCCEED();
}
