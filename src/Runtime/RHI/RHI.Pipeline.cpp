module;
#include <memory>
#include <vector>
#include "RHI.Vulkan.hpp"

module RHI:Pipeline.Impl;
import :Pipeline;
import :Shader;
import Core.Error;
import Core.Logging;

namespace RHI
{
    VkFormat ToVulkan(Format format)
    {
        switch (format)
        {
        case Format::R32_SFLOAT: return VK_FORMAT_R32_SFLOAT;
        case Format::R32G32_SFLOAT: return VK_FORMAT_R32G32_SFLOAT;
        case Format::R32G32B32_SFLOAT: return VK_FORMAT_R32G32B32_SFLOAT;
        case Format::R32G32B32A32_SFLOAT: return VK_FORMAT_R32G32B32A32_SFLOAT;
        case Format::R8G8B8A8_UNORM: return VK_FORMAT_R8G8B8A8_UNORM;
        case Format::R8G8B8A8_SRGB: return VK_FORMAT_R8G8B8A8_SRGB;
        case Format::B8G8R8A8_UNORM: return VK_FORMAT_B8G8R8A8_UNORM;
        case Format::B8G8R8A8_SRGB: return VK_FORMAT_B8G8R8A8_SRGB;
        case Format::R16G16B16A16_SFLOAT: return VK_FORMAT_R16G16B16A16_SFLOAT;
        case Format::D32_SFLOAT: return VK_FORMAT_D32_SFLOAT;
        case Format::D24_UNORM_S8_UINT: return VK_FORMAT_D24_UNORM_S8_UINT;
        case Format::Undefined: break;
        }
        return VK_FORMAT_UNDEFINED;
    }

    VkPrimitiveTopology ToVulkan(PrimitiveTopology topology)
    {
        switch (topology)
        {
        case PrimitiveTopology::PointList: return VK_PRIMITIVE_TOPOLOGY_POINT_LIST;
        case PrimitiveTopology::LineList: return VK_PRIMITIVE_TOPOLOGY_LINE_LIST;
        case PrimitiveTopology::LineStrip: return VK_PRIMITIVE_TOPOLOGY_LINE_STRIP;
        case PrimitiveTopology::TriangleList: return VK_PRIMITIVE_TOPOLOGY_TRIANGLE_LIST;
        case PrimitiveTopology::TriangleStrip: return VK_PRIMITIVE_TOPOLOGY_TRIANGLE_STRIP;
        }
        return VK_PRIMITIVE_TOPOLOGY_TRIANGLE_LIST;
    }

    VkDescriptorType ToVulkan(DescriptorType type)
    {
        switch (type)
        {
        case DescriptorType::UniformBuffer: return VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER;
        case DescriptorType::SampledImage: return VK_DESCRIPTOR_TYPE_SAMPLED_IMAGE;
        case DescriptorType::Sampler: return VK_DESCRIPTOR_TYPE_SAMPLER;
        }
        return VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER;
    }

    // -------------------------------------------------------------------------
    // Pipeline layout
    // -------------------------------------------------------------------------

    Core::Expected<std::unique_ptr<VulkanPipelineLayout>> VulkanPipelineLayout::Create(
        VulkanDevice& device, const PipelineLayoutDesc& desc)
    {
        auto layout = std::make_unique<VulkanPipelineLayout>(device);
        VkDevice vkDevice = device.GetLogicalDevice();

        for (const auto& set : desc.Sets)
        {
            std::vector<VkDescriptorSetLayoutBinding> bindings;
            bindings.reserve(set.Bindings.size());
            for (const auto& b : set.Bindings)
            {
                VkDescriptorSetLayoutBinding binding{};
                binding.binding = b.Binding;
                binding.descriptorType = ToVulkan(b.Type);
                binding.descriptorCount = b.Count;
                binding.stageFlags = ToVulkan(b.Visibility);
                bindings.push_back(binding);
            }

            VkDescriptorSetLayoutCreateInfo info{};
            info.sType = VK_STRUCTURE_TYPE_DESCRIPTOR_SET_LAYOUT_CREATE_INFO;
            info.bindingCount = static_cast<uint32_t>(bindings.size());
            info.pBindings = bindings.data();

            VkDescriptorSetLayout setLayout = VK_NULL_HANDLE;
            if (vkCreateDescriptorSetLayout(vkDevice, &info, nullptr, &setLayout) != VK_SUCCESS)
            {
                Core::Log::Error("Failed to create descriptor set layout {} for '{}'",
                                 layout->m_SetLayouts.size(), desc.Label);
                return std::unexpected(Core::ErrorCode::PipelineCreationFailed);
            }
            layout->m_SetLayouts.push_back(setLayout);
        }

        VkPipelineLayoutCreateInfo pipelineLayoutInfo{};
        pipelineLayoutInfo.sType = VK_STRUCTURE_TYPE_PIPELINE_LAYOUT_CREATE_INFO;
        pipelineLayoutInfo.setLayoutCount = static_cast<uint32_t>(layout->m_SetLayouts.size());
        pipelineLayoutInfo.pSetLayouts = layout->m_SetLayouts.data();

        if (vkCreatePipelineLayout(vkDevice, &pipelineLayoutInfo, nullptr, &layout->m_Layout) != VK_SUCCESS)
        {
            Core::Log::Error("Failed to create pipeline layout '{}'", desc.Label);
            return std::unexpected(Core::ErrorCode::PipelineCreationFailed);
        }
        return layout;
    }

    VulkanPipelineLayout::~VulkanPipelineLayout()
    {
        VkDevice vkDevice = m_Device.GetLogicalDevice();
        if (m_Layout) vkDestroyPipelineLayout(vkDevice, m_Layout, nullptr);
        for (VkDescriptorSetLayout setLayout : m_SetLayouts)
        {
            vkDestroyDescriptorSetLayout(vkDevice, setLayout, nullptr);
        }
    }

    // -------------------------------------------------------------------------
    // Graphics pipeline (dynamic rendering, no render pass)
    // -------------------------------------------------------------------------

    Core::Expected<std::unique_ptr<VulkanGraphicsPipeline>> VulkanGraphicsPipeline::Create(
        VulkanDevice& device, const GraphicsPipelineDesc& desc)
    {
        const auto* layout = dynamic_cast<const VulkanPipelineLayout*>(desc.Layout);
        const auto* vertexModule = dynamic_cast<const VulkanShaderModule*>(desc.VertexModule);
        const auto* fragmentModule = dynamic_cast<const VulkanShaderModule*>(desc.FragmentModule);
        if (!layout || !vertexModule || !fragmentModule)
        {
            Core::Log::Error("Pipeline '{}' references objects that were not created by this device", desc.Label);
            return std::unexpected(Core::ErrorCode::InvalidArgument);
        }

        // 1. Shaders
        VkPipelineShaderStageCreateInfo shaderStages[2]{};
        shaderStages[0].sType = VK_STRUCTURE_TYPE_PIPELINE_SHADER_STAGE_CREATE_INFO;
        shaderStages[0].stage = VK_SHADER_STAGE_VERTEX_BIT;
        shaderStages[0].module = vertexModule->GetHandle();
        shaderStages[0].pName = desc.VertexEntryPoint.c_str();
        shaderStages[1].sType = VK_STRUCTURE_TYPE_PIPELINE_SHADER_STAGE_CREATE_INFO;
        shaderStages[1].stage = VK_SHADER_STAGE_FRAGMENT_BIT;
        shaderStages[1].module = fragmentModule->GetHandle();
        shaderStages[1].pName = desc.FragmentEntryPoint.c_str();

        // 2. Vertex input: binding index == position in VertexBuffers
        std::vector<VkVertexInputBindingDescription> bindingDescriptions;
        std::vector<VkVertexInputAttributeDescription> attributeDescriptions;
        for (uint32_t i = 0; i < desc.VertexBuffers.size(); ++i)
        {
            const auto& buffer = desc.VertexBuffers[i];
            VkVertexInputBindingDescription binding{};
            binding.binding = i;
            binding.stride = buffer.Stride;
            binding.inputRate = buffer.StepMode == VertexStepMode::Instance
                                    ? VK_VERTEX_INPUT_RATE_INSTANCE
                                    : VK_VERTEX_INPUT_RATE_VERTEX;
            bindingDescriptions.push_back(binding);

            for (const auto& attribute : buffer.Attributes)
            {
                VkVertexInputAttributeDescription attr{};
                attr.binding = i;
                attr.location = attribute.Location;
                attr.format = ToVulkan(attribute.Type);
                attr.offset = attribute.Offset;
                attributeDescriptions.push_back(attr);
            }
        }

        VkPipelineVertexInputStateCreateInfo vertexInputInfo{};
        vertexInputInfo.sType = VK_STRUCTURE_TYPE_PIPELINE_VERTEX_INPUT_STATE_CREATE_INFO;
        vertexInputInfo.vertexBindingDescriptionCount = static_cast<uint32_t>(bindingDescriptions.size());
        vertexInputInfo.pVertexBindingDescriptions = bindingDescriptions.data();
        vertexInputInfo.vertexAttributeDescriptionCount = static_cast<uint32_t>(attributeDescriptions.size());
        vertexInputInfo.pVertexAttributeDescriptions = attributeDescriptions.data();

        // 3. Input Assembly
        VkPipelineInputAssemblyStateCreateInfo inputAssembly{};
        inputAssembly.sType = VK_STRUCTURE_TYPE_PIPELINE_INPUT_ASSEMBLY_STATE_CREATE_INFO;
        inputAssembly.topology = ToVulkan(desc.Topology);
        inputAssembly.primitiveRestartEnable = VK_FALSE;

        // 4. Viewport & Scissor (Dynamic State)
        VkPipelineViewportStateCreateInfo viewportState{};
        viewportState.sType = VK_STRUCTURE_TYPE_PIPELINE_VIEWPORT_STATE_CREATE_INFO;
        viewportState.viewportCount = 1;
        viewportState.scissorCount = 1;

        // 5. Rasterizer
        VkPipelineRasterizationStateCreateInfo rasterizer{};
        rasterizer.sType = VK_STRUCTURE_TYPE_PIPELINE_RASTERIZATION_STATE_CREATE_INFO;
        rasterizer.polygonMode = VK_POLYGON_MODE_FILL;
        rasterizer.lineWidth = 1.0f;
        rasterizer.cullMode = VK_CULL_MODE_BACK_BIT;
        rasterizer.frontFace = VK_FRONT_FACE_COUNTER_CLOCKWISE;

        // 6. Multisampling
        VkPipelineMultisampleStateCreateInfo multisampling{};
        multisampling.sType = VK_STRUCTURE_TYPE_PIPELINE_MULTISAMPLE_STATE_CREATE_INFO;
        multisampling.rasterizationSamples = VK_SAMPLE_COUNT_1_BIT;

        // 7. Color Blending (opaque)
        VkPipelineColorBlendAttachmentState colorBlendAttachment{};
        colorBlendAttachment.colorWriteMask = VK_COLOR_COMPONENT_R_BIT | VK_COLOR_COMPONENT_G_BIT |
            VK_COLOR_COMPONENT_B_BIT | VK_COLOR_COMPONENT_A_BIT;
        colorBlendAttachment.blendEnable = VK_FALSE;

        VkPipelineColorBlendStateCreateInfo colorBlending{};
        colorBlending.sType = VK_STRUCTURE_TYPE_PIPELINE_COLOR_BLEND_STATE_CREATE_INFO;
        colorBlending.attachmentCount = 1;
        colorBlending.pAttachments = &colorBlendAttachment;

        // 8. Dynamic States
        const VkDynamicState dynamicStates[] = {VK_DYNAMIC_STATE_VIEWPORT, VK_DYNAMIC_STATE_SCISSOR};
        VkPipelineDynamicStateCreateInfo dynamicState{};
        dynamicState.sType = VK_STRUCTURE_TYPE_PIPELINE_DYNAMIC_STATE_CREATE_INFO;
        dynamicState.dynamicStateCount = 2;
        dynamicState.pDynamicStates = dynamicStates;

        // 9. Depth
        VkPipelineDepthStencilStateCreateInfo depthStencil{};
        depthStencil.sType = VK_STRUCTURE_TYPE_PIPELINE_DEPTH_STENCIL_STATE_CREATE_INFO;
        depthStencil.depthTestEnable = desc.DepthFormat.has_value() ? VK_TRUE : VK_FALSE;
        depthStencil.depthWriteEnable = desc.DepthFormat.has_value() ? VK_TRUE : VK_FALSE;
        depthStencil.depthCompareOp = VK_COMPARE_OP_LESS;

        const VkFormat colorFormat = ToVulkan(desc.ColorFormat);

        VkPipelineRenderingCreateInfo renderingInfo{};
        renderingInfo.sType = VK_STRUCTURE_TYPE_PIPELINE_RENDERING_CREATE_INFO;
        renderingInfo.colorAttachmentCount = 1;
        renderingInfo.pColorAttachmentFormats = &colorFormat;
        renderingInfo.depthAttachmentFormat = desc.DepthFormat ? ToVulkan(*desc.DepthFormat) : VK_FORMAT_UNDEFINED;

        // 10. Create
        VkGraphicsPipelineCreateInfo pipelineInfo{};
        pipelineInfo.sType = VK_STRUCTURE_TYPE_GRAPHICS_PIPELINE_CREATE_INFO;
        pipelineInfo.pNext = &renderingInfo;
        pipelineInfo.stageCount = 2;
        pipelineInfo.pStages = shaderStages;
        pipelineInfo.pVertexInputState = &vertexInputInfo;
        pipelineInfo.pInputAssemblyState = &inputAssembly;
        pipelineInfo.pViewportState = &viewportState;
        pipelineInfo.pRasterizationState = &rasterizer;
        pipelineInfo.pMultisampleState = &multisampling;
        pipelineInfo.pColorBlendState = &colorBlending;
        pipelineInfo.pDynamicState = &dynamicState;
        pipelineInfo.pDepthStencilState = &depthStencil;
        pipelineInfo.layout = layout->GetHandle();
        pipelineInfo.renderPass = VK_NULL_HANDLE;

        VkPipeline pipeline = VK_NULL_HANDLE;
        if (VkResult result = vkCreateGraphicsPipelines(device.GetLogicalDevice(), VK_NULL_HANDLE, 1, &pipelineInfo,
                                                        nullptr, &pipeline);
            result != VK_SUCCESS)
        {
            Core::Log::Error("Failed to create graphics pipeline '{}' (VkResult {})", desc.Label,
                             static_cast<int>(result));
            return std::unexpected(Core::ErrorCode::PipelineCreationFailed);
        }

        return std::make_unique<VulkanGraphicsPipeline>(device, pipeline);
    }

    VulkanGraphicsPipeline::~VulkanGraphicsPipeline()
    {
        if (m_Pipeline) vkDestroyPipeline(m_Device.GetLogicalDevice(), m_Pipeline, nullptr);
    }
}
