module;
#include <format>
#include <span>
#include <string>
#include <type_traits>
#include <variant>

module Graphics:BindingLayout.Impl;
import :BindingLayout;
import RHI;

namespace Graphics
{
    BindingEntry MakeUniformBuffer(uint32_t binding, RHI::ShaderStageFlags visibility)
    {
        return BindingEntry{.Binding = binding, .Visibility = visibility, .Kind = UniformBufferBinding{}};
    }

    BindingEntry MakeTexture(uint32_t binding, RHI::ShaderStageFlags visibility,
                             TextureSampleKind sampleKind, TextureDimension dimension)
    {
        return BindingEntry{
            .Binding = binding,
            .Visibility = visibility,
            .Kind = TextureBinding{.SampleKind = sampleKind, .Dimension = dimension, .Multisampled = false}
        };
    }

    BindingEntry MakeSampler(uint32_t binding, RHI::ShaderStageFlags visibility, bool filtering, bool comparison)
    {
        return BindingEntry{
            .Binding = binding,
            .Visibility = visibility,
            .Kind = SamplerBinding{.Filtering = filtering, .Comparison = comparison}
        };
    }

    std::string Describe(TextureDimension dimension)
    {
        switch (dimension)
        {
        case TextureDimension::D1: return "1d";
        case TextureDimension::D2: return "2d";
        case TextureDimension::D2Array: return "2d-array";
        case TextureDimension::D3: return "3d";
        case TextureDimension::Cube: return "cube";
        case TextureDimension::CubeArray: return "cube-array";
        }
        return "unknown";
    }

    namespace
    {
        std::string Describe(TextureSampleKind kind)
        {
            switch (kind.SampleType)
            {
            case TextureSampleKind::Type::Float: return kind.Filterable ? "float" : "float(unfilterable)";
            case TextureSampleKind::Type::Sint: return "sint";
            case TextureSampleKind::Type::Uint: return "uint";
            case TextureSampleKind::Type::Depth: return "depth";
            }
            return "unknown";
        }
    }

    std::string Describe(const BindingKind& kind)
    {
        return std::visit([](const auto& k) -> std::string
        {
            using T = std::decay_t<decltype(k)>;
            if constexpr (std::is_same_v<T, UniformBufferBinding>)
            {
                return "uniform buffer";
            }
            else if constexpr (std::is_same_v<T, TextureBinding>)
            {
                return std::format("texture<{}, {}{}>", Describe(k.SampleKind), Describe(k.Dimension),
                                   k.Multisampled ? ", multisampled" : "");
            }
            else
            {
                if (k.Comparison) return "sampler(comparison)";
                return k.Filtering ? "sampler(filtering)" : "sampler(non-filtering)";
            }
        }, kind);
    }

    std::string Describe(const BindingEntry& entry)
    {
        std::string text = std::format("binding {}: {} [{}]", entry.Binding, Describe(entry.Kind),
                                       RHI::ToString(entry.Visibility));
        if (entry.ArrayCount) text += std::format(" x{}", *entry.ArrayCount);
        return text;
    }

    RHI::PipelineLayoutDesc ToPipelineLayoutDesc(std::span<const BindingGroupLayout> groups, std::string label)
    {
        RHI::PipelineLayoutDesc desc;
        desc.Label = std::move(label);
        desc.Sets.reserve(groups.size());

        for (const auto& group : groups)
        {
            RHI::DescriptorSetLayoutDesc set;
            set.Bindings.reserve(group.Entries.size());
            for (const auto& entry : group.Entries)
            {
                RHI::DescriptorBindingDesc binding;
                binding.Binding = entry.Binding;
                binding.Count = entry.ArrayCount.value_or(1);
                binding.Visibility = entry.Visibility;
                if (std::holds_alternative<UniformBufferBinding>(entry.Kind))
                    binding.Type = RHI::DescriptorType::UniformBuffer;
                else if (std::holds_alternative<TextureBinding>(entry.Kind))
                    binding.Type = RHI::DescriptorType::SampledImage;
                else
                    binding.Type = RHI::DescriptorType::Sampler;
                set.Bindings.push_back(binding);
            }
            desc.Sets.push_back(std::move(set));
        }
        return desc;
    }
}
