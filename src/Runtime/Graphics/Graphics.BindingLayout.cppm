module;
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <variant>
#include <vector>

export module Graphics:BindingLayout;

import RHI;

export namespace Graphics
{
    // -------------------------------------------------------------------------
    // Binding-group contract shared by shader reflection and pipeline layouts.
    // Group index == descriptor set number; entries are kept in discovery order.
    // -------------------------------------------------------------------------

    enum class TextureDimension : uint8_t
    {
        D1,
        D2,
        D2Array,
        D3,
        Cube,
        CubeArray
    };

    struct TextureSampleKind
    {
        enum class Type : uint8_t
        {
            Float,
            Sint,
            Uint,
            Depth
        };

        Type SampleType = Type::Float;
        bool Filterable = true; // Only meaningful for Float

        static constexpr TextureSampleKind Float(bool filterable) { return {Type::Float, filterable}; }
        static constexpr TextureSampleKind Sint() { return {Type::Sint, false}; }
        static constexpr TextureSampleKind Uint() { return {Type::Uint, false}; }
        static constexpr TextureSampleKind Depth() { return {Type::Depth, false}; }

        bool operator==(const TextureSampleKind&) const = default;
    };

    struct UniformBufferBinding
    {
        bool operator==(const UniformBufferBinding&) const = default;
    };

    struct TextureBinding
    {
        TextureSampleKind SampleKind;
        TextureDimension Dimension = TextureDimension::D2;
        bool Multisampled = false;

        bool operator==(const TextureBinding&) const = default;
    };

    struct SamplerBinding
    {
        bool Filtering = true;
        bool Comparison = false;

        bool operator==(const SamplerBinding&) const = default;
    };

    using BindingKind = std::variant<UniformBufferBinding, TextureBinding, SamplerBinding>;

    struct BindingEntry
    {
        uint32_t Binding = 0;
        RHI::ShaderStageFlags Visibility = RHI::ShaderStageFlags::None;
        BindingKind Kind;
        std::optional<uint32_t> ArrayCount; // empty == single resource

        bool operator==(const BindingEntry&) const = default;
    };

    struct BindingGroupLayout
    {
        std::optional<std::string> Label;
        std::vector<BindingEntry> Entries;

        bool operator==(const BindingGroupLayout&) const = default;
    };

    // Factories for hand-written contracts.
    [[nodiscard]] BindingEntry MakeUniformBuffer(uint32_t binding, RHI::ShaderStageFlags visibility);
    [[nodiscard]] BindingEntry MakeTexture(uint32_t binding, RHI::ShaderStageFlags visibility,
                                           TextureSampleKind sampleKind = TextureSampleKind::Float(true),
                                           TextureDimension dimension = TextureDimension::D2);
    [[nodiscard]] BindingEntry MakeSampler(uint32_t binding, RHI::ShaderStageFlags visibility,
                                           bool filtering = true, bool comparison = false);

    [[nodiscard]] std::string Describe(TextureDimension dimension);
    [[nodiscard]] std::string Describe(const BindingKind& kind);
    [[nodiscard]] std::string Describe(const BindingEntry& entry);

    // Lowers a contract into the device's pipeline-layout description.
    [[nodiscard]] RHI::PipelineLayoutDesc ToPipelineLayoutDesc(std::span<const BindingGroupLayout> groups,
                                                              std::string label);
}
