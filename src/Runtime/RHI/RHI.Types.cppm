module;
#include <cstdint>
#include <string_view>
#include <vector>

export module RHI:Types;

export namespace RHI
{
    enum class ShaderStage : uint8_t
    {
        Vertex,
        Fragment
    };

    // Bit set of shader stages that may access a resource.
    enum class ShaderStageFlags : uint32_t
    {
        None = 0,
        Vertex = 1u << 0,
        Fragment = 1u << 1,
        VertexFragment = Vertex | Fragment
    };

    [[nodiscard]] constexpr ShaderStageFlags operator|(ShaderStageFlags a, ShaderStageFlags b)
    {
        return static_cast<ShaderStageFlags>(static_cast<uint32_t>(a) | static_cast<uint32_t>(b));
    }

    [[nodiscard]] constexpr ShaderStageFlags operator&(ShaderStageFlags a, ShaderStageFlags b)
    {
        return static_cast<ShaderStageFlags>(static_cast<uint32_t>(a) & static_cast<uint32_t>(b));
    }

    constexpr ShaderStageFlags& operator|=(ShaderStageFlags& a, ShaderStageFlags b)
    {
        a = a | b;
        return a;
    }

    [[nodiscard]] constexpr ShaderStageFlags ToStageFlags(ShaderStage stage)
    {
        return stage == ShaderStage::Vertex ? ShaderStageFlags::Vertex : ShaderStageFlags::Fragment;
    }

    // True when every stage in 'subset' is also present in 'superset'.
    [[nodiscard]] constexpr bool ContainsAll(ShaderStageFlags superset, ShaderStageFlags subset)
    {
        return (superset & subset) == subset;
    }

    [[nodiscard]] constexpr std::string_view ToString(ShaderStage stage)
    {
        return stage == ShaderStage::Vertex ? "vertex" : "fragment";
    }

    [[nodiscard]] constexpr std::string_view ToString(ShaderStageFlags flags)
    {
        switch (flags)
        {
        case ShaderStageFlags::None: return "none";
        case ShaderStageFlags::Vertex: return "vertex";
        case ShaderStageFlags::Fragment: return "fragment";
        case ShaderStageFlags::VertexFragment: return "vertex|fragment";
        }
        return "unknown";
    }

    enum class Format : uint32_t
    {
        Undefined,

        // Vertex formats
        R32_SFLOAT,
        R32G32_SFLOAT,
        R32G32B32_SFLOAT,
        R32G32B32A32_SFLOAT,

        // Attachment formats
        R8G8B8A8_UNORM,
        R8G8B8A8_SRGB,
        B8G8R8A8_UNORM,
        B8G8R8A8_SRGB,
        R16G16B16A16_SFLOAT,
        D32_SFLOAT,
        D24_UNORM_S8_UINT
    };

    [[nodiscard]] constexpr uint32_t FormatSizeBytes(Format format)
    {
        switch (format)
        {
        case Format::R32_SFLOAT: return 4;
        case Format::R32G32_SFLOAT: return 8;
        case Format::R32G32B32_SFLOAT: return 12;
        case Format::R32G32B32A32_SFLOAT: return 16;
        case Format::R8G8B8A8_UNORM:
        case Format::R8G8B8A8_SRGB:
        case Format::B8G8R8A8_UNORM:
        case Format::B8G8R8A8_SRGB:
        case Format::D32_SFLOAT:
        case Format::D24_UNORM_S8_UINT: return 4;
        case Format::R16G16B16A16_SFLOAT: return 8;
        case Format::Undefined: return 0;
        }
        return 0;
    }

    enum class PrimitiveTopology : uint8_t
    {
        PointList,
        LineList,
        LineStrip,
        TriangleList,
        TriangleStrip
    };

    enum class VertexStepMode : uint8_t
    {
        Vertex,
        Instance
    };

    struct VertexAttribute
    {
        uint32_t Location = 0;
        Format Type = Format::Undefined;
        uint32_t Offset = 0;
    };

    // One bound vertex stream. Binding index is the position in the pipeline's layout list.
    struct VertexBufferLayout
    {
        uint32_t Stride = 0;
        VertexStepMode StepMode = VertexStepMode::Vertex;
        std::vector<VertexAttribute> Attributes;
    };

    enum class BufferUsage : uint8_t
    {
        Vertex,
        Index,
        Uniform
    };

    enum class DescriptorType : uint8_t
    {
        UniformBuffer,
        SampledImage,
        Sampler
    };
}
