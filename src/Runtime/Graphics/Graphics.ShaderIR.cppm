module;
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

export module Graphics:ShaderIR;

import RHI;

export namespace Graphics
{
    // Reflection-level view of a parsed shader source. One module per stage block.
    struct IRBinding
    {
        uint32_t Group = 0;
        uint32_t Binding = 0;

        bool operator==(const IRBinding&) const = default;
    };

    enum class IRScalar : uint8_t
    {
        Float,
        Sint,
        Uint,
        Bool
    };

    enum class IRImageDimension : uint8_t
    {
        D1,
        D2,
        D3,
        Cube,
        Rect,
        Buffer,
        SubpassData
    };

    struct IRType
    {
        enum class Category : uint8_t
        {
            Scalar,
            Vector,
            Matrix,
            Array,
            Struct,
            Image,
            Sampler,
            CombinedImageSampler,
            StorageBuffer,
            StorageImage,
            Other
        };

        Category Kind = Category::Other;

        // Image / StorageImage / CombinedImageSampler
        IRScalar SampledScalar = IRScalar::Float;
        IRImageDimension Dimension = IRImageDimension::D2;
        bool Arrayed = false;
        bool Depth = false;
        bool Multisampled = false;

        // Sampler: used together with a depth image in a comparison
        bool Comparison = false;

        // Descriptor arrays. Empty for single resources.
        std::optional<uint32_t> ArrayCount;

        bool operator==(const IRType&) const = default;
    };

    struct IREntryPoint
    {
        std::string Name;
        RHI::ShaderStage Stage = RHI::ShaderStage::Vertex;
        uint32_t ModuleIndex = 0;
    };

    struct IRGlobal
    {
        std::string Name;
        uint32_t ModuleIndex = 0;
        std::optional<IRBinding> Binding;
        IRType Type;
    };

    struct IRModule
    {
        RHI::ShaderStage Stage = RHI::ShaderStage::Vertex;
        std::vector<uint32_t> Spirv;
        uint32_t FirstLine = 1; // line of the block start in the original source
    };

    struct ShaderIR
    {
        std::vector<IRModule> Modules;
        std::vector<IREntryPoint> EntryPoints; // declaration order
        std::vector<IRGlobal> Globals;
    };
}
