module;
#include <algorithm>
#include <cstdint>
#include <expected>
#include <format>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

module Graphics:ShaderCompiler.Impl;
import :ShaderCompiler;
import :BindingLayout;
import :CompileError;
import :ShaderIR;
import :ShaderFrontend;
import RHI;
import Core.Error;
import Core.Logging;

namespace Graphics
{
    namespace
    {
        std::string_view CategoryName(IRType::Category category)
        {
            switch (category)
            {
            case IRType::Category::Scalar: return "scalar";
            case IRType::Category::Vector: return "vector";
            case IRType::Category::Matrix: return "matrix";
            case IRType::Category::Array: return "array";
            case IRType::Category::Struct: return "struct";
            case IRType::Category::Image: return "image";
            case IRType::Category::Sampler: return "sampler";
            case IRType::Category::CombinedImageSampler: return "combined image sampler";
            case IRType::Category::StorageBuffer: return "storage buffer";
            case IRType::Category::StorageImage: return "storage image";
            case IRType::Category::Other: return "other";
            }
            return "unknown";
        }

        std::optional<TextureDimension> ToTextureDimension(IRImageDimension dimension, bool arrayed)
        {
            switch (dimension)
            {
            case IRImageDimension::D1: return arrayed ? std::nullopt : std::optional(TextureDimension::D1);
            case IRImageDimension::D2: return arrayed ? TextureDimension::D2Array : TextureDimension::D2;
            case IRImageDimension::D3: return arrayed ? std::nullopt : std::optional(TextureDimension::D3);
            case IRImageDimension::Cube: return arrayed ? TextureDimension::CubeArray : TextureDimension::Cube;
            default: return std::nullopt;
            }
        }

        CompileError Unsupported(std::string message)
        {
            Core::Log::Error("Shader binding inference: {}", message);
            return CompileError::Make(CompileError::Kind::UnsupportedBinding, std::move(message));
        }
    }

    std::expected<BindingKind, CompileError> InferBindingKind(const IRType& type, std::string_view globalName)
    {
        switch (type.Kind)
        {
        case IRType::Category::Scalar:
        case IRType::Category::Vector:
        case IRType::Category::Matrix:
        case IRType::Category::Array:
        case IRType::Category::Struct:
            return UniformBufferBinding{};

        case IRType::Category::Image:
        {
            auto dimension = ToTextureDimension(type.Dimension, type.Arrayed);
            if (!dimension)
            {
                return std::unexpected(Unsupported(std::format(
                    "unimplemented image dimension for global '{}'", globalName)));
            }

            TextureSampleKind sampleKind;
            if (type.Depth)
                sampleKind = TextureSampleKind::Depth();
            else if (type.SampledScalar == IRScalar::Sint)
                sampleKind = TextureSampleKind::Sint();
            else if (type.SampledScalar == IRScalar::Uint)
                sampleKind = TextureSampleKind::Uint();
            else if (type.SampledScalar == IRScalar::Float)
                sampleKind = TextureSampleKind::Float(true);
            else
            {
                return std::unexpected(Unsupported(std::format(
                    "unimplemented image sample type for global '{}'", globalName)));
            }

            return TextureBinding{.SampleKind = sampleKind, .Dimension = *dimension,
                                  .Multisampled = type.Multisampled};
        }

        case IRType::Category::Sampler:
            return SamplerBinding{.Filtering = !type.Comparison, .Comparison = type.Comparison};

        default:
            return std::unexpected(Unsupported(std::format(
                "unimplemented binding category '{}' for global '{}'", CategoryName(type.Kind), globalName)));
        }
    }

    std::expected<std::vector<BindingGroupLayout>, CompileError> InferLayout(
        const ShaderIR& ir, std::span<const uint32_t> moduleIndices)
    {
        std::vector<BindingGroupLayout> groups;

        for (uint32_t moduleIndex : moduleIndices)
        {
            const RHI::ShaderStageFlags stageBit = RHI::ToStageFlags(ir.Modules[moduleIndex].Stage);

            for (const IRGlobal& global : ir.Globals)
            {
                if (global.ModuleIndex != moduleIndex || !global.Binding) continue;

                auto kind = InferBindingKind(global.Type, global.Name);
                if (!kind) return std::unexpected(std::move(kind.error()));

                const uint32_t group = global.Binding->Group;
                const uint32_t binding = global.Binding->Binding;
                if (groups.size() <= group) groups.resize(group + 1);

                auto& entries = groups[group].Entries;
                auto existing = std::ranges::find_if(entries, [binding](const BindingEntry& e)
                {
                    return e.Binding == binding;
                });

                if (existing == entries.end())
                {
                    entries.push_back(BindingEntry{
                        .Binding = binding,
                        .Visibility = stageBit,
                        .Kind = *kind,
                        .ArrayCount = global.Type.ArrayCount
                    });
                    continue;
                }

                if (existing->Kind != *kind || existing->ArrayCount != global.Type.ArrayCount)
                {
                    std::string message = std::format(
                        "group {} binding {} is declared as {} and as {} ('{}', {} stage)",
                        group, binding, Describe(*existing), Describe(BindingEntry{
                            .Binding = binding, .Visibility = stageBit, .Kind = *kind,
                            .ArrayCount = global.Type.ArrayCount}),
                        global.Name, RHI::ToString(ir.Modules[moduleIndex].Stage));
                    Core::Log::Error("Shader binding inference: {}", message);
                    return std::unexpected(CompileError::Make(CompileError::Kind::BindingConflict,
                                                              std::move(message)));
                }

                existing->Visibility |= stageBit;
            }
        }
        return groups;
    }

    // -------------------------------------------------------------------------
    // ShaderCompiler
    // -------------------------------------------------------------------------

    ShaderCompiler::ShaderCompiler(const ShaderCompilerConfig& config)
        : m_Frontend(config)
    {
    }

    std::expected<CompiledShader, CompileError> ShaderCompiler::Compile(
        RHI::IDevice& device, std::string_view name, std::string_view source,
        std::optional<RHI::ShaderStage> stageHint) const
    {
        auto ir = m_Frontend.Parse(name, source, stageHint);
        if (!ir)
        {
            Core::Log::Error("Shader '{}' failed to parse: {}", name, ir.error().ToString());
            return std::unexpected(std::move(ir.error()));
        }
        return Link(device, name, *ir);
    }

    std::expected<CompiledShader, CompileError> ShaderCompiler::Link(
        RHI::IDevice& device, std::string_view name, const ShaderIR& ir)
    {
        CompiledShader shader;
        shader.m_Name = std::string(name);

        // 1. Entry points: first declared wins, extras are reported.
        const IREntryPoint* vertex = nullptr;
        const IREntryPoint* fragment = nullptr;
        uint32_t vertexCount = 0;
        uint32_t fragmentCount = 0;
        for (const auto& entry : ir.EntryPoints)
        {
            if (entry.Stage == RHI::ShaderStage::Vertex)
            {
                if (!vertex) vertex = &entry;
                ++vertexCount;
            }
            else
            {
                if (!fragment) fragment = &entry;
                ++fragmentCount;
            }
        }

        if (!vertex) return std::unexpected(CompileError::MissingEntryPoint(RHI::ShaderStage::Vertex));
        if (!fragment) return std::unexpected(CompileError::MissingEntryPoint(RHI::ShaderStage::Fragment));

        auto reportDuplicates = [&](uint32_t count, const IREntryPoint& kept)
        {
            if (count <= 1) return;
            std::string warning = std::format("shader '{}' declares {} {} entry points; using the first ('{}')",
                                              name, count, RHI::ToString(kept.Stage), kept.Name);
            Core::Log::Warn("{}", warning);
            shader.m_Warnings.push_back(std::move(warning));
        };
        reportDuplicates(vertexCount, *vertex);
        reportDuplicates(fragmentCount, *fragment);

        shader.m_VertexEntryPoint = vertex->Name;
        shader.m_FragmentEntryPoint = fragment->Name;

        // 2. Binding layout from the selected modules only
        std::vector<uint32_t> selected{vertex->ModuleIndex};
        if (fragment->ModuleIndex != vertex->ModuleIndex) selected.push_back(fragment->ModuleIndex);

        auto layout = InferLayout(ir, selected);
        if (!layout) return std::unexpected(std::move(layout.error()));
        shader.m_InferredLayout = std::move(*layout);

        // 3. Device modules
        auto createModule = [&](uint32_t moduleIndex, RHI::ShaderStage stage)
            -> std::expected<std::shared_ptr<RHI::ShaderModule>, CompileError>
        {
            RHI::ShaderModuleDesc desc;
            desc.Code = ir.Modules[moduleIndex].Spirv;
            desc.Stage = stage;
            desc.Label = std::format("{} ({})", name, RHI::ToString(stage));

            auto created = device.CreateShaderModule(desc);
            if (!created)
            {
                return std::unexpected(CompileError::Make(
                    CompileError::Kind::Device,
                    std::format("failed to create {} module on '{}': {}", RHI::ToString(stage),
                                device.GetName(), Core::ErrorCodeToString(created.error()))));
            }
            return std::shared_ptr<RHI::ShaderModule>(std::move(*created));
        };

        auto vertexModule = createModule(vertex->ModuleIndex, RHI::ShaderStage::Vertex);
        if (!vertexModule) return std::unexpected(std::move(vertexModule.error()));
        shader.m_VertexModule = std::move(*vertexModule);

        if (fragment->ModuleIndex == vertex->ModuleIndex)
        {
            shader.m_FragmentModule = shader.m_VertexModule;
        }
        else
        {
            auto fragmentModule = createModule(fragment->ModuleIndex, RHI::ShaderStage::Fragment);
            if (!fragmentModule) return std::unexpected(std::move(fragmentModule.error()));
            shader.m_FragmentModule = std::move(*fragmentModule);
        }

        Core::Log::Info("Compiled shader '{}' (vertex: {}, fragment: {}, {} binding group(s))",
                        name, shader.m_VertexEntryPoint, shader.m_FragmentEntryPoint,
                        shader.m_InferredLayout.size());
        return shader;
    }
}
