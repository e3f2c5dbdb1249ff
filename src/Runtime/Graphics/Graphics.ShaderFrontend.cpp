module;
#include <charconv>
#include <cstdint>
#include <expected>
#include <format>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

#include <shaderc/shaderc.hpp>
#include <spirv_cross/spirv_cross.hpp>

module Graphics:ShaderFrontend.Impl;
import :ShaderFrontend;
import :ShaderIR;
import :CompileError;
import RHI;
import Core.Logging;

namespace Graphics
{
    namespace
    {
        constexpr std::string_view kStagePragma = "#pragma shader_stage(";

        std::string_view TrimLeft(std::string_view s)
        {
            size_t i = 0;
            while (i < s.size() && (s[i] == ' ' || s[i] == '\t')) ++i;
            return s.substr(i);
        }

        bool IsBlank(std::string_view s)
        {
            return s.find_first_not_of(" \t\r\n") == std::string_view::npos;
        }

        std::vector<std::string_view> SplitLines(std::string_view source)
        {
            std::vector<std::string_view> lines;
            size_t start = 0;
            while (start <= source.size())
            {
                size_t end = source.find('\n', start);
                if (end == std::string_view::npos)
                {
                    lines.push_back(source.substr(start));
                    break;
                }
                lines.push_back(source.substr(start, end - start));
                start = end + 1;
            }
            return lines;
        }

        shaderc_shader_kind ToShadercKind(RHI::ShaderStage stage)
        {
            return stage == RHI::ShaderStage::Vertex ? shaderc_vertex_shader : shaderc_fragment_shader;
        }

        // Builds the per-block text: every source line is either kept or blanked.
        std::string AssembleBlock(const std::vector<std::string_view>& lines,
                                  const std::vector<int>& owner, int blockIndex)
        {
            std::string text;
            for (size_t i = 0; i < lines.size(); ++i)
            {
                const bool keep = owner[i] == blockIndex || owner[i] == -1;
                if (keep) text.append(lines[i]);
                if (i + 1 < lines.size()) text.push_back('\n');
            }
            return text;
        }
    }

    std::expected<std::vector<StageBlock>, CompileError> SplitStageBlocks(
        std::string_view source, std::optional<RHI::ShaderStage> stageHint)
    {
        const auto lines = SplitLines(source);

        // owner[i]: -1 = prelude, -2 = marker line, >= 0 = block index
        std::vector<int> owner(lines.size(), -1);
        std::vector<StageBlock> blocks;
        int current = -1;

        if (stageHint)
        {
            blocks.push_back({*stageHint, {}, 1});
            current = 0;
        }

        bool leadingHasContent = false;
        for (size_t i = 0; i < lines.size(); ++i)
        {
            std::string_view line = TrimLeft(lines[i]);
            if (line.starts_with(kStagePragma))
            {
                const auto lineNumber = static_cast<uint32_t>(i + 1);
                const size_t close = line.find(')');
                if (close == std::string_view::npos)
                {
                    return std::unexpected(CompileError::Parse("malformed shader_stage pragma",
                                                               SourceLocation{lineNumber, 1}));
                }

                std::string_view stageName = line.substr(kStagePragma.size(), close - kStagePragma.size());
                RHI::ShaderStage stage;
                if (stageName == "vertex" || stageName == "vert")
                    stage = RHI::ShaderStage::Vertex;
                else if (stageName == "fragment" || stageName == "frag")
                    stage = RHI::ShaderStage::Fragment;
                else
                {
                    return std::unexpected(CompileError::Parse(
                        std::format("unsupported shader stage '{}'", stageName), SourceLocation{lineNumber, 1}));
                }

                owner[i] = -2;
                blocks.push_back({stage, {}, lineNumber + 1});
                current = static_cast<int>(blocks.size()) - 1;
                continue;
            }

            // A #version in the hinted leading block applies to every block.
            if (stageHint && current == 0 && line.starts_with("#version"))
                continue;

            owner[i] = current;
            if (current == 0 && stageHint && !IsBlank(lines[i])) leadingHasContent = true;
        }

        // With a hint, a file that starts directly with a marker has no leading block.
        const bool dropLeading = stageHint && !leadingHasContent;

        std::vector<StageBlock> result;
        for (size_t b = 0; b < blocks.size(); ++b)
        {
            if (b == 0 && dropLeading) continue;
            StageBlock block = blocks[b];
            block.Text = AssembleBlock(lines, owner, static_cast<int>(b));
            result.push_back(std::move(block));
        }
        return result;
    }

    std::optional<SourceLocation> ParseDiagnosticLocation(std::string_view message, std::string_view sourceName)
    {
        auto parseNumber = [](std::string_view text, size_t& pos) -> std::optional<uint32_t>
        {
            uint32_t value = 0;
            auto [ptr, ec] = std::from_chars(text.data() + pos, text.data() + text.size(), value);
            if (ec != std::errc{} || ptr == text.data() + pos) return std::nullopt;
            pos = static_cast<size_t>(ptr - text.data());
            return value;
        };

        const std::string prefix = std::format("{}:", sourceName);
        size_t search = 0;
        while ((search = message.find(prefix, search)) != std::string_view::npos)
        {
            size_t pos = search + prefix.size();
            auto line = parseNumber(message, pos);
            if (line && pos < message.size() && message[pos] == ':')
            {
                SourceLocation location{*line, 0};
                size_t columnPos = pos + 1;
                if (auto column = parseNumber(message, columnPos);
                    column && columnPos < message.size() && message[columnPos] == ':')
                {
                    location.Column = *column;
                }
                return location;
            }
            search += prefix.size();
        }
        return std::nullopt;
    }

    // -------------------------------------------------------------------------
    // ShaderFrontend
    // -------------------------------------------------------------------------

    ShaderFrontend::ShaderFrontend(const ShaderCompilerConfig& config)
        : m_Config(config)
    {
        m_Options.SetSourceLanguage(shaderc_source_language_glsl);
        m_Options.SetTargetEnvironment(shaderc_target_env_vulkan, shaderc_env_version_vulkan_1_3);
        m_Options.SetOptimizationLevel(config.Optimize
                                           ? shaderc_optimization_level_performance
                                           : shaderc_optimization_level_zero);
        if (config.GenerateDebugInfo) m_Options.SetGenerateDebugInfo();
        if (config.WarningsAsErrors) m_Options.SetWarningsAsErrors();
    }

    std::expected<std::vector<uint32_t>, CompileError> ShaderFrontend::CompileBlock(
        std::string_view name, const StageBlock& block) const
    {
        const std::string sourceName(name);
        shaderc::SpvCompilationResult result = m_Compiler.CompileGlslToSpv(
            block.Text.data(), block.Text.size(), ToShadercKind(block.Stage), sourceName.c_str(), "main",
            m_Options);

        if (result.GetCompilationStatus() != shaderc_compilation_status_success)
        {
            std::string message = result.GetErrorMessage();
            auto location = ParseDiagnosticLocation(message, sourceName);
            if (!location) location = SourceLocation{block.FirstLine, 0};
            return std::unexpected(CompileError::Parse(std::move(message), location));
        }

        if (result.GetNumWarnings() > 0)
        {
            Core::Log::Warn("Shader '{}' ({} block): {}", name, RHI::ToString(block.Stage), result.GetErrorMessage());
        }

        return std::vector<uint32_t>(result.cbegin(), result.cend());
    }

    std::expected<ShaderIR, CompileError> ShaderFrontend::Parse(std::string_view name, std::string_view source,
                                                                std::optional<RHI::ShaderStage> stageHint) const
    {
        auto blocks = SplitStageBlocks(source, stageHint);
        if (!blocks) return std::unexpected(std::move(blocks.error()));

        ShaderIR ir;
        ir.Modules.reserve(blocks->size());
        for (const auto& block : *blocks)
        {
            auto spirv = CompileBlock(name, block);
            if (!spirv) return std::unexpected(std::move(spirv.error()));

            ir.Modules.push_back(IRModule{block.Stage, std::move(*spirv), block.FirstLine});
            if (auto reflected = ReflectModule(ir, static_cast<uint32_t>(ir.Modules.size() - 1)); !reflected)
            {
                return std::unexpected(std::move(reflected.error()));
            }
        }

        Core::Log::Debug("Shader '{}': {} module(s), {} entry point(s), {} global(s)", name, ir.Modules.size(),
                         ir.EntryPoints.size(), ir.Globals.size());
        return ir;
    }

    // -------------------------------------------------------------------------
    // Reflection
    // -------------------------------------------------------------------------

    namespace
    {
        IRScalar ToScalar(spirv_cross::SPIRType::BaseType type)
        {
            switch (type)
            {
            case spirv_cross::SPIRType::Int:
            case spirv_cross::SPIRType::Short:
            case spirv_cross::SPIRType::SByte:
            case spirv_cross::SPIRType::Int64: return IRScalar::Sint;
            case spirv_cross::SPIRType::UInt:
            case spirv_cross::SPIRType::UShort:
            case spirv_cross::SPIRType::UByte:
            case spirv_cross::SPIRType::UInt64: return IRScalar::Uint;
            case spirv_cross::SPIRType::Boolean: return IRScalar::Bool;
            default: return IRScalar::Float;
            }
        }

        IRImageDimension ToDimension(spv::Dim dim)
        {
            switch (dim)
            {
            case spv::Dim1D: return IRImageDimension::D1;
            case spv::Dim2D: return IRImageDimension::D2;
            case spv::Dim3D: return IRImageDimension::D3;
            case spv::DimCube: return IRImageDimension::Cube;
            case spv::DimRect: return IRImageDimension::Rect;
            case spv::DimBuffer: return IRImageDimension::Buffer;
            default: return IRImageDimension::SubpassData;
            }
        }

        // Fills ArrayCount. Returns false for runtime-sized or specialization-sized arrays.
        bool ReadArrayCount(const spirv_cross::SPIRType& type, IRType& out)
        {
            if (type.array.empty()) return true;

            uint32_t count = 1;
            for (size_t i = 0; i < type.array.size(); ++i)
            {
                if (!type.array_size_literal[i] || type.array[i] == 0) return false;
                count *= type.array[i];
            }
            out.ArrayCount = count;
            return true;
        }

        void ReadImage(const spirv_cross::Compiler& reflector, const spirv_cross::SPIRType& type, IRType& out)
        {
            out.SampledScalar = ToScalar(reflector.get_type(type.image.type).basetype);
            out.Dimension = ToDimension(type.image.dim);
            out.Arrayed = type.image.arrayed;
            out.Depth = type.image.depth;
            out.Multisampled = type.image.ms;
        }

        std::optional<IRBinding> ReadBinding(const spirv_cross::Compiler& reflector, spirv_cross::ID id)
        {
            if (!reflector.has_decoration(id, spv::DecorationBinding)) return std::nullopt;
            return IRBinding{
                reflector.get_decoration(id, spv::DecorationDescriptorSet),
                reflector.get_decoration(id, spv::DecorationBinding)
            };
        }
    }

    std::expected<void, CompileError> ReflectModule(ShaderIR& ir, uint32_t moduleIndex)
    {
        const IRModule& irModule = ir.Modules[moduleIndex];

        try
        {
            spirv_cross::Compiler reflector(irModule.Spirv);

            for (const auto& entry : reflector.get_entry_points_and_stages())
            {
                if (entry.execution_model == spv::ExecutionModelVertex)
                    ir.EntryPoints.push_back({entry.name, RHI::ShaderStage::Vertex, moduleIndex});
                else if (entry.execution_model == spv::ExecutionModelFragment)
                    ir.EntryPoints.push_back({entry.name, RHI::ShaderStage::Fragment, moduleIndex});
            }

            // Must be queried before build_combined_image_samplers() adds synthetic variables.
            const spirv_cross::ShaderResources resources = reflector.get_shader_resources();

            std::vector<uint32_t> globalIds; // SPIR-V variable id per appended global
            auto addGlobal = [&](const spirv_cross::Resource& res, IRType::Category category)
            {
                const spirv_cross::SPIRType& type = reflector.get_type(res.type_id);
                IRType irType;
                irType.Kind = category;
                if (category == IRType::Category::Image || category == IRType::Category::StorageImage ||
                    category == IRType::Category::CombinedImageSampler)
                {
                    ReadImage(reflector, type, irType);
                }
                if (!ReadArrayCount(type, irType)) irType.Kind = IRType::Category::Other;

                ir.Globals.push_back({res.name, moduleIndex, ReadBinding(reflector, res.id), irType});
                globalIds.push_back(static_cast<uint32_t>(res.id));
            };

            const size_t firstGlobal = ir.Globals.size();
            for (const auto& res : resources.uniform_buffers) addGlobal(res, IRType::Category::Struct);
            for (const auto& res : resources.separate_images) addGlobal(res, IRType::Category::Image);
            for (const auto& res : resources.separate_samplers) addGlobal(res, IRType::Category::Sampler);
            for (const auto& res : resources.sampled_images) addGlobal(res, IRType::Category::CombinedImageSampler);
            for (const auto& res : resources.storage_buffers) addGlobal(res, IRType::Category::StorageBuffer);
            for (const auto& res : resources.storage_images) addGlobal(res, IRType::Category::StorageImage);
            for (const auto& res : resources.subpass_inputs) addGlobal(res, IRType::Category::Image);
            for (const auto& res : resources.atomic_counters) addGlobal(res, IRType::Category::Other);
            for (const auto& res : resources.acceleration_structures) addGlobal(res, IRType::Category::Other);

            // Depth-compare usage is only visible through image/sampler pairs.
            reflector.build_combined_image_samplers();
            std::unordered_set<uint32_t> depthImages;
            std::unordered_set<uint32_t> comparisonSamplers;
            for (const auto& combined : reflector.get_combined_image_samplers())
            {
                const auto& combinedType = reflector.get_type_from_variable(combined.combined_id);
                const auto& imageType = reflector.get_type_from_variable(combined.image_id);
                if (combinedType.image.depth || imageType.image.depth)
                {
                    depthImages.insert(static_cast<uint32_t>(combined.image_id));
                    comparisonSamplers.insert(static_cast<uint32_t>(combined.sampler_id));
                }
            }

            for (size_t i = 0; i < globalIds.size(); ++i)
            {
                IRGlobal& global = ir.Globals[firstGlobal + i];
                if (global.Type.Kind == IRType::Category::Image && depthImages.contains(globalIds[i]))
                    global.Type.Depth = true;
                if (global.Type.Kind == IRType::Category::Sampler && comparisonSamplers.contains(globalIds[i]))
                    global.Type.Comparison = true;
            }
        }
        catch (const spirv_cross::CompilerError& e)
        {
            Core::Log::Error("SPIR-V reflection failed for module {}: {}", moduleIndex, e.what());
            return std::unexpected(CompileError::Parse(std::format("reflection failed: {}", e.what()),
                                                       SourceLocation{irModule.FirstLine, 0}));
        }
        return {};
    }
}
