module;
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <shaderc/shaderc.hpp>

export module Graphics:ShaderFrontend;

import RHI;
import :ShaderIR;
import :CompileError;

export namespace Graphics
{
    struct ShaderCompilerConfig
    {
        bool Optimize = false;
        bool GenerateDebugInfo = true;
        bool WarningsAsErrors = false;
    };

    // One stage-specific slice of a multi-stage source.
    // 'Text' has exactly as many lines as the original source: lines that belong
    // to other blocks are blanked so diagnostics report the user's line numbers.
    struct StageBlock
    {
        RHI::ShaderStage Stage = RHI::ShaderStage::Vertex;
        std::string Text;
        uint32_t FirstLine = 1;
    };

    // Splits 'source' at "#pragma shader_stage(<stage>)" lines.
    // Without a hint, text before the first marker is a prelude shared by every block.
    // With a hint, that text is itself a block of the hinted stage; only its #version line is shared.
    [[nodiscard]] std::expected<std::vector<StageBlock>, CompileError> SplitStageBlocks(
        std::string_view source, std::optional<RHI::ShaderStage> stageHint);

    // Extracts "<name>:<line>[:<column>]:" from a glslang/shaderc diagnostic.
    [[nodiscard]] std::optional<SourceLocation> ParseDiagnosticLocation(std::string_view message,
                                                                       std::string_view sourceName);

    // GLSL -> SPIR-V (shaderc) -> reflected ShaderIR (SPIRV-Cross).
    class ShaderFrontend
    {
    public:
        explicit ShaderFrontend(const ShaderCompilerConfig& config = {});

        [[nodiscard]] std::expected<ShaderIR, CompileError> Parse(std::string_view name,
                                                                  std::string_view source,
                                                                  std::optional<RHI::ShaderStage> stageHint) const;

        [[nodiscard]] const ShaderCompilerConfig& GetConfig() const { return m_Config; }

    private:
        [[nodiscard]] std::expected<std::vector<uint32_t>, CompileError> CompileBlock(
            std::string_view name, const StageBlock& block) const;

        ShaderCompilerConfig m_Config;
        shaderc::Compiler m_Compiler;
        shaderc::CompileOptions m_Options;
    };

    // Reflects one SPIR-V module. Appends its entry points and bound globals to 'ir'.
    [[nodiscard]] std::expected<void, CompileError> ReflectModule(ShaderIR& ir, uint32_t moduleIndex);
}
