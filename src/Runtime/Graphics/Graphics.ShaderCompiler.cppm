module;
#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

export module Graphics:ShaderCompiler;

import RHI;
import :BindingLayout;
import :CompileError;
import :ShaderIR;
import :ShaderFrontend;

export namespace Graphics
{
    // Result of a successful compile. Never modified after construction.
    class CompiledShader
    {
    public:
        [[nodiscard]] const std::string& GetName() const { return m_Name; }
        [[nodiscard]] const std::string& GetVertexEntryPoint() const { return m_VertexEntryPoint; }
        [[nodiscard]] const std::string& GetFragmentEntryPoint() const { return m_FragmentEntryPoint; }

        // Both handles point at the same module when the entry points share one.
        [[nodiscard]] const std::shared_ptr<RHI::ShaderModule>& GetVertexModule() const { return m_VertexModule; }
        [[nodiscard]] const std::shared_ptr<RHI::ShaderModule>& GetFragmentModule() const { return m_FragmentModule; }

        [[nodiscard]] const std::vector<BindingGroupLayout>& GetInferredLayout() const { return m_InferredLayout; }
        [[nodiscard]] const std::vector<std::string>& GetWarnings() const { return m_Warnings; }

    private:
        friend class ShaderCompiler;
        CompiledShader() = default;

        std::string m_Name;
        std::string m_VertexEntryPoint;
        std::string m_FragmentEntryPoint;
        std::shared_ptr<RHI::ShaderModule> m_VertexModule;
        std::shared_ptr<RHI::ShaderModule> m_FragmentModule;
        std::vector<BindingGroupLayout> m_InferredLayout;
        std::vector<std::string> m_Warnings;
    };

    // Maps one reflected global to its binding kind. Fails for categories the
    // pipeline layout cannot express.
    [[nodiscard]] std::expected<BindingKind, CompileError> InferBindingKind(const IRType& type,
                                                                           std::string_view globalName);

    // Builds the binding-group list from the globals of 'moduleIndices' only.
    // Group index == descriptor set; missing sets become empty groups.
    [[nodiscard]] std::expected<std::vector<BindingGroupLayout>, CompileError> InferLayout(
        const ShaderIR& ir, std::span<const uint32_t> moduleIndices);

    class ShaderCompiler
    {
    public:
        explicit ShaderCompiler(const ShaderCompilerConfig& config = {});

        // source -> IR -> entry points -> inferred layout -> device shader modules.
        [[nodiscard]] std::expected<CompiledShader, CompileError> Compile(
            RHI::IDevice& device, std::string_view name, std::string_view source,
            std::optional<RHI::ShaderStage> stageHint = std::nullopt) const;

        // Everything after parsing. Exposed so already-reflected IR can be linked directly.
        [[nodiscard]] static std::expected<CompiledShader, CompileError> Link(
            RHI::IDevice& device, std::string_view name, const ShaderIR& ir);

        [[nodiscard]] const ShaderCompilerConfig& GetConfig() const { return m_Frontend.GetConfig(); }

    private:
        ShaderFrontend m_Frontend;
    };
}
