module;
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

export module Graphics:LiveShader;

import RHI;
import Core.Filesystem;
import :ShaderCompiler;
import :PipelineManager;

export namespace Graphics
{
    // Edit -> compile -> validate -> swap loop around one pipeline slot.
    // A failed attempt never touches the bound pipeline; its diagnostic is kept
    // until the next attempt.
    class LiveShader
    {
    public:
        struct ApplyResult
        {
            enum class Status : uint8_t
            {
                Swapped,
                CompileFailed,
                LayoutMismatch,
                DeviceFailed
            };

            Status State = Status::Swapped;
            std::string Diagnostic; // empty on Swapped

            [[nodiscard]] bool Succeeded() const { return State == Status::Swapped; }
        };

        LiveShader(const ShaderCompiler& compiler, RHI::IDevice& device, GraphicsPipelineHandle handle,
                   std::string name, std::optional<RHI::ShaderStage> stageHint = std::nullopt);
        ~LiveShader();

        LiveShader(const LiveShader&) = delete;
        LiveShader& operator=(const LiveShader&) = delete;

        ApplyResult Apply(std::string_view source);

        // Re-applies 'path' whenever it changes on disk. Changes are picked up by Update().
        void WatchFile(const std::string& path);

        // Main thread. Applies the newest contents of every file changed since the last call.
        void Update();

        [[nodiscard]] const std::string& GetLastDiagnostic() const { return m_LastDiagnostic; }
        [[nodiscard]] const GraphicsPipelineHandle& GetHandle() const { return m_Handle; }
        [[nodiscard]] const std::string& GetName() const { return m_Name; }

    private:
        void OnFileChanged(const std::string& path);

        const ShaderCompiler& m_Compiler;
        RHI::IDevice& m_Device;
        GraphicsPipelineHandle m_Handle;
        std::string m_Name;
        std::optional<RHI::ShaderStage> m_StageHint;
        std::string m_LastDiagnostic;
        std::vector<std::string> m_WatchedPaths;
        std::vector<Core::Filesystem::FileWatcher::WatchId> m_WatchIds;

        // Filled by the FileWatcher thread
        std::mutex m_QueueMutex;
        std::vector<std::string> m_DirtyPaths;
    };

    [[nodiscard]] std::string_view ToString(LiveShader::ApplyResult::Status status);
}
