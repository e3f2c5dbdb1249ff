module;
#include <algorithm>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

module Graphics:LiveShader.Impl;
import :LiveShader;
import :CompileError;
import :LayoutValidator;
import Core;

namespace Graphics
{
    LiveShader::LiveShader(const ShaderCompiler& compiler, RHI::IDevice& device, GraphicsPipelineHandle handle,
                           std::string name, std::optional<RHI::ShaderStage> stageHint)
        : m_Compiler(compiler)
        , m_Device(device)
        , m_Handle(std::move(handle))
        , m_Name(std::move(name))
        , m_StageHint(stageHint)
    {
    }

    LiveShader::~LiveShader()
    {
        for (const auto id : m_WatchIds)
            Core::Filesystem::FileWatcher::Unwatch(id);
    }

    LiveShader::ApplyResult LiveShader::Apply(std::string_view source)
    {
        using Status = ApplyResult::Status;

        auto compiled = m_Compiler.Compile(m_Device, m_Name, source, m_StageHint);
        if (!compiled)
        {
            ApplyResult result{
                compiled.error().ErrorKind == CompileError::Kind::Device ? Status::DeviceFailed : Status::CompileFailed,
                compiled.error().ToString()};
            m_LastDiagnostic = result.Diagnostic;
            return result;
        }

        auto mismatches = ValidateLayout(compiled->GetInferredLayout(), m_Handle.GetContract());
        if (!mismatches.empty())
        {
            m_LastDiagnostic = FormatMismatches(mismatches);
            Core::Log::Error("[LiveShader] '{}' does not fit the pipeline contract:\n{}", m_Name, m_LastDiagnostic);
            return {Status::LayoutMismatch, m_LastDiagnostic};
        }

        if (auto recreated = m_Handle.Recreate(m_Device, *compiled); !recreated)
        {
            m_LastDiagnostic = std::string("pipeline creation failed: ") +
                               std::string(Core::ErrorCodeToString(recreated.error()));
            return {Status::DeviceFailed, m_LastDiagnostic};
        }

        m_LastDiagnostic.clear();
        return {Status::Swapped, {}};
    }

    void LiveShader::WatchFile(const std::string& path)
    {
        if (std::ranges::find(m_WatchedPaths, path) != m_WatchedPaths.end()) return;

        const auto id = Core::Filesystem::FileWatcher::Watch(path, [this](const std::string& changed) {
            this->OnFileChanged(changed);
        });
        if (id == Core::Filesystem::FileWatcher::InvalidWatch) return;

        m_WatchedPaths.push_back(path);
        m_WatchIds.push_back(id);
    }

    void LiveShader::OnFileChanged(const std::string& path)
    {
        // FileWatcher thread
        std::lock_guard lock(m_QueueMutex);
        m_DirtyPaths.push_back(path);
    }

    void LiveShader::Update()
    {
        std::vector<std::string> dirty;
        {
            std::lock_guard lock(m_QueueMutex);
            if (m_DirtyPaths.empty()) return;
            dirty = std::move(m_DirtyPaths);
            m_DirtyPaths.clear();
        }

        std::sort(dirty.begin(), dirty.end());
        dirty.erase(std::unique(dirty.begin(), dirty.end()), dirty.end());

        for (const auto& path : dirty)
        {
            auto source = Core::Filesystem::ReadTextFile(path);
            if (!source)
            {
                Core::Log::Error("[HotReload] Could not read {} ({}). Keeping old pipeline.",
                                 path, Core::ErrorCodeToString(source.error()));
                continue;
            }

            auto result = Apply(*source);
            if (result.Succeeded())
                Core::Log::Info("[HotReload] Hot-swapped shader: {} (generation {})", m_Name,
                                m_Handle.GetGeneration());
            else
                Core::Log::Warn("[HotReload] {} rejected ({}). Keeping old pipeline.", path, ToString(result.State));
        }
    }

    std::string_view ToString(LiveShader::ApplyResult::Status status)
    {
        switch (status)
        {
        case LiveShader::ApplyResult::Status::Swapped: return "swapped";
        case LiveShader::ApplyResult::Status::CompileFailed: return "compile failed";
        case LiveShader::ApplyResult::Status::LayoutMismatch: return "layout mismatch";
        case LiveShader::ApplyResult::Status::DeviceFailed: return "device failed";
        }
        return "unknown";
    }
}
