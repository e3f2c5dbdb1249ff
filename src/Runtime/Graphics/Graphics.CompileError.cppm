module;
#include <cstdint>
#include <format>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

export module Graphics:CompileError;

import RHI;

export namespace Graphics
{
    struct SourceLocation
    {
        uint32_t Line = 0;
        uint32_t Column = 0;

        bool operator==(const SourceLocation&) const = default;
    };

    // Everything that can stop a shader source from becoming a CompiledShader.
    struct CompileError
    {
        enum class Kind : uint8_t
        {
            Parse,
            MissingEntryPoint,
            UnsupportedBinding,
            BindingConflict,
            Device
        };

        Kind ErrorKind = Kind::Parse;
        std::string Message;
        std::optional<SourceLocation> Location;  // Parse only
        std::optional<RHI::ShaderStage> Stage;   // MissingEntryPoint only

        [[nodiscard]] static CompileError Parse(std::string message, std::optional<SourceLocation> location)
        {
            return {Kind::Parse, std::move(message), location, std::nullopt};
        }

        [[nodiscard]] static CompileError MissingEntryPoint(RHI::ShaderStage stage)
        {
            return {Kind::MissingEntryPoint,
                    std::format("no {} entry point found", RHI::ToString(stage)),
                    std::nullopt, stage};
        }

        [[nodiscard]] static CompileError Make(Kind kind, std::string message)
        {
            return {kind, std::move(message), std::nullopt, std::nullopt};
        }

        [[nodiscard]] std::string ToString() const
        {
            switch (ErrorKind)
            {
            case Kind::Parse:
                if (Location) return std::format("parse error at {}:{}: {}", Location->Line, Location->Column, Message);
                return std::format("parse error: {}", Message);
            case Kind::MissingEntryPoint:
                return std::format("missing entry point: {}", Message);
            case Kind::UnsupportedBinding:
                return std::format("unsupported binding: {}", Message);
            case Kind::BindingConflict:
                return std::format("binding conflict: {}", Message);
            case Kind::Device:
                return std::format("device error: {}", Message);
            }
            return Message;
        }
    };

    [[nodiscard]] constexpr std::string_view ToString(CompileError::Kind kind)
    {
        switch (kind)
        {
        case CompileError::Kind::Parse: return "Parse";
        case CompileError::Kind::MissingEntryPoint: return "MissingEntryPoint";
        case CompileError::Kind::UnsupportedBinding: return "UnsupportedBinding";
        case CompileError::Kind::BindingConflict: return "BindingConflict";
        case CompileError::Kind::Device: return "Device";
        }
        return "Unknown";
    }
}
