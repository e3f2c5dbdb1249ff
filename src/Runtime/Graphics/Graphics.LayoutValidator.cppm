module;
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

export module Graphics:LayoutValidator;

import :BindingLayout;

export namespace Graphics
{
    struct LayoutMismatch
    {
        uint32_t Group = 0;
        std::optional<uint32_t> Binding; // empty when the whole group (or group count) is at fault
        std::string Reason;
    };

    // "Can the expected contract accept what the shader infers?"
    // Not symmetric: the shader may ask for less than the contract provides, never more.
    [[nodiscard]] std::vector<LayoutMismatch> ValidateLayout(std::span<const BindingGroupLayout> inferred,
                                                             std::span<const BindingGroupLayout> expected);

    [[nodiscard]] bool LayoutMatches(std::span<const BindingGroupLayout> inferred,
                                     std::span<const BindingGroupLayout> expected);

    [[nodiscard]] bool IsKindCompatible(const BindingKind& expected, const BindingKind& inferred);

    // One line per mismatch, suitable for an editor status panel.
    [[nodiscard]] std::string FormatMismatches(std::span<const LayoutMismatch> mismatches);
}
