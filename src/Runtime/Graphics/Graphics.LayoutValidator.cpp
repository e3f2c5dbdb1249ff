module;
#include <algorithm>
#include <cstdint>
#include <format>
#include <span>
#include <string>
#include <variant>
#include <vector>

module Graphics:LayoutValidator.Impl;
import :LayoutValidator;
import :BindingLayout;
import RHI;

namespace Graphics
{
    namespace
    {
        std::vector<const BindingEntry*> SortedByBinding(const BindingGroupLayout& group)
        {
            std::vector<const BindingEntry*> sorted;
            sorted.reserve(group.Entries.size());
            for (const auto& entry : group.Entries) sorted.push_back(&entry);
            std::ranges::stable_sort(sorted, {}, [](const BindingEntry* e) { return e->Binding; });
            return sorted;
        }

        void CompareEntries(uint32_t group, const BindingEntry& inferred, const BindingEntry& expected,
                            std::vector<LayoutMismatch>& out)
        {
            if (!RHI::ContainsAll(expected.Visibility, inferred.Visibility))
            {
                out.push_back({group, inferred.Binding, std::format(
                    "shader needs visibility {} but the contract only offers {}",
                    RHI::ToString(inferred.Visibility), RHI::ToString(expected.Visibility))});
            }

            if (!IsKindCompatible(expected.Kind, inferred.Kind))
            {
                out.push_back({group, inferred.Binding, std::format(
                    "shader declares {} but the contract provides {}",
                    Describe(inferred.Kind), Describe(expected.Kind))});
            }

            if (expected.ArrayCount)
            {
                if (!inferred.ArrayCount)
                {
                    out.push_back({group, inferred.Binding, std::format(
                        "contract provides an array of {} but the shader declares a single resource",
                        *expected.ArrayCount)});
                }
                else if (*inferred.ArrayCount > *expected.ArrayCount)
                {
                    out.push_back({group, inferred.Binding, std::format(
                        "shader declares an array of {} but the contract provides only {}",
                        *inferred.ArrayCount, *expected.ArrayCount)});
                }
            }
        }

        void CompareGroup(uint32_t group, const BindingGroupLayout& inferred, const BindingGroupLayout& expected,
                          std::vector<LayoutMismatch>& out)
        {
            const auto lhs = SortedByBinding(inferred);
            const auto rhs = SortedByBinding(expected);

            for (size_t i = 1; i < rhs.size(); ++i)
            {
                if (rhs[i]->Binding == rhs[i - 1]->Binding)
                {
                    out.push_back({group, rhs[i]->Binding, "contract declares this binding more than once"});
                }
            }

            // Merge walk: unmatched entries on either side are reported by binding number.
            size_t i = 0;
            size_t j = 0;
            while (i < lhs.size() || j < rhs.size())
            {
                if (j == rhs.size() || (i < lhs.size() && lhs[i]->Binding < rhs[j]->Binding))
                {
                    out.push_back({group, lhs[i]->Binding, std::format(
                        "shader declares {} which the contract does not provide", Describe(lhs[i]->Kind))});
                    ++i;
                }
                else if (i == lhs.size() || rhs[j]->Binding < lhs[i]->Binding)
                {
                    out.push_back({group, rhs[j]->Binding, std::format(
                        "contract provides {} which the shader does not declare", Describe(rhs[j]->Kind))});
                    ++j;
                }
                else
                {
                    CompareEntries(group, *lhs[i], *rhs[j], out);
                    ++i;
                    ++j;
                }
            }
        }
    }

    bool IsKindCompatible(const BindingKind& expected, const BindingKind& inferred)
    {
        if (expected == inferred) return true;

        // Texture: a filterable-float slot accepts a shader that only needs unfilterable float.
        if (const auto* e = std::get_if<TextureBinding>(&expected))
        {
            const auto* i = std::get_if<TextureBinding>(&inferred);
            return i && e->SampleKind == TextureSampleKind::Float(true) &&
                i->SampleKind == TextureSampleKind::Float(false) &&
                e->Dimension == i->Dimension && e->Multisampled == i->Multisampled;
        }

        // Sampler: a filtering slot accepts a shader that only needs non-filtering.
        if (const auto* e = std::get_if<SamplerBinding>(&expected))
        {
            const auto* i = std::get_if<SamplerBinding>(&inferred);
            return i && e->Filtering && !e->Comparison && !i->Filtering && !i->Comparison;
        }

        return false;
    }

    std::vector<LayoutMismatch> ValidateLayout(std::span<const BindingGroupLayout> inferred,
                                               std::span<const BindingGroupLayout> expected)
    {
        std::vector<LayoutMismatch> mismatches;

        if (inferred.size() != expected.size())
        {
            mismatches.push_back({static_cast<uint32_t>(std::min(inferred.size(), expected.size())), std::nullopt,
                                  std::format("shader uses {} binding group(s) but the contract has {}",
                                              inferred.size(), expected.size())});
        }

        const size_t common = std::min(inferred.size(), expected.size());
        for (size_t g = 0; g < common; ++g)
        {
            CompareGroup(static_cast<uint32_t>(g), inferred[g], expected[g], mismatches);
        }
        return mismatches;
    }

    bool LayoutMatches(std::span<const BindingGroupLayout> inferred, std::span<const BindingGroupLayout> expected)
    {
        return ValidateLayout(inferred, expected).empty();
    }

    std::string FormatMismatches(std::span<const LayoutMismatch> mismatches)
    {
        std::string text;
        for (const auto& m : mismatches)
        {
            if (!text.empty()) text.push_back('\n');
            if (m.Binding)
                text += std::format("group {}, binding {}: {}", m.Group, *m.Binding, m.Reason);
            else
                text += std::format("group {}: {}", m.Group, m.Reason);
        }
        return text;
    }
}
