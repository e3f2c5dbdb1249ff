module;
#include <cstdint>
#include <entt/entity/registry.hpp>

export module ECS:Components.Hierarchy;

import Core.Error;

export namespace ECS::Components::Hierarchy
{
    // Intrusive child list. Parent/sibling links are plain entity ids, never owning.
    struct Component
    {
        entt::entity Parent = entt::null;
        entt::entity FirstChild = entt::null;
        entt::entity NextSibling = entt::null;
        entt::entity PrevSibling = entt::null;
        uint32_t ChildCount = 0;
    };

    // Fails with InvalidArgument for invalid entities or self-parenting and with
    // InvalidState when 'newParent' is a descendant of 'child'. Attaching to entt::null detaches.
    [[nodiscard]] Core::Result Attach(entt::registry& registry, entt::entity child, entt::entity newParent);
    void Detach(entt::registry& registry, entt::entity child);

    // Returns true if 'potentialDescendant' is 'entity' or lives somewhere below it.
    [[nodiscard]] bool IsDescendant(const entt::registry& registry, entt::entity entity,
                                    entt::entity potentialDescendant);
}
