module;
#include <cstdint>
#include <entt/entity/registry.hpp>

module ECS:Components.Hierarchy.Impl;
import :Components.Hierarchy;
import Core;

namespace ECS::Components::Hierarchy::Detail
{
    void AttachHelper(entt::registry& registry, entt::entity child, Component& childComp,
                      entt::entity parent, Component& parentComp)
    {
        // 1. Set Parent
        childComp.Parent = parent;

        // 2. Insert at Head of Parent's list
        childComp.NextSibling = parentComp.FirstChild;
        childComp.PrevSibling = entt::null;

        if (registry.valid(parentComp.FirstChild))
        {
            auto& oldHead = registry.get<Component>(parentComp.FirstChild);
            oldHead.PrevSibling = child;
        }

        parentComp.FirstChild = child;
        parentComp.ChildCount++;
    }

    void DetachHelper(entt::registry& registry, Component& childComp)
    {
        // A dangling parent id has no list to unlink from.
        auto* parentComp = registry.valid(childComp.Parent) ? registry.try_get<Component>(childComp.Parent) : nullptr;

        // 1. Fix Previous Sibling or Parent Head
        if (childComp.PrevSibling != entt::null)
        {
            if (auto* prev = registry.try_get<Component>(childComp.PrevSibling))
                prev->NextSibling = childComp.NextSibling;
        }
        else if (parentComp)
        {
            parentComp->FirstChild = childComp.NextSibling;
        }

        // 2. Fix Next Sibling
        if (childComp.NextSibling != entt::null)
        {
            if (auto* next = registry.try_get<Component>(childComp.NextSibling))
                next->PrevSibling = childComp.PrevSibling;
        }

        // 3. Update Parent Data
        if (parentComp && parentComp->ChildCount > 0) parentComp->ChildCount--;

        // 4. Clear Child Data
        childComp.Parent = entt::null;
        childComp.NextSibling = entt::null;
        childComp.PrevSibling = entt::null;
    }
}

namespace ECS::Components::Hierarchy
{
    bool IsDescendant(const entt::registry& registry, entt::entity entity, entt::entity potentialDescendant)
    {
        // Bounded walk: a corrupted parent chain must not hang the caller.
        const auto limit = registry.storage<entt::entity>()->size() + 1;
        entt::entity current = potentialDescendant;
        for (size_t hops = 0; hops < limit && registry.valid(current); ++hops)
        {
            if (current == entity) return true;

            const auto* comp = registry.try_get<Component>(current);
            if (!comp) break;
            current = comp->Parent;
        }
        return false;
    }

    Core::Result Attach(entt::registry& registry, entt::entity child, entt::entity newParent)
    {
        if (!registry.valid(child) || child == newParent)
            return Core::Err(Core::ErrorCode::InvalidArgument);

        // 1. Handle Detachment / Null Parent
        if (newParent == entt::null)
        {
            Detach(registry, child);
            return Core::Ok();
        }

        if (!registry.valid(newParent))
            return Core::Err(Core::ErrorCode::InvalidArgument);

        // 2. Cycle Detection
        if (IsDescendant(registry, child, newParent))
        {
            Core::Log::Warn("Hierarchy::Attach -- cycle detected: cannot attach entity {} to its own descendant {}",
                            static_cast<uint32_t>(child), static_cast<uint32_t>(newParent));
            return Core::Err(Core::ErrorCode::InvalidState);
        }

        auto& childComp = registry.get_or_emplace<Component>(child);

        // 3. If already attached to someone else, detach first
        if (childComp.Parent != entt::null)
        {
            if (childComp.Parent == newParent) return Core::Ok();
            Detail::DetachHelper(registry, childComp);
        }

        // 4. Perform Attach
        auto& parentComp = registry.get_or_emplace<Component>(newParent);
        Detail::AttachHelper(registry, child, registry.get<Component>(child), newParent, parentComp);
        return Core::Ok();
    }

    void Detach(entt::registry& registry, entt::entity child)
    {
        if (!registry.valid(child)) return;

        // Use try_get. If it doesn't have a component, it's effectively detached.
        auto* childComp = registry.try_get<Component>(child);
        if (childComp && childComp->Parent != entt::null)
        {
            Detail::DetachHelper(registry, *childComp);
        }
    }
}
