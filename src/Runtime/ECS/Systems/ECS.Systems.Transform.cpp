module;
#include <cstdint>
#include <unordered_set>
#include <vector>

#include <entt/entity/registry.hpp>
#include <glm/glm.hpp>

module ECS:Systems.Transform.Impl;
import :Systems.Transform;
import :Components.Transform;
import :Components.Hierarchy;
import :Components.Renderable;
import Core;

namespace ECS::Systems::Transform::Detail
{
    // True when no ancestor of 'entity' is dirty, i.e. the node can be resolved
    // from a clean parent. Corrupt links end the walk.
    bool IsTopmostDirty(const entt::registry& reg, entt::entity entity)
    {
        const auto limit = reg.storage<entt::entity>()->size() + 1;
        entt::entity current = entity;
        for (size_t hops = 0; hops < limit; ++hops)
        {
            const auto* hierarchy = reg.try_get<Components::Hierarchy::Component>(current);
            if (!hierarchy || hierarchy->Parent == entt::null) return true;

            const entt::entity parent = hierarchy->Parent;
            if (parent == current || !reg.valid(parent)) return true;
            if (reg.all_of<Components::Transform::IsDirtyTag>(parent)) return false;
            current = parent;
        }
        return false;
    }

    // Returns false if the node could not be resolved.
    bool Resolve(entt::registry& reg, entt::entity entity)
    {
        const auto& local = reg.get<Components::Transform::Component>(entity);
        auto& world = reg.get<Components::Transform::WorldMatrix>(entity);
        const auto* hierarchy = reg.try_get<Components::Hierarchy::Component>(entity);

        if (!hierarchy || hierarchy->Parent == entt::null)
        {
            world.Matrix = local.Local;
        }
        else if (hierarchy->Parent == entity)
        {
            Core::Log::Warn("TransformSystem: node {} is its own parent, skipping",
                            static_cast<uint32_t>(entity));
            return false;
        }
        else if (!reg.valid(hierarchy->Parent) || !reg.all_of<Components::Transform::WorldMatrix>(hierarchy->Parent))
        {
            Core::Log::Warn("TransformSystem: node {} has invalid parent {}, skipping",
                            static_cast<uint32_t>(entity), static_cast<uint32_t>(hierarchy->Parent));
            return false;
        }
        else
        {
            world.Matrix = reg.get<Components::Transform::WorldMatrix>(hierarchy->Parent).Matrix * local.Local;
        }

        reg.remove<Components::Transform::IsDirtyTag>(entity);

        if (const auto* renderable = reg.try_get<Components::Renderable::Component>(entity))
        {
            if (auto refreshed = Components::Renderable::Refresh(*renderable, world.Matrix); !refreshed)
            {
                Core::Log::Error("TransformSystem: could not refresh instance {} of node {} ({})",
                                 renderable->Instance, static_cast<uint32_t>(entity),
                                 Core::ErrorCodeToString(refreshed.error()));
            }
        }
        return true;
    }
}

namespace ECS::Systems::Transform
{
    void OnUpdate(entt::registry& registry)
    {
        // 1. Seed with the topmost dirty nodes. Their ancestors are already clean.
        std::vector<entt::entity> worklist;
        for (auto entity : registry.view<Components::Transform::IsDirtyTag>())
        {
            if (registry.all_of<Components::Transform::Component, Components::Transform::WorldMatrix>(entity) &&
                Detail::IsTopmostDirty(registry, entity))
            {
                worklist.push_back(entity);
            }
        }

        // 2. Pop, resolve, push children. A parent is always resolved before its children
        //    and every node is resolved at most once, even if the links form a cycle.
        std::unordered_set<entt::entity> resolved;
        while (!worklist.empty())
        {
            const entt::entity entity = worklist.back();
            worklist.pop_back();

            if (!resolved.insert(entity).second) continue;
            if (!Detail::Resolve(registry, entity)) continue;

            const auto* hierarchy = registry.try_get<Components::Hierarchy::Component>(entity);
            if (!hierarchy) continue;

            entt::entity child = hierarchy->FirstChild;
            for (uint32_t i = 0; i < hierarchy->ChildCount && registry.valid(child); ++i)
            {
                const auto* childHierarchy = registry.try_get<Components::Hierarchy::Component>(child);
                if (!childHierarchy) break;

                if (childHierarchy->Parent == entity &&
                    registry.all_of<Components::Transform::Component, Components::Transform::WorldMatrix>(child))
                {
                    worklist.push_back(child);
                }
                child = childHierarchy->NextSibling;
            }
        }
    }
}
