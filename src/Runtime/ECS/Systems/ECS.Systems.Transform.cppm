module;
#include <entt/fwd.hpp>

export module ECS:Systems.Transform;
import :Components.Transform;
import :Components.Hierarchy;

export namespace ECS::Systems::Transform
{
    // Resolves WorldMatrix for every dirty node and everything below it, and pushes
    // the new transforms into the renderable instance slots.
    // Post: every node reachable from a root is clean and World == ParentWorld * Local.
    // Nodes with a corrupt parent link are logged, skipped and left dirty.
    void OnUpdate(entt::registry& registry);
}
