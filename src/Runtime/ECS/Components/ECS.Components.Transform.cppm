module;
#include <glm/glm.hpp>

export module ECS:Components.Transform;

export namespace ECS::Components::Transform
{
    // Local transform relative to the parent (or to world space for a root).
    struct Component
    {
        glm::mat4 Local{1.0f};
    };

    // Cached global transform. Stale while IsDirtyTag is present.
    struct WorldMatrix
    {
        glm::mat4 Matrix{1.0f};
    };

    // Tag component for dirty tracking - zero size, just marks entity
    // Usage: registry.emplace_or_replace<IsDirtyTag>(entity) when the local transform or the parent changes
    //        registry.view<IsDirtyTag>() to iterate stale nodes
    struct IsDirtyTag
    {
    };
}
