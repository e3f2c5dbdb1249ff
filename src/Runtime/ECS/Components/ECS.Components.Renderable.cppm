module;
#include <memory>

#include <glm/glm.hpp>

export module ECS:Components.Renderable;

import Core.Error;
import Graphics;

export namespace ECS::Components::Renderable
{
    // One instance slot in a model shared with other nodes. Assigned once, never replaced.
    struct Component
    {
        std::shared_ptr<Graphics::Model> Model;
        Graphics::InstanceId Instance = 0;
    };

    // Pushes 'world' into the node's instance slot. Takes the model mutex.
    [[nodiscard]] Core::Result Refresh(const Component& renderable, const glm::mat4& world);
}
