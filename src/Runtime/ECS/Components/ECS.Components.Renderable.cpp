module;
#include <mutex>

#include <glm/glm.hpp>

module ECS:Components.Renderable.Impl;
import :Components.Renderable;
import Core;
import Graphics;

namespace ECS::Components::Renderable
{
    Core::Result Refresh(const Component& renderable, const glm::mat4& world)
    {
        if (!renderable.Model) return Core::Err(Core::ErrorCode::InvalidState);

        std::lock_guard lock(renderable.Model->Mutex);
        return renderable.Model->UpdateInstance(renderable.Instance, world);
    }
}
