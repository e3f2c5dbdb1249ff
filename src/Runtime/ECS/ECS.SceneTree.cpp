module;
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

#include <entt/entity/registry.hpp>
#include <glm/glm.hpp>

module ECS:SceneTree.Impl;
import :SceneTree;
import :Components;
import :Systems.Transform;
import Core;
import Graphics;

namespace ECS
{
    NodeHandle SceneTree::NewNode()
    {
        const entt::entity e = m_Registry.create();
        m_Registry.emplace<Components::Transform::Component>(e);
        m_Registry.emplace<Components::Transform::WorldMatrix>(e);
        m_Registry.emplace<Components::Hierarchy::Component>(e);
        return e;
    }

    bool SceneTree::IsValid(NodeHandle node) const
    {
        return m_Registry.valid(node) &&
               m_Registry.all_of<Components::Transform::Component, Components::Transform::WorldMatrix>(node);
    }

    void SceneTree::UpdateLocalTransform(NodeHandle node, const glm::mat4& local)
    {
        if (!IsValid(node))
        {
            Core::Log::Warn("SceneTree::UpdateLocalTransform -- unknown node {}", static_cast<uint32_t>(node));
            return;
        }

        m_Registry.get<Components::Transform::Component>(node).Local = local;

        const auto& hierarchy = m_Registry.get<Components::Hierarchy::Component>(node);
        if (hierarchy.Parent == entt::null)
            ResolveRoot(node);
        else
            m_Registry.emplace_or_replace<Components::Transform::IsDirtyTag>(node);
    }

    void SceneTree::ResolveRoot(NodeHandle node)
    {
        const glm::mat4& local = m_Registry.get<Components::Transform::Component>(node).Local;
        m_Registry.get<Components::Transform::WorldMatrix>(node).Matrix = local;
        m_Registry.remove<Components::Transform::IsDirtyTag>(node);

        if (const auto* renderable = m_Registry.try_get<Components::Renderable::Component>(node))
        {
            if (auto refreshed = Components::Renderable::Refresh(*renderable, local); !refreshed)
            {
                Core::Log::Error("SceneTree: could not refresh instance {} of node {} ({})", renderable->Instance,
                                 static_cast<uint32_t>(node), Core::ErrorCodeToString(refreshed.error()));
            }
        }

        MarkChildrenDirty(node);
    }

    void SceneTree::MarkChildrenDirty(NodeHandle node)
    {
        const auto& hierarchy = m_Registry.get<Components::Hierarchy::Component>(node);
        entt::entity child = hierarchy.FirstChild;
        for (uint32_t i = 0; i < hierarchy.ChildCount && m_Registry.valid(child); ++i)
        {
            m_Registry.emplace_or_replace<Components::Transform::IsDirtyTag>(child);
            child = m_Registry.get<Components::Hierarchy::Component>(child).NextSibling;
        }
    }

    Core::Result SceneTree::SetRenderable(NodeHandle node, std::shared_ptr<Graphics::Model> model)
    {
        if (!IsValid(node) || !model)
            return Core::Err(Core::ErrorCode::InvalidArgument);

        if (m_Registry.all_of<Components::Renderable::Component>(node))
        {
            Core::Log::Error("SceneTree::SetRenderable -- node {} already has a renderable",
                             static_cast<uint32_t>(node));
            return Core::Err(Core::ErrorCode::InvalidState);
        }

        const glm::mat4& world = m_Registry.get<Components::Transform::WorldMatrix>(node).Matrix;

        Graphics::InstanceId instance = 0;
        {
            std::lock_guard lock(model->Mutex);
            instance = model->NewInstance();
            if (auto written = model->UpdateInstance(instance, world); !written)
                return Core::Err(written.error());
        }

        m_Registry.emplace<Components::Renderable::Component>(node, std::move(model), instance);
        return Core::Ok();
    }

    void SceneTree::UpdateTransforms()
    {
        Systems::Transform::OnUpdate(m_Registry);
    }

    Core::Result SceneTree::SetParent(NodeHandle child, NodeHandle parent)
    {
        if (!IsValid(child) || !IsValid(parent))
            return Core::Err(Core::ErrorCode::InvalidArgument);

        if (auto attached = Components::Hierarchy::Attach(m_Registry, child, parent); !attached)
            return attached;

        m_Registry.emplace_or_replace<Components::Transform::IsDirtyTag>(child);
        return Core::Ok();
    }

    void SceneTree::Detach(NodeHandle child)
    {
        if (!IsValid(child)) return;

        Components::Hierarchy::Detach(m_Registry, child);
        ResolveRoot(child);
    }

    std::optional<NodeState> SceneTree::Get(NodeHandle node) const
    {
        if (!IsValid(node)) return std::nullopt;

        NodeState state;
        state.Local = m_Registry.get<Components::Transform::Component>(node).Local;
        state.World = m_Registry.get<Components::Transform::WorldMatrix>(node).Matrix;
        state.Dirty = m_Registry.all_of<Components::Transform::IsDirtyTag>(node);

        if (const auto* hierarchy = m_Registry.try_get<Components::Hierarchy::Component>(node))
        {
            if (hierarchy->Parent != entt::null) state.Parent = hierarchy->Parent;

            entt::entity child = hierarchy->FirstChild;
            for (uint32_t i = 0; i < hierarchy->ChildCount && m_Registry.valid(child); ++i)
            {
                state.Children.push_back(child);
                child = m_Registry.get<Components::Hierarchy::Component>(child).NextSibling;
            }
        }

        if (const auto* renderable = m_Registry.try_get<Components::Renderable::Component>(node))
            state.Instance = renderable->Instance;

        return state;
    }

    std::optional<glm::mat4> SceneTree::GetGlobalTransform(NodeHandle node) const
    {
        if (!IsValid(node) || m_Registry.all_of<Components::Transform::IsDirtyTag>(node))
            return std::nullopt;
        return m_Registry.get<Components::Transform::WorldMatrix>(node).Matrix;
    }
}
