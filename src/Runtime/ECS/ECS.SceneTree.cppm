module;
#include <cstddef>
#include <memory>
#include <optional>
#include <vector>

#include <entt/entity/registry.hpp>
#include <glm/glm.hpp>

export module ECS:SceneTree;

import Core.Error;
import Graphics;
import :Components;

export namespace ECS
{
    using NodeHandle = entt::entity;

    // Snapshot of one node, for inspection and tests.
    struct NodeState
    {
        glm::mat4 Local{1.0f};
        glm::mat4 World{1.0f};
        bool Dirty = false;
        std::optional<NodeHandle> Parent;
        std::vector<NodeHandle> Children;
        std::optional<Graphics::InstanceId> Instance;
    };

    // Hierarchical transform store on top of an entt::registry.
    // Nodes are never destroyed; handles stay valid for the lifetime of the tree.
    // Not thread-safe: guard the whole tree with one lock if it is shared.
    class SceneTree
    {
    public:
        SceneTree() = default;
        SceneTree(const SceneTree&) = delete;
        SceneTree& operator=(const SceneTree&) = delete;

        // Identity local/world, clean, no parent, no renderable.
        [[nodiscard]] NodeHandle NewNode();

        // Marks the node dirty. A root resolves immediately and marks its children dirty instead.
        void UpdateLocalTransform(NodeHandle node, const glm::mat4& local);

        // One-time assignment. Appends an instance to 'model' and writes the node's
        // current world transform into it.
        [[nodiscard]] Core::Result SetRenderable(NodeHandle node, std::shared_ptr<Graphics::Model> model);

        void UpdateTransforms();

        [[nodiscard]] Core::Result SetParent(NodeHandle child, NodeHandle parent);

        // Makes 'child' a root. Its world transform becomes its local transform.
        void Detach(NodeHandle child);

        [[nodiscard]] std::optional<NodeState> Get(NodeHandle node) const;

        // Empty for unknown nodes and while the cached transform is stale.
        [[nodiscard]] std::optional<glm::mat4> GetGlobalTransform(NodeHandle node) const;

        [[nodiscard]] bool IsValid(NodeHandle node) const;

        [[nodiscard]] size_t Size() const { return m_Registry.storage<entt::entity>()->size(); }

        entt::registry& GetRegistry() { return m_Registry; }
        [[nodiscard]] const entt::registry& GetRegistry() const { return m_Registry; }

    private:
        void ResolveRoot(NodeHandle node);
        void MarkChildrenDirty(NodeHandle node);

        entt::registry m_Registry;
    };
}
