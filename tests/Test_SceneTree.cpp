#include <gtest/gtest.h>
#include <glm/glm.hpp>
#include <glm/gtc/matrix_transform.hpp>
#include <entt/entity/entity.hpp>
#include <entt/entity/registry.hpp>
#include <cstdint>
#include <memory>

import ECS;
import Graphics;
import Core;

using namespace ECS;

namespace
{
    glm::mat4 Translation(float x, float y, float z)
    {
        return glm::translate(glm::mat4(1.0f), glm::vec3(x, y, z));
    }

    glm::mat4 RotationY(float radians)
    {
        return glm::rotate(glm::mat4(1.0f), radians, glm::vec3(0.0f, 1.0f, 0.0f));
    }

    bool IsDirty(const SceneTree& tree, NodeHandle node)
    {
        return tree.Get(node)->Dirty;
    }
}

// -----------------------------------------------------------------------------
// Nodes
// -----------------------------------------------------------------------------

TEST(ECS_SceneTree, NewNode_IsIdentityAndClean)
{
    SceneTree tree;
    const NodeHandle node = tree.NewNode();

    ASSERT_TRUE(tree.IsValid(node));
    const auto state = tree.Get(node);
    ASSERT_TRUE(state.has_value());
    EXPECT_EQ(state->Local, glm::mat4(1.0f));
    EXPECT_EQ(state->World, glm::mat4(1.0f));
    EXPECT_FALSE(state->Dirty);
    EXPECT_FALSE(state->Parent.has_value());
    EXPECT_TRUE(state->Children.empty());
    EXPECT_FALSE(state->Instance.has_value());
    EXPECT_EQ(tree.Size(), 1u);
}

TEST(ECS_SceneTree, UnknownNode_IsIgnored)
{
    SceneTree tree;
    (void)tree.NewNode();
    const auto unknown = static_cast<NodeHandle>(1234);

    EXPECT_FALSE(tree.IsValid(unknown));
    EXPECT_FALSE(tree.Get(unknown).has_value());
    EXPECT_FALSE(tree.GetGlobalTransform(unknown).has_value());

    const uint64_t warningsBefore = Core::Log::GetWarningCount();
    tree.UpdateLocalTransform(unknown, Translation(1.0f, 0.0f, 0.0f));
    EXPECT_GT(Core::Log::GetWarningCount(), warningsBefore);
}

TEST(ECS_SceneTree, RootUpdate_ResolvesImmediately)
{
    SceneTree tree;
    const NodeHandle root = tree.NewNode();
    const glm::mat4 local = Translation(1.0f, 2.0f, 3.0f);

    tree.UpdateLocalTransform(root, local);

    EXPECT_FALSE(IsDirty(tree, root));
    const auto world = tree.GetGlobalTransform(root);
    ASSERT_TRUE(world.has_value());
    EXPECT_EQ(*world, local);
}

TEST(ECS_SceneTree, ChildUpdate_StaysDirtyUntilUpdateTransforms)
{
    SceneTree tree;
    const NodeHandle root = tree.NewNode();
    const NodeHandle child = tree.NewNode();
    ASSERT_TRUE(tree.SetParent(child, root).has_value());
    tree.UpdateTransforms();

    tree.UpdateLocalTransform(child, Translation(0.0f, 1.0f, 0.0f));
    EXPECT_TRUE(IsDirty(tree, child));
    EXPECT_FALSE(tree.GetGlobalTransform(child).has_value());

    tree.UpdateTransforms();
    EXPECT_FALSE(IsDirty(tree, child));
    EXPECT_EQ(*tree.GetGlobalTransform(child), Translation(0.0f, 1.0f, 0.0f));
}

// -----------------------------------------------------------------------------
// Propagation
// -----------------------------------------------------------------------------

TEST(ECS_SceneTree, Chain_ComposesParentFirst)
{
    SceneTree tree;
    const NodeHandle a = tree.NewNode();
    const NodeHandle b = tree.NewNode();
    const NodeHandle c = tree.NewNode();

    const glm::mat4 m1 = Translation(1.0f, 0.0f, 0.0f);
    const glm::mat4 m2 = RotationY(glm::radians(90.0f));
    const glm::mat4 m3 = glm::scale(Translation(0.0f, 0.0f, 2.0f), glm::vec3(2.0f));

    tree.UpdateLocalTransform(a, m1);
    ASSERT_TRUE(tree.SetParent(b, a).has_value());
    ASSERT_TRUE(tree.SetParent(c, b).has_value());
    tree.UpdateLocalTransform(b, m2);
    tree.UpdateLocalTransform(c, m3);

    tree.UpdateTransforms();

    EXPECT_EQ(*tree.GetGlobalTransform(b), m1 * m2);
    EXPECT_EQ(*tree.GetGlobalTransform(c), m1 * m2 * m3);
    EXPECT_EQ(tree.Get(c)->Parent, b);
}

TEST(ECS_SceneTree, RootEdit_MarksChildrenAndPropagates)
{
    SceneTree tree;
    const NodeHandle root = tree.NewNode();
    const NodeHandle child = tree.NewNode();
    const NodeHandle grandchild = tree.NewNode();
    ASSERT_TRUE(tree.SetParent(child, root).has_value());
    ASSERT_TRUE(tree.SetParent(grandchild, child).has_value());
    tree.UpdateLocalTransform(grandchild, Translation(0.0f, 0.0f, 1.0f));
    tree.UpdateTransforms();

    tree.UpdateLocalTransform(root, Translation(5.0f, 0.0f, 0.0f));
    EXPECT_TRUE(IsDirty(tree, child));

    tree.UpdateTransforms();
    EXPECT_EQ(*tree.GetGlobalTransform(child), Translation(5.0f, 0.0f, 0.0f));
    EXPECT_EQ(*tree.GetGlobalTransform(grandchild), Translation(5.0f, 0.0f, 1.0f));
}

TEST(ECS_SceneTree, SelfParentedNode_IsSkipped)
{
    SceneTree tree;
    const NodeHandle root = tree.NewNode();
    const NodeHandle broken = tree.NewNode();
    const NodeHandle sibling = tree.NewNode();
    ASSERT_TRUE(tree.SetParent(broken, root).has_value());
    ASSERT_TRUE(tree.SetParent(sibling, root).has_value());
    tree.UpdateTransforms();

    auto& reg = tree.GetRegistry();
    reg.get<Components::Hierarchy::Component>(broken).Parent = broken;
    tree.UpdateLocalTransform(broken, Translation(1.0f, 0.0f, 0.0f));
    tree.UpdateLocalTransform(sibling, Translation(0.0f, 1.0f, 0.0f));

    const uint64_t warningsBefore = Core::Log::GetWarningCount();
    tree.UpdateTransforms();

    EXPECT_GT(Core::Log::GetWarningCount(), warningsBefore);
    EXPECT_TRUE(IsDirty(tree, broken));
    EXPECT_FALSE(IsDirty(tree, sibling));
    EXPECT_EQ(*tree.GetGlobalTransform(sibling), Translation(0.0f, 1.0f, 0.0f));
}

TEST(ECS_SceneTree, DanglingParent_IsSkipped)
{
    SceneTree tree;
    const NodeHandle node = tree.NewNode();
    const NodeHandle other = tree.NewNode();

    auto& reg = tree.GetRegistry();
    const entt::entity gone = reg.create();
    reg.destroy(gone);
    reg.get<Components::Hierarchy::Component>(node).Parent = gone;
    tree.UpdateLocalTransform(node, Translation(1.0f, 0.0f, 0.0f));
    reg.emplace_or_replace<Components::Transform::IsDirtyTag>(other);

    tree.UpdateTransforms();

    EXPECT_TRUE(IsDirty(tree, node));
    EXPECT_FALSE(IsDirty(tree, other));
}

// -----------------------------------------------------------------------------
// Reparenting
// -----------------------------------------------------------------------------

TEST(ECS_SceneTree, SetParent_RejectsCyclesAndSelf)
{
    SceneTree tree;
    const NodeHandle a = tree.NewNode();
    const NodeHandle b = tree.NewNode();
    const NodeHandle c = tree.NewNode();
    ASSERT_TRUE(tree.SetParent(b, a).has_value());
    ASSERT_TRUE(tree.SetParent(c, b).has_value());

    auto cycle = tree.SetParent(a, c);
    ASSERT_FALSE(cycle.has_value());
    EXPECT_EQ(cycle.error(), Core::ErrorCode::InvalidState);
    EXPECT_FALSE(tree.Get(a)->Parent.has_value());

    auto self = tree.SetParent(b, b);
    ASSERT_FALSE(self.has_value());
    EXPECT_EQ(self.error(), Core::ErrorCode::InvalidArgument);
    EXPECT_EQ(tree.Get(b)->Parent, a);

    auto unknown = tree.SetParent(b, static_cast<NodeHandle>(999));
    ASSERT_FALSE(unknown.has_value());
    EXPECT_EQ(unknown.error(), Core::ErrorCode::InvalidArgument);
}

TEST(ECS_SceneTree, SetParent_MovesBetweenParents)
{
    SceneTree tree;
    const NodeHandle first = tree.NewNode();
    const NodeHandle second = tree.NewNode();
    const NodeHandle child = tree.NewNode();
    tree.UpdateLocalTransform(second, Translation(0.0f, 3.0f, 0.0f));

    ASSERT_TRUE(tree.SetParent(child, first).has_value());
    ASSERT_TRUE(tree.SetParent(child, second).has_value());
    tree.UpdateTransforms();

    EXPECT_TRUE(tree.Get(first)->Children.empty());
    ASSERT_EQ(tree.Get(second)->Children.size(), 1u);
    EXPECT_EQ(tree.Get(second)->Children[0], child);
    EXPECT_EQ(*tree.GetGlobalTransform(child), Translation(0.0f, 3.0f, 0.0f));
}

TEST(ECS_SceneTree, Detach_MakesNodeARoot)
{
    SceneTree tree;
    const NodeHandle root = tree.NewNode();
    const NodeHandle child = tree.NewNode();
    tree.UpdateLocalTransform(root, Translation(10.0f, 0.0f, 0.0f));
    ASSERT_TRUE(tree.SetParent(child, root).has_value());
    tree.UpdateLocalTransform(child, Translation(0.0f, 1.0f, 0.0f));
    tree.UpdateTransforms();
    ASSERT_EQ(*tree.GetGlobalTransform(child), Translation(10.0f, 1.0f, 0.0f));

    tree.Detach(child);

    EXPECT_FALSE(tree.Get(child)->Parent.has_value());
    EXPECT_TRUE(tree.Get(root)->Children.empty());
    EXPECT_FALSE(IsDirty(tree, child));
    EXPECT_EQ(*tree.GetGlobalTransform(child), Translation(0.0f, 1.0f, 0.0f));
}

// -----------------------------------------------------------------------------
// Renderables
// -----------------------------------------------------------------------------

TEST(ECS_SceneTree, SetRenderable_WritesCurrentWorld)
{
    SceneTree tree;
    auto model = std::make_shared<Graphics::Model>("Cube");
    const NodeHandle node = tree.NewNode();
    tree.UpdateLocalTransform(node, Translation(2.0f, 0.0f, 0.0f));

    ASSERT_TRUE(tree.SetRenderable(node, model).has_value());

    const auto state = tree.Get(node);
    ASSERT_TRUE(state->Instance.has_value());
    ASSERT_EQ(model->GetInstanceCount(), 1u);
    EXPECT_EQ(model->Instances[*state->Instance].Model, Translation(2.0f, 0.0f, 0.0f));
}

TEST(ECS_SceneTree, SetRenderable_IsOneTime)
{
    SceneTree tree;
    auto model = std::make_shared<Graphics::Model>("Cube");
    const NodeHandle node = tree.NewNode();
    ASSERT_TRUE(tree.SetRenderable(node, model).has_value());

    auto again = tree.SetRenderable(node, model);
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error(), Core::ErrorCode::InvalidState);
    EXPECT_EQ(model->GetInstanceCount(), 1u);

    auto nullModel = tree.SetRenderable(tree.NewNode(), nullptr);
    ASSERT_FALSE(nullModel.has_value());
    EXPECT_EQ(nullModel.error(), Core::ErrorCode::InvalidArgument);

    auto unknown = tree.SetRenderable(static_cast<NodeHandle>(4321), model);
    ASSERT_FALSE(unknown.has_value());
    EXPECT_EQ(unknown.error(), Core::ErrorCode::InvalidArgument);
}

TEST(ECS_SceneTree, UpdateTransforms_RefreshesSharedModelInstances)
{
    SceneTree tree;
    auto model = std::make_shared<Graphics::Model>("Orbiter");
    const NodeHandle root = tree.NewNode();
    const NodeHandle left = tree.NewNode();
    const NodeHandle right = tree.NewNode();
    ASSERT_TRUE(tree.SetParent(left, root).has_value());
    ASSERT_TRUE(tree.SetParent(right, root).has_value());
    ASSERT_TRUE(tree.SetRenderable(left, model).has_value());
    ASSERT_TRUE(tree.SetRenderable(right, model).has_value());

    tree.UpdateLocalTransform(root, Translation(0.0f, 0.0f, -5.0f));
    tree.UpdateLocalTransform(left, Translation(-1.0f, 0.0f, 0.0f));
    tree.UpdateLocalTransform(right, Translation(1.0f, 0.0f, 0.0f));
    tree.UpdateTransforms();

    const auto leftInstance = *tree.Get(left)->Instance;
    const auto rightInstance = *tree.Get(right)->Instance;
    EXPECT_NE(leftInstance, rightInstance);
    EXPECT_EQ(model->Instances[leftInstance].Model, Translation(-1.0f, 0.0f, -5.0f));
    EXPECT_EQ(model->Instances[rightInstance].Model, Translation(1.0f, 0.0f, -5.0f));
}
