export module ECS;

export import :Components;
export import :Systems.Transform;
export import :SceneTree;
