export module RHI;

export import :Types;
export import :Device;
export import :Context;
export import :VulkanDevice;
export import :Shader;
export import :Pipeline;
export import :Buffer;
