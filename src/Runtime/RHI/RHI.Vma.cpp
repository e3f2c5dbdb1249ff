// RHI.Vma.cpp: plain translation unit that instantiates Vulkan Memory Allocator.

#include <cstdlib>
#include <cstdio>

#define VK_NO_PROTOTYPES
#include <volk.h>

// Must match the configuration seen by RHI.Vulkan.hpp users.
#define VMA_IMPLEMENTATION
#define VMA_STATIC_VULKAN_FUNCTIONS 0
#define VMA_DYNAMIC_VULKAN_FUNCTIONS 1

#include <vk_mem_alloc.h>
