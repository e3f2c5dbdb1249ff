#pragma once

// Every translation unit that touches Vulkan goes through this header so the
// loader configuration stays identical everywhere.
#ifndef VK_NO_PROTOTYPES
    #define VK_NO_PROTOTYPES
#endif

#include <volk.h>

// Declarations only. VMA_IMPLEMENTATION lives in RHI.Vma.cpp.
#include <vk_mem_alloc.h>
