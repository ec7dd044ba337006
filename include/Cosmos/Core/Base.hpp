#pragma once

#include "Platform.hpp"

// Base macros shared by every Cosmos header

#define COSMOS_NODISCARD [[nodiscard]]
#define COSMOS_LIKELY [[likely]]
#define COSMOS_UNLIKELY [[unlikely]]

// Cross-platform struct packing macros
#ifdef _MSC_VER
    #define COSMOS_PACK_BEGIN __pragma(pack(push, 1))
    #define COSMOS_PACK_END __pragma(pack(pop))
#elif defined(__GNUC__) || defined(__clang__)
    #define COSMOS_PACK_BEGIN _Pragma("pack(push, 1)")
    #define COSMOS_PACK_END _Pragma("pack(pop)")
#else
    #error "Unsupported compiler for struct packing"
#endif

#if defined(COSMOS_COMPILER_MSVC)
    #define COSMOS_FORCEINLINE __forceinline
#else
    #define COSMOS_FORCEINLINE inline __attribute__((always_inline))
#endif

// Runtime assertion macro, only active when the build defines COSMOS_BUILD_DEBUG
#ifdef COSMOS_BUILD_DEBUG
    #include <cassert>
    #define COSMOS_ASSERT(condition, message) assert((condition) && (message))
#else
    #define COSMOS_ASSERT(condition, message) ((void)0)
#endif
