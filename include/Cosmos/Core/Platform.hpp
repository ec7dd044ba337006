#pragma once

// Platform Detection
#if defined(_WIN32) || defined(_WIN64)
    #define COSMOS_PLATFORM_WINDOWS 1
    #ifndef WIN32_LEAN_AND_MEAN
        #define WIN32_LEAN_AND_MEAN
    #endif
    #ifndef NOMINMAX
        #define NOMINMAX
    #endif
#elif defined(__APPLE__) && defined(__MACH__)
    #define COSMOS_PLATFORM_APPLE 1
#elif defined(__linux__)
    #define COSMOS_PLATFORM_LINUX 1
#elif defined(__unix__)
    #define COSMOS_PLATFORM_UNIX 1
#else
    #error "Unknown platform"
#endif

// Compiler Detection
#if defined(_MSC_VER)
    #define COSMOS_COMPILER_MSVC 1
#elif defined(__clang__)
    #define COSMOS_COMPILER_CLANG 1
#elif defined(__GNUC__) || defined(__GNUG__)
    #define COSMOS_COMPILER_GCC 1
#else
    #error "Unknown compiler"
#endif

// Endianness Detection
// Persisted records carry the writer's endianness and are rejected on mismatch
#if defined(__BYTE_ORDER__)
    #if __BYTE_ORDER__ == __ORDER_LITTLE_ENDIAN__
        #define COSMOS_LITTLE_ENDIAN 1
    #elif __BYTE_ORDER__ == __ORDER_BIG_ENDIAN__
        #define COSMOS_BIG_ENDIAN 1
    #endif
#elif defined(_MSC_VER) || defined(__i386__) || defined(__x86_64__) || defined(__aarch64__)
    #define COSMOS_LITTLE_ENDIAN 1
#else
    #error "Unknown endianness"
#endif

// C++ Standard Detection
#if __cplusplus >= 202002L || (defined(_MSVC_LANG) && _MSVC_LANG >= 202002L)
    #define COSMOS_CPP20 1
#else
    #error "Requires C++20 or later"
#endif
