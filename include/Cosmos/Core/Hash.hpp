#pragma once

#include <cstddef>
#include <cstdint>

#include "Base.hpp"

#if defined(__SSE4_2__)
    #include <nmmintrin.h>
    #define COSMOS_HAS_SSE42 1
#endif

namespace Cosmos
{
    COSMOS_FORCEINLINE std::uint64_t HashCombine(std::uint64_t seed, std::uint64_t value) noexcept
    {
#if defined(COSMOS_HAS_SSE42)
        return _mm_crc32_u64(seed, value);
#else
        // MurmurHash3 finalizer
        std::uint64_t h = seed ^ value;
        h ^= h >> 33;
        h *= 0xff51afd7ed558ccdULL;
        h ^= h >> 33;
        h *= 0xc4ceb9fe1a85ec53ULL;
        h ^= h >> 33;
        return h;
#endif
    }

    // FNV-1a over bytes, used for string-like keys
    inline constexpr std::uint64_t HashBytes(const char* data, std::size_t size) noexcept
    {
        std::uint64_t hash = 0xcbf29ce484222325ULL;
        for (std::size_t i = 0; i < size; ++i)
        {
            hash ^= static_cast<std::uint8_t>(data[i]);
            hash *= 0x100000001b3ULL;
        }
        return hash;
    }
}
