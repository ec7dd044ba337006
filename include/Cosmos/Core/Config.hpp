#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

#include "Base.hpp"

namespace Cosmos
{
    namespace config
    {
        // Width of the single bitmap type used for allocator bits, entity masks and queries
        inline constexpr std::size_t BITMAP_BITS = 128;

        // Bit indices are pre-incremented, so index 0 is never issued
        inline constexpr std::uint32_t FIRST_BIT_INDEX = 1;

        inline constexpr std::size_t COMPONENT_CAPACITY = BITMAP_BITS - FIRST_BIT_INDEX;

        // Top-level keys of the external store
        inline constexpr std::string_view GENESIS_KEY = "genesis";
        inline constexpr std::string_view WORLD_KEY = "world";
        inline constexpr std::string_view REGISTER_KEY = "register";

        // When true, Unregister locates addresses with a binary search even though
        // addresses are kept in insertion order, matching records written by
        // sorted-lookup deployments. Addresses registered out of sorted order may
        // then never be found. Off by default: lookups are linear.
        inline constexpr bool UNREGISTER_ASSUMES_SORTED =
#ifdef COSMOS_UNREGISTER_SORTED_LOOKUP
            true;
#else
            false;
#endif
    }
}
