#pragma once

#define COSMOS_VERSION_MAJOR 0
#define COSMOS_VERSION_MINOR 3
#define COSMOS_VERSION_PATCH 0

#define COSMOS_VERSION ((COSMOS_VERSION_MAJOR << 16) | (COSMOS_VERSION_MINOR << 8) | COSMOS_VERSION_PATCH)

namespace Cosmos
{
    inline constexpr int VERSION_MAJOR = COSMOS_VERSION_MAJOR;
    inline constexpr int VERSION_MINOR = COSMOS_VERSION_MINOR;
    inline constexpr int VERSION_PATCH = COSMOS_VERSION_PATCH;
    inline constexpr int VERSION = COSMOS_VERSION;
}
