#pragma once

#include "Base.hpp"

// Tracy integration, enabled when the build defines TRACY_ENABLE (COSMOS_ENABLE_TRACY in CMake)
#if defined(TRACY_ENABLE)
    #include <tracy/Tracy.hpp>

    #define COSMOS_PROFILE_ZONE_NAMED(name) ZoneScopedN(name)
    #define COSMOS_PROFILE_FUNCTION() ZoneScoped
    #define COSMOS_PROFILE_PLOT(name, val) TracyPlot(name, val)
#else
    #define COSMOS_PROFILE_ZONE_NAMED(name)
    #define COSMOS_PROFILE_FUNCTION()
    #define COSMOS_PROFILE_PLOT(name, val)
#endif
