#pragma once

#include <cstdint>

#include "Base.hpp"

// Tracy integration - only enabled in Release builds with TRACY_ENABLE
#if defined(LANESCAN_BUILD_RELEASE) && defined(TRACY_ENABLE)
    #include <tracy/Tracy.hpp>

    // Zone scoped profiling - tracks execution time of current scope
    #define LANESCAN_PROFILE_ZONE_NAMED_COLOR(name, color) ZoneScopedNC(name, color)

    // Attach a value to the enclosing zone
    #define LANESCAN_PROFILE_ZONE_VALUE(value) ZoneValue(value)

    // Plot values over time
    #define LANESCAN_PROFILE_PLOT(name, val) TracyPlot(name, val)

    // Messages
    #define LANESCAN_PROFILE_MESSAGE_COLOR(text, size, color) TracyMessageC(text, size, color)
#else
    // No-op macros when profiling is disabled
    #define LANESCAN_PROFILE_ZONE_NAMED_COLOR(name, color)

    #define LANESCAN_PROFILE_ZONE_VALUE(value)

    #define LANESCAN_PROFILE_PLOT(name, val)

    #define LANESCAN_PROFILE_MESSAGE_COLOR(text, size, color)
#endif

// Color constants for profiling zones (matches Tracy's color scheme)
namespace Lanescan::Profile
{
    constexpr std::uint32_t ColorBuild = 0xDD0000;
    constexpr std::uint32_t ColorSelect = 0xDDDD00;
    constexpr std::uint32_t ColorLayout = 0x0088FF;
    constexpr std::uint32_t ColorFailure = 0xFF0088;
}
