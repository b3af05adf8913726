#pragma once

#include <cstddef>
#include <cstdint>

#include "Base.hpp"

namespace Lanescan
{
    namespace config
    {
        // Only the first MAX_KEY_SEARCH_LEN bytes of a key are candidates for a discriminating position
        inline constexpr std::size_t MAX_KEY_SEARCH_LEN = 32;
    }

    /**
     * Per-build tuning knobs. Capacity (lane groups and vector width) is fixed by
     * the map's template parameters; these only shape the position search.
     */
    struct BuildOptions
    {
        // Candidate offsets are [0, min(longest key, searchDepth)). Must be non-zero.
        std::size_t searchDepth = config::MAX_KEY_SEARCH_LEN;
    };

    template<typename T>
    inline constexpr T DivCeil(T value, T divisor) noexcept
    {
        return (value + divisor - 1) / divisor;
    }
}
