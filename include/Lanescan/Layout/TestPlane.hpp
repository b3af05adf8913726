#pragma once

#include <cstddef>
#include <cstdint>

#include "../Core/Base.hpp"
#include "../Platform/Simd.hpp"

namespace Lanescan
{
    // One lane group's bytes at one discriminating offset; slot i belongs to entry (group * W + i).
    // Aligned to the vector width so a whole plane is a single aligned load.
    template<Simd::SimdWidth Width>
    struct alignas(Simd::AlignmentV<Width>) TestPlane
    {
        static constexpr std::size_t LANES = Simd::WidthTraits<Width>::bytes;
        using MaskType = typename Simd::WidthTraits<Width>::MaskType;

        std::uint8_t lanes[LANES] = {};

        // Bit i set when slot i holds `value`
        LANESCAN_NODISCARD LANESCAN_FORCEINLINE MaskType Match(std::uint8_t value) const noexcept
        {
            return Simd::Ops::MatchByteMask<Width>(lanes, value);
        }

        void Set(std::size_t slot, std::uint8_t value) noexcept
        {
            LANESCAN_ASSERT(slot < LANES, "Plane slot out of range");
            lanes[slot] = value;
        }

        LANESCAN_NODISCARD std::uint8_t Get(std::size_t slot) const noexcept
        {
            LANESCAN_ASSERT(slot < LANES, "Plane slot out of range");
            return lanes[slot];
        }

        LANESCAN_NODISCARD const std::uint8_t* Data() const noexcept
        {
            return lanes;
        }
    };
}
