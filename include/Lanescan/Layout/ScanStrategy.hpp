#pragma once

#include <cstddef>
#include <cstdint>

#include "../Core/Base.hpp"
#include "../Platform/Simd.hpp"
#include "TestPlane.hpp"

namespace Lanescan
{
    // A scan strategy reduces one lane group to "which slot survived every plane".
    //
    // ScanGroup returns slot + 1 for the surviving valid slot, or 0 when none did.
    // Construction guarantees at most one valid slot can survive a full scan, so
    // neither strategy needs to disambiguate between several hits.

    // Default: AND the per-plane equality bitmasks, seeded with the validity mask,
    // and take the lowest set bit.
    struct BitmaskScan
    {
        template<Simd::SimdWidth Width>
        LANESCAN_NODISCARD static LANESCAN_FORCEINLINE std::size_t ScanGroup(
            const TestPlane<Width>* LANESCAN_RESTRICT planes,
            const std::uint8_t* LANESCAN_RESTRICT queryBytes,
            std::size_t positionCount,
            typename Simd::WidthTraits<Width>::MaskType validMask) noexcept
        {
            auto matched = validMask;
            for (std::size_t scan = 0; scan < positionCount; ++scan)
            {
                matched &= planes[scan].Match(queryBytes[scan]);
            }

            const std::size_t slot = static_cast<std::size_t>(Simd::Ops::CountTrailingZeros(matched));
            return matched ? slot + 1 : 0;
        }
    };

    // Alternative for targets without cheap mask extraction: start from the lane
    // pattern [W, W-1, ..., 1], zero every lane that fails a plane, then take the
    // horizontal maximum. The largest survivor is the lowest surviving slot, and
    // padding slots sit above every valid slot, so a valid hit always wins.
    struct DescendingMaxScan
    {
        template<Simd::SimdWidth Width>
        LANESCAN_NODISCARD static LANESCAN_FORCEINLINE std::size_t ScanGroup(
            const TestPlane<Width>* LANESCAN_RESTRICT planes,
            const std::uint8_t* LANESCAN_RESTRICT queryBytes,
            std::size_t positionCount,
            typename Simd::WidthTraits<Width>::MaskType validMask) noexcept
        {
            using Lanes = Simd::Ops::ByteLanes<Width>;
            constexpr std::size_t LANES = Simd::WidthTraits<Width>::bytes;

            auto state = Lanes::Descending();
            for (std::size_t scan = 0; scan < positionCount; ++scan)
            {
                Lanes::AndEqual(state, planes[scan].Data(), queryBytes[scan]);
            }

            const std::size_t top = Lanes::ReduceMax(state);
            const std::size_t slot = LANES - top;
            const std::size_t validCount = static_cast<std::size_t>(Simd::Ops::PopCount(validMask));

            const bool hit = (top != 0) & (slot < validCount);
            return hit ? slot + 1 : 0;
        }
    };
}
