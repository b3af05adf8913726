#pragma once

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <span>
#include <string_view>

#include "../Core/Config.hpp"
#include "../Core/Profile.hpp"
#include "../Platform/Simd.hpp"
#include "../Selector/KeyBytes.hpp"
#include "ScanStrategy.hpp"
#include "TestPlane.hpp"

namespace Lanescan
{
    /**
     * Materialized scan plan for a fixed key set.
     *
     * Keys are split into lane groups of W consecutive entries. For every group g
     * and discriminating offset p (in selection order) the layout holds a plane of
     * the W keys' padded bytes at p, stored at index g * PositionCount() + scan.
     * Slots past the last entry are zero and are excluded by the group's validity
     * mask, which always has its low ValidCount(g) bits set.
     *
     * Storage is fixed at MaxPlanes planes; Build requires
     * GroupCount() * PositionCount() <= MaxPlanes, which keeps every index used by
     * FindCandidate inside the arrays.
     */
    template<std::size_t MaxPlanes, Simd::SimdWidth Width>
    class LaneLayout
    {
        static_assert(MaxPlanes > 0, "LaneLayout needs room for at least one plane");

    public:
        using Plane = TestPlane<Width>;
        using MaskType = typename Simd::WidthTraits<Width>::MaskType;
        using SizeType = std::size_t;

        static constexpr SizeType LANES = Simd::WidthTraits<Width>::bytes;
        // Planes across all groups; GroupCount() * PositionCount() never exceeds it
        static constexpr SizeType MAX_PLANES = MaxPlanes;
        static constexpr SizeType CAPACITY = MaxPlanes * LANES;

        // Returned by FindCandidate when no slot survives
        static constexpr SizeType NO_CANDIDATE = std::numeric_limits<SizeType>::max();

        LaneLayout() = default;

        // Largest number of positions a key set of `keyCount` may use
        LANESCAN_NODISCARD static constexpr SizeType PositionBudget(SizeType keyCount) noexcept
        {
            return keyCount == 0 ? 0 : MaxPlanes / DivCeil(keyCount, LANES);
        }

        static LaneLayout Build(std::span<const std::string_view> keys, std::span<const std::size_t> positions) noexcept
        {
            LANESCAN_PROFILE_ZONE_NAMED_COLOR("Lanescan::LaneLayout::Build", Profile::ColorLayout);
            LANESCAN_ASSERT(!keys.empty() && keys.size() <= CAPACITY, "Key count outside layout capacity");
            LANESCAN_ASSERT(positions.size() <= PositionBudget(keys.size()), "Position list exceeds plane budget");

            LaneLayout layout;
            layout.m_groupCount = DivCeil(keys.size(), LANES);
            layout.m_positionCount = positions.size();

            for (SizeType scan = 0; scan < positions.size(); ++scan)
            {
                layout.m_positions[scan] = positions[scan];
            }

            for (SizeType group = 0; group < layout.m_groupCount; ++group)
            {
                const SizeType first = group * LANES;
                const SizeType count = std::min(LANES, keys.size() - first);

                for (SizeType scan = 0; scan < layout.m_positionCount; ++scan)
                {
                    Plane& plane = layout.m_planes[group * layout.m_positionCount + scan];
                    for (SizeType slot = 0; slot < count; ++slot)
                    {
                        plane.Set(slot, PaddedByte(keys[first + slot], positions[scan]));
                    }
                }

                layout.m_validMasks[group] = Simd::Ops::LaneMask<Width>(count);
            }

            return layout;
        }

        /**
         * Entry index whose bytes at every discriminating offset equal the query's,
         * or NO_CANDIDATE. The candidate still has to be confirmed against the full
         * key; this only proves it is the one stored key the query could be.
         *
         * Every group and every plane is visited regardless of the query, and
         * nothing is allocated.
         */
        template<typename Strategy = BitmaskScan>
        LANESCAN_NODISCARD SizeType FindCandidate(std::string_view query) const noexcept
        {
            std::array<std::uint8_t, MaxPlanes> queryBytes;
            for (SizeType scan = 0; scan < m_positionCount; ++scan)
            {
                queryBytes[scan] = PaddedByte(query, m_positions[scan]);
            }

            // At most one group reports a hit, so summing replaces a branch
            SizeType encoded = 0;
            const Plane* planes = m_planes.data();
            for (SizeType group = 0; group < m_groupCount; ++group)
            {
                const SizeType hit = Strategy::template ScanGroup<Width>(planes, queryBytes.data(), m_positionCount, m_validMasks[group]);
                encoded += hit + group * LANES * static_cast<SizeType>(hit != 0);
                planes += m_positionCount;
            }

            return encoded - 1;
        }

        LANESCAN_NODISCARD SizeType GroupCount() const noexcept { return m_groupCount; }
        LANESCAN_NODISCARD SizeType PositionCount() const noexcept { return m_positionCount; }
        LANESCAN_NODISCARD SizeType PlaneCount() const noexcept { return m_groupCount * m_positionCount; }

        LANESCAN_NODISCARD std::span<const std::size_t> Positions() const noexcept
        {
            return {m_positions.data(), m_positionCount};
        }

        LANESCAN_NODISCARD const Plane& PlaneAt(SizeType group, SizeType scan) const noexcept
        {
            LANESCAN_ASSERT(group < m_groupCount && scan < m_positionCount, "Plane index out of range");
            return m_planes[group * m_positionCount + scan];
        }

        LANESCAN_NODISCARD MaskType ValidMask(SizeType group) const noexcept
        {
            LANESCAN_ASSERT(group < m_groupCount, "Group index out of range");
            return m_validMasks[group];
        }

        LANESCAN_NODISCARD SizeType ValidCount(SizeType group) const noexcept
        {
            return static_cast<SizeType>(Simd::Ops::PopCount(ValidMask(group)));
        }

    private:
        std::array<Plane, MaxPlanes> m_planes{};
        std::array<std::size_t, MaxPlanes> m_positions{};
        std::array<MaskType, MaxPlanes> m_validMasks{};
        SizeType m_groupCount = 0;
        SizeType m_positionCount = 0;
    };
}
