#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "../Core/Base.hpp"
#include "../Core/Config.hpp"
#include "../Core/Error.hpp"
#include "../Core/Profile.hpp"
#include "../Core/Result.hpp"
#include "../Layout/LaneLayout.hpp"
#include "../Layout/ScanStrategy.hpp"
#include "../Platform/Simd.hpp"
#include "../Selector/PositionSelector.hpp"

namespace Lanescan
{
    // Error payload of a failed build: the reason, plus the caller's entries, untouched
    template<typename Value>
    struct BuildFailure
    {
        Error error;
        std::vector<std::pair<std::string, Value>> entries;
    };

    // PerfectScanMap: immutable string-keyed map for small, fixed key sets
    // - No hashing: a handful of byte offsets chosen at build time tell every key apart
    // - Lookup compares the query's bytes at those offsets against all keys at once,
    //   W keys per vector compare, then confirms the one candidate with a full compare
    //
    // MaxPlanes bounds the test planes (lane groups x offsets) the map can hold, so
    // at most MaxPlanes * W keys fit and fewer keys leave room for more offsets.
    //
    // Thread Safety: immutable after TryBuild; any number of threads may read
    // concurrently without synchronization.
    template<typename Value,
             std::size_t MaxPlanes,
             Simd::SimdWidth Width = Simd::Width128,
             typename Strategy = BitmaskScan>
    class PerfectScanMap
    {
    public:
        using KeyType = std::string;
        using MappedType = Value;
        using ValueType = std::pair<std::string, Value>;
        using SizeType = std::size_t;
        using EntryList = std::vector<ValueType>;
        using const_iterator = typename EntryList::const_iterator;
        using iterator = const_iterator;
        using LayoutType = LaneLayout<MaxPlanes, Width>;
        using FailureType = BuildFailure<Value>;
        using BuildResult = Result<PerfectScanMap, FailureType>;

        static constexpr SizeType LANE_WIDTH = LayoutType::LANES;
        static constexpr SizeType MAX_PLANES = MaxPlanes;
        static constexpr SizeType CAPACITY = LayoutType::CAPACITY;

        /**
         * Analyze `entries` and build the map. Insertion order is kept for iteration.
         *
         * Fails with EmptyInput, CapacityExceeded, InvalidArgument (zero search
         * depth) or Unsolvable; on failure the entries come back unmodified in the
         * error payload so the caller can fall back to another container.
         */
        static BuildResult TryBuild(EntryList entries, const BuildOptions& options = {})
        {
            LANESCAN_PROFILE_ZONE_NAMED_COLOR("Lanescan::PerfectScanMap::TryBuild", Profile::ColorBuild);

            if (entries.empty()) LANESCAN_UNLIKELY
            {
                return Fail(ErrorCode::EmptyInput, std::move(entries));
            }

            if (entries.size() > CAPACITY) LANESCAN_UNLIKELY
            {
                return Fail(ErrorCode::CapacityExceeded, std::move(entries));
            }

            std::vector<std::string_view> keys;
            keys.reserve(entries.size());
            for (const auto& entry : entries)
            {
                keys.emplace_back(entry.first);
            }

            auto selection = SelectPositions(keys, LayoutType::PositionBudget(keys.size()), options);
            if (!selection) LANESCAN_UNLIKELY
            {
                return Fail(selection.Error(), std::move(entries));
            }

            const auto& positions = selection.Value().positions;
            LayoutType layout = LayoutType::Build(keys, positions);

            LANESCAN_PROFILE_PLOT("Lanescan.PositionCount", static_cast<std::int64_t>(layout.PositionCount()));
            LANESCAN_PROFILE_PLOT("Lanescan.GroupCount", static_cast<std::int64_t>(layout.GroupCount()));

            return PerfectScanMap(std::move(entries), layout);
        }

        // Value stored under `key`, or nullptr
        LANESCAN_NODISCARD const Value* Get(std::string_view key) const noexcept
        {
            const SizeType index = FindIndex(key);
            return index < m_entries.size() ? &m_entries[index].second : nullptr;
        }

        LANESCAN_NODISCARD const_iterator Find(std::string_view key) const noexcept
        {
            return m_entries.begin() + static_cast<std::ptrdiff_t>(FindIndex(key));
        }

        LANESCAN_NODISCARD bool Contains(std::string_view key) const noexcept
        {
            return FindIndex(key) < m_entries.size();
        }

        LANESCAN_NODISCARD SizeType Size() const noexcept { return m_entries.size(); }
        LANESCAN_NODISCARD bool Empty() const noexcept { return m_entries.empty(); }

        // Entries in construction order
        LANESCAN_NODISCARD std::span<const ValueType> Entries() const noexcept { return m_entries; }

        LANESCAN_NODISCARD const_iterator begin() const noexcept { return m_entries.begin(); }
        LANESCAN_NODISCARD const_iterator end() const noexcept { return m_entries.end(); }
        LANESCAN_NODISCARD const_iterator cbegin() const noexcept { return m_entries.cbegin(); }
        LANESCAN_NODISCARD const_iterator cend() const noexcept { return m_entries.cend(); }

        // Introspection
        LANESCAN_NODISCARD SizeType PositionCount() const noexcept { return m_layout.PositionCount(); }
        LANESCAN_NODISCARD SizeType GroupCount() const noexcept { return m_layout.GroupCount(); }
        LANESCAN_NODISCARD SizeType PlaneCount() const noexcept { return m_layout.PlaneCount(); }
        LANESCAN_NODISCARD std::span<const std::size_t> Positions() const noexcept { return m_layout.Positions(); }
        LANESCAN_NODISCARD const LayoutType& Layout() const noexcept { return m_layout; }

    private:
        PerfectScanMap(EntryList&& entries, const LayoutType& layout)
            : m_entries(std::move(entries))
            , m_layout(layout)
        {
        }

        static BuildResult Fail(const Error& error, EntryList&& entries)
        {
            LANESCAN_PROFILE_MESSAGE_COLOR(error.message, std::strlen(error.message), Profile::ColorFailure);
            return Err(FailureType{error, std::move(entries)});
        }

        static BuildResult Fail(ErrorCode code, EntryList&& entries)
        {
            return Fail(MakeError(code), std::move(entries));
        }

        // Index of the entry equal to `key`, or Size()
        SizeType FindIndex(std::string_view key) const noexcept
        {
            const SizeType candidate = m_layout.template FindCandidate<Strategy>(key);
            LANESCAN_ASSERT(candidate == LayoutType::NO_CANDIDATE || candidate < m_entries.size(),
                            "Scan produced a slot outside the entry range");

            // The scan only compares the chosen offsets; the full compare rejects
            // queries that agree there but differ elsewhere (including in length)
            const bool confirmed = candidate < m_entries.size() && m_entries[candidate].first == key;
            return confirmed ? candidate : m_entries.size();
        }

        EntryList m_entries;
        LayoutType m_layout;
    };
}
