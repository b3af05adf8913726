#pragma once

#include <algorithm>
#include <bit>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <span>
#include <string_view>
#include <vector>

#include "../Core/Config.hpp"
#include "../Core/Error.hpp"
#include "../Core/Profile.hpp"
#include "../Core/Result.hpp"
#include "KeyBytes.hpp"

namespace Lanescan
{
    // Ordered discriminating offsets plus the score recorded when each was picked
    struct PositionSelection
    {
        std::vector<std::size_t> positions;
        std::vector<std::size_t> scores;
    };

    /**
     * Score of `candidate` given the offsets already chosen. Lower is better.
     *
     * For every key, count the keys (itself included) that agree with it on all
     * chosen offsets plus the candidate, and add ceil(log2(count)). A key that is
     * already unique contributes 0, so a total of 0 means every key is separated.
     *
     * Pure: depends only on its arguments and allocates nothing, so candidates can
     * be scored independently.
     */
    LANESCAN_NODISCARD inline std::size_t ScoreCandidate(const KeyByteMatrix& matrix,
                                                        std::span<const std::size_t> chosen,
                                                        std::size_t candidate) noexcept
    {
        const std::size_t keyCount = matrix.KeyCount();
        std::size_t score = 0;

        for (std::size_t self = 0; self < keyCount; ++self)
        {
            const std::uint8_t selfByte = matrix.At(self, candidate);
            std::size_t alike = 0;
            for (std::size_t other = 0; other < keyCount; ++other)
            {
                const bool same = matrix.At(other, candidate) == selfByte && matrix.AgreeAt(self, other, chosen);
                alike += same;
            }

            // alike >= 1 (the key agrees with itself); bit_width(alike - 1) == ceil(log2(alike))
            score += static_cast<std::size_t>(std::bit_width(alike - 1));
        }

        return score;
    }

    /**
     * Greedy search for discriminating offsets.
     *
     * Each round scores every unchosen offset in [0, depth) and appends the one
     * with the lowest score, the lowest offset winning ties. Stops with success as
     * soon as the appended offset scores 0. Fails with Unsolvable when `budget`
     * rounds pass (or every offset is used) without separating all keys.
     */
    LANESCAN_NODISCARD inline Result<PositionSelection, Error> SelectPositions(const KeyByteMatrix& matrix, std::size_t budget)
    {
        LANESCAN_PROFILE_ZONE_NAMED_COLOR("Lanescan::SelectPositions", Profile::ColorSelect);

        PositionSelection selection;
        selection.positions.reserve(std::min(budget, matrix.Depth()));
        selection.scores.reserve(std::min(budget, matrix.Depth()));

        for (std::size_t round = 0; round < budget; ++round)
        {
            constexpr std::size_t UNSCORED = std::numeric_limits<std::size_t>::max();
            std::size_t best = UNSCORED;
            std::size_t bestScore = UNSCORED;

            for (std::size_t candidate = 0; candidate < matrix.Depth(); ++candidate)
            {
                const auto& chosen = selection.positions;
                if (std::find(chosen.begin(), chosen.end(), candidate) != chosen.end())
                {
                    continue;
                }

                const std::size_t score = ScoreCandidate(matrix, chosen, candidate);
                if (score < bestScore)
                {
                    best = candidate;
                    bestScore = score;
                }
            }

            if (best == UNSCORED) LANESCAN_UNLIKELY
            {
                break;
            }

            selection.positions.push_back(best);
            selection.scores.push_back(bestScore);

            if (bestScore == 0)
            {
                LANESCAN_PROFILE_ZONE_VALUE(selection.positions.size());
                return selection;
            }
        }

        return Err(MakeError(ErrorCode::Unsolvable));
    }

    // Convenience overload: validates inputs and builds the byte matrix
    LANESCAN_NODISCARD inline Result<PositionSelection, Error> SelectPositions(std::span<const std::string_view> keys,
                                                                             std::size_t budget,
                                                                             const BuildOptions& options = {})
    {
        if (keys.empty())
        {
            return Err(MakeError(ErrorCode::EmptyInput));
        }
        if (options.searchDepth == 0)
        {
            return Err(MakeError(ErrorCode::InvalidArgument, "Search depth must be at least one byte"));
        }

        const KeyByteMatrix matrix(keys, KeyByteMatrix::DepthFor(keys, options.searchDepth));
        return SelectPositions(matrix, budget);
    }
}
