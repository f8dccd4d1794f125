/*
 * Copyright (C) 2025 The Fooder Authors
 *
 * This file is part of Fooder.
 *
 * Fooder is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * Fooder is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with Fooder.  If not, see <http://www.gnu.org/licenses/>.
 */

#pragma once

#include <cstddef>
#include <span>
#include <vector>

#include "recommendation/RatingMatrix.hpp"
#include "recommendation/Similarity.hpp"
#include "recommendation/Types.hpp"

namespace fooder::recommendation
{
    class InteractionTable;
    class PreferenceLedger;

    struct NeighborSelectionParameters
    {
        std::size_t minNeighborCount{ 5 };
        std::size_t maxNeighborCount{ 100 };
        double distancePercentile{ 10 };
    };

    // Linear interpolation between closest ranks, values need not be sorted
    // Returns 0 if values is empty
    double computePercentile(std::span<const Distance> values, double percentile);

    struct PercentileFilterResult
    {
        std::vector<UserDistance> rows;
        std::size_t targetCount{};
    };

    // Counts the rows whose distance is at most the given percentile of all distances:
    //  - count < minRows: targetCount = minRows, rows left untouched
    //  - count > maxRows: targetCount = maxRows, rows left untouched
    //  - otherwise: targetCount = count, only the rows within the percentile are kept
    PercentileFilterResult percentileFilter(std::vector<UserDistance> rows, std::size_t minRows, std::size_t maxRows, double percentile = 10);

    struct NeighborSelection
    {
        // Closest users first, each of them rated at least one recipe missing from the ledger
        std::vector<UserId> neighbors;

        // neighbors x recipes missing from the ledger and rated by at least one neighbor
        RatingMatrix candidateRatings;
    };

    NeighborSelection selectNeighbors(const InteractionTable& table, const PreferenceLedger& ledger, const NeighborSelectionParameters& parameters);
} // namespace fooder::recommendation
