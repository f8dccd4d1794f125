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

#include "recommendation/NeighborSelector.hpp"

#include <algorithm>
#include <cassert>
#include <cmath>
#include <unordered_set>

#include "core/ILogger.hpp"
#include "recommendation/InteractionTable.hpp"
#include "recommendation/PreferenceLedger.hpp"

namespace fooder::recommendation
{
    double computePercentile(std::span<const Distance> values, double percentile)
    {
        if (values.empty())
            return 0;

        std::vector<Distance> sortedValues(std::cbegin(values), std::cend(values));
        std::sort(std::begin(sortedValues), std::end(sortedValues));

        const double rank{ std::clamp(percentile, 0., 100.) / 100. * static_cast<double>(sortedValues.size() - 1) };
        const std::size_t lowerIndex{ static_cast<std::size_t>(std::floor(rank)) };
        const std::size_t upperIndex{ static_cast<std::size_t>(std::ceil(rank)) };

        const double lowerValue{ static_cast<double>(sortedValues[lowerIndex]) };
        const double upperValue{ static_cast<double>(sortedValues[upperIndex]) };

        return lowerValue + (upperValue - lowerValue) * (rank - static_cast<double>(lowerIndex));
    }

    PercentileFilterResult percentileFilter(std::vector<UserDistance> rows, std::size_t minRows, std::size_t maxRows, double percentile)
    {
        PercentileFilterResult res;

        if (rows.empty())
        {
            res.targetCount = minRows;
            return res;
        }

        std::vector<Distance> distances;
        distances.reserve(rows.size());
        std::transform(std::cbegin(rows), std::cend(rows), std::back_inserter(distances), [](const UserDistance& row) { return row.distance; });

        const double threshold{ computePercentile(distances, percentile) };
        auto isWithinThreshold{ [=](const UserDistance& row) { return static_cast<double>(row.distance) <= threshold; } };

        const std::size_t count{ static_cast<std::size_t>(std::count_if(std::cbegin(rows), std::cend(rows), isWithinThreshold)) };
        FOODER_LOG_IF(RECOMMENDATION, DEBUG, count < minRows || count > maxRows, count << " users within distance " << threshold << ", neighbor count clamped to [" << minRows << ", " << maxRows << "]");
        if (count < minRows)
        {
            res.targetCount = minRows;
            res.rows = std::move(rows);
        }
        else if (count > maxRows)
        {
            res.targetCount = maxRows;
            res.rows = std::move(rows);
        }
        else
        {
            res.targetCount = count;
            std::copy_if(std::cbegin(rows), std::cend(rows), std::back_inserter(res.rows), isWithinThreshold);
        }

        return res;
    }

    NeighborSelection selectNeighbors(const InteractionTable& table, const PreferenceLedger& ledger, const NeighborSelectionParameters& parameters)
    {
        const std::vector<RecipeId> ratedRecipeIds{ ledger.getRecipeIds() };
        const std::unordered_set<RecipeId> ratedRecipes(std::cbegin(ratedRecipeIds), std::cend(ratedRecipeIds));

        // Distance of every user who rated at least one of the ledger recipes
        const std::vector<InteractionRecord> reducedRecords{ table.select([&](const InteractionRecord& record) { return ratedRecipes.contains(record.recipeId); }) };
        const RatingMatrix reducedMatrix{ RatingMatrix::build(reducedRecords) };

        PercentileFilterResult filterResult{ percentileFilter(computeDistances(ledger.getEntries(), reducedMatrix), parameters.minNeighborCount, parameters.maxNeighborCount, parameters.distancePercentile) };
        FOODER_LOG(RECOMMENDATION, DEBUG, "Candidate users = " << reducedMatrix.getRowCount() << ", kept = " << filterResult.rows.size() << ", target neighbor count = " << filterResult.targetCount);

        // rows come in ascending user id order: ties are broken by user id
        std::stable_sort(std::begin(filterResult.rows), std::end(filterResult.rows), [](const UserDistance& lhs, const UserDistance& rhs) { return lhs.distance < rhs.distance; });
        if (filterResult.rows.size() > filterResult.targetCount)
            filterResult.rows.resize(filterResult.targetCount);

        std::vector<UserId> pool;
        pool.reserve(filterResult.rows.size());
        std::transform(std::cbegin(filterResult.rows), std::cend(filterResult.rows), std::back_inserter(pool), [](const UserDistance& row) { return row.userId; });
        const std::unordered_set<UserId> poolUsers(std::cbegin(pool), std::cend(pool));

        // What the pool users rated apart from the ledger recipes
        const std::vector<InteractionRecord> remainingRecords{ table.select([&](const InteractionRecord& record) { return poolUsers.contains(record.userId) && !ratedRecipes.contains(record.recipeId); }) };
        const RatingMatrix remainingMatrix{ RatingMatrix::build(remainingRecords) };

        NeighborSelection selection;
        std::copy_if(std::cbegin(pool), std::cend(pool), std::back_inserter(selection.neighbors), [&](UserId userId) { return remainingMatrix.findRow(userId).has_value(); });
        selection.candidateRatings = remainingMatrix.reindex(selection.neighbors, remainingMatrix.getRecipeIds());

        FOODER_LOG(RECOMMENDATION, DEBUG, "Neighbor pool = " << pool.size() << ", neighbors with recipes to suggest = " << selection.neighbors.size() << ", candidate recipes = " << selection.candidateRatings.getColumnCount());

        return selection;
    }
} // namespace fooder::recommendation
