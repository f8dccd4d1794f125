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

#include "recommendation/NeighborReport.hpp"

#include <algorithm>
#include <unordered_set>

#include "core/ILogger.hpp"
#include "recommendation/Exception.hpp"
#include "recommendation/InteractionTable.hpp"
#include "recommendation/PreferenceLedger.hpp"
#include "recommendation/RatingMatrix.hpp"

namespace fooder::recommendation
{
    NeighborReport buildNeighborReport(const InteractionTable& table, const PreferenceLedger& ledger, std::span<const UserId> neighbors, Rating polarity)
    {
        if (neighbors.empty())
        {
            FOODER_LOG(RECOMMENDATION, WARNING, "No neighbor found");
            throw NoNeighborException{};
        }

        const std::vector<RecipeId> likedRecipeIds{ ledger.getRecipeIds(Rating::Like) };
        const std::unordered_set<RecipeId> likedRecipes(std::cbegin(likedRecipeIds), std::cend(likedRecipeIds));
        const std::vector<RecipeId> dislikedRecipeIds{ ledger.getRecipeIds(Rating::Dislike) };
        const std::unordered_set<RecipeId> dislikedRecipes(std::cbegin(dislikedRecipeIds), std::cend(dislikedRecipeIds));

        const std::unordered_set<UserId> neighborUsers(std::cbegin(neighbors), std::cend(neighbors));
        const std::vector<InteractionRecord> neighborRecords{ table.select([&](const InteractionRecord& record) { return neighborUsers.contains(record.userId); }) };
        const RatingMatrix neighborMatrix{ RatingMatrix::build(neighborRecords) };

        // missing ledger recipes act as columns full of noRating and do not count
        NeighborReport report;
        report.reserve(neighbors.size());
        for (UserId neighbor : neighbors)
        {
            NeighborReportEntry entry{ neighbor };

            if (const std::optional<std::size_t> row{ neighborMatrix.findRow(neighbor) })
            {
                for (std::size_t column{}; column < neighborMatrix.getColumnCount(); ++column)
                {
                    const RecipeId recipeId{ neighborMatrix.getRecipeIds()[column] };
                    const RatingValue value{ neighborMatrix.get(*row, column) };

                    if (likedRecipes.contains(recipeId))
                    {
                        if (value == toRatingValue(Rating::Like))
                            entry.commonLikes++;
                    }
                    else if (value == toRatingValue(Rating::Like))
                        entry.recipesToRecommend++;

                    if (dislikedRecipes.contains(recipeId) && value == toRatingValue(Rating::Dislike))
                        entry.commonDislikes++;
                }
            }

            report.push_back(entry);
        }

        std::sort(std::begin(report), std::end(report), [](const NeighborReportEntry& lhs, const NeighborReportEntry& rhs) { return lhs.userId < rhs.userId; });
        std::stable_sort(std::begin(report), std::end(report), [polarity](const NeighborReportEntry& lhs, const NeighborReportEntry& rhs) {
            if (polarity == Rating::Like)
                return lhs.commonLikes > rhs.commonLikes;

            return lhs.commonDislikes > rhs.commonDislikes;
        });

        return report;
    }
} // namespace fooder::recommendation
