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

#include "recommendation/Similarity.hpp"

#include <cassert>
#include <cstdlib>

namespace fooder::recommendation
{
    Distance computeDistance(std::span<const RatingValue> ratingsA, std::span<const RatingValue> ratingsB)
    {
        assert(ratingsA.size() == ratingsB.size());

        Distance distance{};
        for (std::size_t i{}; i < ratingsA.size(); ++i)
            distance += static_cast<Distance>(std::abs(ratingsA[i] - ratingsB[i]));

        return distance;
    }

    std::vector<UserDistance> computeDistances(std::span<const ReferenceRating> referenceRatings, const RatingMatrix& matrix)
    {
        std::vector<std::size_t> columns;
        std::vector<RatingValue> referenceValues;
        for (const auto& [recipeId, rating] : referenceRatings)
        {
            if (const std::optional<std::size_t> column{ matrix.findColumn(recipeId) })
            {
                columns.push_back(*column);
                referenceValues.push_back(toRatingValue(rating));
            }
        }

        std::vector<UserDistance> res;
        res.reserve(matrix.getRowCount());

        std::vector<RatingValue> rowValues(columns.size());
        for (std::size_t row{}; row < matrix.getRowCount(); ++row)
        {
            for (std::size_t i{}; i < columns.size(); ++i)
                rowValues[i] = matrix.get(row, columns[i]);

            res.push_back(UserDistance{ matrix.getUserIds()[row], computeDistance(rowValues, referenceValues) });
        }

        return res;
    }
} // namespace fooder::recommendation
