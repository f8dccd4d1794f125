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

#include <span>
#include <utility>
#include <vector>

#include "recommendation/RatingMatrix.hpp"
#include "recommendation/Types.hpp"

namespace fooder::recommendation
{
    using Distance = unsigned long;

    struct UserDistance
    {
        UserId userId;
        Distance distance;

        bool operator==(const UserDistance&) const = default;
    };

    using ReferenceRating = std::pair<RecipeId, Rating>;

    // Sum of absolute differences, both vectors must have the same size
    Distance computeDistance(std::span<const RatingValue> ratingsA, std::span<const RatingValue> ratingsB);

    // Distance of each matrix row to the reference ratings, in row order
    // Only reference recipes that are columns of the matrix are compared
    std::vector<UserDistance> computeDistances(std::span<const ReferenceRating> referenceRatings, const RatingMatrix& matrix);
} // namespace fooder::recommendation
