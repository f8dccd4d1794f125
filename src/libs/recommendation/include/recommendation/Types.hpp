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

#include <string_view>

#include "core/TaggedType.hpp"

namespace fooder::recommendation
{
    using UserId = core::TaggedType<struct UserIdTag, long long>;
    using RecipeId = core::TaggedType<struct RecipeIdTag, long long>;

    enum class Rating
    {
        Dislike = -1,
        Like = 1,
    };

    // Value stored in rating matrices: -1, 1, or 0 for "no opinion"
    using RatingValue = int;
    static constexpr RatingValue noRating{ 0 };

    constexpr RatingValue toRatingValue(Rating rating)
    {
        return static_cast<RatingValue>(rating);
    }

    std::string_view toString(Rating rating);

    // Catalog partition, tables and preferences never mix across dish types
    enum class DishType
    {
        Main,
        Dessert,
    };

    // Accepts "main" and "dessert", throws InvalidDishTypeException otherwise
    DishType parseDishType(std::string_view dishType);
    std::string_view toString(DishType dishType);

    struct InteractionRecord
    {
        UserId userId;
        RecipeId recipeId;
        Rating rating;

        bool operator==(const InteractionRecord&) const = default;
    };
} // namespace fooder::recommendation
