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

#include "recommendation/Types.hpp"

#include "core/ILogger.hpp"
#include "recommendation/Exception.hpp"

namespace fooder::recommendation
{
    std::string_view toString(Rating rating)
    {
        switch (rating)
        {
        case Rating::Like:
            return "like";
        case Rating::Dislike:
            return "dislike";
        }
        return "";
    }

    DishType parseDishType(std::string_view dishType)
    {
        if (dishType == "main")
            return DishType::Main;
        if (dishType == "dessert")
            return DishType::Dessert;

        FOODER_LOG(RECOMMENDATION, INFO, "Invalid type of dish: '" << dishType << "'");
        throw InvalidDishTypeException{ dishType };
    }

    std::string_view toString(DishType dishType)
    {
        switch (dishType)
        {
        case DishType::Main:
            return "main";
        case DishType::Dessert:
            return "dessert";
        }
        return "";
    }
} // namespace fooder::recommendation
