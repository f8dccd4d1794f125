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

#include <string>

#include "core/Exception.hpp"
#include "recommendation/Types.hpp"

namespace fooder::recommendation
{
    class Exception : public core::FooderException
    {
    public:
        using FooderException::FooderException;
    };

    class InvalidDishTypeException : public Exception
    {
    public:
        InvalidDishTypeException(std::string_view dishType)
            : Exception{ "The type of dish must be \"main\" or \"dessert\" only, and not \"" + std::string{ dishType } + "\"" }
        {
        }
    };

    class PreferenceNotFoundException : public Exception
    {
    public:
        PreferenceNotFoundException(RecipeId recipeId)
            : Exception{ "The recipe ID " + std::to_string(recipeId.value()) + " is not in the user preferences" }
            , _recipeId{ recipeId }
        {
        }

        RecipeId getRecipeId() const { return _recipeId; }

    private:
        RecipeId _recipeId;
    };

    // All the recipes of the dish type have already been rated
    class NoMoreRecipesException : public Exception
    {
    public:
        NoMoreRecipesException()
            : Exception{ "No more recipes to suggest" } {}
    };

    // Graph or neighbor report requested before any neighbor-driven suggestion
    class NoNeighborException : public Exception
    {
    public:
        NoNeighborException()
            : Exception{ "No neighbor found" } {}
    };

    class DataShapeException : public Exception
    {
    public:
        using Exception::Exception;
    };

    class InteractionTableLoadException : public DataShapeException
    {
    public:
        using DataShapeException::DataShapeException;
    };
} // namespace fooder::recommendation
