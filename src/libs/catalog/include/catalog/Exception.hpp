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

#include "catalog/Recipe.hpp"
#include "core/Exception.hpp"

namespace fooder::catalog
{
    class Exception : public core::FooderException
    {
    public:
        using FooderException::FooderException;
    };

    class RecipeNotFoundException : public Exception
    {
    public:
        RecipeNotFoundException(RecipeId recipeId)
            : Exception{ "Recipe " + std::to_string(recipeId.value()) + " not found in catalog" }
            , _recipeId{ recipeId }
        {
        }

        RecipeId getRecipeId() const { return _recipeId; }

    private:
        RecipeId _recipeId;
    };

    class RecipeCatalogLoadException : public Exception
    {
    public:
        using Exception::Exception;
    };
} // namespace fooder::catalog
