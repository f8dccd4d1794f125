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
#include <filesystem>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

#include "catalog/Recipe.hpp"

namespace fooder::catalog
{
    // Read-only recipe details, used to display suggestions
    class IRecipeCatalog
    {
    public:
        virtual ~IRecipeCatalog() = default;

        virtual std::size_t getRecipeCount() const = 0;

        // Throws RecipeNotFoundException
        virtual const Recipe& getRecipe(RecipeId recipeId) const = 0;
        virtual std::optional<Recipe> findRecipe(RecipeId recipeId) const = 0;
    };

    // Throws RecipeCatalogLoadException on duplicate ids
    std::unique_ptr<IRecipeCatalog> createRecipeCatalog(std::vector<Recipe> recipes);

    // Throws RecipeCatalogLoadException if the file cannot be read or parsed
    std::unique_ptr<IRecipeCatalog> createRecipeCatalog(const std::filesystem::path& recipesFile);

    // Expects a header line naming the "id", "name", "steps", "description" and "ingredients" columns
    // Quoted fields may span several lines
    std::vector<Recipe> parseRecipes(std::istream& is, std::string_view sourceName);
} // namespace fooder::catalog
