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

#include <unordered_map>

#include "catalog/IRecipeCatalog.hpp"

namespace fooder::catalog
{
    class RecipeCatalog final : public IRecipeCatalog
    {
    public:
        explicit RecipeCatalog(std::vector<Recipe> recipes);
        ~RecipeCatalog() override = default;
        RecipeCatalog(const RecipeCatalog&) = delete;
        RecipeCatalog& operator=(const RecipeCatalog&) = delete;

    private:
        std::size_t getRecipeCount() const override { return _recipes.size(); }
        const Recipe& getRecipe(RecipeId recipeId) const override;
        std::optional<Recipe> findRecipe(RecipeId recipeId) const override;

        std::unordered_map<RecipeId, Recipe> _recipes;
    };
} // namespace fooder::catalog
