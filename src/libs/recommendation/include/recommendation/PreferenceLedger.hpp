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

#include <optional>
#include <utility>
#include <vector>

#include "recommendation/Types.hpp"

namespace fooder::recommendation
{
    // Ratings of the active user, in history order (most recent last)
    // A recipe appears at most once
    class PreferenceLedger
    {
    public:
        using Entry = std::pair<RecipeId, Rating>;

        // Updating the rating of a known recipe keeps its position in history
        void add(RecipeId recipeId, Rating rating);

        // Throws PreferenceNotFoundException if recipeId is not in the ledger
        void remove(RecipeId recipeId);

        bool contains(RecipeId recipeId) const;
        std::optional<Rating> find(RecipeId recipeId) const;

        bool empty() const { return _entries.empty(); }
        std::size_t size() const { return _entries.size(); }

        const std::vector<Entry>& getEntries() const { return _entries; }

        // In history order, optionally restricted to a rating
        std::vector<RecipeId> getRecipeIds(std::optional<Rating> rating = std::nullopt) const;

        bool operator==(const PreferenceLedger&) const = default;

    private:
        std::vector<Entry>::iterator findEntry(RecipeId recipeId);
        std::vector<Entry>::const_iterator findEntry(RecipeId recipeId) const;

        std::vector<Entry> _entries;
    };
} // namespace fooder::recommendation
