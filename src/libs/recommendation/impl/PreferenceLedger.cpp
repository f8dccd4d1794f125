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

#include "recommendation/PreferenceLedger.hpp"

#include <algorithm>

#include "core/ILogger.hpp"
#include "recommendation/Exception.hpp"

namespace fooder::recommendation
{
    void PreferenceLedger::add(RecipeId recipeId, Rating rating)
    {
        FOODER_LOG(RECOMMENDATION, DEBUG, "Adding preference for recipe " << recipeId << " with rating " << toString(rating));

        if (auto it{ findEntry(recipeId) }; it != std::end(_entries))
            it->second = rating;
        else
            _entries.emplace_back(recipeId, rating);
    }

    void PreferenceLedger::remove(RecipeId recipeId)
    {
        FOODER_LOG(RECOMMENDATION, DEBUG, "Deleting preference for recipe " << recipeId);

        const auto it{ findEntry(recipeId) };
        if (it == std::end(_entries))
        {
            FOODER_LOG(RECOMMENDATION, INFO, "Recipe ID " << recipeId << " not in user preferences");
            throw PreferenceNotFoundException{ recipeId };
        }

        _entries.erase(it);
    }

    bool PreferenceLedger::contains(RecipeId recipeId) const
    {
        return findEntry(recipeId) != std::cend(_entries);
    }

    std::optional<Rating> PreferenceLedger::find(RecipeId recipeId) const
    {
        const auto it{ findEntry(recipeId) };
        if (it == std::cend(_entries))
            return std::nullopt;

        return it->second;
    }

    std::vector<RecipeId> PreferenceLedger::getRecipeIds(std::optional<Rating> rating) const
    {
        std::vector<RecipeId> res;
        res.reserve(_entries.size());

        for (const auto& [recipeId, entryRating] : _entries)
        {
            if (!rating || *rating == entryRating)
                res.push_back(recipeId);
        }

        return res;
    }

    std::vector<PreferenceLedger::Entry>::iterator PreferenceLedger::findEntry(RecipeId recipeId)
    {
        return std::find_if(std::begin(_entries), std::end(_entries), [=](const Entry& entry) { return entry.first == recipeId; });
    }

    std::vector<PreferenceLedger::Entry>::const_iterator PreferenceLedger::findEntry(RecipeId recipeId) const
    {
        return std::find_if(std::cbegin(_entries), std::cend(_entries), [=](const Entry& entry) { return entry.first == recipeId; });
    }
} // namespace fooder::recommendation
