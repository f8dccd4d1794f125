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

#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

#include "recommendation/AdjacencyGraph.hpp"
#include "recommendation/NeighborReport.hpp"
#include "recommendation/NeighborSelector.hpp"
#include "recommendation/PreferenceLedger.hpp"
#include "recommendation/Types.hpp"

namespace fooder::recommendation
{
    class IInteractionTableProvider;

    enum class SuggestionSource
    {
        ColdStart, // nothing rated yet, random recipe
        Neighbors, // best rated recipe among the closest users
        Fallback,  // no usable neighbor, random recipe not rated yet
    };

    struct Suggestion
    {
        RecipeId recipeId;
        SuggestionSource source;
        std::vector<UserId> neighbors; // neighbor set of the session after this suggestion
    };

    struct RecipeSessionParameters
    {
        NeighborSelectionParameters neighborSelection;
        GraphPruning graphPruning{ GraphPruning::ConnectedComponent };
        std::optional<std::uint_fast32_t> randomSeed; // seeded from the system if not set
    };

    // Recommendation state of the active user for one dish type
    class IRecipeSession
    {
    public:
        virtual ~IRecipeSession() = default;

        virtual DishType getDishType() const = 0;

        // Never returns an already rated recipe
        // Throws NoMoreRecipesException once every recipe of the dish type has been rated
        virtual Suggestion suggest() = 0;

        virtual void like(RecipeId recipeId) = 0;
        virtual void dislike(RecipeId recipeId) = 0;
        virtual void addPreference(RecipeId recipeId, Rating rating) = 0;

        // Throws PreferenceNotFoundException if the recipe has not been rated
        virtual void undo(RecipeId recipeId) = 0;

        virtual const PreferenceLedger& getPreferences() const = 0;

        // Neighbor set of the last neighbor selection, kept by cold start suggestions
        virtual std::span<const UserId> getNeighbors() const = 0;

        // Both throw NoNeighborException if the neighbor set is empty
        virtual AdjacencyGraph getAdjacencyGraph(Rating polarity) const = 0;
        virtual NeighborReport getNeighborReport(Rating polarity) const = 0;
    };

    std::unique_ptr<IRecipeSession> createRecipeSession(IInteractionTableProvider& tableProvider, DishType dishType, const RecipeSessionParameters& parameters = {});

    // Throws InvalidDishTypeException if dishType is neither "main" nor "dessert"
    std::unique_ptr<IRecipeSession> createRecipeSession(IInteractionTableProvider& tableProvider, std::string_view dishType, const RecipeSessionParameters& parameters = {});
} // namespace fooder::recommendation
