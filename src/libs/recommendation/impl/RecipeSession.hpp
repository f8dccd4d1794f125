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

#include <memory>
#include <vector>

#include "core/Random.hpp"
#include "recommendation/IRecipeSession.hpp"
#include "recommendation/InteractionTable.hpp"

namespace fooder::recommendation
{
    class RecipeSession final : public IRecipeSession
    {
    public:
        RecipeSession(std::shared_ptr<const InteractionTable> table, DishType dishType, const RecipeSessionParameters& parameters);
        ~RecipeSession() override = default;
        RecipeSession(const RecipeSession&) = delete;
        RecipeSession& operator=(const RecipeSession&) = delete;

    private:
        DishType getDishType() const override { return _dishType; }

        Suggestion suggest() override;

        void like(RecipeId recipeId) override;
        void dislike(RecipeId recipeId) override;
        void addPreference(RecipeId recipeId, Rating rating) override;
        void undo(RecipeId recipeId) override;

        const PreferenceLedger& getPreferences() const override { return _preferences; }
        std::span<const UserId> getNeighbors() const override { return _neighbors; }

        AdjacencyGraph getAdjacencyGraph(Rating polarity) const override;
        NeighborReport getNeighborReport(Rating polarity) const override;

        RecipeId pickRandomRecipe(const std::vector<InteractionRecord>& records);

        const std::shared_ptr<const InteractionTable> _table;
        const DishType _dishType;
        const RecipeSessionParameters _parameters;
        core::random::RandGenerator _randGenerator;

        PreferenceLedger _preferences;
        std::vector<UserId> _neighbors;
    };
} // namespace fooder::recommendation
