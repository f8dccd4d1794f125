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

#include "RecipeSession.hpp"

#include <cassert>
#include <utility>

#include "core/ILogger.hpp"
#include "recommendation/Exception.hpp"
#include "recommendation/IInteractionTableProvider.hpp"

namespace fooder::recommendation
{
    namespace
    {
        core::random::RandGenerator createRandGenerator(const RecipeSessionParameters& parameters)
        {
            if (parameters.randomSeed)
                return core::random::createSeededGenerator(*parameters.randomSeed);

            return core::random::createSeededGenerator(core::random::getRandGenerator()());
        }
    } // namespace

    std::unique_ptr<IRecipeSession> createRecipeSession(IInteractionTableProvider& tableProvider, DishType dishType, const RecipeSessionParameters& parameters)
    {
        return std::make_unique<RecipeSession>(tableProvider.getTable(dishType), dishType, parameters);
    }

    std::unique_ptr<IRecipeSession> createRecipeSession(IInteractionTableProvider& tableProvider, std::string_view dishType, const RecipeSessionParameters& parameters)
    {
        return createRecipeSession(tableProvider, parseDishType(dishType), parameters);
    }

    RecipeSession::RecipeSession(std::shared_ptr<const InteractionTable> table, DishType dishType, const RecipeSessionParameters& parameters)
        : _table{ std::move(table) }
        , _dishType{ dishType }
        , _parameters{ parameters }
        , _randGenerator{ createRandGenerator(parameters) }
    {
        assert(_table);
        FOODER_LOG(RECOMMENDATION, DEBUG, "Created session for " << toString(_dishType) << " dishes (" << _table->getRecipeIds().size() << " recipes)");
    }

    Suggestion RecipeSession::suggest()
    {
        if (_preferences.empty())
        {
            FOODER_LOG(RECOMMENDATION, INFO, "User's history is empty, suggesting a random recipe");

            if (_table->empty())
                throw NoMoreRecipesException{};

            // neighbors are only updated by a neighbor selection
            return Suggestion{ pickRandomRecipe(_table->getRecords()), SuggestionSource::ColdStart, _neighbors };
        }

        NeighborSelection selection{ selectNeighbors(*_table, _preferences, _parameters.neighborSelection) };
        _neighbors = std::move(selection.neighbors);

        if (!_neighbors.empty())
        {
            const RatingMatrix& candidateRatings{ selection.candidateRatings };
            assert(candidateRatings.getColumnCount() > 0);

            // columns are sorted by recipe id: the lowest recipe id wins ties
            std::size_t bestColumn{};
            long long bestSum{ candidateRatings.getColumnSum(0) };
            for (std::size_t column{ 1 }; column < candidateRatings.getColumnCount(); ++column)
            {
                const long long sum{ candidateRatings.getColumnSum(column) };
                if (sum > bestSum)
                {
                    bestSum = sum;
                    bestColumn = column;
                }
            }

            const RecipeId recipeId{ candidateRatings.getRecipeIds()[bestColumn] };
            FOODER_LOG(RECOMMENDATION, DEBUG, "Suggesting recipe " << recipeId << " (score " << bestSum << ", " << _neighbors.size() << " neighbors)");

            return Suggestion{ recipeId, SuggestionSource::Neighbors, _neighbors };
        }

        const std::vector<InteractionRecord> remainingRecords{ _table->select([this](const InteractionRecord& record) { return !_preferences.contains(record.recipeId); }) };
        if (remainingRecords.empty())
        {
            FOODER_LOG(RECOMMENDATION, INFO, "No more recipes to suggest from the dataset");
            throw NoMoreRecipesException{};
        }

        FOODER_LOG(RECOMMENDATION, INFO, "No more recipes to suggest from the user preferences, suggesting a random recipe");
        return Suggestion{ pickRandomRecipe(remainingRecords), SuggestionSource::Fallback, {} };
    }

    void RecipeSession::like(RecipeId recipeId)
    {
        addPreference(recipeId, Rating::Like);
    }

    void RecipeSession::dislike(RecipeId recipeId)
    {
        addPreference(recipeId, Rating::Dislike);
    }

    void RecipeSession::addPreference(RecipeId recipeId, Rating rating)
    {
        _preferences.add(recipeId, rating);
    }

    void RecipeSession::undo(RecipeId recipeId)
    {
        _preferences.remove(recipeId);
    }

    AdjacencyGraph RecipeSession::getAdjacencyGraph(Rating polarity) const
    {
        return buildAdjacencyGraph(*_table, _preferences, _neighbors, polarity, _parameters.graphPruning);
    }

    NeighborReport RecipeSession::getNeighborReport(Rating polarity) const
    {
        return buildNeighborReport(*_table, _preferences, _neighbors, polarity);
    }

    RecipeId RecipeSession::pickRandomRecipe(const std::vector<InteractionRecord>& records)
    {
        // each record is equally likely: often rated recipes come up more often
        const auto it{ core::random::pickRandom(_randGenerator, records) };
        assert(it != std::cend(records));

        return it->recipeId;
    }
} // namespace fooder::recommendation
