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

#include <benchmark/benchmark.h>

#include "core/Random.hpp"
#include "recommendation/IInteractionTableProvider.hpp"
#include "recommendation/IRecipeSession.hpp"
#include "recommendation/InteractionTable.hpp"
#include "recommendation/NeighborSelector.hpp"
#include "recommendation/PreferenceLedger.hpp"
#include "recommendation/RatingMatrix.hpp"

namespace fooder::recommendation
{
    namespace
    {
        // Each user rates ratingsPerUser distinct recipes among recipeCount
        InteractionTable generateTable(std::size_t userCount, std::size_t recipeCount, std::size_t ratingsPerUser)
        {
            core::random::RandGenerator generator{ core::random::createSeededGenerator(42) };

            std::vector<InteractionRecord> records;
            records.reserve(userCount * ratingsPerUser);
            for (std::size_t user{}; user < userCount; ++user)
            {
                const std::size_t firstRecipe{ core::random::getRandom<std::size_t>(generator, 0, recipeCount - 1) };
                for (std::size_t i{}; i < ratingsPerUser; ++i)
                {
                    const Rating rating{ core::random::getRandom(generator, 0, 1) == 0 ? Rating::Dislike : Rating::Like };
                    records.push_back(InteractionRecord{ UserId{ static_cast<long long>(user) }, RecipeId{ static_cast<long long>((firstRecipe + i) % recipeCount) }, rating });
                }
            }

            return InteractionTable{ std::move(records) };
        }

        PreferenceLedger generateLedger(std::size_t recipeCount, std::size_t size)
        {
            PreferenceLedger ledger;
            for (std::size_t i{}; i < size; ++i)
                ledger.add(RecipeId{ static_cast<long long>((i * 7) % recipeCount) }, i % 3 == 0 ? Rating::Dislike : Rating::Like);

            return ledger;
        }
    } // namespace

    static void BM_RatingMatrix_build(benchmark::State& state)
    {
        const InteractionTable table{ generateTable(static_cast<std::size_t>(state.range(0)), 2'000, 20) };

        for (auto _ : state)
            benchmark::DoNotOptimize(RatingMatrix::build(table.getRecords()));
    }

    static void BM_selectNeighbors(benchmark::State& state)
    {
        const InteractionTable table{ generateTable(static_cast<std::size_t>(state.range(0)), 2'000, 20) };
        const PreferenceLedger ledger{ generateLedger(2'000, static_cast<std::size_t>(state.range(1))) };

        for (auto _ : state)
            benchmark::DoNotOptimize(selectNeighbors(table, ledger, NeighborSelectionParameters{}));
    }

    static void BM_RecipeSession_suggest(benchmark::State& state)
    {
        auto tableProvider{ createInteractionTableProvider(generateTable(static_cast<std::size_t>(state.range(0)), 2'000, 20), InteractionTable{}) };

        RecipeSessionParameters parameters;
        parameters.randomSeed = 0;
        auto session{ createRecipeSession(*tableProvider, DishType::Main, parameters) };
        for (std::size_t i{}; i < 10; ++i)
            session->addPreference(RecipeId{ static_cast<long long>(i * 13) }, i % 2 == 0 ? Rating::Like : Rating::Dislike);

        for (auto _ : state)
            benchmark::DoNotOptimize(session->suggest());
    }

    BENCHMARK(BM_RatingMatrix_build)->Arg(1'000)->Arg(10'000);
    BENCHMARK(BM_selectNeighbors)->Args({ 1'000, 5 })->Args({ 10'000, 5 })->Args({ 10'000, 50 });
    BENCHMARK(BM_RecipeSession_suggest)->Arg(1'000)->Arg(10'000);
} // namespace fooder::recommendation

BENCHMARK_MAIN();
