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

#include <initializer_list>
#include <memory>
#include <vector>

#include <gtest/gtest.h>

#include "recommendation/IInteractionTableProvider.hpp"
#include "recommendation/InteractionTable.hpp"
#include "recommendation/Types.hpp"

namespace fooder::recommendation::tests
{
    struct RawRecord
    {
        long long userId;
        long long recipeId;
        int rating;
    };

    inline std::vector<InteractionRecord> makeRecords(std::initializer_list<RawRecord> rawRecords)
    {
        std::vector<InteractionRecord> records;
        for (const RawRecord& rawRecord : rawRecords)
            records.push_back(InteractionRecord{ UserId{ rawRecord.userId }, RecipeId{ rawRecord.recipeId }, rawRecord.rating > 0 ? Rating::Like : Rating::Dislike });

        return records;
    }

    inline InteractionTable makeTable(std::initializer_list<RawRecord> rawRecords)
    {
        return InteractionTable{ makeRecords(rawRecords) };
    }

    // Small dataset where user 4 is the only one sharing tastes with someone who likes recipe 102
    inline InteractionTable makeMainDishTable()
    {
        return makeTable({
            { 1, 101, 1 },
            { 2, 102, 1 },
            { 3, 103, -1 },
            { 4, 102, 1 },
            { 4, 103, 1 },
        });
    }

    inline InteractionTable makeDessertTable()
    {
        return makeTable({
            { 1, 201, 1 },
            { 2, 202, -1 },
        });
    }

    class RecommendationTest : public ::testing::Test
    {
    protected:
        void SetUp() override
        {
            _tableProvider = createInteractionTableProvider(makeMainDishTable(), makeDessertTable());
        }

        IInteractionTableProvider& getTableProvider() { return *_tableProvider; }

    private:
        std::unique_ptr<IInteractionTableProvider> _tableProvider;
    };
} // namespace fooder::recommendation::tests
