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

#include <gtest/gtest.h>

#include "recommendation/Exception.hpp"
#include "recommendation/PreferenceLedger.hpp"

namespace fooder::recommendation::tests
{
    TEST(PreferenceLedger, empty)
    {
        const PreferenceLedger ledger;
        EXPECT_TRUE(ledger.empty());
        EXPECT_EQ(ledger.size(), 0);
        EXPECT_FALSE(ledger.contains(RecipeId{ 1 }));
        EXPECT_FALSE(ledger.find(RecipeId{ 1 }).has_value());
        EXPECT_TRUE(ledger.getRecipeIds().empty());
    }

    TEST(PreferenceLedger, add)
    {
        PreferenceLedger ledger;
        ledger.add(RecipeId{ 3 }, Rating::Like);
        ledger.add(RecipeId{ 1 }, Rating::Dislike);
        ledger.add(RecipeId{ 2 }, Rating::Like);

        ASSERT_EQ(ledger.size(), 3);
        EXPECT_EQ(ledger.getRecipeIds(), (std::vector<RecipeId>{ RecipeId{ 3 }, RecipeId{ 1 }, RecipeId{ 2 } }));
        EXPECT_EQ(ledger.getRecipeIds(Rating::Like), (std::vector<RecipeId>{ RecipeId{ 3 }, RecipeId{ 2 } }));
        EXPECT_EQ(ledger.getRecipeIds(Rating::Dislike), (std::vector<RecipeId>{ RecipeId{ 1 } }));
        EXPECT_EQ(ledger.find(RecipeId{ 1 }), Rating::Dislike);
    }

    TEST(PreferenceLedger, update)
    {
        PreferenceLedger ledger;
        ledger.add(RecipeId{ 1 }, Rating::Like);
        ledger.add(RecipeId{ 2 }, Rating::Like);
        ledger.add(RecipeId{ 1 }, Rating::Dislike);

        ASSERT_EQ(ledger.size(), 2);
        EXPECT_EQ(ledger.getEntries()[0], (PreferenceLedger::Entry{ RecipeId{ 1 }, Rating::Dislike }));
        EXPECT_EQ(ledger.getEntries()[1], (PreferenceLedger::Entry{ RecipeId{ 2 }, Rating::Like }));
    }

    TEST(PreferenceLedger, remove)
    {
        PreferenceLedger ledger;
        ledger.add(RecipeId{ 1 }, Rating::Like);
        ledger.add(RecipeId{ 2 }, Rating::Dislike);

        ledger.remove(RecipeId{ 1 });
        EXPECT_FALSE(ledger.contains(RecipeId{ 1 }));
        EXPECT_TRUE(ledger.contains(RecipeId{ 2 }));
        EXPECT_EQ(ledger.size(), 1);

        EXPECT_THROW(ledger.remove(RecipeId{ 1 }), PreferenceNotFoundException);
        EXPECT_EQ(ledger.size(), 1);
    }

    TEST(PreferenceLedger, addThenRemove)
    {
        PreferenceLedger ledger;
        ledger.add(RecipeId{ 3 }, Rating::Like);
        ledger.add(RecipeId{ 1 }, Rating::Dislike);
        ledger.add(RecipeId{ 7 }, Rating::Like);
        const PreferenceLedger ledgerBefore{ ledger };

        for (const Rating rating : { Rating::Like, Rating::Dislike })
        {
            ledger.add(RecipeId{ 5 }, rating);
            EXPECT_NE(ledger, ledgerBefore);

            ledger.remove(RecipeId{ 5 });
            EXPECT_EQ(ledger, ledgerBefore);
            EXPECT_EQ(ledger.getRecipeIds(), (std::vector<RecipeId>{ RecipeId{ 3 }, RecipeId{ 1 }, RecipeId{ 7 } }));
        }
    }

    TEST(PreferenceLedger, removeUnknown)
    {
        PreferenceLedger ledger;
        ledger.add(RecipeId{ 1 }, Rating::Like);
        const PreferenceLedger ledgerBefore{ ledger };

        try
        {
            ledger.remove(RecipeId{ 42 });
            FAIL() << "expected PreferenceNotFoundException";
        }
        catch (const PreferenceNotFoundException& e)
        {
            EXPECT_EQ(e.getRecipeId(), RecipeId{ 42 });
        }

        EXPECT_EQ(ledger, ledgerBefore);
    }
} // namespace fooder::recommendation::tests
