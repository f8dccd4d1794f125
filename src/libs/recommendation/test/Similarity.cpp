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

#include <array>

#include <gtest/gtest.h>

#include "recommendation/RatingMatrix.hpp"
#include "recommendation/Similarity.hpp"

#include "Common.hpp"

namespace fooder::recommendation::tests
{
    TEST(Similarity, computeDistance)
    {
        struct TestCase
        {
            std::vector<RatingValue> ratingsA;
            std::vector<RatingValue> ratingsB;
            Distance expectedDistance;
        };

        const TestCase tests[]{
            { {}, {}, 0 },
            { { 1 }, { 1 }, 0 },
            { { 1 }, { -1 }, 2 },
            { { 1 }, { 0 }, 1 },
            { { -1, 0, 1 }, { -1, 0, 1 }, 0 },
            { { -1, 0, 1 }, { 1, 0, -1 }, 4 },
            { { 0, 0, 0 }, { 1, -1, 1 }, 3 },
        };

        for (const TestCase& test : tests)
        {
            EXPECT_EQ(computeDistance(test.ratingsA, test.ratingsB), test.expectedDistance);
            EXPECT_EQ(computeDistance(test.ratingsB, test.ratingsA), test.expectedDistance) << "distance must be symmetric";
            EXPECT_EQ(computeDistance(test.ratingsA, test.ratingsA), 0);
        }
    }

    TEST(Similarity, computeDistances)
    {
        const InteractionTable table{ makeMainDishTable() };
        const RatingMatrix matrix{ RatingMatrix::build(table.getRecords()) };

        const std::array<ReferenceRating, 2> referenceRatings{ ReferenceRating{ RecipeId{ 101 }, Rating::Like }, ReferenceRating{ RecipeId{ 102 }, Rating::Dislike } };
        const std::vector<UserDistance> distances{ computeDistances(referenceRatings, matrix) };

        ASSERT_EQ(distances.size(), 4);
        EXPECT_EQ(distances[0], (UserDistance{ UserId{ 1 }, 1 }));
        EXPECT_EQ(distances[1], (UserDistance{ UserId{ 2 }, 3 }));
        EXPECT_EQ(distances[2], (UserDistance{ UserId{ 3 }, 2 }));
        EXPECT_EQ(distances[3], (UserDistance{ UserId{ 4 }, 3 }));
    }

    TEST(Similarity, computeDistances_unknownRecipe)
    {
        const InteractionTable table{ makeMainDishTable() };
        const RatingMatrix matrix{ RatingMatrix::build(table.getRecords()) };

        // recipe 999 is not a column: it does not count
        const std::array<ReferenceRating, 2> referenceRatings{ ReferenceRating{ RecipeId{ 999 }, Rating::Like }, ReferenceRating{ RecipeId{ 103 }, Rating::Like } };
        const std::vector<UserDistance> distances{ computeDistances(referenceRatings, matrix) };

        ASSERT_EQ(distances.size(), 4);
        EXPECT_EQ(distances[0].distance, 1);
        EXPECT_EQ(distances[1].distance, 1);
        EXPECT_EQ(distances[2].distance, 2);
        EXPECT_EQ(distances[3].distance, 0);
    }
} // namespace fooder::recommendation::tests
