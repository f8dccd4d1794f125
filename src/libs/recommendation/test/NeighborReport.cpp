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
#include "recommendation/NeighborReport.hpp"
#include "recommendation/PreferenceLedger.hpp"

#include "Common.hpp"

namespace fooder::recommendation::tests
{
    TEST(NeighborReport, singleNeighbor)
    {
        const InteractionTable table{ makeMainDishTable() };
        PreferenceLedger ledger;
        ledger.add(RecipeId{ 102 }, Rating::Like);
        const std::vector<UserId> neighbors{ UserId{ 4 } };

        const NeighborReport report{ buildNeighborReport(table, ledger, neighbors, Rating::Like) };
        ASSERT_EQ(report.size(), 1);
        EXPECT_EQ(report[0].userId, UserId{ 4 });
        EXPECT_EQ(report[0].commonLikes, 1);
        EXPECT_EQ(report[0].commonDislikes, 0);
        EXPECT_EQ(report[0].recipesToRecommend, 1);
    }

    TEST(NeighborReport, ordering)
    {
        const InteractionTable table{ makeTable({
            { 1, 10, 1 },
            { 1, 30, -1 },
            { 1, 40, -1 },
            { 2, 10, 1 },
            { 2, 20, 1 },
            { 2, 50, 1 },
            { 3, 30, -1 },
            { 3, 40, -1 },
            { 3, 60, 1 },
            { 3, 70, 1 },
        }) };
        PreferenceLedger ledger;
        ledger.add(RecipeId{ 10 }, Rating::Like);
        ledger.add(RecipeId{ 20 }, Rating::Like);
        ledger.add(RecipeId{ 30 }, Rating::Dislike);
        ledger.add(RecipeId{ 40 }, Rating::Dislike);
        const std::vector<UserId> neighbors{ UserId{ 3 }, UserId{ 1 }, UserId{ 2 } };

        {
            const NeighborReport report{ buildNeighborReport(table, ledger, neighbors, Rating::Like) };
            const NeighborReport expectedReport{
                NeighborReportEntry{ UserId{ 2 }, 2, 0, 1 },
                NeighborReportEntry{ UserId{ 1 }, 1, 2, 0 },
                NeighborReportEntry{ UserId{ 3 }, 0, 2, 2 },
            };
            EXPECT_EQ(report, expectedReport);
        }

        {
            const NeighborReport report{ buildNeighborReport(table, ledger, neighbors, Rating::Dislike) };
            const NeighborReport expectedReport{
                NeighborReportEntry{ UserId{ 1 }, 1, 2, 0 },
                NeighborReportEntry{ UserId{ 3 }, 0, 2, 2 },
                NeighborReportEntry{ UserId{ 2 }, 2, 0, 1 },
            };
            EXPECT_EQ(report, expectedReport);
        }
    }

    TEST(NeighborReport, noNeighbor)
    {
        const InteractionTable table{ makeMainDishTable() };
        const PreferenceLedger ledger;

        EXPECT_THROW(buildNeighborReport(table, ledger, {}, Rating::Dislike), NoNeighborException);
    }
} // namespace fooder::recommendation::tests
