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

#include <cstddef>
#include <span>
#include <vector>

#include "recommendation/Types.hpp"

namespace fooder::recommendation
{
    class InteractionTable;
    class PreferenceLedger;

    struct NeighborReportEntry
    {
        UserId userId;
        std::size_t commonLikes{};        // recipes liked by both
        std::size_t commonDislikes{};     // recipes disliked by both
        std::size_t recipesToRecommend{}; // recipes the neighbor likes that are not liked by the active user

        bool operator==(const NeighborReportEntry&) const = default;
    };

    using NeighborReport = std::vector<NeighborReportEntry>;

    // Sorted by decreasing common likes (Like polarity) or common dislikes (Dislike polarity), then by user id
    // Throws NoNeighborException if neighbors is empty
    NeighborReport buildNeighborReport(const InteractionTable& table, const PreferenceLedger& ledger, std::span<const UserId> neighbors, Rating polarity);
} // namespace fooder::recommendation
