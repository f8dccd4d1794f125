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
#include <vector>

#include "recommendation/Types.hpp"

namespace fooder::recommendation
{
    // Immutable (user, recipe, rating) records of one dish type
    class InteractionTable
    {
    public:
        InteractionTable() = default;
        // Throws DataShapeException on duplicate (user, recipe) pairs
        explicit InteractionTable(std::vector<InteractionRecord> records);

        const std::vector<InteractionRecord>& getRecords() const { return _records; }
        std::size_t size() const { return _records.size(); }
        bool empty() const { return _records.empty(); }

        // Distinct recipe ids, ascending
        const std::vector<RecipeId>& getRecipeIds() const { return _recipeIds; }

        template<typename Predicate>
        std::vector<InteractionRecord> select(Predicate predicate) const
        {
            std::vector<InteractionRecord> res;
            for (const InteractionRecord& record : _records)
            {
                if (predicate(record))
                    res.push_back(record);
            }

            return res;
        }

    private:
        std::vector<InteractionRecord> _records;
        std::vector<RecipeId> _recipeIds;
    };
} // namespace fooder::recommendation
