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

#include "recommendation/InteractionTable.hpp"

#include <algorithm>
#include <set>
#include <string>
#include <utility>

#include "core/ILogger.hpp"
#include "recommendation/Exception.hpp"

namespace fooder::recommendation
{
    InteractionTable::InteractionTable(std::vector<InteractionRecord> records)
        : _records{ std::move(records) }
    {
        std::set<std::pair<UserId, RecipeId>> knownPairs;
        for (const InteractionRecord& record : _records)
        {
            if (!knownPairs.emplace(record.userId, record.recipeId).second)
            {
                FOODER_LOG(RECOMMENDATION, ERROR, "Duplicate interaction for user " << record.userId << " and recipe " << record.recipeId);
                throw DataShapeException{ "Duplicate interaction for user " + std::to_string(record.userId.value()) + " and recipe " + std::to_string(record.recipeId.value()) };
            }
        }

        _recipeIds.reserve(_records.size());
        std::transform(std::cbegin(_records), std::cend(_records), std::back_inserter(_recipeIds), [](const InteractionRecord& record) { return record.recipeId; });

        std::sort(std::begin(_recipeIds), std::end(_recipeIds));
        _recipeIds.erase(std::unique(std::begin(_recipeIds), std::end(_recipeIds)), std::end(_recipeIds));
    }
} // namespace fooder::recommendation
