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

#include "recommendation/RatingMatrix.hpp"

#include <algorithm>
#include <string>
#include <unordered_map>

#include "core/ILogger.hpp"
#include "recommendation/Exception.hpp"

namespace fooder::recommendation
{
    namespace
    {
        template<typename IdType>
        std::vector<IdType> getSortedUniqueIds(std::vector<IdType> ids)
        {
            std::sort(std::begin(ids), std::end(ids));
            ids.erase(std::unique(std::begin(ids), std::end(ids)), std::end(ids));
            return ids;
        }

        template<typename IdType>
        std::unordered_map<IdType, std::size_t> buildIndex(const std::vector<IdType>& ids)
        {
            std::unordered_map<IdType, std::size_t> index;
            index.reserve(ids.size());
            for (std::size_t i{}; i < ids.size(); ++i)
                index.emplace(ids[i], i);

            return index;
        }

        template<typename IdType>
        std::optional<std::size_t> findIndex(const std::vector<IdType>& ids, IdType id)
        {
            const auto it{ std::find(std::cbegin(ids), std::cend(ids), id) };
            if (it == std::cend(ids))
                return std::nullopt;

            return static_cast<std::size_t>(std::distance(std::cbegin(ids), it));
        }
    } // namespace

    RatingMatrix::RatingMatrix(std::vector<UserId> userIds, std::vector<RecipeId> recipeIds)
        : _userIds{ std::move(userIds) }
        , _recipeIds{ std::move(recipeIds) }
        , _values(_userIds.size() * _recipeIds.size(), noRating)
    {
    }

    RatingMatrix RatingMatrix::build(std::span<const InteractionRecord> records)
    {
        std::vector<UserId> userIds;
        std::vector<RecipeId> recipeIds;
        userIds.reserve(records.size());
        recipeIds.reserve(records.size());
        for (const InteractionRecord& record : records)
        {
            userIds.push_back(record.userId);
            recipeIds.push_back(record.recipeId);
        }

        RatingMatrix matrix{ getSortedUniqueIds(std::move(userIds)), getSortedUniqueIds(std::move(recipeIds)) };

        const auto userIndex{ buildIndex(matrix._userIds) };
        const auto recipeIndex{ buildIndex(matrix._recipeIds) };
        for (const InteractionRecord& record : records)
        {
            const std::size_t row{ userIndex.at(record.userId) };
            const std::size_t column{ recipeIndex.at(record.recipeId) };

            if (matrix.get(row, column) != noRating)
            {
                FOODER_LOG(RECOMMENDATION, ERROR, "Duplicate interaction for user " << record.userId << " and recipe " << record.recipeId);
                throw DataShapeException{ "Duplicate interaction for user " + std::to_string(record.userId.value()) + " and recipe " + std::to_string(record.recipeId.value()) };
            }

            matrix.set(row, column, toRatingValue(record.rating));
        }

        return matrix;
    }

    std::optional<std::size_t> RatingMatrix::findRow(UserId userId) const
    {
        return findIndex(_userIds, userId);
    }

    std::optional<std::size_t> RatingMatrix::findColumn(RecipeId recipeId) const
    {
        return findIndex(_recipeIds, recipeId);
    }

    RatingValue RatingMatrix::get(UserId userId, RecipeId recipeId) const
    {
        const std::optional<std::size_t> row{ findRow(userId) };
        const std::optional<std::size_t> column{ findColumn(recipeId) };
        if (!row || !column)
            return noRating;

        return get(*row, *column);
    }

    bool RatingMatrix::isRowEmpty(std::size_t row) const
    {
        const auto values{ getRow(row) };
        return std::all_of(std::cbegin(values), std::cend(values), [](RatingValue value) { return value == noRating; });
    }

    long long RatingMatrix::getColumnSum(std::size_t column) const
    {
        assert(column < getColumnCount());

        long long sum{};
        for (std::size_t row{}; row < getRowCount(); ++row)
            sum += get(row, column);

        return sum;
    }

    RatingMatrix RatingMatrix::reindex(std::span<const UserId> userIds, std::span<const RecipeId> recipeIds) const
    {
        RatingMatrix res{ std::vector<UserId>(std::cbegin(userIds), std::cend(userIds)), std::vector<RecipeId>(std::cbegin(recipeIds), std::cend(recipeIds)) };

        const auto userIndex{ buildIndex(_userIds) };
        const auto recipeIndex{ buildIndex(_recipeIds) };

        for (std::size_t row{}; row < res.getRowCount(); ++row)
        {
            const auto itRow{ userIndex.find(res._userIds[row]) };
            if (itRow == std::cend(userIndex))
                continue;

            for (std::size_t column{}; column < res.getColumnCount(); ++column)
            {
                const auto itColumn{ recipeIndex.find(res._recipeIds[column]) };
                if (itColumn == std::cend(recipeIndex))
                    continue;

                res.set(row, column, get(itRow->second, itColumn->second));
            }
        }

        return res;
    }
} // namespace fooder::recommendation
