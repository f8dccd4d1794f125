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

#include <cassert>
#include <optional>
#include <span>
#include <vector>

#include "recommendation/Types.hpp"

namespace fooder::recommendation
{
    // Dense user x recipe view of interaction records
    // Rows and columns are kept sorted by ascending id unless reindexed
    class RatingMatrix
    {
    public:
        RatingMatrix() = default;

        // All cells set to noRating
        RatingMatrix(std::vector<UserId> userIds, std::vector<RecipeId> recipeIds);

        // Pivots records: rows = exactly the users of records, columns = exactly the recipes of records
        // Throws DataShapeException on duplicate (user, recipe) pairs
        static RatingMatrix build(std::span<const InteractionRecord> records);

        const std::vector<UserId>& getUserIds() const { return _userIds; }
        const std::vector<RecipeId>& getRecipeIds() const { return _recipeIds; }

        std::size_t getRowCount() const { return _userIds.size(); }
        std::size_t getColumnCount() const { return _recipeIds.size(); }
        bool empty() const { return _userIds.empty() || _recipeIds.empty(); }

        std::optional<std::size_t> findRow(UserId userId) const;
        std::optional<std::size_t> findColumn(RecipeId recipeId) const;

        RatingValue get(std::size_t row, std::size_t column) const
        {
            assert(row < getRowCount() && column < getColumnCount());
            return _values[row * getColumnCount() + column];
        }

        void set(std::size_t row, std::size_t column, RatingValue value)
        {
            assert(row < getRowCount() && column < getColumnCount());
            _values[row * getColumnCount() + column] = value;
        }

        // noRating if the user or the recipe is not part of the matrix
        RatingValue get(UserId userId, RecipeId recipeId) const;

        std::span<const RatingValue> getRow(std::size_t row) const
        {
            assert(row < getRowCount());
            return std::span{ _values }.subspan(row * getColumnCount(), getColumnCount());
        }

        bool isRowEmpty(std::size_t row) const;
        long long getColumnSum(std::size_t column) const;

        // Rows and columns in the requested order, cells that do not exist in this matrix are set to noRating
        RatingMatrix reindex(std::span<const UserId> userIds, std::span<const RecipeId> recipeIds) const;

    private:
        std::vector<UserId> _userIds;
        std::vector<RecipeId> _recipeIds;
        std::vector<RatingValue> _values; // row major
    };
} // namespace fooder::recommendation
