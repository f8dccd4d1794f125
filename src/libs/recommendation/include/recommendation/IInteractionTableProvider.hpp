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

#include <filesystem>
#include <istream>
#include <memory>
#include <string_view>

#include "recommendation/InteractionTable.hpp"
#include "recommendation/Types.hpp"

namespace fooder::recommendation
{
    // Gives access to the interaction table of each dish type
    // Tables are immutable once provided and can be shared among sessions
    class IInteractionTableProvider
    {
    public:
        virtual ~IInteractionTableProvider() = default;

        virtual std::shared_ptr<const InteractionTable> getTable(DishType dishType) = 0;
    };

    std::unique_ptr<IInteractionTableProvider> createInteractionTableProvider(InteractionTable mainTable, InteractionTable dessertTable);

    // Tables are loaded on first access
    std::unique_ptr<IInteractionTableProvider> createCsvInteractionTableProvider(const std::filesystem::path& mainFile, const std::filesystem::path& dessertFile);

    // Expects a header line naming at least the "user_id", "recipe_id" and "rate" columns
    // Throws InteractionTableLoadException on malformed input, DataShapeException on duplicate (user, recipe) pairs
    InteractionTable parseInteractionTable(std::istream& is, std::string_view sourceName);
    InteractionTable loadInteractionTable(const std::filesystem::path& file);
} // namespace fooder::recommendation
