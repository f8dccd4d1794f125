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

#include <mutex>

#include "recommendation/IInteractionTableProvider.hpp"

namespace fooder::recommendation
{
    class InteractionTableProvider final : public IInteractionTableProvider
    {
    public:
        InteractionTableProvider(InteractionTable mainTable, InteractionTable dessertTable);
        ~InteractionTableProvider() override = default;
        InteractionTableProvider(const InteractionTableProvider&) = delete;
        InteractionTableProvider& operator=(const InteractionTableProvider&) = delete;

    private:
        std::shared_ptr<const InteractionTable> getTable(DishType dishType) override;

        const std::shared_ptr<const InteractionTable> _mainTable;
        const std::shared_ptr<const InteractionTable> _dessertTable;
    };

    class CsvInteractionTableProvider final : public IInteractionTableProvider
    {
    public:
        CsvInteractionTableProvider(const std::filesystem::path& mainFile, const std::filesystem::path& dessertFile);
        ~CsvInteractionTableProvider() override = default;
        CsvInteractionTableProvider(const CsvInteractionTableProvider&) = delete;
        CsvInteractionTableProvider& operator=(const CsvInteractionTableProvider&) = delete;

    private:
        std::shared_ptr<const InteractionTable> getTable(DishType dishType) override;

        struct CachedTable
        {
            std::filesystem::path file;
            std::shared_ptr<const InteractionTable> table;
        };

        std::mutex _mutex;
        CachedTable _mainTable;
        CachedTable _dessertTable;
    };
} // namespace fooder::recommendation
