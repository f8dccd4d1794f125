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

#include "InteractionTableProvider.hpp"

#include <cerrno>
#include <fstream>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

#include "core/ILogger.hpp"
#include "core/String.hpp"
#include "recommendation/Exception.hpp"

namespace fooder::recommendation
{
    namespace
    {
        constexpr std::string_view userIdColumnName{ "user_id" };
        constexpr std::string_view recipeIdColumnName{ "recipe_id" };
        constexpr std::string_view ratingColumnName{ "rate" };

        std::optional<std::size_t> findColumn(const std::vector<std::string_view>& header, std::string_view name)
        {
            for (std::size_t i{}; i < header.size(); ++i)
            {
                if (core::stringUtils::stringCaseInsensitiveEqual(core::stringUtils::stringTrim(header[i], " \t\r\""), name))
                    return i;
            }

            return std::nullopt;
        }

        std::optional<Rating> parseRating(std::string_view str)
        {
            const std::optional<int> value{ core::stringUtils::readAs<int>(str) };
            if (value == toRatingValue(Rating::Like))
                return Rating::Like;
            if (value == toRatingValue(Rating::Dislike))
                return Rating::Dislike;

            return std::nullopt;
        }
    } // namespace

    std::unique_ptr<IInteractionTableProvider> createInteractionTableProvider(InteractionTable mainTable, InteractionTable dessertTable)
    {
        return std::make_unique<InteractionTableProvider>(std::move(mainTable), std::move(dessertTable));
    }

    std::unique_ptr<IInteractionTableProvider> createCsvInteractionTableProvider(const std::filesystem::path& mainFile, const std::filesystem::path& dessertFile)
    {
        return std::make_unique<CsvInteractionTableProvider>(mainFile, dessertFile);
    }

    InteractionTable parseInteractionTable(std::istream& is, std::string_view sourceName)
    {
        auto throwLoadError{ [&](std::size_t lineNumber, const std::string& error) {
            FOODER_LOG(RECOMMENDATION, ERROR, "Cannot load interactions from '" << sourceName << "', line " << lineNumber << ": " << error);
            throw InteractionTableLoadException{ "Cannot load interactions from '" + std::string{ sourceName } + "', line " + std::to_string(lineNumber) + ": " + error };
        } };

        std::string line;
        std::size_t lineNumber{};
        if (!std::getline(is, line))
            throwLoadError(lineNumber, "missing header");
        ++lineNumber;

        const std::vector<std::string_view> header{ core::stringUtils::splitString(line, ',') };
        const std::optional<std::size_t> userIdColumn{ findColumn(header, userIdColumnName) };
        const std::optional<std::size_t> recipeIdColumn{ findColumn(header, recipeIdColumnName) };
        const std::optional<std::size_t> ratingColumn{ findColumn(header, ratingColumnName) };
        if (!userIdColumn || !recipeIdColumn || !ratingColumn)
            throwLoadError(lineNumber, "header must contain the '" + std::string{ userIdColumnName } + "', '" + std::string{ recipeIdColumnName } + "' and '" + std::string{ ratingColumnName } + "' columns");

        std::vector<InteractionRecord> records;
        while (std::getline(is, line))
        {
            ++lineNumber;

            if (core::stringUtils::stringTrim(line).empty())
                continue;

            const std::vector<std::string_view> fields{ core::stringUtils::splitString(line, ',') };
            if (fields.size() != header.size())
                throwLoadError(lineNumber, "expected " + std::to_string(header.size()) + " fields, got " + std::to_string(fields.size()));

            const std::optional<long long> userId{ core::stringUtils::readAs<long long>(core::stringUtils::stringTrim(fields[*userIdColumn])) };
            const std::optional<long long> recipeId{ core::stringUtils::readAs<long long>(core::stringUtils::stringTrim(fields[*recipeIdColumn])) };
            const std::optional<Rating> rating{ parseRating(core::stringUtils::stringTrim(fields[*ratingColumn])) };
            if (!userId || !recipeId)
                throwLoadError(lineNumber, "invalid user or recipe id");
            if (!rating)
                throwLoadError(lineNumber, "rating must be 1 or -1");

            records.push_back(InteractionRecord{ UserId{ *userId }, RecipeId{ *recipeId }, *rating });
        }

        return InteractionTable{ std::move(records) };
    }

    InteractionTable loadInteractionTable(const std::filesystem::path& file)
    {
        FOODER_LOG(RECOMMENDATION, INFO, "Loading interactions from '" << file.string() << "'...");

        std::ifstream ifs{ file };
        if (!ifs)
        {
            const std::error_code ec{ errno, std::generic_category() };
            throw InteractionTableLoadException{ "Cannot open interactions file '" + file.string() + "': " + ec.message() };
        }

        InteractionTable table{ parseInteractionTable(ifs, file.string()) };
        FOODER_LOG(RECOMMENDATION, INFO, "Loaded " << table.size() << " interactions on " << table.getRecipeIds().size() << " recipes from '" << file.string() << "'");

        return table;
    }

    InteractionTableProvider::InteractionTableProvider(InteractionTable mainTable, InteractionTable dessertTable)
        : _mainTable{ std::make_shared<const InteractionTable>(std::move(mainTable)) }
        , _dessertTable{ std::make_shared<const InteractionTable>(std::move(dessertTable)) }
    {
    }

    std::shared_ptr<const InteractionTable> InteractionTableProvider::getTable(DishType dishType)
    {
        switch (dishType)
        {
        case DishType::Main:
            return _mainTable;
        case DishType::Dessert:
            return _dessertTable;
        }

        return {};
    }

    CsvInteractionTableProvider::CsvInteractionTableProvider(const std::filesystem::path& mainFile, const std::filesystem::path& dessertFile)
        : _mainTable{ mainFile, {} }
        , _dessertTable{ dessertFile, {} }
    {
    }

    std::shared_ptr<const InteractionTable> CsvInteractionTableProvider::getTable(DishType dishType)
    {
        CachedTable& cachedTable{ dishType == DishType::Main ? _mainTable : _dessertTable };

        const std::scoped_lock lock{ _mutex };
        if (!cachedTable.table)
            cachedTable.table = std::make_shared<const InteractionTable>(loadInteractionTable(cachedTable.file));

        return cachedTable.table;
    }
} // namespace fooder::recommendation
