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

#include "RecipeCatalog.hpp"

#include <cerrno>
#include <fstream>
#include <istream>
#include <system_error>

#include "catalog/Exception.hpp"
#include "catalog/ListLiteral.hpp"
#include "core/ILogger.hpp"
#include "core/String.hpp"

namespace fooder::catalog
{
    namespace
    {
        struct Columns
        {
            std::size_t id;
            std::size_t name;
            std::size_t steps;
            std::size_t description;
            std::size_t ingredients;
        };

        std::optional<std::size_t> findColumn(const std::vector<std::string>& header, std::string_view name)
        {
            for (std::size_t i{}; i < header.size(); ++i)
            {
                if (core::stringUtils::stringCaseInsensitiveEqual(core::stringUtils::stringTrim(header[i]), name))
                    return i;
            }

            return std::nullopt;
        }

        // A record ends at the first line break that is not inside a quoted field
        std::optional<std::string> readRecord(std::istream& is, std::size_t& lineNumber)
        {
            std::string record;
            std::string line;
            bool first{ true };
            while (std::getline(is, line))
            {
                ++lineNumber;
                if (!first)
                    record += '\n';
                record += line;
                first = false;

                if (core::stringUtils::splitQuotedRecord(record))
                    return record;
            }

            if (!first)
                return record; // unterminated quoted field, reported by the caller
            return std::nullopt;
        }
    } // namespace

    std::unique_ptr<IRecipeCatalog> createRecipeCatalog(std::vector<Recipe> recipes)
    {
        return std::make_unique<RecipeCatalog>(std::move(recipes));
    }

    std::unique_ptr<IRecipeCatalog> createRecipeCatalog(const std::filesystem::path& recipesFile)
    {
        FOODER_LOG(CATALOG, INFO, "Loading recipes from '" << recipesFile.string() << "'...");

        std::ifstream ifs{ recipesFile };
        if (!ifs)
        {
            const std::error_code ec{ errno, std::generic_category() };
            throw RecipeCatalogLoadException{ "Cannot open recipes file '" + recipesFile.string() + "': " + ec.message() };
        }

        auto catalog{ createRecipeCatalog(parseRecipes(ifs, recipesFile.string())) };
        FOODER_LOG(CATALOG, INFO, "Loaded " << catalog->getRecipeCount() << " recipes from '" << recipesFile.string() << "'");

        return catalog;
    }

    std::vector<Recipe> parseRecipes(std::istream& is, std::string_view sourceName)
    {
        auto throwLoadError{ [&](std::size_t lineNumber, const std::string& error) {
            FOODER_LOG(CATALOG, ERROR, "Cannot load recipes from '" << sourceName << "', line " << lineNumber << ": " << error);
            throw RecipeCatalogLoadException{ "Cannot load recipes from '" + std::string{ sourceName } + "', line " + std::to_string(lineNumber) + ": " + error };
        } };

        std::size_t lineNumber{};
        const std::optional<std::string> headerRecord{ readRecord(is, lineNumber) };
        if (!headerRecord)
            throwLoadError(lineNumber, "missing header");

        const std::optional<std::vector<std::string>> header{ core::stringUtils::splitQuotedRecord(*headerRecord) };
        if (!header)
            throwLoadError(lineNumber, "malformed header");

        const std::optional<std::size_t> idColumn{ findColumn(*header, "id") };
        const std::optional<std::size_t> nameColumn{ findColumn(*header, "name") };
        const std::optional<std::size_t> stepsColumn{ findColumn(*header, "steps") };
        const std::optional<std::size_t> descriptionColumn{ findColumn(*header, "description") };
        const std::optional<std::size_t> ingredientsColumn{ findColumn(*header, "ingredients") };
        if (!idColumn || !nameColumn || !stepsColumn || !descriptionColumn || !ingredientsColumn)
            throwLoadError(lineNumber, "header must contain the 'id', 'name', 'steps', 'description' and 'ingredients' columns");
        const Columns columns{ *idColumn, *nameColumn, *stepsColumn, *descriptionColumn, *ingredientsColumn };

        std::vector<Recipe> recipes;
        while (const std::optional<std::string> record{ readRecord(is, lineNumber) })
        {
            if (core::stringUtils::stringTrim(*record).empty())
                continue;

            const std::optional<std::vector<std::string>> fields{ core::stringUtils::splitQuotedRecord(*record) };
            if (!fields)
                throwLoadError(lineNumber, "unterminated quoted field");
            if (fields->size() != header->size())
                throwLoadError(lineNumber, "expected " + std::to_string(header->size()) + " fields, got " + std::to_string(fields->size()));

            const std::optional<long long> id{ core::stringUtils::readAs<long long>(core::stringUtils::stringTrim((*fields)[columns.id])) };
            if (!id)
                throwLoadError(lineNumber, "invalid recipe id");

            std::optional<std::vector<std::string>> steps{ parseListLiteral((*fields)[columns.steps]) };
            if (!steps)
                throwLoadError(lineNumber, "invalid steps list");

            std::optional<std::vector<std::string>> ingredients{ parseListLiteral((*fields)[columns.ingredients]) };
            if (!ingredients)
                throwLoadError(lineNumber, "invalid ingredients list");

            Recipe recipe{ RecipeId{ *id }, std::string{ core::stringUtils::stringTrim((*fields)[columns.name]) }, std::move(*steps), (*fields)[columns.description], std::move(*ingredients) };
            recipes.push_back(std::move(recipe));
        }

        return recipes;
    }

    RecipeCatalog::RecipeCatalog(std::vector<Recipe> recipes)
    {
        _recipes.reserve(recipes.size());
        for (Recipe& recipe : recipes)
        {
            const RecipeId recipeId{ recipe.id };
            if (!_recipes.emplace(recipeId, std::move(recipe)).second)
                throw RecipeCatalogLoadException{ "Duplicate recipe id " + std::to_string(recipeId.value()) };
        }
    }

    const Recipe& RecipeCatalog::getRecipe(RecipeId recipeId) const
    {
        const auto it{ _recipes.find(recipeId) };
        if (it == std::cend(_recipes))
        {
            FOODER_LOG(CATALOG, DEBUG, "Recipe " << recipeId << " not found");
            throw RecipeNotFoundException{ recipeId };
        }

        return it->second;
    }

    std::optional<Recipe> RecipeCatalog::findRecipe(RecipeId recipeId) const
    {
        const auto it{ _recipes.find(recipeId) };
        if (it == std::cend(_recipes))
            return std::nullopt;

        return it->second;
    }
} // namespace fooder::catalog
