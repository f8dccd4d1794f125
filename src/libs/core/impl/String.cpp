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

#include "core/String.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

#include <Wt/WDateTime.h>

namespace fooder::core::stringUtils
{
    template<>
    std::optional<std::string> readAs(std::string_view str)
    {
        return std::string{ str };
    }

    std::vector<std::string_view> splitString(std::string_view str, char separator)
    {
        std::vector<std::string_view> res;

        std::string_view::size_type strBegin{};
        while (true)
        {
            const std::string_view::size_type separatorPos{ str.find(separator, strBegin) };
            if (separatorPos == std::string_view::npos)
            {
                res.push_back(str.substr(strBegin));
                break;
            }

            res.push_back(str.substr(strBegin, separatorPos - strBegin));
            strBegin = separatorPos + 1;
        }

        return res;
    }

    std::optional<std::vector<std::string>> splitQuotedRecord(std::string_view record, char delimiter, char quoteChar)
    {
        std::vector<std::string> res;
        std::string current;
        bool inQuotes{};

        for (std::size_t i{}; i < record.size(); ++i)
        {
            const char c{ record[i] };

            if (inQuotes)
            {
                if (c != quoteChar)
                    current += c;
                else if (i + 1 < record.size() && record[i + 1] == quoteChar)
                {
                    current += quoteChar;
                    ++i;
                }
                else
                    inQuotes = false;
            }
            else if (c == quoteChar)
                inQuotes = true;
            else if (c == delimiter)
                res.push_back(std::exchange(current, {}));
            else
                current += c;
        }

        if (inQuotes)
            return std::nullopt;

        res.push_back(std::move(current));
        return res;
    }

    std::string joinStrings(std::span<const std::string> strings, std::string_view delimiter)
    {
        std::string res;
        for (const std::string& str : strings)
        {
            if (!res.empty())
                res += delimiter;
            res += str;
        }

        return res;
    }

    std::string_view stringTrim(std::string_view str, std::string_view whitespaces)
    {
        std::string_view res;

        const auto strBegin = str.find_first_not_of(whitespaces);
        if (strBegin != std::string_view::npos)
        {
            const auto strEnd{ str.find_last_not_of(whitespaces) };
            const auto strRange{ strEnd - strBegin + 1 };

            res = str.substr(strBegin, strRange);
        }

        return res;
    }

    std::string stringToLower(std::string_view str)
    {
        std::string res;
        res.reserve(str.size());

        std::transform(std::cbegin(str), std::cend(str), std::back_inserter(res), [](unsigned char c) { return std::tolower(c); });

        return res;
    }

    bool stringCaseInsensitiveEqual(std::string_view strA, std::string_view strB)
    {
        if (strA.size() != strB.size())
            return false;

        for (std::size_t i{}; i < strA.size(); ++i)
        {
            if (std::tolower(static_cast<unsigned char>(strA[i])) != std::tolower(static_cast<unsigned char>(strB[i])))
                return false;
        }

        return true;
    }

    std::string toISO8601String(const Wt::WDateTime& dateTime)
    {
        if (dateTime.isValid())
        {
            // assume UTC
            return dateTime.toString("yyyy-MM-ddThh:mm:ss.zzz", false).toUTF8() + 'Z';
        }

        return "";
    }
} // namespace fooder::core::stringUtils
