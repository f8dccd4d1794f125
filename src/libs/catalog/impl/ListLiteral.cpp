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

#include "catalog/ListLiteral.hpp"

#include "core/String.hpp"

namespace fooder::catalog
{
    namespace
    {
        constexpr std::string_view whitespaces{ " \t\r\n" };

        void skipWhitespaces(std::string_view str, std::size_t& pos)
        {
            while (pos < str.size() && whitespaces.find(str[pos]) != std::string_view::npos)
                ++pos;
        }

        char unescape(char c)
        {
            switch (c)
            {
            case 'n':
                return '\n';
            case 't':
                return '\t';
            case 'r':
                return '\r';
            default:
                return c;
            }
        }

        // pos must be on the opening quote, ends up after the closing quote
        std::optional<std::string> parseQuotedItem(std::string_view str, std::size_t& pos)
        {
            const char quoteChar{ str[pos++] };

            std::string res;
            while (pos < str.size())
            {
                const char c{ str[pos++] };
                if (c == quoteChar)
                    return res;

                if (c != '\\')
                {
                    res += c;
                    continue;
                }

                if (pos == str.size())
                    break;

                const char escaped{ str[pos++] };
                if (escaped == '\\' || escaped == '\'' || escaped == '"')
                    res += escaped;
                else if (const char unescaped{ unescape(escaped) }; unescaped != escaped)
                    res += unescaped;
                else
                {
                    res += '\\';
                    res += escaped;
                }
            }

            return std::nullopt;
        }
    } // namespace

    std::optional<std::vector<std::string>> parseListLiteral(std::string_view str)
    {
        str = core::stringUtils::stringTrim(str, whitespaces);
        if (str.size() < 2 || str.front() != '[' || str.back() != ']')
            return std::nullopt;

        const std::string_view content{ str.substr(1, str.size() - 2) };

        std::vector<std::string> res;
        std::size_t pos{};
        while (true)
        {
            skipWhitespaces(content, pos);
            if (pos == content.size())
                break;

            if (content[pos] != '\'' && content[pos] != '"')
                return std::nullopt;

            std::optional<std::string> item{ parseQuotedItem(content, pos) };
            if (!item)
                return std::nullopt;
            res.push_back(std::move(*item));

            skipWhitespaces(content, pos);
            if (pos == content.size())
                break;
            if (content[pos] != ',')
                return std::nullopt;
            ++pos;
        }

        return res;
    }
} // namespace fooder::catalog
