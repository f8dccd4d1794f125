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

#include <gtest/gtest.h>

#include "catalog/ListLiteral.hpp"

namespace fooder::catalog::tests
{
    TEST(ListLiteral, valid)
    {
        struct TestCase
        {
            std::string_view input;
            std::vector<std::string> expectedOutput;
        };

        TestCase tests[]{
            { "[]", {} },
            { " [ ] ", {} },
            { "['a']", { "a" } },
            { "['preheat oven', 'mix']", { "preheat oven", "mix" } },
            { "[\"don't stir\", 'salt']", { "don't stir", "salt" } },
            { "['it\\'s done', 'a \\\\ b']", { "it's done", "a \\ b" } },
            { "['a\\nb']", { "a\nb" } },
            { "['a', 'b',]", { "a", "b" } },
            { "['a, b', '[c]']", { "a, b", "[c]" } },
            { "['']", { "" } },
        };

        for (const TestCase& test : tests)
        {
            const std::optional<std::vector<std::string>> output{ parseListLiteral(test.input) };
            ASSERT_TRUE(output.has_value()) << "input = '" << test.input << "'";
            EXPECT_EQ(*output, test.expectedOutput) << "input = '" << test.input << "'";
        }
    }

    TEST(ListLiteral, invalid)
    {
        const std::string_view tests[]{
            "",
            "[",
            "'a'",
            "[a]",
            "['a' 'b']",
            "['a'",
            "['a]",
            "[1, 2]",
            "['a',, 'b']",
        };

        for (std::string_view test : tests)
            EXPECT_FALSE(parseListLiteral(test).has_value()) << "input = '" << test << "'";
    }
} // namespace fooder::catalog::tests
