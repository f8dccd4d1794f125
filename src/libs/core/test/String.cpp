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

#include <Wt/WDate.h>
#include <Wt/WDateTime.h>
#include <Wt/WTime.h>

#include "core/String.hpp"

namespace fooder::core::stringUtils::tests
{
    TEST(StringUtils, splitString)
    {
        struct TestCase
        {
            std::string_view input;
            char delimiter;
            std::vector<std::string_view> expectedOutput;
        };

        TestCase tests[]{
            { "abc", ',', { "abc" } },
            { "", ',', { "" } },
            { "a,b,c", ',', { "a", "b", "c" } },
            { ",b,c", ',', { "", "b", "c" } },
            { "a,b,", ',', { "a", "b", "" } },
            { ",,", ',', { "", "", "" } },
            { " , ,c", ',', { " ", " ", "c" } },
            { "a;b,c", ';', { "a", "b,c" } },
        };

        for (const TestCase& test : tests)
        {
            const std::vector<std::string_view> output{ splitString(test.input, test.delimiter) };
            EXPECT_EQ(output, test.expectedOutput) << "input = '" << test.input << "'";
        }
    }

    TEST(StringUtils, splitQuotedRecord)
    {
        struct TestCase
        {
            std::string_view input;
            std::optional<std::vector<std::string>> expectedOutput;
        };

        TestCase tests[]{
            { "", std::vector<std::string>{ "" } },
            { "a,b,c", std::vector<std::string>{ "a", "b", "c" } },
            { "\"a,b\",c", std::vector<std::string>{ "a,b", "c" } },
            { "1,\"say \"\"hi\"\"\",3", std::vector<std::string>{ "1", "say \"hi\"", "3" } },
            { "\"\",x", std::vector<std::string>{ "", "x" } },
            { "a,\"multi\nline\"", std::vector<std::string>{ "a", "multi\nline" } },
            { "a,\"unterminated", std::nullopt },
            { "\"", std::nullopt },
        };

        for (const TestCase& test : tests)
        {
            const std::optional<std::vector<std::string>> output{ splitQuotedRecord(test.input) };
            EXPECT_EQ(output, test.expectedOutput) << "input = '" << test.input << "'";
        }
    }

    TEST(StringUtils, splitQuotedRecord_customChars)
    {
        const std::optional<std::vector<std::string>> output{ splitQuotedRecord("'a;b';c", ';', '\'') };
        ASSERT_TRUE(output.has_value());
        EXPECT_EQ(*output, (std::vector<std::string>{ "a;b", "c" }));
    }

    TEST(StringUtils, joinStrings)
    {
        EXPECT_EQ(joinStrings(std::vector<std::string>{}, ", "), "");
        EXPECT_EQ(joinStrings(std::vector<std::string>{ "a" }, ", "), "a");
        EXPECT_EQ(joinStrings(std::vector<std::string>{ "a", "b", "c" }, ", "), "a, b, c");
    }

    TEST(StringUtils, stringTrim)
    {
        EXPECT_EQ(stringTrim(""), "");
        EXPECT_EQ(stringTrim("   "), "");
        EXPECT_EQ(stringTrim(" a b \t\r"), "a b");
        EXPECT_EQ(stringTrim("\"user_id\"", "\""), "user_id");
    }

    TEST(StringUtils, stringCaseInsensitiveEqual)
    {
        EXPECT_TRUE(stringCaseInsensitiveEqual("", ""));
        EXPECT_TRUE(stringCaseInsensitiveEqual("Recipe_ID", "recipe_id"));
        EXPECT_FALSE(stringCaseInsensitiveEqual("recipe", "recipe_id"));
        EXPECT_EQ(stringToLower("MaIn"), "main");
    }

    TEST(StringUtils, readAs_int)
    {
        EXPECT_EQ(readAs<int>("1024"), 1024);
        EXPECT_EQ(readAs<int>("0"), 0);
        EXPECT_EQ(readAs<int>("-1"), -1);
        EXPECT_EQ(readAs<int>("+1"), 1);
        EXPECT_EQ(readAs<long long>("123456789012"), 123456789012);
        EXPECT_EQ(readAs<int>(""), std::nullopt);
        EXPECT_EQ(readAs<int>("+"), std::nullopt);
        EXPECT_EQ(readAs<int>("-"), std::nullopt);
        EXPECT_EQ(readAs<int>("a"), std::nullopt);
        EXPECT_EQ(readAs<int>("1024a"), std::nullopt);
        EXPECT_EQ(readAs<int>("1.0"), std::nullopt);
        EXPECT_EQ(readAs<int>(" 1"), std::nullopt);
    }

    TEST(StringUtils, readAs_string)
    {
        EXPECT_EQ(readAs<std::string>("foo bar"), "foo bar");
    }

    TEST(StringUtils, toISO8601String)
    {
        EXPECT_EQ(toISO8601String(Wt::WDateTime{}), "");
        EXPECT_EQ(toISO8601String(Wt::WDateTime{ Wt::WDate{ 2024, 3, 5 }, Wt::WTime{ 14, 7, 9, 250 } }), "2024-03-05T14:07:09.250Z");
    }
} // namespace fooder::core::stringUtils::tests
