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

#include <filesystem>
#include <fstream>

#include <gtest/gtest.h>

#include "core/Exception.hpp"
#include "core/IConfig.hpp"

namespace fooder::core::tests
{
    class ConfigTest : public ::testing::Test
    {
    protected:
        void SetUp() override
        {
            _configFile = std::filesystem::temp_directory_path() / ("fooder_test_" + std::string{ ::testing::UnitTest::GetInstance()->current_test_info()->name() } + ".conf");
        }

        void TearDown() override
        {
            std::filesystem::remove(_configFile);
        }

        const std::filesystem::path& writeConfig(std::string_view content)
        {
            std::ofstream ofs{ _configFile };
            ofs << content;
            return _configFile;
        }

    private:
        std::filesystem::path _configFile;
    };

    TEST_F(ConfigTest, values)
    {
        const auto config{ createConfig(writeConfig("log-min-severity = \"debug\";\n"
                                                    "recipes-file = \"/var/fooder/recipes.csv\";\n"
                                                    "neighbor-min-count = 3;\n")) };

        EXPECT_EQ(config->getString("log-min-severity", "info"), "debug");
        EXPECT_EQ(config->getPath("recipes-file", "recipes.csv"), std::filesystem::path{ "/var/fooder/recipes.csv" });
        EXPECT_EQ(config->getULong("neighbor-min-count", 5), 3);
    }

    TEST_F(ConfigTest, defaults)
    {
        const auto config{ createConfig(writeConfig("# nothing set\n")) };

        EXPECT_EQ(config->getString("log-min-severity", "info"), "info");
        EXPECT_EQ(config->getPath("recipes-file", "data/recipes.csv"), std::filesystem::path{ "data/recipes.csv" });
        EXPECT_EQ(config->getULong("neighbor-min-count", 5), 5);
    }

    TEST_F(ConfigTest, wrongType)
    {
        const auto config{ createConfig(writeConfig("neighbor-min-count = \"five\";\n")) };
        EXPECT_EQ(config->getULong("neighbor-min-count", 5), 5);
    }

    TEST_F(ConfigTest, parseError)
    {
        EXPECT_THROW(createConfig(writeConfig("neighbor-min-count = ;\n")), FooderException);
    }

    TEST_F(ConfigTest, missingFile)
    {
        EXPECT_THROW(createConfig("/nonexistent/fooder.conf"), FooderException);
    }
} // namespace fooder::core::tests
