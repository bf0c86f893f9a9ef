/*
 * Copyright (C) 2025 Emeric Poupon
 *
 * This file is part of MTG.
 *
 * MTG is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * MTG is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with MTG.  If not, see <http://www.gnu.org/licenses/>.
 */

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "core/Exception.hpp"
#include "core/IConfig.hpp"
#include "core/TemporaryFile.hpp"

namespace mtg::core::tests
{
    namespace
    {
        std::unique_ptr<IConfig> createConfigFromContent(const TemporaryFile& file, std::string_view content)
        {
            {
                std::ofstream ofs{ file.getPath(), std::ios::trunc };
                ofs << content;
            }
            return createConfig(file.getPath());
        }
    } // namespace

    TEST(Config, values)
    {
        TemporaryFile file{ std::filesystem::temp_directory_path() };
        auto config{ createConfigFromContent(file, R"(
working-dir = "/tmp/mtg";
listen-port = 5091;
behind-reverse-proxy = true;
video-max-size-mb = 4096;
stream-idle-timeout-ms = 2500;
cover-allowed-content-types = ( "image/png", "image/jpeg" );
)") };

        EXPECT_EQ(config->getPath("working-dir", "/var/mtg"), std::filesystem::path{ "/tmp/mtg" });
        EXPECT_EQ(config->getULong("listen-port", 5090), 5091);
        EXPECT_TRUE(config->getBool("behind-reverse-proxy", false));
        EXPECT_EQ(config->getULongLong("video-max-size-mb", 2048), 4096);
        EXPECT_EQ(config->getDuration("stream-idle-timeout-ms", std::chrono::milliseconds{ 15000 }), std::chrono::milliseconds{ 2500 });
        EXPECT_TRUE(config->hasSetting("listen-port"));

        std::vector<std::string> types;
        config->visitStrings("cover-allowed-content-types", [&](std::string_view type) { types.emplace_back(type); }, { "image/webp" });
        EXPECT_EQ(types, (std::vector<std::string>{ "image/png", "image/jpeg" }));
    }

    TEST(Config, defaults)
    {
        TemporaryFile file{ std::filesystem::temp_directory_path() };
        auto config{ createConfigFromContent(file, "") };

        EXPECT_EQ(config->getString("cache-control", "private, max-age=3600"), "private, max-age=3600");
        EXPECT_EQ(config->getULong("listen-port", 5090), 5090);
        EXPECT_FALSE(config->getBool("behind-reverse-proxy", false));
        EXPECT_FALSE(config->hasSetting("listen-port"));

        std::vector<std::string> types;
        config->visitStrings("cover-allowed-content-types", [&](std::string_view type) { types.emplace_back(type); }, { "image/webp" });
        EXPECT_EQ(types, (std::vector<std::string>{ "image/webp" }));
    }

    TEST(Config, negativeSize)
    {
        TemporaryFile file{ std::filesystem::temp_directory_path() };
        auto config{ createConfigFromContent(file, "book-max-size-mb = -1;") };

        EXPECT_THROW(config->getULongLong("book-max-size-mb", 100), MtgException);
    }

    TEST(Config, parseError)
    {
        TemporaryFile file{ std::filesystem::temp_directory_path() };
        EXPECT_THROW(createConfigFromContent(file, "listen-port = ;"), MtgException);
    }

    TEST(Config, missingFile)
    {
        EXPECT_THROW(createConfig("/this/file/does/not/exist.conf"), MtgException);
    }
} // namespace mtg::core::tests
