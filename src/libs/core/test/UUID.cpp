/*
 * Copyright (C) 2024 Emeric Poupon
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

#include <set>
#include <string>

#include <gtest/gtest.h>

#include "core/UUID.hpp"

namespace mtg::core::tests
{
    TEST(UUID, caseInsensitive)
    {
        const std::optional<UUID> uuid1{ UUID::fromString("3f51c839-bee2-4e9d-a7b7-0693e45178fc") };
        const std::optional<UUID> uuid2{ UUID::fromString("3f51C839-bEE2-4e9d-a7B7-0693e45178fC") };

        ASSERT_TRUE(uuid1);
        EXPECT_EQ(uuid1, uuid2);
        EXPECT_EQ(uuid2->getAsString(), "3f51c839-bee2-4e9d-a7b7-0693e45178fc");
    }

    TEST(UUID, invalid)
    {
        EXPECT_FALSE(UUID::fromString(""));
        EXPECT_FALSE(UUID::fromString("3f51c839-bee2-4e9d-a7b7"));
        EXPECT_FALSE(UUID::fromString("3f51c839bee24e9da7b70693e45178fc"));
        EXPECT_FALSE(UUID::fromString("3f51c839-bee2-4e9d-a7b7-0693e45178fg"));
        EXPECT_FALSE(UUID::fromString("../51c839-bee2-4e9d-a7b7-0693e45178fc"));
    }

    TEST(UUID, generate)
    {
        std::set<std::string> generated;
        for (std::size_t i{}; i < 100; ++i)
        {
            const UUID uuid{ UUID::generate() };
            const std::string_view str{ uuid.getAsString() };

            ASSERT_EQ(str.size(), 36);
            EXPECT_EQ(str[14], '4');
            EXPECT_NE(std::string_view{ "89ab" }.find(str[19]), std::string_view::npos);
            EXPECT_TRUE(UUID::fromString(str));
            generated.emplace(str);
        }

        EXPECT_EQ(generated.size(), 100);
    }

    TEST(UUID, readAs)
    {
        EXPECT_TRUE(stringUtils::readAs<UUID>("3f51c839-bee2-4e9d-a7b7-0693e45178fc"));
        EXPECT_FALSE(stringUtils::readAs<UUID>("42"));
    }
} // namespace mtg::core::tests
