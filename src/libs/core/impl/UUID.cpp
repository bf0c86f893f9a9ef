/*
 * Copyright (C) 2020 Emeric Poupon
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

#include "core/UUID.hpp"

#include <array>
#include <cstdint>
#include <iomanip>
#include <regex>
#include <sstream>

#include "core/Exception.hpp"
#include "core/Random.hpp"

namespace mtg::core
{
    namespace stringUtils
    {
        template<>
        std::optional<UUID> readAs(std::string_view str)
        {
            return UUID::fromString(str);
        }
    } // namespace stringUtils

    namespace
    {
        bool stringIsUUID(std::string_view str)
        {
            static const std::regex re{ R"([0-9a-fA-F]{8}\-[0-9a-fA-F]{4}\-[0-9a-fA-F]{4}\-[0-9a-fA-F]{4}\-[0-9a-fA-F]{12})" };

            return std::regex_match(std::cbegin(str), std::cend(str), re);
        }
    } // namespace

    UUID::UUID(std::string_view str)
        : _value{ stringUtils::stringToLower(str) }
    {
    }

    std::optional<UUID> UUID::fromString(std::string_view str)
    {
        if (!stringIsUUID(str))
            return std::nullopt;

        return UUID{ str };
    }

    UUID UUID::generate()
    {
        // Form is "123e4567-e89b-42d3-a456-426614174000"
        std::array<std::uint8_t, 16> bytes;
        for (std::uint8_t& byte : bytes)
            byte = random::getRandom<std::uint8_t>(0, 255);

        bytes[6] = (bytes[6] & 0x0F) | 0x40; // version 4
        bytes[8] = (bytes[8] & 0x3F) | 0x80; // RFC 4122 variant

        std::ostringstream oss;
        for (std::size_t i{}; i < bytes.size(); ++i)
        {
            if (i == 4 || i == 6 || i == 8 || i == 10)
                oss << '-';
            oss << std::hex << std::setfill('0') << std::setw(2) << static_cast<int>(bytes[i]);
        }

        std::optional<UUID> uuid{ fromString(oss.str()) };
        if (!uuid)
            throw MtgException{ "Generated an invalid UUID" };

        return *uuid;
    }
} // namespace mtg::core
