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

#include "transfer/RangeParser.hpp"

#include <algorithm>
#include <cctype>
#include <limits>

#include "core/String.hpp"

namespace mtg::transfer
{
    namespace
    {
        constexpr std::string_view rangeUnitPrefix{ "bytes=" };

        bool isDigits(std::string_view str)
        {
            return !str.empty() && std::all_of(std::cbegin(str), std::cend(str), [](unsigned char c) { return std::isdigit(c); });
        }
    } // namespace

    RangeParseResult parseRange(std::optional<std::string_view> rangeHeader, std::uint64_t objectSize)
    {
        if (!rangeHeader)
            return NoRange{};

        const std::string_view header{ core::stringUtils::stringTrim(*rangeHeader, " \t") };
        if (header.size() < rangeUnitPrefix.size() || !core::stringUtils::stringCaseInsensitiveEqual(header.substr(0, rangeUnitPrefix.size()), rangeUnitPrefix))
            return UnsatisfiableRange{};

        const std::string_view rangeSpec{ core::stringUtils::stringTrim(header.substr(rangeUnitPrefix.size()), " \t") };
        if (rangeSpec.find(',') != std::string_view::npos)
            return UnsatisfiableRange{};

        const std::size_t dashPos{ rangeSpec.find('-') };
        if (dashPos == std::string_view::npos)
            return UnsatisfiableRange{};

        const std::string_view startStr{ rangeSpec.substr(0, dashPos) };
        const std::string_view endStr{ rangeSpec.substr(dashPos + 1) };

        // "-<suffix>" is not supported
        const std::optional<std::uint64_t> start{ core::stringUtils::readDecimal(startStr) };
        if (!start)
            return UnsatisfiableRange{};

        std::uint64_t end{ std::numeric_limits<std::uint64_t>::max() };
        if (!endStr.empty())
        {
            if (!isDigits(endStr))
                return UnsatisfiableRange{};

            // too large to fit: clamped below anyway
            if (const std::optional<std::uint64_t> value{ core::stringUtils::readDecimal(endStr) })
                end = *value;
        }

        if (*start >= objectSize)
            return UnsatisfiableRange{};

        end = std::min(end, objectSize - 1);
        if (*start > end)
            return UnsatisfiableRange{};

        return ByteRange{ *start, end };
    }
} // namespace mtg::transfer
