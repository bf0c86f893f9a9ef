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

#pragma once

#include <cstdint>
#include <optional>
#include <string_view>
#include <variant>

namespace mtg::transfer
{
    // Inclusive bounds, 0 <= start <= end < object size
    struct ByteRange
    {
        std::uint64_t start{};
        std::uint64_t end{};

        std::uint64_t getSize() const { return end - start + 1; }

        bool operator==(const ByteRange&) const = default;
    };

    struct NoRange
    {
        bool operator==(const NoRange&) const = default;
    };

    struct UnsatisfiableRange
    {
        bool operator==(const UnsatisfiableRange&) const = default;
    };

    using RangeParseResult = std::variant<NoRange, ByteRange, UnsatisfiableRange>;

    // Only the single "bytes=<start>-[<end>]" form is supported
    // Suffix ranges, multiple ranges and malformed headers are unsatisfiable
    RangeParseResult parseRange(std::optional<std::string_view> rangeHeader, std::uint64_t objectSize);
} // namespace mtg::transfer
