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

namespace mtg::core::literals
{
    // Object sizes may exceed 4GiB, always use 64 bits
    constexpr std::uint64_t operator""_KiB(unsigned long long int x)
    {
        return 1024ULL * x;
    }

    constexpr std::uint64_t operator""_MiB(unsigned long long int x)
    {
        return 1024_KiB * x;
    }

    constexpr std::uint64_t operator""_GiB(unsigned long long int x)
    {
        return 1024_MiB * x;
    }
} // namespace mtg::core::literals
