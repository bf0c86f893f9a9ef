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

#pragma once

#include <random>

namespace mtg::core::random
{
    using RandGenerator = std::mt19937;
    RandGenerator& getRandGenerator();

    template<typename T>
    T getRandom(T min, T max)
    {
        // uniform_int_distribution is not defined for char types
        std::uniform_int_distribution<unsigned> dist{ static_cast<unsigned>(min), static_cast<unsigned>(max) };
        return static_cast<T>(dist(getRandGenerator()));
    }
} // namespace mtg::core::random
