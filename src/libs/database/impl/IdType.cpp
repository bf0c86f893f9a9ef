/*
 * Copyright (C) 2021 Emeric Poupon
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

#include "database/IdType.hpp"

namespace mtg::db
{
    IdType::IdType(ValueType id)
        : _id{ id }
    {
    }

    bool IdType::isValid() const
    {
        return _id >= 0;
    }

    std::string IdType::toString() const
    {
        return std::to_string(_id);
    }
} // namespace mtg::db
