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

#pragma once

#include <string>

#include <Wt/Dbo/Query.h>
#include <Wt/Dbo/Session.h>

namespace mtg::db::utils
{
    void executeCommand(Wt::Dbo::Session& session, const std::string& command);

    template<typename Query>
    auto fetchQuerySingleResult(const Query& query)
    {
        return query.resultValue();
    }
} // namespace mtg::db::utils
