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

#include <functional>
#include <memory>

#include "transfer/CategoryPolicy.hpp"
#include "transfer/IPolicyResolver.hpp"
#include "transfer/MediaCategory.hpp"

namespace mtg::db
{
    class IDb;
    class Session;

    std::unique_ptr<transfer::IPolicyResolver> createPolicyResolver(IDb& db);

    // Creates the missing category settings rows, existing rows are left untouched
    void initCategorySettings(Session& session, std::function<transfer::CategoryPolicy(transfer::MediaCategory)> policyProvider);
} // namespace mtg::db
