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

#include <mutex>
#include <shared_mutex>

#include <Wt/Dbo/Transaction.h>

namespace mtg::db
{
    // Writes are serialized, the transaction is committed on destruction
    class WriteTransaction
    {
    public:
        WriteTransaction(std::shared_mutex& mutex, Wt::Dbo::Session& session);
        ~WriteTransaction();

    private:
        WriteTransaction(const WriteTransaction&) = delete;
        WriteTransaction& operator=(const WriteTransaction&) = delete;

        const std::unique_lock<std::shared_mutex> _lock;
        Wt::Dbo::Transaction _transaction;
    };

    class ReadTransaction
    {
    public:
        ReadTransaction(Wt::Dbo::Session& session);
        ~ReadTransaction();

    private:
        ReadTransaction(const ReadTransaction&) = delete;
        ReadTransaction& operator=(const ReadTransaction&) = delete;

        Wt::Dbo::Transaction _transaction;
    };
} // namespace mtg::db
