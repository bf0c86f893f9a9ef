/*
 * Copyright (C) 2019 Emeric Poupon
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

#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <thread>

#include <Wt/Dbo/SqlConnectionPool.h>

#include "database/IDb.hpp"

namespace mtg::db
{
    class Db : public IDb
    {
    public:
        Db(const std::filesystem::path& dbPath, std::size_t connectionCount);
        ~Db() override;

        void executeSql(const std::string& sql);

    private:
        Db(const Db&) = delete;
        Db& operator=(const Db&) = delete;

        friend class Session;

        Session& getTLSSession() override;

        std::shared_mutex& getMutex() { return _sharedMutex; }
        Wt::Dbo::SqlConnectionPool& getConnectionPool() { return *_connectionPool; }

        void logCompileOptions();
        void performQuickCheck();
        void performIntegrityCheck();

        class ScopedConnection
        {
        public:
            ScopedConnection(Wt::Dbo::SqlConnectionPool& pool);
            ~ScopedConnection();

            Wt::Dbo::SqlConnection* operator->() const;
            Wt::Dbo::SqlConnection& operator*() const { return *_connection; }

        private:
            ScopedConnection(const ScopedConnection&) = delete;
            ScopedConnection& operator=(const ScopedConnection&) = delete;

            Wt::Dbo::SqlConnectionPool& _connectionPool;
            std::unique_ptr<Wt::Dbo::SqlConnection> _connection;
        };

        std::shared_mutex _sharedMutex;
        std::unique_ptr<Wt::Dbo::SqlConnectionPool> _connectionPool;

        std::mutex _sessionsMutex;
        std::map<std::thread::id, std::unique_ptr<Session>> _sessions;
    };
} // namespace mtg::db
