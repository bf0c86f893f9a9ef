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

#include "Db.hpp"

#include <functional>

#include <Wt/Dbo/FixedSqlConnectionPool.h>
#include <Wt/Dbo/backend/Sqlite3.h>

#include "core/Exception.hpp"
#include "core/IConfig.hpp"
#include "core/ILogger.hpp"
#include "core/Service.hpp"
#include "database/Session.hpp"

namespace mtg::db
{
    namespace
    {
        class Connection : public Wt::Dbo::backend::Sqlite3
        {
        public:
            Connection(const std::filesystem::path& dbPath)
                : Wt::Dbo::backend::Sqlite3{ dbPath.string() }
                , _dbPath{ dbPath }
            {
                prepare();
            }

            Connection(const Connection& other)
                : Wt::Dbo::backend::Sqlite3{ other }
                , _dbPath{ other._dbPath }
            {
                prepare();
            }
            ~Connection() override = default;

        private:
            Connection& operator=(const Connection&) = delete;
            Connection(Connection&&) = delete;
            Connection&& operator=(Connection&&) = delete;

            std::unique_ptr<SqlConnection> clone() const override
            {
                return std::make_unique<Connection>(*this);
            }

            void prepare()
            {
                // the records database is shared with other writers
                executeSql("PRAGMA journal_mode=WAL");
                executeSql("PRAGMA synchronous=normal");
                executeSql("PRAGMA busy_timeout=5000");
            }

            std::filesystem::path _dbPath;
        };

        enum class IntegrityCheckType
        {
            Quick,
            Full
        };
        bool checkDbIntegrity(Wt::Dbo::SqlConnection& connection, IntegrityCheckType checkType, std::function<void(std::string_view error)> errorCallback)
        {
            bool integrityCheckPassed{};

            auto statement = connection.prepareStatement(checkType == IntegrityCheckType::Full ? "PRAGMA integrity_check" : "PRAGMA quick_check");
            statement->execute();

            std::string result;
            result.reserve(32);
            while (statement->nextRow())
            {
                result.clear();
                statement->getResult(0, &result, static_cast<int>(result.capacity()));

                if (result == "ok")
                {
                    integrityCheckPassed = true;
                    break;
                }

                errorCallback(result);
            }

            return integrityCheckPassed;
        }

        void getCompileOptions(Wt::Dbo::SqlConnection& connection, std::function<void(std::string_view compileOption)> callback)
        {
            auto statement = connection.prepareStatement("PRAGMA compile_options");
            statement->execute();

            std::string res;
            while (statement->nextRow())
            {
                res.clear();

                if (statement->getResult(0, &res, static_cast<int>(res.capacity())))
                    callback(res);
            }
        }
    } // namespace

    std::unique_ptr<IDb> createDb(const std::filesystem::path& dbPath, std::size_t connectionCount)
    {
        return std::make_unique<Db>(dbPath, connectionCount);
    }

    Db::Db(const std::filesystem::path& dbPath, std::size_t connectionCount)
    {
        std::string checkType{ "quick" };
        MTG_LOG(DB, INFO, "Creating connection pool on file " << dbPath);

        auto connection{ std::make_unique<Connection>(dbPath) };
        if (core::IConfig * config{ core::Service<core::IConfig>::get() }) // may not be here on testU
        {
            connection->setProperty("show-queries", config->getBool("db-show-queries", false) ? "true" : "false");
            checkType = config->getString("db-integrity-check", "quick");
        }

        auto connectionPool{ std::make_unique<Wt::Dbo::FixedSqlConnectionPool>(std::move(connection), static_cast<int>(connectionCount)) };
        connectionPool->setTimeout(std::chrono::seconds{ 10 });

        _connectionPool = std::move(connectionPool);

        logCompileOptions();
        if (checkType == "quick")
            performQuickCheck();
        else if (checkType == "full")
            performIntegrityCheck();
        else if (checkType != "none")
            throw core::MtgException{ "Invalid 'db-integrity-check' value: '" + checkType + "'. Expected 'quick', 'full' or 'none'." };
    }

    Db::~Db() = default;

    void Db::executeSql(const std::string& sql)
    {
        ScopedConnection connection{ *_connectionPool };
        connection->executeSql(sql);
    }

    Session& Db::getTLSSession()
    {
        std::scoped_lock lock{ _sessionsMutex };

        std::unique_ptr<Session>& session{ _sessions[std::this_thread::get_id()] };
        if (!session)
            session = std::make_unique<Session>(*this);

        return *session;
    }

    void Db::logCompileOptions()
    {
        ScopedConnection connection{ *_connectionPool };

        MTG_LOG(DB, DEBUG, "Sqlite3 compile options:");
        getCompileOptions(*connection, [](std::string_view compileOption) {
            MTG_LOG(DB, DEBUG, compileOption);
        });
    }

    void Db::performQuickCheck()
    {
        ScopedConnection connection{ *_connectionPool };

        MTG_LOG(DB, INFO, "Performing quick database check...");

        const bool quickCheckPassed{ checkDbIntegrity(*connection, IntegrityCheckType::Quick, [&](std::string_view error) {
            MTG_LOG(DB, ERROR, "Quick check error: " << error);
        }) };

        if (quickCheckPassed)
            MTG_LOG(DB, INFO, "Quick database check passed!");
        else
            MTG_LOG(DB, ERROR, "Quick database check done with errors!");
    }

    void Db::performIntegrityCheck()
    {
        ScopedConnection connection{ *_connectionPool };

        MTG_LOG(DB, INFO, "Checking database integrity...");

        const bool integrityCheckPassed{ checkDbIntegrity(*connection, IntegrityCheckType::Full, [&](std::string_view error) {
            MTG_LOG(DB, ERROR, "Integrity check error: " << error);
        }) };

        if (integrityCheckPassed)
            MTG_LOG(DB, INFO, "Database integrity check passed!");
        else
            MTG_LOG(DB, ERROR, "Database integrity check done with errors!");
    }

    Db::ScopedConnection::ScopedConnection(Wt::Dbo::SqlConnectionPool& pool)
        : _connectionPool{ pool }
        , _connection{ _connectionPool.getConnection() }
    {
    }

    Db::ScopedConnection::~ScopedConnection()
    {
        _connectionPool.returnConnection(std::move(_connection));
    }

    Wt::Dbo::SqlConnection* Db::ScopedConnection::operator->() const
    {
        return _connection.get();
    }
} // namespace mtg::db
