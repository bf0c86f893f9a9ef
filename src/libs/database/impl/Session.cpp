/*
 * Copyright (C) 2013 Emeric Poupon
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

#include "database/Session.hpp"

#include "core/ILogger.hpp"

#include "database/objects/CategorySettings.hpp"
#include "database/objects/MediaRecord.hpp"

#include "Db.hpp"
#include "Utils.hpp"

namespace mtg::db
{
    Session::Session(IDb& db)
        : _db{ db }
    {
        _session.setConnectionPool(static_cast<Db&>(_db).getConnectionPool());

        _session.mapClass<CategorySettings>("category_settings");
        _session.mapClass<MediaRecord>("media_record");
    }

    WriteTransaction Session::createWriteTransaction()
    {
        return WriteTransaction{ static_cast<Db&>(_db).getMutex(), _session };
    }

    ReadTransaction Session::createReadTransaction()
    {
        return ReadTransaction{ _session };
    }

    void Session::execute(std::string_view statement)
    {
        utils::executeCommand(_session, std::string{ statement });
    }

    void Session::prepareTablesIfNeeded()
    {
        MTG_LOG(DB, INFO, "Preparing tables...");

        // Initial creation case
        try
        {
            auto transaction{ createWriteTransaction() };
            _session.createTables();
            MTG_LOG(DB, INFO, "Tables created");
        }
        catch (Wt::Dbo::Exception& e)
        {
            MTG_LOG(DB, DEBUG, "Cannot create tables: " << e.what());
            if (std::string_view{ e.what() }.find("already exists") == std::string_view::npos)
            {
                MTG_LOG(DB, ERROR, "Cannot create tables: " << e.what());
                throw;
            }
        }
    }

    void Session::createIndexesIfNeeded()
    {
        MTG_LOG(DB, INFO, "Creating indexes...");

        {
            auto transaction{ createWriteTransaction() };
            utils::executeCommand(_session, "CREATE UNIQUE INDEX IF NOT EXISTS category_settings_category_idx ON category_settings(category)");

            utils::executeCommand(_session, "CREATE UNIQUE INDEX IF NOT EXISTS media_record_record_id_idx ON media_record(record_id)");
            utils::executeCommand(_session, "CREATE INDEX IF NOT EXISTS media_record_owner_idx ON media_record(owner_id)");
        }

        MTG_LOG(DB, INFO, "Indexes created!");
    }
} // namespace mtg::db
