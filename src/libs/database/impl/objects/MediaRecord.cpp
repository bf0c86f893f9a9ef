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

#include "database/objects/MediaRecord.hpp"

#include <Wt/Dbo/Impl.h>

#include "database/Session.hpp"

#include "Utils.hpp"
#include "traits/IdTypeTraits.hpp"

DBO_INSTANTIATE_TEMPLATES(mtg::db::MediaRecord)

namespace mtg::db
{
    MediaRecord::MediaRecord(std::string_view recordId, std::string_view ownerId, std::string_view category, std::string_view storageKey)
        : _recordId{ recordId }
        , _ownerId{ ownerId }
        , _category{ category }
        , _storageKey{ storageKey }
    {
    }

    MediaRecord::pointer MediaRecord::create(Session& session, std::string_view recordId, std::string_view ownerId, std::string_view category, std::string_view storageKey)
    {
        return session.getDboSession()->add(std::unique_ptr<MediaRecord>(new MediaRecord{ recordId, ownerId, category, storageKey }));
    }

    MediaRecord::pointer MediaRecord::find(Session& session, MediaRecordId id)
    {
        return utils::fetchQuerySingleResult(session.getDboSession()->find<MediaRecord>().where("id = ?").bind(id));
    }

    MediaRecord::pointer MediaRecord::find(Session& session, std::string_view recordId)
    {
        return utils::fetchQuerySingleResult(session.getDboSession()->find<MediaRecord>().where("record_id = ?").bind(std::string{ recordId }));
    }

    std::size_t MediaRecord::getCount(Session& session)
    {
        return utils::fetchQuerySingleResult(session.getDboSession()->query<int>("SELECT COUNT(*) FROM media_record"));
    }
} // namespace mtg::db
