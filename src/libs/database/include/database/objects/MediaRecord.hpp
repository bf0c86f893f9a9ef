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

#include <cstddef>
#include <string>
#include <string_view>

#include <Wt/Dbo/Field.h>

#include "database/IdType.hpp"
#include "database/Object.hpp"

MTG_DECLARE_IDTYPE(MediaRecordId)

namespace mtg::db
{
    class Session;

    // Row of the shared records table: who owns an object and where it is stored
    class MediaRecord final : public Object<MediaRecord, MediaRecordId>
    {
    public:
        MediaRecord() = default;

        static pointer find(Session& session, MediaRecordId id);
        static pointer find(Session& session, std::string_view recordId);
        static std::size_t getCount(Session& session);

        // Getters
        const std::string& getRecordId() const { return _recordId; }
        const std::string& getOwnerId() const { return _ownerId; }
        const std::string& getCategory() const { return _category; }
        const std::string& getStorageKey() const { return _storageKey; }

        // Setters
        void setStorageKey(std::string_view storageKey) { _storageKey = storageKey; }

        template<class Action>
        void persist(Action& a)
        {
            Wt::Dbo::field(a, _recordId, "record_id");
            Wt::Dbo::field(a, _ownerId, "owner_id");
            Wt::Dbo::field(a, _category, "category");
            Wt::Dbo::field(a, _storageKey, "storage_key");
        }

    private:
        friend class Session;

        MediaRecord(std::string_view recordId, std::string_view ownerId, std::string_view category, std::string_view storageKey);
        static pointer create(Session& session, std::string_view recordId, std::string_view ownerId, std::string_view category, std::string_view storageKey);

        std::string _recordId;
        std::string _ownerId;
        std::string _category;
        std::string _storageKey;
    };
} // namespace mtg::db
