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
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <Wt/Dbo/Field.h>

#include "database/IdType.hpp"
#include "database/Object.hpp"

MTG_DECLARE_IDTYPE(CategorySettingsId)

namespace mtg::db
{
    class Session;

    // Upload limits of a media category, editable while the gateway runs
    class CategorySettings final : public Object<CategorySettings, CategorySettingsId>
    {
    public:
        CategorySettings() = default;

        static std::size_t getCount(Session& session);
        static pointer find(Session& session, CategorySettingsId id);
        static pointer find(Session& session, std::string_view category);

        // Getters
        const std::string& getCategory() const { return _category; }
        std::uint64_t getMaxSizeBytes() const { return static_cast<std::uint64_t>(_maxSizeBytes); }
        std::vector<std::string_view> getAllowedContentTypes() const;

        // Setters
        void setMaxSizeBytes(std::uint64_t maxSizeBytes) { _maxSizeBytes = static_cast<long long>(maxSizeBytes); }
        void setAllowedContentTypes(std::span<const std::string_view> contentTypes);

        template<class Action>
        void persist(Action& a)
        {
            Wt::Dbo::field(a, _category, "category");
            Wt::Dbo::field(a, _maxSizeBytes, "max_size_bytes");
            Wt::Dbo::field(a, _allowedContentTypes, "allowed_content_types");
        }

    private:
        friend class Session;

        CategorySettings(std::string_view category);
        static pointer create(Session& session, std::string_view category);

        std::string _category;
        long long _maxSizeBytes{};
        std::string _allowedContentTypes; // space separated
    };
} // namespace mtg::db
