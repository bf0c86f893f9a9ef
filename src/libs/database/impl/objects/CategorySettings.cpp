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

#include "database/objects/CategorySettings.hpp"

#include <Wt/Dbo/Impl.h>

#include "core/String.hpp"
#include "database/Session.hpp"

#include "Utils.hpp"
#include "traits/IdTypeTraits.hpp"

DBO_INSTANTIATE_TEMPLATES(mtg::db::CategorySettings)

namespace mtg::db
{
    CategorySettings::CategorySettings(std::string_view category)
        : _category{ category }
    {
    }

    CategorySettings::pointer CategorySettings::create(Session& session, std::string_view category)
    {
        return session.getDboSession()->add(std::unique_ptr<CategorySettings>(new CategorySettings{ category }));
    }

    std::size_t CategorySettings::getCount(Session& session)
    {
        return utils::fetchQuerySingleResult(session.getDboSession()->query<int>("SELECT COUNT(*) FROM category_settings"));
    }

    CategorySettings::pointer CategorySettings::find(Session& session, CategorySettingsId id)
    {
        return utils::fetchQuerySingleResult(session.getDboSession()->find<CategorySettings>().where("id = ?").bind(id));
    }

    CategorySettings::pointer CategorySettings::find(Session& session, std::string_view category)
    {
        return utils::fetchQuerySingleResult(session.getDboSession()->find<CategorySettings>().where("category = ?").bind(std::string{ category }));
    }

    std::vector<std::string_view> CategorySettings::getAllowedContentTypes() const
    {
        std::vector<std::string_view> contentTypes{ core::stringUtils::splitString(_allowedContentTypes, " ,") };
        std::erase_if(contentTypes, [](std::string_view contentType) { return contentType.empty(); });

        return contentTypes;
    }

    void CategorySettings::setAllowedContentTypes(std::span<const std::string_view> contentTypes)
    {
        _allowedContentTypes = core::stringUtils::joinStrings(contentTypes, " ");
    }
} // namespace mtg::db
