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

#include <cstdint>
#include <set>
#include <string>
#include <string_view>

#include "transfer/MediaCategory.hpp"

namespace mtg::transfer
{
    // Size and type limits of a media category, resolved once per request
    struct CategoryPolicy
    {
        std::uint64_t maxSizeBytes{};
        std::set<std::string> allowedContentTypes; // normalized

        bool isContentTypeAllowed(std::string_view contentType) const;
    };

    // lower case, without parameters: "Audio/MPEG; foo=bar" -> "audio/mpeg"
    std::string normalizeContentType(std::string_view contentType);

    CategoryPolicy getDefaultCategoryPolicy(MediaCategory category);
} // namespace mtg::transfer
