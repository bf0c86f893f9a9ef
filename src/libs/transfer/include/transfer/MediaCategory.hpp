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

#include <array>
#include <optional>
#include <string_view>

namespace mtg::transfer
{
    enum class MediaCategory
    {
        Book,
        Audio,
        Video,
        Image,
        Cover,
    };

    constexpr std::array<MediaCategory, 5> mediaCategories{ MediaCategory::Book, MediaCategory::Audio, MediaCategory::Video, MediaCategory::Image, MediaCategory::Cover };

    // name used in requests, config and database: "book", "audio", ...
    std::string_view getCategoryName(MediaCategory category);
    // first segment of the storage keys: "books", "audio", ...
    std::string_view getKeyPrefix(MediaCategory category);

    std::optional<MediaCategory> parseCategoryName(std::string_view name);
} // namespace mtg::transfer
