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

#include "transfer/MediaCategory.hpp"

namespace mtg::transfer
{
    std::string_view getCategoryName(MediaCategory category)
    {
        switch (category)
        {
        case MediaCategory::Book:
            return "book";
        case MediaCategory::Audio:
            return "audio";
        case MediaCategory::Video:
            return "video";
        case MediaCategory::Image:
            return "image";
        case MediaCategory::Cover:
            return "cover";
        }
        return "";
    }

    std::string_view getKeyPrefix(MediaCategory category)
    {
        switch (category)
        {
        case MediaCategory::Book:
            return "books";
        case MediaCategory::Audio:
            return "audio";
        case MediaCategory::Video:
            return "video";
        case MediaCategory::Image:
            return "images";
        case MediaCategory::Cover:
            return "covers";
        }
        return "";
    }

    std::optional<MediaCategory> parseCategoryName(std::string_view name)
    {
        for (const MediaCategory category : mediaCategories)
        {
            if (getCategoryName(category) == name)
                return category;
        }

        return std::nullopt;
    }
} // namespace mtg::transfer
