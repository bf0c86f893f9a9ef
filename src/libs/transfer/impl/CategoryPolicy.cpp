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

#include "transfer/CategoryPolicy.hpp"

#include "core/SizeLiterals.hpp"
#include "core/String.hpp"

namespace mtg::transfer
{
    using namespace core::literals;

    bool CategoryPolicy::isContentTypeAllowed(std::string_view contentType) const
    {
        const std::string normalized{ normalizeContentType(contentType) };
        if (normalized.empty())
            return false;

        return allowedContentTypes.contains(normalized);
    }

    std::string normalizeContentType(std::string_view contentType)
    {
        if (const std::size_t pos{ contentType.find(';') }; pos != std::string_view::npos)
            contentType = contentType.substr(0, pos);

        return core::stringUtils::stringToLower(core::stringUtils::stringTrim(contentType, " \t"));
    }

    CategoryPolicy getDefaultCategoryPolicy(MediaCategory category)
    {
        switch (category)
        {
        case MediaCategory::Book:
            return CategoryPolicy{ 100_MiB, { "application/pdf", "application/epub+zip", "application/x-mobipocket-ebook" } };
        case MediaCategory::Audio:
            return CategoryPolicy{ 500_MiB, { "audio/mpeg", "audio/mp3", "audio/wav", "audio/x-wav", "audio/ogg", "audio/mp4", "audio/x-m4a", "audio/flac", "audio/x-flac", "audio/aac", "audio/webm" } };
        case MediaCategory::Video:
            return CategoryPolicy{ 2_GiB, { "video/mp4", "video/webm", "video/ogg", "video/quicktime", "video/x-matroska", "video/x-msvideo" } };
        case MediaCategory::Image:
            return CategoryPolicy{ 100_MiB, { "image/jpeg", "image/png", "image/webp", "image/gif", "image/svg+xml", "image/bmp", "image/avif", "image/heic" } };
        case MediaCategory::Cover:
            return CategoryPolicy{ 5_MiB, { "image/jpeg", "image/png", "image/webp", "image/gif" } };
        }
        return CategoryPolicy{};
    }
} // namespace mtg::transfer
