/*
 * Copyright (C) 2024 Emeric Poupon
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

#include "core/MimeTypes.hpp"

#include <algorithm>
#include <string>
#include <unordered_map>
#include <utility>

#include "core/String.hpp"

namespace mtg::core
{
    namespace
    {
        struct MimeTypeEntry
        {
            std::string_view extension;
            std::string_view mimeType;
        };

        // First entry for a given mime type is its preferred extension
        constexpr MimeTypeEntry mimeTypeEntries[]{
            // audio
            { "mp3", "audio/mpeg" },
            { "mp3", "audio/mp3" },
            { "aac", "audio/aac" },
            { "flac", "audio/flac" },
            { "flac", "audio/x-flac" },
            { "m4a", "audio/mp4" },
            { "m4a", "audio/x-m4a" },
            { "m4b", "audio/mp4" },
            { "oga", "audio/ogg" },
            { "ogg", "audio/ogg" },
            { "opus", "audio/opus" },
            { "wav", "audio/wav" },
            { "wav", "audio/x-wav" },
            { "weba", "audio/webm" },

            // books
            { "pdf", "application/pdf" },
            { "epub", "application/epub+zip" },
            { "mobi", "application/x-mobipocket-ebook" },

            // image
            { "avif", "image/avif" },
            { "bmp", "image/bmp" },
            { "gif", "image/gif" },
            { "heic", "image/heic" },
            { "jpg", "image/jpeg" },
            { "jpeg", "image/jpeg" },
            { "png", "image/png" },
            { "svg", "image/svg+xml" },
            { "webp", "image/webp" },

            // video
            { "avi", "video/x-msvideo" },
            { "mkv", "video/x-matroska" },
            { "mov", "video/quicktime" },
            { "mp4", "video/mp4" },
            { "m4v", "video/mp4" },
            { "ogv", "video/ogg" },
            { "webm", "video/webm" },
        };

        std::string_view stripMimeTypeParameters(std::string_view mimeType)
        {
            const std::size_t pos{ mimeType.find(';') };
            if (pos != std::string_view::npos)
                mimeType = mimeType.substr(0, pos);

            return stringUtils::stringTrim(mimeType, " \t");
        }
    } // namespace

    std::string_view getMimeType(const std::filesystem::path& fileExtension)
    {
        static const std::unordered_map<std::string, std::string_view> entries{ [] {
            std::unordered_map<std::string, std::string_view> res;
            for (const MimeTypeEntry& entry : mimeTypeEntries)
                res.emplace("." + std::string{ entry.extension }, entry.mimeType); // first one wins
            return res;
        }() };

        auto it{ entries.find(stringUtils::stringToLower(fileExtension.string())) };
        if (it == std::cend(entries))
            return "application/octet-stream";

        return it->second;
    }

    std::optional<std::string_view> getFileExtension(std::string_view mimeType)
    {
        const std::string normalized{ stringUtils::stringToLower(stripMimeTypeParameters(mimeType)) };

        auto it{ std::find_if(std::cbegin(mimeTypeEntries), std::cend(mimeTypeEntries), [&](const MimeTypeEntry& entry) { return entry.mimeType == normalized; }) };
        if (it == std::cend(mimeTypeEntries))
            return std::nullopt;

        return it->extension;
    }
} // namespace mtg::core
