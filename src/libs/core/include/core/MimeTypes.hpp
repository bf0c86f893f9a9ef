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

#pragma once

#include <filesystem>
#include <optional>
#include <string_view>

namespace mtg::core
{
    // fileExtension includes the leading dot, case insensitive
    // returns "application/octet-stream" if unknown
    std::string_view getMimeType(const std::filesystem::path& fileExtension);

    // preferred file extension (without dot) for a mime type, parameters such as "; charset=" are ignored
    std::optional<std::string_view> getFileExtension(std::string_view mimeType);
} // namespace mtg::core
