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
#include <filesystem>
#include <fstream>
#include <span>
#include <string_view>

namespace mtg::core
{
    // Uniquely named file, removed from disk when the object is destroyed
    class TemporaryFile
    {
    public:
        // throws MtgException if the file cannot be created
        TemporaryFile(const std::filesystem::path& directory, std::string_view prefix = "mtg-");
        ~TemporaryFile();
        TemporaryFile(const TemporaryFile&) = delete;
        TemporaryFile& operator=(const TemporaryFile&) = delete;

        const std::filesystem::path& getPath() const { return _path; }
        std::uint64_t getWrittenBytes() const { return _writtenBytes; }

        // throws MtgException on write error
        void write(std::span<const char> data);
        // flushes and closes the file, no more writes allowed
        void close();

    private:
        std::filesystem::path _path;
        std::ofstream _stream;
        std::uint64_t _writtenBytes{};
    };
} // namespace mtg::core
