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

#include "core/TemporaryFile.hpp"

#include <unistd.h>

#include <cerrno>
#include <string>
#include <system_error>
#include <vector>

#include "core/Exception.hpp"
#include "core/ILogger.hpp"

namespace mtg::core
{
    TemporaryFile::TemporaryFile(const std::filesystem::path& directory, std::string_view prefix)
    {
        const std::string pattern{ (directory / (std::string{ prefix } + "XXXXXX")).string() };
        std::vector<char> pathBuffer(std::cbegin(pattern), std::cend(pattern));
        pathBuffer.push_back('\0');

        const int fd{ ::mkstemp(pathBuffer.data()) };
        if (fd < 0)
        {
            const std::error_code ec{ errno, std::generic_category() };
            throw MtgException{ "Cannot create temporary file in '" + directory.string() + "': " + ec.message() };
        }
        ::close(fd);

        _path = pathBuffer.data();
        _stream.open(_path, std::ios::out | std::ios::binary | std::ios::trunc);
        if (!_stream)
        {
            std::error_code ec;
            std::filesystem::remove(_path, ec);
            throw MtgException{ "Cannot open temporary file '" + _path.string() + "'" };
        }
    }

    TemporaryFile::~TemporaryFile()
    {
        if (_stream.is_open())
            _stream.close();

        std::error_code ec;
        std::filesystem::remove(_path, ec);
        if (ec)
            MTG_LOG(UTILS, ERROR, "Cannot remove temporary file '" << _path.string() << "': " << ec.message());
    }

    void TemporaryFile::write(std::span<const char> data)
    {
        if (!_stream.is_open())
            throw MtgException{ "Temporary file '" + _path.string() + "' is closed" };

        _stream.write(data.data(), static_cast<std::streamsize>(data.size()));
        if (!_stream)
            throw MtgException{ "Write error in temporary file '" + _path.string() + "'" };

        _writtenBytes += data.size();
    }

    void TemporaryFile::close()
    {
        if (!_stream.is_open())
            return;

        _stream.flush();
        const bool failed{ !_stream };
        _stream.close();
        if (failed)
            throw MtgException{ "Flush error in temporary file '" + _path.string() + "'" };
    }
} // namespace mtg::core
