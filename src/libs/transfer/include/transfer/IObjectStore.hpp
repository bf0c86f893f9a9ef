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
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "transfer/RangeParser.hpp"

namespace mtg::transfer
{
    enum class StoreResult
    {
        Ok,
        NotFound,
        Error,
    };

    struct ObjectMetadata
    {
        std::uint64_t sizeBytes{};
        std::string contentType; // may be empty
    };

    // Pull based stream of object bytes
    class IByteStream
    {
    public:
        virtual ~IByteStream() = default;

        // data is valid until the next call to asyncRead or the destruction of the stream, cancel leaves it untouched
        // end of stream is an empty span with StoreResult::Ok
        using ReadCallback = std::function<void(StoreResult result, std::span<const std::byte> data)>;

        // At most one read in flight
        virtual void asyncRead(std::size_t maxBytes, ReadCallback callback) = 0;

        // Releases the underlying handle, a pending read completes silently (callback never called)
        virtual void cancel() = 0;
    };

    // Callbacks may be called from any thread, the store must be usable concurrently
    // No timeout is enforced here: callers bound every call
    class IObjectStore
    {
    public:
        virtual ~IObjectStore() = default;

        using HeadCallback = std::function<void(StoreResult result, const ObjectMetadata& metadata)>;
        virtual void asyncHead(std::string_view key, HeadCallback callback) = 0;

        // no range means whole object
        using GetRangeCallback = std::function<void(StoreResult result, std::unique_ptr<IByteStream> stream)>;
        virtual void asyncGetRange(std::string_view key, std::optional<ByteRange> range, GetRangeCallback callback) = 0;

        // The source file may be removed as soon as the callback is called
        using CompletionCallback = std::function<void(StoreResult result)>;
        virtual void asyncPut(std::string_view key, const std::filesystem::path& sourceFile, std::string_view contentType, CompletionCallback callback) = 0;
        virtual void asyncRemove(std::string_view key, CompletionCallback callback) = 0;

        virtual void asyncCheckHealth(CompletionCallback callback) = 0;
    };
} // namespace mtg::transfer
