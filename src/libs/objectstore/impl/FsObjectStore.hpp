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

#include <filesystem>

#include <boost/asio/io_context.hpp>

#include "core/IOContextRunner.hpp"
#include "transfer/IObjectStore.hpp"

namespace mtg::objectstore
{
    class FsObjectStore final : public transfer::IObjectStore
    {
    public:
        FsObjectStore(const std::filesystem::path& rootDirectory, std::size_t threadCount);
        ~FsObjectStore() override;
        FsObjectStore(const FsObjectStore&) = delete;
        FsObjectStore& operator=(const FsObjectStore&) = delete;

    private:
        void asyncHead(std::string_view key, HeadCallback callback) override;
        void asyncGetRange(std::string_view key, std::optional<transfer::ByteRange> range, GetRangeCallback callback) override;
        void asyncPut(std::string_view key, const std::filesystem::path& sourceFile, std::string_view contentType, CompletionCallback callback) override;
        void asyncRemove(std::string_view key, CompletionCallback callback) override;
        void asyncCheckHealth(CompletionCallback callback) override;

        transfer::StoreResult head(const std::string& key, transfer::ObjectMetadata& metadata) const;
        transfer::StoreResult openStream(const std::string& key, std::optional<transfer::ByteRange> range, std::unique_ptr<transfer::IByteStream>& stream);
        transfer::StoreResult put(const std::string& key, const std::filesystem::path& sourceFile, std::string_view contentType) const;
        transfer::StoreResult remove(const std::string& key) const;
        transfer::StoreResult checkHealth() const;

        std::filesystem::path getObjectPath(std::string_view key) const;
        std::filesystem::path getMetadataPath(std::string_view key) const;

        const std::filesystem::path _objectsDirectory;
        const std::filesystem::path _metadataDirectory;
        boost::asio::io_context _ioContext;
        core::IOContextRunner _ioContextRunner;
    };
} // namespace mtg::objectstore
