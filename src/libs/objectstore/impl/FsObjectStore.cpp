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

#include "FsObjectStore.hpp"

#include <algorithm>
#include <fstream>
#include <mutex>
#include <vector>

#include <boost/asio/post.hpp>

#include "core/Exception.hpp"
#include "core/ILogger.hpp"
#include "core/UUID.hpp"
#include "objectstore/FsObjectStore.hpp"

#define LOG(sev, message) MTG_LOG(STORE, sev, "[FsObjectStore] - " << message)

namespace mtg::objectstore
{
    using transfer::ByteRange;
    using transfer::ObjectMetadata;
    using transfer::StoreResult;

    namespace
    {
        class FsByteStream final : public transfer::IByteStream
        {
        public:
            FsByteStream(boost::asio::io_context& ioContext, std::ifstream ifs, std::uint64_t size)
                : _ioContext{ ioContext }
                , _state{ std::make_shared<State>(std::move(ifs), size) }
            {
            }

            ~FsByteStream() override
            {
                cancel();
            }
            FsByteStream(const FsByteStream&) = delete;
            FsByteStream& operator=(const FsByteStream&) = delete;

        private:
            void asyncRead(std::size_t maxBytes, ReadCallback callback) override
            {
                boost::asio::post(_ioContext, [state = _state, maxBytes, callback = std::move(callback)] {
                    // held while calling back: a cancelled stream never calls back
                    std::scoped_lock lock{ state->mutex };
                    if (state->cancelled)
                        return;

                    const std::size_t readSize{ static_cast<std::size_t>(std::min<std::uint64_t>(maxBytes, state->remainingBytes)) };
                    if (readSize == 0)
                    {
                        callback(StoreResult::Ok, {});
                        return;
                    }

                    state->buffer.resize(readSize);
                    state->ifs.read(reinterpret_cast<char*>(state->buffer.data()), static_cast<std::streamsize>(readSize));
                    const std::size_t readCount{ static_cast<std::size_t>(state->ifs.gcount()) };
                    if (readCount == 0)
                    {
                        if (state->ifs.bad())
                        {
                            LOG(ERROR, "Read error");
                            callback(StoreResult::Error, {});
                        }
                        else
                            callback(StoreResult::Ok, {}); // file shrunk meanwhile

                        return;
                    }

                    state->remainingBytes -= readCount;
                    callback(StoreResult::Ok, std::span<const std::byte>{ state->buffer.data(), readCount });
                });
            }

            void cancel() override
            {
                std::scoped_lock lock{ _state->mutex };
                if (_state->cancelled)
                    return;

                _state->cancelled = true;
                _state->ifs.close();
            }

            struct State
            {
                State(std::ifstream stream, std::uint64_t size)
                    : ifs{ std::move(stream) }
                    , remainingBytes{ size }
                {
                }

                std::mutex mutex;
                std::ifstream ifs;
                std::uint64_t remainingBytes;
                bool cancelled{};
                std::vector<std::byte> buffer;
            };

            boost::asio::io_context& _ioContext;
            const std::shared_ptr<State> _state;
        };

        std::filesystem::path getTemporarySibling(const std::filesystem::path& path)
        {
            std::filesystem::path tmpPath{ path };
            tmpPath += ".tmp-";
            tmpPath += core::UUID::generate().getAsString();
            return tmpPath;
        }

        // write to a temporary sibling, then rename over the destination
        bool atomicCopy(const std::filesystem::path& source, const std::filesystem::path& destination)
        {
            const std::filesystem::path tmpPath{ getTemporarySibling(destination) };

            std::error_code ec;
            std::filesystem::copy_file(source, tmpPath, std::filesystem::copy_options::overwrite_existing, ec);
            if (!ec)
                std::filesystem::rename(tmpPath, destination, ec);

            if (ec)
            {
                LOG(ERROR, "Cannot write " << destination << ": " << ec.message());

                std::error_code removeEc;
                std::filesystem::remove(tmpPath, removeEc);
                return false;
            }

            return true;
        }

        bool atomicWrite(std::string_view content, const std::filesystem::path& destination)
        {
            const std::filesystem::path tmpPath{ getTemporarySibling(destination) };
            {
                std::ofstream ofs{ tmpPath, std::ios::out | std::ios::binary | std::ios::trunc };
                ofs.write(content.data(), static_cast<std::streamsize>(content.size()));
                if (!ofs)
                {
                    LOG(ERROR, "Cannot write " << tmpPath);
                    std::error_code ec;
                    std::filesystem::remove(tmpPath, ec);
                    return false;
                }
            }

            std::error_code ec;
            std::filesystem::rename(tmpPath, destination, ec);
            if (ec)
            {
                LOG(ERROR, "Cannot rename " << tmpPath << ": " << ec.message());
                std::filesystem::remove(tmpPath, ec);
                return false;
            }

            return true;
        }

        bool isMissingFileError(const std::error_code& ec)
        {
            return ec == std::errc::no_such_file_or_directory || ec == std::errc::not_a_directory;
        }
    } // namespace

    std::unique_ptr<transfer::IObjectStore> createFsObjectStore(const std::filesystem::path& rootDirectory, std::size_t threadCount)
    {
        return std::make_unique<FsObjectStore>(rootDirectory, threadCount);
    }

    FsObjectStore::FsObjectStore(const std::filesystem::path& rootDirectory, std::size_t threadCount)
        : _objectsDirectory{ rootDirectory / "objects" }
        , _metadataDirectory{ rootDirectory / "meta" }
        , _ioContextRunner{ _ioContext, threadCount, "ObjectStore" }
    {
        for (const std::filesystem::path& directory : { _objectsDirectory, _metadataDirectory })
        {
            std::error_code ec;
            std::filesystem::create_directories(directory, ec);
            if (ec)
                throw core::MtgException{ "Cannot create directory '" + directory.string() + "': " + ec.message() };
        }

        LOG(INFO, "Using " << rootDirectory << ", thread count = " << threadCount);
    }

    FsObjectStore::~FsObjectStore()
    {
        _ioContextRunner.stop();
    }

    void FsObjectStore::asyncHead(std::string_view key, HeadCallback callback)
    {
        boost::asio::post(_ioContext, [this, key = std::string{ key }, callback = std::move(callback)] {
            ObjectMetadata metadata;
            const StoreResult result{ head(key, metadata) };
            callback(result, metadata);
        });
    }

    void FsObjectStore::asyncGetRange(std::string_view key, std::optional<ByteRange> range, GetRangeCallback callback)
    {
        boost::asio::post(_ioContext, [this, key = std::string{ key }, range, callback = std::move(callback)] {
            std::unique_ptr<transfer::IByteStream> stream;
            const StoreResult result{ openStream(key, range, stream) };
            callback(result, std::move(stream));
        });
    }

    void FsObjectStore::asyncPut(std::string_view key, const std::filesystem::path& sourceFile, std::string_view contentType, CompletionCallback callback)
    {
        boost::asio::post(_ioContext, [this, key = std::string{ key }, sourceFile, contentType = std::string{ contentType }, callback = std::move(callback)] {
            callback(put(key, sourceFile, contentType));
        });
    }

    void FsObjectStore::asyncRemove(std::string_view key, CompletionCallback callback)
    {
        boost::asio::post(_ioContext, [this, key = std::string{ key }, callback = std::move(callback)] {
            callback(remove(key));
        });
    }

    void FsObjectStore::asyncCheckHealth(CompletionCallback callback)
    {
        boost::asio::post(_ioContext, [this, callback = std::move(callback)] {
            callback(checkHealth());
        });
    }

    StoreResult FsObjectStore::head(const std::string& key, ObjectMetadata& metadata) const
    {
        const std::filesystem::path objectPath{ getObjectPath(key) };

        std::error_code ec;
        const std::filesystem::file_status status{ std::filesystem::status(objectPath, ec) };
        if (ec)
        {
            if (isMissingFileError(ec))
                return StoreResult::NotFound;

            LOG(ERROR, "Cannot stat " << objectPath << ": " << ec.message());
            return StoreResult::Error;
        }

        if (!std::filesystem::is_regular_file(status))
            return StoreResult::NotFound;

        metadata.sizeBytes = std::filesystem::file_size(objectPath, ec);
        if (ec)
        {
            LOG(ERROR, "Cannot get size of " << objectPath << ": " << ec.message());
            return StoreResult::Error;
        }

        // no metadata is not an error: the content type is derived from the key
        std::ifstream metadataStream{ getMetadataPath(key) };
        if (metadataStream)
            std::getline(metadataStream, metadata.contentType);

        return StoreResult::Ok;
    }

    StoreResult FsObjectStore::openStream(const std::string& key, std::optional<ByteRange> range, std::unique_ptr<transfer::IByteStream>& stream)
    {
        ObjectMetadata metadata;
        const StoreResult result{ head(key, metadata) };
        if (result != StoreResult::Ok)
            return result;

        const std::filesystem::path objectPath{ getObjectPath(key) };
        std::ifstream ifs{ objectPath, std::ios::in | std::ios::binary };
        if (!ifs)
        {
            LOG(ERROR, "Cannot open " << objectPath);
            return StoreResult::Error;
        }

        std::uint64_t size{ metadata.sizeBytes };
        if (range)
        {
            if (range->end >= metadata.sizeBytes)
            {
                LOG(ERROR, "Range " << range->start << "-" << range->end << " out of bounds for " << objectPath << ", size = " << metadata.sizeBytes);
                return StoreResult::Error;
            }

            ifs.seekg(static_cast<std::istream::off_type>(range->start));
            if (!ifs)
            {
                LOG(ERROR, "Cannot seek in " << objectPath);
                return StoreResult::Error;
            }
            size = range->getSize();
        }

        stream = std::make_unique<FsByteStream>(_ioContext, std::move(ifs), size);
        return StoreResult::Ok;
    }

    StoreResult FsObjectStore::put(const std::string& key, const std::filesystem::path& sourceFile, std::string_view contentType) const
    {
        const std::filesystem::path objectPath{ getObjectPath(key) };
        const std::filesystem::path metadataPath{ getMetadataPath(key) };

        std::error_code ec;
        std::filesystem::create_directories(objectPath.parent_path(), ec);
        if (!ec)
            std::filesystem::create_directories(metadataPath.parent_path(), ec);
        if (ec)
        {
            LOG(ERROR, "Cannot create directories for '" << key << "': " << ec.message());
            return StoreResult::Error;
        }

        if (!atomicCopy(sourceFile, objectPath))
            return StoreResult::Error;

        if (!atomicWrite(contentType, metadataPath))
        {
            std::filesystem::remove(objectPath, ec);
            return StoreResult::Error;
        }

        LOG(DEBUG, "Stored '" << key << "'");
        return StoreResult::Ok;
    }

    StoreResult FsObjectStore::remove(const std::string& key) const
    {
        std::error_code ec;
        const bool removed{ std::filesystem::remove(getObjectPath(key), ec) };
        if (ec)
        {
            LOG(ERROR, "Cannot remove '" << key << "': " << ec.message());
            return StoreResult::Error;
        }

        std::filesystem::remove(getMetadataPath(key), ec);
        if (ec)
            LOG(WARNING, "Cannot remove metadata of '" << key << "': " << ec.message());

        return removed ? StoreResult::Ok : StoreResult::NotFound;
    }

    StoreResult FsObjectStore::checkHealth() const
    {
        for (const std::filesystem::path& directory : { _objectsDirectory, _metadataDirectory })
        {
            std::error_code ec;
            if (!std::filesystem::is_directory(directory, ec))
            {
                LOG(ERROR, "Directory " << directory << " is not available" << (ec ? ": " + ec.message() : ""));
                return StoreResult::Error;
            }
        }

        return StoreResult::Ok;
    }

    std::filesystem::path FsObjectStore::getObjectPath(std::string_view key) const
    {
        return _objectsDirectory / key;
    }

    std::filesystem::path FsObjectStore::getMetadataPath(std::string_view key) const
    {
        return _metadataDirectory / key;
    }
} // namespace mtg::objectstore
