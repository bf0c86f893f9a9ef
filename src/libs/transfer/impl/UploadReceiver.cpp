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

#include "transfer/IUploadReceiver.hpp"

#include <condition_variable>
#include <istream>
#include <mutex>
#include <vector>

#include "core/Exception.hpp"
#include "core/ILogger.hpp"
#include "core/ITimer.hpp"
#include "core/TemporaryFile.hpp"
#include "transfer/IObjectStore.hpp"
#include "transfer/TransferError.hpp"
#include "transfer/TransferSettings.hpp"

#define LOG(sev, message) MTG_LOG(UPLOAD, sev, "[Upload] - " << message)

namespace mtg::transfer
{
    namespace
    {
        enum class StoreCallOutcome
        {
            Done,
            Failed,
            TimedOut,
        };

        // First outcome wins: either the store answered or the deadline expired
        class StoreCallWaiter
        {
        public:
            bool complete(StoreCallOutcome outcome)
            {
                {
                    std::scoped_lock lock{ _mutex };
                    if (_outcome)
                        return false;
                    _outcome = outcome;
                }
                _cv.notify_all();
                return true;
            }

            StoreCallOutcome wait()
            {
                std::unique_lock lock{ _mutex };
                _cv.wait(lock, [this] { return _outcome.has_value(); });
                return *_outcome;
            }

        private:
            std::mutex _mutex;
            std::condition_variable _cv;
            std::optional<StoreCallOutcome> _outcome;
        };

        class UploadReceiver final : public IUploadReceiver
        {
        public:
            UploadReceiver(IObjectStore& store, core::ITimerFactory& timerFactory, const TransferSettings& settings, const std::filesystem::path& tempDirectory)
                : _store{ store }
                , _timerFactory{ timerFactory }
                , _settings{ settings }
                , _tempDirectory{ tempDirectory }
            {
            }

        private:
            UploadResult receive(const UploadRequest& request, const CategoryPolicy& policy, std::istream& body) override;
            void discardObject(const StorageKey& key) override;

            std::unique_ptr<core::TemporaryFile> bufferBody(std::istream& body, std::uint64_t maxSizeBytes);
            void storeObject(const StorageKey& key, const core::TemporaryFile& file, std::string_view contentType);

            IObjectStore& _store;
            core::ITimerFactory& _timerFactory;
            const TransferSettings _settings;
            const std::filesystem::path _tempDirectory;
        };

        UploadResult UploadReceiver::receive(const UploadRequest& request, const CategoryPolicy& policy, std::istream& body)
        {
            if (!isValidOwnerId(request.ownerId))
                throw TransferException{ TransferErrorKind::BadRequest, "Invalid owner id" };

            // checked before reading anything
            const std::string contentType{ normalizeContentType(request.declaredContentType) };
            if (!policy.isContentTypeAllowed(contentType))
            {
                LOG(DEBUG, "Rejected content type '" << request.declaredContentType << "' for category " << getCategoryName(request.category));
                throw TransferException{ TransferErrorKind::BadRequest, "Unsupported content type '" + contentType + "'" };
            }

            if (request.declaredContentLength && *request.declaredContentLength > policy.maxSizeBytes)
            {
                LOG(DEBUG, "Declared size " << *request.declaredContentLength << " exceeds limit " << policy.maxSizeBytes);
                throw TransferException{ TransferErrorKind::PayloadTooLarge, "File too large" };
            }

            // removed on every exit path
            const std::unique_ptr<core::TemporaryFile> file{ bufferBody(body, policy.maxSizeBytes) };

            const StorageKey key{ generateStorageKey(request.category, request.ownerId, computeFileExtension(request.originalFilename, contentType)) };
            storeObject(key, *file, contentType);

            LOG(INFO, "Stored '" << key.getAsString() << "', size = " << file->getWrittenBytes() << ", type = " << contentType);
            return UploadResult{ key, file->getWrittenBytes(), contentType };
        }

        std::unique_ptr<core::TemporaryFile> UploadReceiver::bufferBody(std::istream& body, std::uint64_t maxSizeBytes)
        {
            std::unique_ptr<core::TemporaryFile> file;
            try
            {
                file = std::make_unique<core::TemporaryFile>(_tempDirectory, "upload-");
            }
            catch (const core::MtgException& e)
            {
                LOG(ERROR, "Cannot create temporary file: " << e.what());
                throw TransferException{ TransferErrorKind::InternalError, "Cannot buffer upload" };
            }

            std::vector<char> buffer(_settings.streamChunkSize);
            while (true)
            {
                body.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
                const std::size_t readCount{ static_cast<std::size_t>(body.gcount()) };
                if (readCount == 0)
                    break;

                if (file->getWrittenBytes() + readCount > maxSizeBytes)
                {
                    LOG(DEBUG, "Body exceeds limit of " << maxSizeBytes << " bytes, rejected after " << file->getWrittenBytes() + readCount << " bytes");
                    throw TransferException{ TransferErrorKind::PayloadTooLarge, "File too large" };
                }

                try
                {
                    file->write(std::span<const char>{ buffer.data(), readCount });
                }
                catch (const core::MtgException& e)
                {
                    LOG(ERROR, "Cannot buffer upload: " << e.what());
                    throw TransferException{ TransferErrorKind::InternalError, "Cannot buffer upload" };
                }

                if (!body)
                    break;
            }

            if (body.bad())
                throw TransferException{ TransferErrorKind::BadRequest, "Cannot read request body" };

            if (file->getWrittenBytes() == 0)
                throw TransferException{ TransferErrorKind::BadRequest, "Empty body" };

            try
            {
                file->close();
            }
            catch (const core::MtgException& e)
            {
                LOG(ERROR, "Cannot buffer upload: " << e.what());
                throw TransferException{ TransferErrorKind::InternalError, "Cannot buffer upload" };
            }

            return file;
        }

        void UploadReceiver::storeObject(const StorageKey& key, const core::TemporaryFile& file, std::string_view contentType)
        {
            auto waiter{ std::make_shared<StoreCallWaiter>() };

            const std::unique_ptr<core::ITimer> deadline{ _timerFactory.createTimer() };
            deadline->start(_settings.writeTimeout, [waiter] { waiter->complete(StoreCallOutcome::TimedOut); });

            _store.asyncPut(key.getAsString(), file.getPath(), contentType, [this, waiter, key](StoreResult result) {
                const bool inTime{ waiter->complete(result == StoreResult::Ok ? StoreCallOutcome::Done : StoreCallOutcome::Failed) };
                if (!inTime && result == StoreResult::Ok)
                {
                    // the client already got a timeout: nobody references this object
                    LOG(WARNING, "Late write of '" << key.getAsString() << "', removing it");
                    discardObject(key);
                }
            });

            const StoreCallOutcome outcome{ waiter->wait() };
            deadline->cancel();

            switch (outcome)
            {
            case StoreCallOutcome::Done:
                return;
            case StoreCallOutcome::Failed:
                LOG(ERROR, "Cannot write '" << key.getAsString() << "' to storage");
                throw TransferException{ TransferErrorKind::InternalError, "Cannot store object" };
            case StoreCallOutcome::TimedOut:
                LOG(WARNING, "Timeout while writing '" << key.getAsString() << "' to storage");
                throw TransferException{ TransferErrorKind::GatewayTimeout, "Storage did not answer in time" };
            }
        }

        void UploadReceiver::discardObject(const StorageKey& key)
        {
            struct PendingRemoval
            {
                StoreCallWaiter waiter;
                std::unique_ptr<core::ITimer> deadline;
            };
            auto removal{ std::make_shared<PendingRemoval>() };
            removal->deadline = _timerFactory.createTimer();

            const std::string keyStr{ key.getAsString() };
            removal->deadline->start(_settings.writeTimeout, [removal, keyStr] {
                if (removal->waiter.complete(StoreCallOutcome::TimedOut))
                    LOG(WARNING, "Timeout while removing '" << keyStr << "'");
            });

            _store.asyncRemove(keyStr, [removal, keyStr](StoreResult result) {
                if (!removal->waiter.complete(result == StoreResult::Error ? StoreCallOutcome::Failed : StoreCallOutcome::Done))
                    return;

                removal->deadline->cancel();
                if (result == StoreResult::Error)
                    LOG(ERROR, "Cannot remove '" << keyStr << "'");
                else
                    LOG(DEBUG, "Removed '" << keyStr << "'");
            });
        }
    } // namespace

    std::unique_ptr<IUploadReceiver> createUploadReceiver(IObjectStore& store, core::ITimerFactory& timerFactory, const TransferSettings& settings, const std::filesystem::path& tempDirectory)
    {
        return std::make_unique<UploadReceiver>(store, timerFactory, settings, tempDirectory);
    }
} // namespace mtg::transfer
