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

#include "DownloadSession.hpp"

#include <algorithm>
#include <filesystem>
#include <sstream>

#include <boost/asio/bind_executor.hpp>
#include <boost/asio/post.hpp>

#include "core/ILogger.hpp"
#include "core/MimeTypes.hpp"

#define LOG(sev, message) MTG_LOG(DOWNLOAD, sev, "[Download " << _id << "] - " << message)

namespace mtg::transfer
{
    namespace
    {
        std::uint64_t generateSessionId()
        {
            static std::atomic<std::uint64_t> nextId{};
            return ++nextId;
        }
    } // namespace

    const char* getDownloadStateName(DownloadState state)
    {
        switch (state)
        {
        case DownloadState::Init:
            return "init";
        case DownloadState::MetadataFetched:
            return "metadata fetched";
        case DownloadState::RangeRejected:
            return "range rejected";
        case DownloadState::Streaming:
            return "streaming";
        case DownloadState::Complete:
            return "complete";
        case DownloadState::Aborted:
            return "aborted";
        case DownloadState::TimedOut:
            return "timed out";
        case DownloadState::Errored:
            return "errored";
        }
        return "";
    }

    bool isTerminal(DownloadState state)
    {
        switch (state)
        {
        case DownloadState::Complete:
        case DownloadState::Aborted:
        case DownloadState::TimedOut:
        case DownloadState::Errored:
            return true;

        case DownloadState::Init:
        case DownloadState::MetadataFetched:
        case DownloadState::RangeRejected:
        case DownloadState::Streaming:
            break;
        }
        return false;
    }

    std::string DownloadHeaders::formatContentRange() const
    {
        std::ostringstream oss;
        if (contentRange)
            oss << "bytes " << contentRange->start << "-" << contentRange->end << "/" << objectSize;
        return oss.str();
    }

    std::string DownloadError::formatContentRange() const
    {
        std::ostringstream oss;
        if (objectSize)
            oss << "bytes */" << *objectSize;
        return oss.str();
    }

    DownloadSession::DownloadSession(boost::asio::io_context& ioContext, IObjectStore& store, core::ITimerFactory& timerFactory, const TransferSettings& settings, DownloadRequest request, std::shared_ptr<IDownloadSink> sink)
        : _id{ generateSessionId() }
        , _strand{ ioContext }
        , _store{ store }
        , _settings{ settings }
        , _request{ std::move(request) }
        , _sink{ std::move(sink) }
        , _deadlineTimer{ timerFactory.createTimer() }
        , _idleTimer{ timerFactory.createTimer() }
    {
    }

    DownloadSession::~DownloadSession()
    {
        if (!isFinished())
            LOG(DEBUG, "Destroyed in state '" << getDownloadStateName(_state) << "'");

        release();
    }

    template<typename Callable>
    void DownloadSession::postOnStrand(Callable&& callable)
    {
        boost::asio::post(boost::asio::bind_executor(_strand, std::forward<Callable>(callable)));
    }

    void DownloadSession::start()
    {
        postOnStrand([self = shared_from_this()] { self->fetchMetadata(); });
    }

    void DownloadSession::cancel()
    {
        postOnStrand([self = shared_from_this()] { self->onClientAbort(); });
    }

    void DownloadSession::onClientAbort()
    {
        if (isFinished())
            return;

        LOG(DEBUG, "Client disconnected in state '" << getDownloadStateName(_state) << "'");
        _sink.reset();
        finish(DownloadState::Aborted);
    }

    void DownloadSession::fetchMetadata()
    {
        if (isFinished())
            return;

        KeyValidationResult validationResult{ validateStorageKey(_request.key, _request.category) };
        if (const KeyRejectionReason* reason{ std::get_if<KeyRejectionReason>(&validationResult) })
        {
            // malformed keys look like missing objects to the client
            LOG(DEBUG, "Rejected key '" << _request.key << "': " << getRejectionReasonName(*reason));
            finishWithError(DownloadState::Errored, DownloadError{ TransferErrorKind::NotFound, "Object not found", std::nullopt });
            return;
        }
        _key = std::get<StorageKey>(std::move(validationResult));

        LOG(DEBUG, "Fetching metadata of '" << _key->getAsString() << "'");
        armDeadline(_settings.metadataTimeout, "metadata fetch");
        _store.asyncHead(_key->getAsString(), [weakSelf = weak_from_this()](StoreResult result, const ObjectMetadata& metadata) {
            if (auto self{ weakSelf.lock() })
                self->postOnStrand([self, result, metadata] { self->onMetadataFetched(result, metadata); });
        });
    }

    void DownloadSession::onMetadataFetched(StoreResult result, const ObjectMetadata& metadata)
    {
        if (isFinished())
            return;

        _deadlineTimer->cancel();

        switch (result)
        {
        case StoreResult::Ok:
            break;
        case StoreResult::NotFound:
            finishWithError(DownloadState::Errored, DownloadError{ TransferErrorKind::NotFound, "Object not found", std::nullopt });
            return;
        case StoreResult::Error:
            finishWithError(DownloadState::Errored, DownloadError{ TransferErrorKind::InternalError, "Cannot fetch object metadata", std::nullopt });
            return;
        }

        // An empty object is considered as a corrupted or incomplete upload
        if (metadata.sizeBytes == 0)
        {
            LOG(WARNING, "Object '" << _key->getAsString() << "' is empty");
            finishWithError(DownloadState::Errored, DownloadError{ TransferErrorKind::NotFound, "Object not found", std::nullopt });
            return;
        }

        _metadata = metadata;
        setState(DownloadState::MetadataFetched);

        const RangeParseResult range{ parseRange(_request.rangeHeader, _metadata.sizeBytes) };
        if (std::holds_alternative<UnsatisfiableRange>(range))
        {
            LOG(DEBUG, "Range '" << _request.rangeHeader.value_or("") << "' not satisfiable, size = " << _metadata.sizeBytes);
            setState(DownloadState::RangeRejected);
            finishWithError(DownloadState::Errored, DownloadError{ TransferErrorKind::RangeNotSatisfiable, "Requested range not satisfiable", _metadata.sizeBytes });
            return;
        }

        if (const ByteRange* byteRange{ std::get_if<ByteRange>(&range) })
        {
            _range = *byteRange;
            _expectedBytes = byteRange->getSize();
        }
        else
            _expectedBytes = _metadata.sizeBytes;

        armDeadline(_settings.readTimeout, "object read");
        _store.asyncGetRange(_key->getAsString(), _range, [weakSelf = weak_from_this()](StoreResult result, std::unique_ptr<IByteStream> stream) {
            auto self{ weakSelf.lock() };
            if (!self)
            {
                if (stream)
                    stream->cancel();
                return;
            }

            self->postOnStrand([self, result, stream = std::move(stream)]() mutable { self->onStreamOpened(result, std::move(stream)); });
        });
    }

    void DownloadSession::onStreamOpened(StoreResult result, std::unique_ptr<IByteStream> stream)
    {
        if (isFinished())
        {
            // late answer, nobody will consume it
            if (stream)
                stream->cancel();
            return;
        }

        _deadlineTimer->cancel();

        if (result == StoreResult::NotFound)
        {
            finishWithError(DownloadState::Errored, DownloadError{ TransferErrorKind::NotFound, "Object not found", std::nullopt });
            return;
        }
        if (result != StoreResult::Ok || !stream)
        {
            finishWithError(DownloadState::Errored, DownloadError{ TransferErrorKind::InternalError, "Cannot read object", std::nullopt });
            return;
        }

        _stream = std::move(stream);
        setState(DownloadState::Streaming);

        const DownloadHeaders headers{ computeHeaders() };
        LOG(DEBUG, "Streaming '" << _key->getAsString() << "', status = " << headers.status << ", length = " << headers.contentLength);
        _sink->onHeaders(headers);

        readNextChunk();
    }

    DownloadHeaders DownloadSession::computeHeaders() const
    {
        DownloadHeaders headers;

        headers.status = _range ? 206 : 200;
        headers.contentLength = _expectedBytes;
        headers.objectSize = _metadata.sizeBytes;
        headers.contentRange = _range;
        headers.cacheControl = _settings.cacheControl;
        if (!_metadata.contentType.empty())
            headers.contentType = _metadata.contentType;
        else
            headers.contentType = core::getMimeType(std::filesystem::path{ std::string{ _key->getFilename() } }.extension());

        return headers;
    }

    void DownloadSession::readNextChunk()
    {
        const std::uint64_t remainingBytes{ _expectedBytes - _relayedBytes };
        const std::size_t chunkSize{ static_cast<std::size_t>(std::min<std::uint64_t>(remainingBytes, _settings.streamChunkSize)) };

        // only armed while waiting for the store: a slow client is not a stall
        armIdleTimer();
        _stream->asyncRead(chunkSize, [weakSelf = weak_from_this()](StoreResult result, std::span<const std::byte> data) {
            if (auto self{ weakSelf.lock() })
                self->postOnStrand([self, result, data] { self->onChunkRead(result, data); });
        });
    }

    void DownloadSession::onChunkRead(StoreResult result, std::span<const std::byte> data)
    {
        // data may be dangling if the stream was released meanwhile
        if (isFinished())
            return;

        _idleTimer->cancel();

        if (result != StoreResult::Ok)
        {
            finishWithAbort(DownloadState::Errored, TransferErrorKind::InternalError, "upstream read error");
            return;
        }

        const std::uint64_t remainingBytes{ _expectedBytes - _relayedBytes };
        if (data.empty())
        {
            if (remainingBytes != 0)
                finishWithAbort(DownloadState::Errored, TransferErrorKind::InternalError, "upstream stream ended prematurely");
            else
                finishComplete();
            return;
        }

        if (data.size() > remainingBytes)
        {
            finishWithAbort(DownloadState::Errored, TransferErrorKind::InternalError, "upstream sent more bytes than expected");
            return;
        }

        _relayedBytes += data.size();
        // the chunk lives in the stream: the sink keeps it alive until it is done with the data, even after a release
        _sink->onData(data, [weakSelf = weak_from_this(), stream = _stream] {
            if (auto self{ weakSelf.lock() })
                self->postOnStrand([self] { self->onChunkConsumed(); });
        });
    }

    void DownloadSession::onChunkConsumed()
    {
        if (isFinished())
            return;

        if (_relayedBytes == _expectedBytes)
            finishComplete();
        else
            readNextChunk();
    }

    void DownloadSession::armDeadline(std::chrono::milliseconds duration, std::string_view operation)
    {
        const std::uint64_t token{ ++_deadlineToken };
        _deadlineTimer->start(duration, [weakSelf = weak_from_this(), token, operation] {
            if (auto self{ weakSelf.lock() })
                self->postOnStrand([self, token, operation] { self->onDeadlineExpired(token, operation); });
        });
    }

    void DownloadSession::onDeadlineExpired(std::uint64_t token, std::string_view operation)
    {
        if (isFinished() || token != _deadlineToken)
            return;

        LOG(WARNING, "Timeout during " << operation << " of '" << getKeyForLog() << "'");
        finishWithError(DownloadState::TimedOut, DownloadError{ TransferErrorKind::GatewayTimeout, "Storage did not answer in time", std::nullopt });
    }

    void DownloadSession::armIdleTimer()
    {
        const std::uint64_t token{ ++_idleToken };
        _idleTimer->start(_settings.streamIdleTimeout, [weakSelf = weak_from_this(), token] {
            if (auto self{ weakSelf.lock() })
                self->postOnStrand([self, token] { self->onIdleTimerExpired(token); });
        });
    }

    void DownloadSession::onIdleTimerExpired(std::uint64_t token)
    {
        if (isFinished() || token != _idleToken)
            return;

        LOG(WARNING, "Upstream stalled for " << _settings.streamIdleTimeout.count() << " ms while streaming '" << _key->getAsString() << "'");
        finishWithAbort(DownloadState::TimedOut, TransferErrorKind::GatewayTimeout, "upstream stalled");
    }

    void DownloadSession::finishWithError(DownloadState state, DownloadError error)
    {
        if (error.kind == TransferErrorKind::InternalError)
            LOG(ERROR, error.message << " for '" << getKeyForLog() << "'");

        std::shared_ptr<IDownloadSink> sink{ std::move(_sink) };
        finish(state);

        if (sink)
            sink->onError(error);
    }

    void DownloadSession::finishWithAbort(DownloadState state, TransferErrorKind kind, std::string_view reason)
    {
        if (kind == TransferErrorKind::InternalError)
            LOG(ERROR, "Aborting transfer of '" << getKeyForLog() << "': " << reason);
        else
            LOG(DEBUG, "Aborting transfer of '" << getKeyForLog() << "': " << reason);

        std::shared_ptr<IDownloadSink> sink{ std::move(_sink) };
        finish(state);

        if (sink)
            sink->onAbort(kind);
    }

    void DownloadSession::finishComplete()
    {
        std::shared_ptr<IDownloadSink> sink{ std::move(_sink) };
        finish(DownloadState::Complete);

        if (sink)
            sink->onComplete();
    }

    void DownloadSession::finish(DownloadState state)
    {
        setState(state);
        release();

        if (state == DownloadState::TimedOut)
            LOG(WARNING, "Finished: state = " << getDownloadStateName(state) << ", key = '" << getKeyForLog() << "', relayed " << _relayedBytes << "/" << _expectedBytes << " bytes");
        else
            LOG(DEBUG, "Finished: state = " << getDownloadStateName(state) << ", key = '" << getKeyForLog() << "', relayed " << _relayedBytes << "/" << _expectedBytes << " bytes");
    }

    void DownloadSession::release()
    {
        _deadlineTimer->cancel();
        _idleTimer->cancel();

        if (_stream)
        {
            _stream->cancel();
            _stream.reset();
        }
    }

    std::string_view DownloadSession::getKeyForLog() const
    {
        return _key ? std::string_view{ _key->getAsString() } : std::string_view{ _request.key };
    }

    void DownloadSession::setState(DownloadState state)
    {
        LOG(DEBUG, "State: " << getDownloadStateName(_state) << " -> " << getDownloadStateName(state));
        _state = state;
    }
} // namespace mtg::transfer
