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

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>

#include <boost/asio/io_context.hpp>
#include <boost/asio/io_context_strand.hpp>

#include "core/ITimer.hpp"
#include "transfer/IDownloadStreamer.hpp"
#include "transfer/IObjectStore.hpp"
#include "transfer/KeyPathValidator.hpp"
#include "transfer/TransferSettings.hpp"

namespace mtg::transfer
{
    // One download, all steps serialized on its own strand
    // INIT -> METADATA_FETCHED -> {RANGE_REJECTED | STREAMING} -> {COMPLETE | ABORTED | TIMED_OUT | ERRORED}
    class DownloadSession final : public IDownloadSession, public std::enable_shared_from_this<DownloadSession>
    {
    public:
        DownloadSession(boost::asio::io_context& ioContext, IObjectStore& store, core::ITimerFactory& timerFactory, const TransferSettings& settings, DownloadRequest request, std::shared_ptr<IDownloadSink> sink);
        ~DownloadSession() override;
        DownloadSession(const DownloadSession&) = delete;
        DownloadSession& operator=(const DownloadSession&) = delete;

        void start();

    private:
        void cancel() override;
        DownloadState getState() const override { return _state; }
        std::uint64_t getRelayedBytes() const override { return _relayedBytes; }

        void fetchMetadata();
        void onMetadataFetched(StoreResult result, const ObjectMetadata& metadata);
        void onStreamOpened(StoreResult result, std::unique_ptr<IByteStream> stream);
        void readNextChunk();
        void onChunkRead(StoreResult result, std::span<const std::byte> data);
        void onChunkConsumed();
        void onClientAbort();

        void armDeadline(std::chrono::milliseconds duration, std::string_view operation);
        void onDeadlineExpired(std::uint64_t token, std::string_view operation);
        void armIdleTimer();
        void onIdleTimerExpired(std::uint64_t token);

        DownloadHeaders computeHeaders() const;

        // Terminal transitions, all of them release resources the same way
        void finishWithError(DownloadState state, DownloadError error);
        void finishWithAbort(DownloadState state, TransferErrorKind kind, std::string_view reason);
        void finishComplete();
        void finish(DownloadState state);
        void release();

        void setState(DownloadState state);
        std::string_view getKeyForLog() const;
        bool isFinished() const { return isTerminal(_state); }

        template<typename Callable>
        void postOnStrand(Callable&& callable);

        const std::uint64_t _id;
        boost::asio::io_context::strand _strand;
        IObjectStore& _store;
        const TransferSettings _settings;
        const DownloadRequest _request;

        std::shared_ptr<IDownloadSink> _sink;
        std::unique_ptr<core::ITimer> _deadlineTimer;
        std::unique_ptr<core::ITimer> _idleTimer;
        std::uint64_t _deadlineToken{};
        std::uint64_t _idleToken{};
        std::shared_ptr<IByteStream> _stream; // also held by the chunk handed over to the sink

        std::optional<StorageKey> _key;
        ObjectMetadata _metadata;
        std::optional<ByteRange> _range;
        std::uint64_t _expectedBytes{};

        std::atomic<DownloadState> _state{ DownloadState::Init };
        std::atomic<std::uint64_t> _relayedBytes{};
    };
} // namespace mtg::transfer
