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
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>

#include "transfer/MediaCategory.hpp"
#include "transfer/RangeParser.hpp"
#include "transfer/TransferError.hpp"

namespace boost::asio
{
    class io_context;
}

namespace mtg::core
{
    class ITimerFactory;
}

namespace mtg::transfer
{
    class IObjectStore;
    struct TransferSettings;

    struct DownloadRequest
    {
        std::string key; // not validated yet
        MediaCategory category;
        std::optional<std::string> rangeHeader;
    };

    struct DownloadHeaders
    {
        unsigned status{}; // 200 or 206
        std::uint64_t contentLength{};
        std::uint64_t objectSize{};
        std::optional<ByteRange> contentRange; // set for partial responses
        std::string contentType;
        std::string cacheControl;

        // "bytes <start>-<end>/<size>"
        std::string formatContentRange() const;
    };

    struct DownloadError
    {
        TransferErrorKind kind;
        std::string message;
        std::optional<std::uint64_t> objectSize; // set when the range was not satisfiable

        // "bytes */<size>"
        std::string formatContentRange() const;
    };

    // Receives the outcome of a download session, always called from the session strand
    // Either onError, or onHeaders then onData* then one of onComplete/onAbort
    // Nothing is called once the session has been cancelled
    class IDownloadSink
    {
    public:
        virtual ~IDownloadSink() = default;

        virtual void onHeaders(const DownloadHeaders& headers) = 0;

        // data stays valid as long as onConsumed is held, even if the session is cancelled or destroyed meanwhile
        // no more data is pulled from the store until onConsumed is called, from any thread
        virtual void onData(std::span<const std::byte> data, std::function<void()> onConsumed) = 0;

        virtual void onComplete() = 0;

        // Nothing sent to the client yet
        virtual void onError(const DownloadError& error) = 0;

        // Headers already sent, the body is truncated: the connection has to be closed
        virtual void onAbort(TransferErrorKind kind) = 0;
    };

    enum class DownloadState
    {
        Init,
        MetadataFetched,
        RangeRejected,
        Streaming,

        // terminal
        Complete,
        Aborted, // client disconnected
        TimedOut,
        Errored,
    };
    const char* getDownloadStateName(DownloadState state);
    bool isTerminal(DownloadState state);

    class IDownloadSession
    {
    public:
        virtual ~IDownloadSession() = default;

        // Client went away: timers and upstream stream are released, sink no longer called
        // Can be called from any thread, at any step
        virtual void cancel() = 0;

        virtual DownloadState getState() const = 0;
        virtual std::uint64_t getRelayedBytes() const = 0;
    };

    class IDownloadStreamer
    {
    public:
        virtual ~IDownloadStreamer() = default;

        // The returned session must be kept alive by the caller until it reaches a terminal state
        virtual std::shared_ptr<IDownloadSession> stream(DownloadRequest request, std::shared_ptr<IDownloadSink> sink) = 0;
    };

    std::unique_ptr<IDownloadStreamer> createDownloadStreamer(boost::asio::io_context& ioContext, IObjectStore& store, core::ITimerFactory& timerFactory, const TransferSettings& settings);
} // namespace mtg::transfer
