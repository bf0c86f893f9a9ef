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

#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <ostream>

#include "transfer/IDownloadStreamer.hpp"

namespace mtg::gateway
{
    // The part of a Wt response the download relay writes to
    class IResponseWriter
    {
    public:
        virtual ~IResponseWriter() = default;

        virtual std::ostream& out() = 0;

        // The response waits for more data, the returned callback resumes it
        virtual std::function<void()> suspend() = 0;
    };

    // Bridges the asynchronous download session to the Wt continuation mechanism
    class WtDownloadSink final : public transfer::IDownloadSink
    {
    public:
        // Blocks until the session produced either the headers or an error
        void waitForResponseStart();

        const std::optional<transfer::DownloadHeaders>& getHeaders() const { return _headers; }
        const std::optional<transfer::DownloadError>& getError() const { return _error; }

        enum class WriteResult
        {
            ChunkWritten, // continue right away
            Suspended,    // resumed through the callback given by the writer
            Finished,     // body complete, or truncated on abort
        };

        // Writes what is available, or suspends the response until more data comes
        WriteResult writeResponse(IResponseWriter& writer);

        // The response is going away, never resume it again
        void detach();

    private:
        void onHeaders(const transfer::DownloadHeaders& headers) override;
        void onData(std::span<const std::byte> data, std::function<void()> onConsumed) override;
        void onComplete() override;
        void onError(const transfer::DownloadError& error) override;
        void onAbort(transfer::TransferErrorKind kind) override;

        void resumeResponse();

        struct PendingData
        {
            std::span<const std::byte> data;
            std::function<void()> onConsumed; // also keeps data alive
        };

        std::mutex _mutex;
        std::condition_variable _cv;
        std::optional<transfer::DownloadHeaders> _headers;
        std::optional<transfer::DownloadError> _error;
        std::optional<PendingData> _pendingData;
        bool _complete{};
        std::optional<transfer::TransferErrorKind> _abortKind;

        // recursive: resuming may synchronously call back writeResponse or detach
        std::recursive_mutex _resumeMutex;
        std::function<void()> _resume;
        bool _detached{};

        // only used from the Wt request handling
        std::function<void()> _sentDataConsumed;
    };
} // namespace mtg::gateway
