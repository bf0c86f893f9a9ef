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


#include "WtDownloadSink.hpp"

#include <utility>

#include "core/ILogger.hpp"
#include "transfer/TransferError.hpp"

#define LOG(sev, message) MTG_LOG(HTTP, sev, "[WtDownloadSink] - " << message)

namespace mtg::gateway
{
    void WtDownloadSink::waitForResponseStart()
    {
        std::unique_lock lock{ _mutex };
        _cv.wait(lock, [this] { return _headers || _error; });
    }

    WtDownloadSink::WriteResult WtDownloadSink::writeResponse(IResponseWriter& writer)
    {
        // the previous chunk has been handed over to the client connection: pull the next one
        if (_sentDataConsumed)
            std::exchange(_sentDataConsumed, {})();

        std::scoped_lock lock{ _resumeMutex, _mutex };

        if (_pendingData)
        {
            writer.out().write(reinterpret_cast<const char*>(_pendingData->data.data()), static_cast<std::streamsize>(_pendingData->data.size()));
            _sentDataConsumed = std::move(_pendingData->onConsumed);
            _pendingData.reset();

            return WriteResult::ChunkWritten;
        }

        if (_complete)
            return WriteResult::Finished;

        if (_abortKind)
        {
            // Content-Length is not honored, the client sees a truncated body
            LOG(DEBUG, "Transfer aborted: " << transfer::getReasonPhrase(*_abortKind));
            return WriteResult::Finished;
        }

        _resume = writer.suspend();
        return WriteResult::Suspended;
    }

    void WtDownloadSink::detach()
    {
        std::scoped_lock lock{ _resumeMutex };
        _detached = true;
        _resume = nullptr;
    }

    void WtDownloadSink::onHeaders(const transfer::DownloadHeaders& headers)
    {
        {
            std::scoped_lock lock{ _mutex };
            _headers = headers;
        }
        _cv.notify_all();
    }

    void WtDownloadSink::onData(std::span<const std::byte> data, std::function<void()> onConsumed)
    {
        {
            std::scoped_lock lock{ _mutex };
            _pendingData = PendingData{ data, std::move(onConsumed) };
        }
        resumeResponse();
    }

    void WtDownloadSink::onComplete()
    {
        {
            std::scoped_lock lock{ _mutex };
            _complete = true;
        }
        resumeResponse();
    }

    void WtDownloadSink::onError(const transfer::DownloadError& error)
    {
        {
            std::scoped_lock lock{ _mutex };
            _error = error;
        }
        _cv.notify_all();
    }

    void WtDownloadSink::onAbort(transfer::TransferErrorKind kind)
    {
        {
            std::scoped_lock lock{ _mutex };
            _abortKind = kind;
        }
        resumeResponse();
    }

    void WtDownloadSink::resumeResponse()
    {
        std::scoped_lock lock{ _resumeMutex };
        if (!_detached && _resume)
            std::exchange(_resume, nullptr)();
    }
} // namespace mtg::gateway
