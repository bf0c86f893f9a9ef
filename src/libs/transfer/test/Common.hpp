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

#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <gtest/gtest.h>

#include "core/ITimer.hpp"
#include "transfer/IDownloadStreamer.hpp"
#include "transfer/IObjectStore.hpp"

namespace mtg::transfer::tests
{
    // Timers only expire when the test advances the clock
    class ManualTimerFactory final : public core::ITimerFactory
    {
    public:
        ManualTimerFactory();
        ~ManualTimerFactory() override;

        std::unique_ptr<core::ITimer> createTimer() override;

        void advance(std::chrono::milliseconds duration);
        std::size_t getArmedTimerCount() const;

    private:
        class ManualTimer;
        friend class ManualTimer;

        std::chrono::milliseconds _now{};
        std::vector<ManualTimer*> _timers;
    };

    std::vector<std::byte> generateObjectData(std::size_t size);

    // Scripted object store, everything happens on the calling thread
    class FakeObjectStore final : public IObjectStore
    {
    public:
        enum class CallBehavior
        {
            Answer,
            Stall, // callback kept until answerPending*() is called
            Fail,
        };

        struct StreamBehavior
        {
            bool manual{}; // reads wait for deliverPendingRead()
            std::optional<std::uint64_t> stallAfterBytes;
            std::optional<std::uint64_t> failAfterBytes;
            std::optional<std::uint64_t> endAfterBytes; // premature end of stream
        };

        struct Object
        {
            std::vector<std::byte> data;
            std::string contentType;
        };

        void addObject(const std::string& key, std::vector<std::byte> data, std::string contentType);
        const Object* findObject(const std::string& key) const;
        std::size_t getObjectCount() const { return _objects.size(); }

        CallBehavior headBehavior{ CallBehavior::Answer };
        CallBehavior getRangeBehavior{ CallBehavior::Answer };
        CallBehavior putBehavior{ CallBehavior::Answer };
        CallBehavior removeBehavior{ CallBehavior::Answer };
        CallBehavior healthBehavior{ CallBehavior::Answer };
        StreamBehavior streamBehavior;

        void answerPendingHead();
        void answerPendingGetRange();
        void answerPendingPut();
        bool deliverPendingRead();

        std::size_t getHeadCount() const { return _headCount; }
        std::size_t getGetRangeCount() const { return _getRangeCount; }
        std::size_t getReadCount() const { return *_readCount; }
        std::size_t getPutCount() const { return _putCount; }
        std::size_t getOpenStreamCount() const { return *_openStreamCount; }
        std::size_t getLiveStreamCount() const { return *_liveStreamCount; } // stream objects not destroyed yet, cancelled or not
        const std::vector<std::string>& getRemovedKeys() const { return _removedKeys; }

    private:
        void asyncHead(std::string_view key, HeadCallback callback) override;
        void asyncGetRange(std::string_view key, std::optional<ByteRange> range, GetRangeCallback callback) override;
        void asyncPut(std::string_view key, const std::filesystem::path& sourceFile, std::string_view contentType, CompletionCallback callback) override;
        void asyncRemove(std::string_view key, CompletionCallback callback) override;
        void asyncCheckHealth(CompletionCallback callback) override;

        void doHead(const std::string& key, const HeadCallback& callback);
        void doGetRange(const std::string& key, std::optional<ByteRange> range, const GetRangeCallback& callback);
        void doPut(const std::string& key, const std::filesystem::path& sourceFile, const std::string& contentType, const CompletionCallback& callback);

        std::map<std::string, Object> _objects;
        std::size_t _headCount{};
        std::size_t _getRangeCount{};
        std::size_t _putCount{};
        std::vector<std::string> _removedKeys;
        const std::shared_ptr<std::size_t> _readCount{ std::make_shared<std::size_t>() };
        const std::shared_ptr<std::size_t> _openStreamCount{ std::make_shared<std::size_t>() };
        const std::shared_ptr<std::size_t> _liveStreamCount{ std::make_shared<std::size_t>() };

        std::function<void()> _pendingHead;
        std::function<void()> _pendingGetRange;
        std::function<void()> _pendingPut;

        class FakeByteStream;
        struct StreamState;
        std::weak_ptr<StreamState> _lastStream;
        std::vector<std::shared_ptr<StreamState>> _streamStates; // kept so that stale chunks are readable garbage
    };

    class RecordingSink final : public IDownloadSink
    {
    public:
        bool autoConsume{ true };

        std::optional<DownloadHeaders> headers;
        std::vector<std::byte> body;
        std::size_t chunkCount{};
        bool completed{};
        std::optional<DownloadError> error;
        std::optional<TransferErrorKind> abortKind;

        bool hasPendingChunk() const { return static_cast<bool>(_pendingConsume); }
        void consumePendingChunk();
        // copy of the chunk held while not consumed
        std::vector<std::byte> getPendingChunk() const;
        std::size_t getTerminalCallCount() const;

    private:
        void onHeaders(const DownloadHeaders& headers) override;
        void onData(std::span<const std::byte> data, std::function<void()> onConsumed) override;
        void onComplete() override;
        void onError(const DownloadError& error) override;
        void onAbort(TransferErrorKind kind) override;

        std::span<const std::byte> _pendingData;
        std::function<void()> _pendingConsume;
    };
} // namespace mtg::transfer::tests
