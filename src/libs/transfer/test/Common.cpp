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

#include "Common.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>

namespace mtg::transfer::tests
{
    class ManualTimerFactory::ManualTimer final : public core::ITimer
    {
    public:
        ManualTimer(ManualTimerFactory& factory)
            : _factory{ factory }
        {
            _factory._timers.push_back(this);
        }

        ~ManualTimer() override
        {
            _factory._timers.erase(std::remove(std::begin(_factory._timers), std::end(_factory._timers), this), std::end(_factory._timers));
        }

        bool fireIfExpired(std::chrono::milliseconds now)
        {
            if (!_armed || _deadline > now)
                return false;

            _armed = false;
            Callback callback{ std::move(_callback) };
            _callback = nullptr;
            callback();
            return true;
        }

        void start(std::chrono::milliseconds duration, Callback callback) override
        {
            _armed = true;
            _deadline = _factory._now + duration;
            _callback = std::move(callback);
        }

        void cancel() override
        {
            _armed = false;
            _callback = nullptr;
        }

        bool isArmed() const override { return _armed; }

        ManualTimerFactory& _factory;
        bool _armed{};
        std::chrono::milliseconds _deadline{};
        Callback _callback;
    };

    ManualTimerFactory::ManualTimerFactory() = default;

    ManualTimerFactory::~ManualTimerFactory()
    {
        EXPECT_TRUE(_timers.empty()) << "Timers outlive their factory";
    }

    std::unique_ptr<core::ITimer> ManualTimerFactory::createTimer()
    {
        return std::make_unique<ManualTimer>(*this);
    }

    void ManualTimerFactory::advance(std::chrono::milliseconds duration)
    {
        _now += duration;

        bool fired;
        do
        {
            fired = false;
            const std::vector<ManualTimer*> timers{ _timers };
            for (ManualTimer* timer : timers)
            {
                if (std::find(std::cbegin(_timers), std::cend(_timers), timer) == std::cend(_timers))
                    continue;

                if (timer->fireIfExpired(_now))
                    fired = true;
            }
        } while (fired);
    }

    std::size_t ManualTimerFactory::getArmedTimerCount() const
    {
        return std::count_if(std::cbegin(_timers), std::cend(_timers), [](const ManualTimer* timer) { return timer->isArmed(); });
    }

    std::vector<std::byte> generateObjectData(std::size_t size)
    {
        std::vector<std::byte> data(size);
        for (std::size_t i{}; i < size; ++i)
            data[i] = static_cast<std::byte>(i % 251);

        return data;
    }

    struct FakeObjectStore::StreamState
    {
        std::vector<std::byte> data;
        StreamBehavior behavior;
        std::shared_ptr<std::size_t> openStreamCount;
        std::shared_ptr<std::size_t> liveStreamCount;
        std::shared_ptr<std::size_t> readCount;

        std::uint64_t position{};
        bool released{};
        std::size_t pendingMaxBytes{};
        IByteStream::ReadCallback pendingCallback;
        std::vector<std::byte> buffer;

        void release()
        {
            if (released)
                return;

            released = true;
            pendingCallback = nullptr;
            --*openStreamCount;
        }

        bool deliver()
        {
            if (released || !pendingCallback)
                return false;

            std::uint64_t limit{ data.size() };
            if (behavior.endAfterBytes)
                limit = std::min(limit, *behavior.endAfterBytes);

            if (behavior.stallAfterBytes)
            {
                if (position >= *behavior.stallAfterBytes)
                    return false;
                limit = std::min(limit, *behavior.stallAfterBytes);
            }

            IByteStream::ReadCallback callback{ std::move(pendingCallback) };
            pendingCallback = nullptr;

            if (behavior.failAfterBytes)
            {
                if (position >= *behavior.failAfterBytes)
                {
                    callback(StoreResult::Error, {});
                    return true;
                }
                limit = std::min(limit, *behavior.failAfterBytes);
            }

            if (position >= limit)
            {
                callback(StoreResult::Ok, {});
                return true;
            }

            const std::uint64_t count{ std::min<std::uint64_t>(pendingMaxBytes, limit - position) };
            buffer.assign(std::cbegin(data) + position, std::cbegin(data) + position + count);
            position += count;

            callback(StoreResult::Ok, std::span<const std::byte>{ buffer });
            return true;
        }
    };

    class FakeObjectStore::FakeByteStream final : public IByteStream
    {
    public:
        FakeByteStream(std::shared_ptr<StreamState> state)
            : _state{ std::move(state) }
        {
            ++*_state->openStreamCount;
            ++*_state->liveStreamCount;
        }

        ~FakeByteStream() override
        {
            _state->release();
            --*_state->liveStreamCount;

            // anyone still reading the last chunk reads garbage
            std::fill(std::begin(_state->buffer), std::end(_state->buffer), std::byte{ 0xEE });
        }

    private:
        void asyncRead(std::size_t maxBytes, ReadCallback callback) override
        {
            ++*_state->readCount;
            if (_state->released)
                return;

            _state->pendingMaxBytes = maxBytes;
            _state->pendingCallback = std::move(callback);
            if (!_state->behavior.manual)
                _state->deliver();
        }

        void cancel() override
        {
            _state->release();
        }

        const std::shared_ptr<StreamState> _state;
    };

    void FakeObjectStore::addObject(const std::string& key, std::vector<std::byte> data, std::string contentType)
    {
        _objects[key] = Object{ std::move(data), std::move(contentType) };
    }

    const FakeObjectStore::Object* FakeObjectStore::findObject(const std::string& key) const
    {
        auto it{ _objects.find(key) };
        return it == std::cend(_objects) ? nullptr : &it->second;
    }

    void FakeObjectStore::answerPendingHead()
    {
        std::function<void()> pending{ std::move(_pendingHead) };
        _pendingHead = nullptr;
        if (pending)
            pending();
    }

    void FakeObjectStore::answerPendingGetRange()
    {
        std::function<void()> pending{ std::move(_pendingGetRange) };
        _pendingGetRange = nullptr;
        if (pending)
            pending();
    }

    void FakeObjectStore::answerPendingPut()
    {
        std::function<void()> pending{ std::move(_pendingPut) };
        _pendingPut = nullptr;
        if (pending)
            pending();
    }

    bool FakeObjectStore::deliverPendingRead()
    {
        if (auto state{ _lastStream.lock() })
            return state->deliver();

        return false;
    }

    void FakeObjectStore::asyncHead(std::string_view key, HeadCallback callback)
    {
        ++_headCount;

        switch (headBehavior)
        {
        case CallBehavior::Answer:
            doHead(std::string{ key }, callback);
            break;
        case CallBehavior::Stall:
            _pendingHead = [this, key = std::string{ key }, callback] { doHead(key, callback); };
            break;
        case CallBehavior::Fail:
            callback(StoreResult::Error, ObjectMetadata{});
            break;
        }
    }

    void FakeObjectStore::doHead(const std::string& key, const HeadCallback& callback)
    {
        const Object* object{ findObject(key) };
        if (!object)
        {
            callback(StoreResult::NotFound, ObjectMetadata{});
            return;
        }

        callback(StoreResult::Ok, ObjectMetadata{ object->data.size(), object->contentType });
    }

    void FakeObjectStore::asyncGetRange(std::string_view key, std::optional<ByteRange> range, GetRangeCallback callback)
    {
        ++_getRangeCount;

        switch (getRangeBehavior)
        {
        case CallBehavior::Answer:
            doGetRange(std::string{ key }, range, callback);
            break;
        case CallBehavior::Stall:
            _pendingGetRange = [this, key = std::string{ key }, range, callback] { doGetRange(key, range, callback); };
            break;
        case CallBehavior::Fail:
            callback(StoreResult::Error, nullptr);
            break;
        }
    }

    void FakeObjectStore::doGetRange(const std::string& key, std::optional<ByteRange> range, const GetRangeCallback& callback)
    {
        const Object* object{ findObject(key) };
        if (!object)
        {
            callback(StoreResult::NotFound, nullptr);
            return;
        }

        auto state{ std::make_shared<StreamState>() };
        if (range)
            state->data.assign(std::cbegin(object->data) + range->start, std::cbegin(object->data) + range->end + 1);
        else
            state->data = object->data;
        state->behavior = streamBehavior;
        state->openStreamCount = _openStreamCount;
        state->liveStreamCount = _liveStreamCount;
        state->readCount = _readCount;
        _lastStream = state;
        _streamStates.push_back(state);

        callback(StoreResult::Ok, std::make_unique<FakeByteStream>(state));
    }

    void FakeObjectStore::asyncPut(std::string_view key, const std::filesystem::path& sourceFile, std::string_view contentType, CompletionCallback callback)
    {
        ++_putCount;

        switch (putBehavior)
        {
        case CallBehavior::Answer:
            doPut(std::string{ key }, sourceFile, std::string{ contentType }, callback);
            break;
        case CallBehavior::Stall:
            _pendingPut = [this, key = std::string{ key }, sourceFile, contentType = std::string{ contentType }, callback] { doPut(key, sourceFile, contentType, callback); };
            break;
        case CallBehavior::Fail:
            callback(StoreResult::Error);
            break;
        }
    }

    void FakeObjectStore::doPut(const std::string& key, const std::filesystem::path& sourceFile, const std::string& contentType, const CompletionCallback& callback)
    {
        std::ifstream ifs{ sourceFile, std::ios::binary };
        if (!ifs)
        {
            callback(StoreResult::Error);
            return;
        }

        std::vector<std::byte> data;
        std::transform(std::istreambuf_iterator<char>{ ifs }, std::istreambuf_iterator<char>{}, std::back_inserter(data), [](char c) { return static_cast<std::byte>(c); });

        addObject(key, std::move(data), contentType);
        callback(StoreResult::Ok);
    }

    void FakeObjectStore::asyncRemove(std::string_view key, CompletionCallback callback)
    {
        switch (removeBehavior)
        {
        case CallBehavior::Answer:
            _removedKeys.emplace_back(key);
            callback(_objects.erase(std::string{ key }) ? StoreResult::Ok : StoreResult::NotFound);
            break;
        case CallBehavior::Stall:
            break;
        case CallBehavior::Fail:
            callback(StoreResult::Error);
            break;
        }
    }

    void FakeObjectStore::asyncCheckHealth(CompletionCallback callback)
    {
        switch (healthBehavior)
        {
        case CallBehavior::Answer:
            callback(StoreResult::Ok);
            break;
        case CallBehavior::Stall:
            break;
        case CallBehavior::Fail:
            callback(StoreResult::Error);
            break;
        }
    }

    void RecordingSink::consumePendingChunk()
    {
        std::function<void()> pending{ std::move(_pendingConsume) };
        _pendingConsume = nullptr;
        _pendingData = {};
        if (pending)
            pending();
    }

    std::vector<std::byte> RecordingSink::getPendingChunk() const
    {
        return std::vector<std::byte>(std::cbegin(_pendingData), std::cend(_pendingData));
    }

    std::size_t RecordingSink::getTerminalCallCount() const
    {
        return (completed ? 1 : 0) + (error ? 1 : 0) + (abortKind ? 1 : 0);
    }

    void RecordingSink::onHeaders(const DownloadHeaders& receivedHeaders)
    {
        EXPECT_FALSE(headers);
        headers = receivedHeaders;
    }

    void RecordingSink::onData(std::span<const std::byte> data, std::function<void()> onConsumed)
    {
        EXPECT_TRUE(headers);
        EXPECT_FALSE(_pendingConsume);

        body.insert(std::end(body), std::cbegin(data), std::cend(data));
        ++chunkCount;

        if (autoConsume)
            onConsumed();
        else
        {
            _pendingData = data;
            _pendingConsume = std::move(onConsumed);
        }
    }

    void RecordingSink::onComplete()
    {
        EXPECT_EQ(getTerminalCallCount(), 0);
        completed = true;
    }

    void RecordingSink::onError(const DownloadError& receivedError)
    {
        EXPECT_EQ(getTerminalCallCount(), 0);
        EXPECT_FALSE(headers);
        error = receivedError;
    }

    void RecordingSink::onAbort(TransferErrorKind kind)
    {
        EXPECT_EQ(getTerminalCallCount(), 0);
        EXPECT_TRUE(headers);
        abortKind = kind;
    }
} // namespace mtg::transfer::tests
