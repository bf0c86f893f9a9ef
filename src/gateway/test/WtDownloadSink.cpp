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


#include <chrono>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "resources/WtDownloadSink.hpp"

namespace mtg::gateway::tests
{
    using namespace std::chrono_literals;
    using WriteResult = WtDownloadSink::WriteResult;

    namespace
    {
        class FakeResponseWriter final : public IResponseWriter
        {
        public:
            std::ostringstream body;
            std::size_t suspendCount{};
            std::size_t resumeCount{};

        private:
            std::ostream& out() override { return body; }

            std::function<void()> suspend() override
            {
                ++suspendCount;
                return [this] { ++resumeCount; };
            }
        };

        std::vector<std::byte> toBytes(std::string_view str)
        {
            std::vector<std::byte> res;
            for (const char c : str)
                res.push_back(static_cast<std::byte>(c));
            return res;
        }

        transfer::DownloadHeaders createHeaders(std::uint64_t size)
        {
            transfer::DownloadHeaders headers;
            headers.status = 200;
            headers.contentLength = size;
            headers.objectSize = size;
            headers.contentType = "audio/mpeg";
            return headers;
        }
    } // namespace

    class WtDownloadSinkTest : public ::testing::Test
    {
    protected:
        std::shared_ptr<WtDownloadSink> sink{ std::make_shared<WtDownloadSink>() };
        transfer::IDownloadSink& sessionSide{ *sink };
        FakeResponseWriter writer;
    };

    TEST_F(WtDownloadSinkTest, responseStartsWithHeaders)
    {
        sessionSide.onHeaders(createHeaders(6));
        sink->waitForResponseStart();

        ASSERT_TRUE(sink->getHeaders());
        EXPECT_EQ(sink->getHeaders()->contentLength, 6);
        EXPECT_FALSE(sink->getError());
    }

    TEST_F(WtDownloadSinkTest, responseStartWaitsForSession)
    {
        std::thread session{ [&] {
            std::this_thread::sleep_for(20ms);
            sessionSide.onError(transfer::DownloadError{ transfer::TransferErrorKind::RangeNotSatisfiable, "Requested range not satisfiable", 1000 });
        } };

        sink->waitForResponseStart();
        session.join();

        EXPECT_FALSE(sink->getHeaders());
        ASSERT_TRUE(sink->getError());
        EXPECT_EQ(sink->getError()->kind, transfer::TransferErrorKind::RangeNotSatisfiable);
        EXPECT_EQ(sink->getError()->objectSize, 1000);
    }

    TEST_F(WtDownloadSinkTest, relaysChunks)
    {
        std::size_t consumedCount{};
        const std::vector<std::byte> first{ toBytes("abc") };
        const std::vector<std::byte> second{ toBytes("def") };

        sessionSide.onHeaders(createHeaders(6));
        sink->waitForResponseStart();

        EXPECT_EQ(sink->writeResponse(writer), WriteResult::Suspended);
        EXPECT_EQ(writer.suspendCount, 1);

        sessionSide.onData(first, [&] { ++consumedCount; });
        EXPECT_EQ(writer.resumeCount, 1);

        EXPECT_EQ(sink->writeResponse(writer), WriteResult::ChunkWritten);
        EXPECT_EQ(writer.body.str(), "abc");
        EXPECT_EQ(consumedCount, 0);

        // chunk handed over to the connection: the next one is requested
        EXPECT_EQ(sink->writeResponse(writer), WriteResult::Suspended);
        EXPECT_EQ(consumedCount, 1);

        sessionSide.onData(second, [&] { ++consumedCount; });
        EXPECT_EQ(writer.resumeCount, 2);
        EXPECT_EQ(sink->writeResponse(writer), WriteResult::ChunkWritten);
        EXPECT_EQ(writer.body.str(), "abcdef");

        EXPECT_EQ(sink->writeResponse(writer), WriteResult::Suspended);
        EXPECT_EQ(consumedCount, 2);

        sessionSide.onComplete();
        EXPECT_EQ(writer.resumeCount, 3);
        EXPECT_EQ(sink->writeResponse(writer), WriteResult::Finished);
        EXPECT_EQ(writer.suspendCount, 3);
    }

    TEST_F(WtDownloadSinkTest, dataAvailableBeforeWrite)
    {
        const std::vector<std::byte> data{ toBytes("abc") };

        sessionSide.onHeaders(createHeaders(3));
        sessionSide.onData(data, [] {});
        sessionSide.onComplete();

        EXPECT_EQ(sink->writeResponse(writer), WriteResult::ChunkWritten);
        EXPECT_EQ(sink->writeResponse(writer), WriteResult::Finished);
        EXPECT_EQ(writer.body.str(), "abc");
        EXPECT_EQ(writer.suspendCount, 0);
        EXPECT_EQ(writer.resumeCount, 0);
    }

    TEST_F(WtDownloadSinkTest, abortTruncatesBody)
    {
        const std::vector<std::byte> data{ toBytes("abc") };

        sessionSide.onHeaders(createHeaders(1000));
        sessionSide.onData(data, [] {});
        EXPECT_EQ(sink->writeResponse(writer), WriteResult::ChunkWritten);

        EXPECT_EQ(sink->writeResponse(writer), WriteResult::Suspended);
        sessionSide.onAbort(transfer::TransferErrorKind::GatewayTimeout);
        EXPECT_EQ(writer.resumeCount, 1);

        EXPECT_EQ(sink->writeResponse(writer), WriteResult::Finished);
        EXPECT_EQ(writer.body.str(), "abc");
    }

    TEST_F(WtDownloadSinkTest, detachedResponseIsNeverResumed)
    {
        sessionSide.onHeaders(createHeaders(3));
        EXPECT_EQ(sink->writeResponse(writer), WriteResult::Suspended);

        sink->detach();

        const std::vector<std::byte> data{ toBytes("abc") };
        sessionSide.onData(data, [] {});
        sessionSide.onComplete();
        EXPECT_EQ(writer.resumeCount, 0);
    }

    TEST_F(WtDownloadSinkTest, chunkKeptUntilWritten)
    {
        auto chunk{ std::make_shared<const std::vector<std::byte>>(toBytes("abc")) };
        const std::weak_ptr<const std::vector<std::byte>> weakChunk{ chunk };

        sessionSide.onHeaders(createHeaders(3));
        sessionSide.onData(*chunk, [chunk] {});
        chunk.reset();

        // only the consumption callback owns the chunk now
        ASSERT_FALSE(weakChunk.expired());
        EXPECT_EQ(sink->writeResponse(writer), WriteResult::ChunkWritten);
        EXPECT_EQ(writer.body.str(), "abc");
        EXPECT_FALSE(weakChunk.expired());

        EXPECT_EQ(sink->writeResponse(writer), WriteResult::Suspended);
        EXPECT_TRUE(weakChunk.expired());
    }
} // namespace mtg::gateway::tests
