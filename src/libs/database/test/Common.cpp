/*
 * Copyright (C) 2021 Emeric Poupon
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

#include <string>

#include "core/UUID.hpp"

namespace mtg::db::tests
{
    TmpDatabase::TmpDatabase()
        : _tmpFile{ std::filesystem::temp_directory_path() / ("mtg-test-" + std::string{ core::UUID::generate().getAsString() } + ".db") }
        , _fileDeleter{ _tmpFile }
        , _db{ createDb(_tmpFile, 1) }
    {
    }

    IDb& TmpDatabase::getDb()
    {
        return *_db;
    }

    DatabaseFixture::~DatabaseFixture()
    {
        testDatabaseEmpty();
    }

    void DatabaseFixture::SetUpTestCase()
    {
        _tmpDb = std::make_unique<TmpDatabase>();
        {
            db::Session& s{ _tmpDb->getDb().getTLSSession() };
            s.prepareTablesIfNeeded();
            s.createIndexesIfNeeded();
        }
    }

    void DatabaseFixture::TearDownTestCase()
    {
        _tmpDb.reset();
    }

    void DatabaseFixture::testDatabaseEmpty()
    {
        auto transaction{ session.createReadTransaction() };

        EXPECT_EQ(CategorySettings::getCount(session), 0);
        EXPECT_EQ(MediaRecord::getCount(session), 0);
    }

    TEST_F(DatabaseFixture, tablesAlreadyCreated)
    {
        session.prepareTablesIfNeeded();
        session.createIndexesIfNeeded();
    }

    TEST_F(DatabaseFixture, mediaRecord)
    {
        const std::string recordId{ core::UUID::generate().getAsString() };
        {
            auto transaction{ session.createReadTransaction() };
            EXPECT_FALSE(MediaRecord::find(session, recordId));
        }

        ScopedMediaRecord record{ session, recordId, "user-1", "audio", "audio/user-1/track.mp3" };
        {
            auto transaction{ session.createReadTransaction() };

            const MediaRecord::pointer found{ MediaRecord::find(session, recordId) };
            ASSERT_TRUE(found);
            EXPECT_EQ(found->getId(), record.getId());
            EXPECT_EQ(found->getRecordId(), recordId);
            EXPECT_EQ(found->getOwnerId(), "user-1");
            EXPECT_EQ(found->getCategory(), "audio");
            EXPECT_EQ(found->getStorageKey(), "audio/user-1/track.mp3");
            EXPECT_EQ(MediaRecord::getCount(session), 1);
        }

        {
            auto transaction{ session.createWriteTransaction() };
            record.get().modify()->setStorageKey("audio/user-1/other.mp3");
        }
        EXPECT_EQ(record.lockAndGet()->getStorageKey(), "audio/user-1/other.mp3");
    }

    TEST_F(DatabaseFixture, categorySettings)
    {
        ScopedCategorySettings settings{ session, "cover" };
        {
            auto transaction{ session.createWriteTransaction() };

            const std::vector<std::string_view> contentTypes{ "image/png", "image/jpeg" };
            settings.get().modify()->setMaxSizeBytes(1024);
            settings.get().modify()->setAllowedContentTypes(contentTypes);
        }

        {
            auto transaction{ session.createReadTransaction() };

            const CategorySettings::pointer found{ CategorySettings::find(session, "cover") };
            ASSERT_TRUE(found);
            EXPECT_EQ(found->getId(), settings.getId());
            EXPECT_EQ(found->getMaxSizeBytes(), std::uint64_t{ 1024 });
            EXPECT_EQ(found->getAllowedContentTypes(), (std::vector<std::string_view>{ "image/png", "image/jpeg" }));
            EXPECT_FALSE(CategorySettings::find(session, "book"));
        }
    }
} // namespace mtg::db::tests
