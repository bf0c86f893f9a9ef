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

#pragma once

#include <filesystem>
#include <memory>

#include <gtest/gtest.h>

#include "database/IDb.hpp"
#include "database/Session.hpp"
#include "database/objects/CategorySettings.hpp"
#include "database/objects/MediaRecord.hpp"

namespace mtg::db::tests
{
    template<typename T>
    class [[nodiscard]] ScopedEntity
    {
    public:
        using IdType = typename T::IdType;

        template<typename... Args>
        ScopedEntity(db::Session& session, Args&&... args)
            : _session{ session }
        {
            auto transaction{ _session.createWriteTransaction() };

            auto entity{ _session.create<T>(std::forward<Args>(args)...) };
            EXPECT_TRUE(entity);
            _id = entity->getId();
        }

        ~ScopedEntity()
        {
            auto transaction{ _session.createWriteTransaction() };

            auto entity{ T::find(_session, _id) };
            if (entity)
                entity.remove();
        }

        ScopedEntity(const ScopedEntity&) = delete;
        ScopedEntity(ScopedEntity&&) = delete;
        ScopedEntity& operator=(const ScopedEntity&) = delete;
        ScopedEntity& operator=(ScopedEntity&&) = delete;

        typename T::pointer lockAndGet()
        {
            auto transaction{ _session.createReadTransaction() };
            return get();
        }

        typename T::pointer get()
        {
            auto entity{ T::find(_session, _id) };
            EXPECT_TRUE(entity);
            return entity;
        }

        IdType getId() const { return _id; }

    private:
        db::Session& _session;
        IdType _id{};
    };

    using ScopedCategorySettings = ScopedEntity<db::CategorySettings>;
    using ScopedMediaRecord = ScopedEntity<db::MediaRecord>;

    class ScopedFileDeleter final
    {
    public:
        ScopedFileDeleter(const std::filesystem::path& path)
            : _path{ path } {}
        ~ScopedFileDeleter()
        {
            std::error_code ec;
            for (const char* suffix : { "", "-wal", "-shm" })
                std::filesystem::remove(_path.string() + suffix, ec);
        }

    private:
        ScopedFileDeleter(const ScopedFileDeleter&) = delete;
        ScopedFileDeleter(ScopedFileDeleter&&) = delete;
        ScopedFileDeleter operator=(const ScopedFileDeleter&) = delete;
        ScopedFileDeleter operator=(ScopedFileDeleter&&) = delete;

        const std::filesystem::path _path;
    };

    class TmpDatabase final
    {
    public:
        TmpDatabase();

        IDb& getDb();

    private:
        const std::filesystem::path _tmpFile;
        ScopedFileDeleter _fileDeleter;
        std::unique_ptr<IDb> _db;
    };

    class DatabaseFixture : public ::testing::Test
    {
    public:
        ~DatabaseFixture() override;

    public:
        static void SetUpTestCase();
        static void TearDownTestCase();

    private:
        void testDatabaseEmpty();

        static inline std::unique_ptr<TmpDatabase> _tmpDb{};

    protected:
        static IDb& getDb() { return _tmpDb->getDb(); }

    public:
        // same session as the one used by the components under test on this thread
        db::Session& session{ _tmpDb->getDb().getTLSSession() };
    };
} // namespace mtg::db::tests
