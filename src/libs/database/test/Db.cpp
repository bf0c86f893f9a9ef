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


#include <filesystem>
#include <fstream>
#include <string>

#include <gtest/gtest.h>

#include "core/Exception.hpp"
#include "core/IConfig.hpp"
#include "core/Service.hpp"
#include "core/TemporaryFile.hpp"
#include "core/UUID.hpp"

#include "Common.hpp"

namespace mtg::db::tests
{
    namespace
    {
        class ScopedConfig
        {
        public:
            ScopedConfig(std::string_view content)
                : _file{ std::filesystem::temp_directory_path() }
            {
                {
                    std::ofstream ofs{ _file.getPath(), std::ios::trunc };
                    ofs << content;
                }
                _config = core::Service<core::IConfig>::exchange(core::createConfig(_file.getPath()));
            }

            ~ScopedConfig()
            {
                core::Service<core::IConfig>::exchange(std::move(_config));
            }

            ScopedConfig(const ScopedConfig&) = delete;
            ScopedConfig& operator=(const ScopedConfig&) = delete;

        private:
            core::TemporaryFile _file;
            std::unique_ptr<core::IConfig> _config; // previous one
        };

        std::filesystem::path getTmpDbPath()
        {
            return std::filesystem::temp_directory_path() / ("mtg-test-" + std::string{ core::UUID::generate().getAsString() } + ".db");
        }
    } // namespace

    TEST(Db, integrityCheckSettings)
    {
        for (const std::string_view checkType : { "quick", "full", "none" })
        {
            ScopedConfig config{ "db-integrity-check = \"" + std::string{ checkType } + "\";" };

            const std::filesystem::path dbPath{ getTmpDbPath() };
            ScopedFileDeleter fileDeleter{ dbPath };
            EXPECT_NO_THROW(createDb(dbPath, 1)) << "check type = " << checkType;
        }
    }

    TEST(Db, invalidIntegrityCheckSetting)
    {
        ScopedConfig config{ "db-integrity-check = \"sometimes\";" };

        const std::filesystem::path dbPath{ getTmpDbPath() };
        ScopedFileDeleter fileDeleter{ dbPath };
        EXPECT_THROW(createDb(dbPath, 1), core::MtgException);
    }
} // namespace mtg::db::tests
