/*
 * Copyright (C) 2019 Emeric Poupon
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

#include "core/IConfig.hpp"

#include <libconfig.h++>

namespace mtg::core
{
    class Config final : public IConfig
    {
    public:
        Config(const std::filesystem::path& p);
        ~Config() override = default;

        Config(const Config&) = delete;
        Config& operator=(const Config&) = delete;

    private:
        std::string_view getString(std::string_view setting, std::string_view def) override;
        void visitStrings(std::string_view setting, std::function<void(std::string_view)> func, std::initializer_list<std::string_view> defs) override;
        std::filesystem::path getPath(std::string_view setting, const std::filesystem::path& def) override;
        unsigned long long getULongLong(std::string_view setting, unsigned long long def) override;
        unsigned long getULong(std::string_view setting, unsigned long def) override;
        std::chrono::milliseconds getDuration(std::string_view setting, std::chrono::milliseconds def) override;
        bool getBool(std::string_view setting, bool def) override;
        bool hasSetting(std::string_view setting) const override;

        libconfig::Config _config;
    };
} // namespace mtg::core
