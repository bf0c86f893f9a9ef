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

#include <chrono>
#include <filesystem>
#include <functional>
#include <initializer_list>
#include <memory>
#include <string_view>

namespace mtg::core
{
    // Read-only access to the gateway configuration file
    class IConfig
    {
    public:
        virtual ~IConfig() = default;

        // Default values are returned in case of setting not found
        virtual std::string_view getString(std::string_view setting, std::string_view def) = 0;
        virtual void visitStrings(std::string_view setting, std::function<void(std::string_view)> func, std::initializer_list<std::string_view> defs) = 0;
        virtual std::filesystem::path getPath(std::string_view setting, const std::filesystem::path& def) = 0;
        virtual unsigned long long getULongLong(std::string_view setting, unsigned long long def) = 0;
        virtual unsigned long getULong(std::string_view setting, unsigned long def) = 0;
        virtual std::chrono::milliseconds getDuration(std::string_view setting, std::chrono::milliseconds def) = 0;
        virtual bool getBool(std::string_view setting, bool def) = 0;
        virtual bool hasSetting(std::string_view setting) const = 0;
    };

    // throws MtgException if the file cannot be read or parsed
    std::unique_ptr<IConfig> createConfig(const std::filesystem::path& p);
} // namespace mtg::core
