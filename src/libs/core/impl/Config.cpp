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

#include "Config.hpp"

#include <string>

#include "core/Exception.hpp"

namespace mtg::core
{
    std::unique_ptr<IConfig> createConfig(const std::filesystem::path& p)
    {
        return std::make_unique<Config>(p);
    }

    Config::Config(const std::filesystem::path& p)
    {
        try
        {
            _config.readFile(p.c_str());
        }
        catch (const libconfig::FileIOException&)
        {
            throw MtgException{ "Cannot open config file '" + p.string() + "'" };
        }
        catch (const libconfig::ParseException& e)
        {
            throw MtgException{ "Cannot parse config file '" + p.string() + "', line = " + std::to_string(e.getLine()) + ", error = '" + e.getError() + "'" };
        }
        catch (const libconfig::ConfigException& e)
        {
            throw MtgException{ "Cannot open config file '" + p.string() + "': " + e.what() };
        }
    }

    std::string_view Config::getString(std::string_view setting, std::string_view def)
    {
        try
        {
            return static_cast<const char*>(_config.lookup(std::string{ setting }));
        }
        catch (const libconfig::ConfigException&)
        {
            return def;
        }
    }

    void Config::visitStrings(std::string_view setting, std::function<void(std::string_view)> func, std::initializer_list<std::string_view> defs)
    {
        try
        {
            const libconfig::Setting& values{ _config.lookup(std::string{ setting }) };
            for (int i{}; i < values.getLength(); ++i)
                func(static_cast<const char*>(values[i]));
        }
        catch (const libconfig::SettingNotFoundException&)
        {
            for (std::string_view def : defs)
                func(def);
        }
        catch (const libconfig::SettingTypeException&)
        {
            throw MtgException{ "Setting '" + std::string{ setting } + "' must be a list of strings" };
        }
    }

    std::filesystem::path Config::getPath(std::string_view setting, const std::filesystem::path& def)
    {
        try
        {
            const char* res{ _config.lookup(std::string{ setting }) };
            return std::filesystem::path{ std::string{ res } };
        }
        catch (const libconfig::ConfigException&)
        {
            return def;
        }
    }

    unsigned long long Config::getULongLong(std::string_view setting, unsigned long long def)
    {
        try
        {
            const long long value{ _config.lookup(std::string{ setting }) };
            if (value < 0)
                throw MtgException{ "Setting '" + std::string{ setting } + "' must not be negative" };

            return static_cast<unsigned long long>(value);
        }
        catch (const libconfig::ConfigException&)
        {
            return def;
        }
    }

    unsigned long Config::getULong(std::string_view setting, unsigned long def)
    {
        return static_cast<unsigned long>(getULongLong(setting, def));
    }

    std::chrono::milliseconds Config::getDuration(std::string_view setting, std::chrono::milliseconds def)
    {
        return std::chrono::milliseconds{ getULongLong(setting, def.count()) };
    }

    bool Config::getBool(std::string_view setting, bool def)
    {
        try
        {
            return _config.lookup(std::string{ setting });
        }
        catch (const libconfig::ConfigException&)
        {
            return def;
        }
    }

    bool Config::hasSetting(std::string_view setting) const
    {
        return _config.exists(std::string{ setting });
    }
} // namespace mtg::core
