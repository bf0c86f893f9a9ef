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

#include "core/String.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>

#include <Wt/WDateTime.h>

namespace mtg::core::stringUtils
{
    namespace details
    {
        template<typename StringType>
        std::string joinStrings(std::span<const StringType> strings, std::string_view delimiter)
        {
            std::string res;
            bool first{ true };

            for (const StringType& str : strings)
            {
                if (!first)
                    res += delimiter;
                res += str;
                first = false;
            }

            return res;
        }
    } // namespace details

    std::optional<std::uint64_t> readDecimal(std::string_view str)
    {
        if (str.empty() || !std::all_of(std::cbegin(str), std::cend(str), [](unsigned char c) { return std::isdigit(c); }))
            return std::nullopt;

        std::uint64_t value{};
        const auto [ptr, ec]{ std::from_chars(str.data(), str.data() + str.size(), value) };
        if (ec != std::errc{} || ptr != str.data() + str.size())
            return std::nullopt;

        return value;
    }

    std::vector<std::string_view> splitString(std::string_view str, char separator)
    {
        return splitString(str, std::string_view{ &separator, 1 });
    }

    std::vector<std::string_view> splitString(std::string_view str, std::string_view separator)
    {
        std::vector<std::string_view> res;

        if (separator.empty())
        {
            res.push_back(str);
            return res;
        }

        std::size_t currentPos{};
        while (true)
        {
            const std::size_t nextSeparatorPos{ str.find(separator, currentPos) };
            if (nextSeparatorPos == std::string_view::npos)
                break;

            res.push_back(str.substr(currentPos, nextSeparatorPos - currentPos));
            currentPos = nextSeparatorPos + separator.size();
        }

        res.push_back(str.substr(currentPos));
        return res;
    }

    std::string joinStrings(std::span<const std::string> strings, std::string_view delimiter)
    {
        return details::joinStrings(strings, delimiter);
    }

    std::string joinStrings(std::span<const std::string_view> strings, std::string_view delimiter)
    {
        return details::joinStrings(strings, delimiter);
    }

    std::string_view stringTrim(std::string_view str, std::string_view whitespaces)
    {
        std::string_view res;

        const auto strBegin{ str.find_first_not_of(whitespaces) };
        if (strBegin != std::string_view::npos)
        {
            const auto strEnd{ str.find_last_not_of(whitespaces) };
            res = str.substr(strBegin, strEnd - strBegin + 1);
        }

        return res;
    }

    std::string stringToLower(std::string_view str)
    {
        std::string res;
        res.reserve(str.size());

        std::transform(std::cbegin(str), std::cend(str), std::back_inserter(res), [](unsigned char c) { return std::tolower(c); });

        return res;
    }

    bool stringCaseInsensitiveEqual(std::string_view strA, std::string_view strB)
    {
        if (strA.size() != strB.size())
            return false;

        for (std::size_t i{}; i < strA.size(); ++i)
        {
            if (std::tolower(static_cast<unsigned char>(strA[i])) != std::tolower(static_cast<unsigned char>(strB[i])))
                return false;
        }

        return true;
    }

    std::string toISO8601String(const Wt::WDateTime& dateTime)
    {
        if (dateTime.isValid())
        {
            // assume UTC
            return dateTime.toString("yyyy-MM-ddThh:mm:ss.zzz", false).toUTF8() + 'Z';
        }

        return "";
    }
} // namespace mtg::core::stringUtils
