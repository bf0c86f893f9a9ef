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

#include "transfer/KeyPathValidator.hpp"

#include <algorithm>
#include <cctype>
#include <string>

#include "core/MimeTypes.hpp"
#include "core/String.hpp"
#include "core/UUID.hpp"
#include "transfer/TransferError.hpp"

namespace mtg::transfer
{
    namespace
    {
        constexpr std::size_t maxKeySize{ 1024 };
        constexpr std::size_t maxOwnerIdSize{ 128 };
        constexpr std::size_t maxFilenameSize{ 255 };
        constexpr std::size_t maxExtensionSize{ 8 };

        bool isForbiddenKeyCharacter(unsigned char c)
        {
            return std::iscntrl(c) || c == '\\';
        }

        bool isValidFilename(std::string_view filename)
        {
            return !filename.empty() && filename.size() <= maxFilenameSize && filename != ".";
        }

        bool isValidExtension(std::string_view extension)
        {
            return !extension.empty()
                && extension.size() <= maxExtensionSize
                && std::all_of(std::cbegin(extension), std::cend(extension), [](unsigned char c) { return std::isalnum(c); });
        }
    } // namespace

    const char* getRejectionReasonName(KeyRejectionReason reason)
    {
        switch (reason)
        {
        case KeyRejectionReason::Empty:
            return "empty key";
        case KeyRejectionReason::TooLong:
            return "key too long";
        case KeyRejectionReason::ParentReference:
            return "parent directory reference";
        case KeyRejectionReason::DoubledSeparator:
            return "doubled separator";
        case KeyRejectionReason::ForbiddenCharacter:
            return "forbidden character";
        case KeyRejectionReason::WrongSegmentCount:
            return "wrong segment count";
        case KeyRejectionReason::CategoryMismatch:
            return "category mismatch";
        case KeyRejectionReason::InvalidOwner:
            return "invalid owner";
        case KeyRejectionReason::InvalidFilename:
            return "invalid filename";
        }
        return "";
    }

    StorageKey::StorageKey(MediaCategory category, std::string_view value)
        : _category{ category }
        , _value{ value }
    {
    }

    std::string_view StorageKey::getOwnerId() const
    {
        const std::string_view value{ _value };
        const std::size_t first{ value.find('/') };
        const std::size_t second{ value.find('/', first + 1) };

        return value.substr(first + 1, second - first - 1);
    }

    std::string_view StorageKey::getFilename() const
    {
        const std::string_view value{ _value };
        return value.substr(value.rfind('/') + 1);
    }

    std::string_view StorageKey::getExtension() const
    {
        const std::string_view filename{ getFilename() };
        const std::size_t pos{ filename.rfind('.') };
        if (pos == std::string_view::npos || pos == 0)
            return {};

        return filename.substr(pos + 1);
    }

    KeyValidationResult validateStorageKey(std::string_view key, MediaCategory expectedCategory) noexcept
    {
        if (key.empty())
            return KeyRejectionReason::Empty;

        if (key.size() > maxKeySize)
            return KeyRejectionReason::TooLong;

        if (key.find("..") != std::string_view::npos)
            return KeyRejectionReason::ParentReference;

        if (key.find("//") != std::string_view::npos)
            return KeyRejectionReason::DoubledSeparator;

        if (std::any_of(std::cbegin(key), std::cend(key), [](unsigned char c) { return isForbiddenKeyCharacter(c); }))
            return KeyRejectionReason::ForbiddenCharacter;

        if (std::count(std::cbegin(key), std::cend(key), '/') != 2)
            return KeyRejectionReason::WrongSegmentCount;

        const std::size_t firstSeparator{ key.find('/') };
        const std::size_t secondSeparator{ key.find('/', firstSeparator + 1) };

        const std::string_view prefix{ key.substr(0, firstSeparator) };
        const std::string_view ownerId{ key.substr(firstSeparator + 1, secondSeparator - firstSeparator - 1) };
        const std::string_view filename{ key.substr(secondSeparator + 1) };

        if (prefix != getKeyPrefix(expectedCategory))
            return KeyRejectionReason::CategoryMismatch;

        if (!isValidOwnerId(ownerId))
            return KeyRejectionReason::InvalidOwner;

        if (!isValidFilename(filename))
            return KeyRejectionReason::InvalidFilename;

        return StorageKey{ expectedCategory, key };
    }

    bool isValidOwnerId(std::string_view ownerId)
    {
        return !ownerId.empty()
            && ownerId.size() <= maxOwnerIdSize
            && std::all_of(std::cbegin(ownerId), std::cend(ownerId), [](unsigned char c) { return std::isalnum(c) || c == '_' || c == '-'; });
    }

    std::string computeFileExtension(std::string_view originalFilename, std::string_view contentType)
    {
        if (const std::size_t pos{ originalFilename.rfind('.') }; pos != std::string_view::npos)
        {
            const std::string extension{ core::stringUtils::stringToLower(originalFilename.substr(pos + 1)) };
            if (isValidExtension(extension))
                return extension;
        }

        if (const std::optional<std::string_view> extension{ core::getFileExtension(contentType) })
            return std::string{ *extension };

        return "bin";
    }

    StorageKey generateStorageKey(MediaCategory category, std::string_view ownerId, std::string_view extension)
    {
        if (!isValidOwnerId(ownerId))
            throw TransferException{ TransferErrorKind::BadRequest, "Invalid owner id" };

        std::string key{ getKeyPrefix(category) };
        key += '/';
        key += ownerId;
        key += '/';
        key += core::UUID::generate().getAsString();
        if (isValidExtension(extension))
        {
            key += '.';
            key += core::stringUtils::stringToLower(extension);
        }

        KeyValidationResult result{ validateStorageKey(key, category) };
        if (const KeyRejectionReason* reason{ std::get_if<KeyRejectionReason>(&result) })
            throw TransferException{ TransferErrorKind::InternalError, std::string{ "Generated an invalid storage key: " } + getRejectionReasonName(*reason) };

        return std::get<StorageKey>(std::move(result));
    }
} // namespace mtg::transfer
