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

#pragma once

#include <string>
#include <string_view>
#include <variant>

#include "transfer/MediaCategory.hpp"

namespace mtg::transfer
{
    enum class KeyRejectionReason
    {
        Empty,
        TooLong,
        ParentReference,
        DoubledSeparator,
        ForbiddenCharacter,
        WrongSegmentCount,
        CategoryMismatch,
        InvalidOwner,
        InvalidFilename,
    };
    const char* getRejectionReasonName(KeyRejectionReason reason);

    class StorageKey;
    using KeyValidationResult = std::variant<StorageKey, KeyRejectionReason>;

    // Sole gate between user provided keys and the object store
    // Never throws, no side effect
    KeyValidationResult validateStorageKey(std::string_view key, MediaCategory expectedCategory) noexcept;

    // Key that passed validation: "<prefix>/<ownerId>/<filename>"
    class StorageKey
    {
    public:
        MediaCategory getCategory() const { return _category; }
        const std::string& getAsString() const { return _value; }
        std::string_view getOwnerId() const;
        std::string_view getFilename() const;
        std::string_view getExtension() const; // without dot, may be empty

        bool operator==(const StorageKey& other) const { return _value == other._value; }

    private:
        StorageKey(MediaCategory category, std::string_view value);
        friend KeyValidationResult validateStorageKey(std::string_view key, MediaCategory expectedCategory) noexcept;

        MediaCategory _category;
        std::string _value;
    };

    // Owner ids are made of [A-Za-z0-9_-]
    bool isValidOwnerId(std::string_view ownerId);

    // Lower case alphanumeric extension taken from the original file name, or else from the content type, "bin" as last resort
    std::string computeFileExtension(std::string_view originalFilename, std::string_view contentType);

    // Fresh key "<prefix>/<ownerId>/<uuid>.<extension>"
    // throws TransferException (BadRequest) if the owner id is invalid
    StorageKey generateStorageKey(MediaCategory category, std::string_view ownerId, std::string_view extension);
} // namespace mtg::transfer
