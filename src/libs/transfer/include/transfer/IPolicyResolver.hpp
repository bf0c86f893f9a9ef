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

#include <optional>
#include <string>
#include <string_view>

#include "transfer/CategoryPolicy.hpp"
#include "transfer/MediaCategory.hpp"

namespace mtg::transfer
{
    struct ResolvedRecord
    {
        std::string storageKey; // not validated
        std::string ownerId;
        MediaCategory category;
    };

    // Ownership and limits lookup, backed by the record database
    // Methods may block, must be usable concurrently
    class IPolicyResolver
    {
    public:
        virtual ~IPolicyResolver() = default;

        // throws TransferException (BadRequest) if the record id is malformed
        virtual std::optional<ResolvedRecord> resolve(std::string_view recordId) = 0;
        virtual CategoryPolicy getLimits(MediaCategory category) = 0;

        // returns false if the record does not exist
        virtual bool updateStorageKey(std::string_view recordId, std::string_view newStorageKey) = 0;

        // throws on database failure
        virtual void checkHealth() = 0;
    };
} // namespace mtg::transfer
