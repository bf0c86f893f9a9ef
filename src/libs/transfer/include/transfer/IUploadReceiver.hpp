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

#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "transfer/CategoryPolicy.hpp"
#include "transfer/KeyPathValidator.hpp"
#include "transfer/MediaCategory.hpp"

namespace mtg::core
{
    class ITimerFactory;
}

namespace mtg::transfer
{
    class IObjectStore;
    struct TransferSettings;

    struct UploadRequest
    {
        MediaCategory category;
        std::string ownerId;
        std::string declaredContentType;
        std::string originalFilename; // may be empty, only used to pick the key extension
        std::optional<std::uint64_t> declaredContentLength;
    };

    struct UploadResult
    {
        StorageKey key;
        std::uint64_t sizeBytes{};
        std::string contentType;
    };

    class IUploadReceiver
    {
    public:
        virtual ~IUploadReceiver() = default;

        // Blocks until the object is stored, the policy is the one of the request category
        // throws TransferException
        virtual UploadResult receive(const UploadRequest& request, const CategoryPolicy& policy, std::istream& body) = 0;

        // Asynchronous, failures are only logged
        virtual void discardObject(const StorageKey& key) = 0;
    };

    std::unique_ptr<IUploadReceiver> createUploadReceiver(IObjectStore& store, core::ITimerFactory& timerFactory, const TransferSettings& settings, const std::filesystem::path& tempDirectory);
} // namespace mtg::transfer
