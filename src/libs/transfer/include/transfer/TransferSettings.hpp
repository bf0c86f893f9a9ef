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

#include <chrono>
#include <cstddef>
#include <string>

#include "transfer/CategoryPolicy.hpp"
#include "transfer/MediaCategory.hpp"

namespace mtg::core
{
    class IConfig;
}

namespace mtg::transfer
{
    struct TransferSettings
    {
        std::chrono::milliseconds metadataTimeout{ 5'000 };
        std::chrono::milliseconds readTimeout{ 30'000 };      // read issuance, not the whole transfer
        std::chrono::milliseconds streamIdleTimeout{ 15'000 }; // max silence while waiting for an upstream chunk
        std::chrono::milliseconds writeTimeout{ 300'000 };
        std::size_t streamChunkSize{ 262'144 };
        std::string cacheControl{ "private, max-age=3600" };
    };

    // throws MtgException on inconsistent values
    TransferSettings readTransferSettings(core::IConfig& config);

    // "<category>-max-size-mb" and "<category>-allowed-content-types", missing values fall back to the built-in defaults
    // throws MtgException on a zero size or an empty type list
    CategoryPolicy readCategoryPolicy(core::IConfig& config, MediaCategory category);
} // namespace mtg::transfer
