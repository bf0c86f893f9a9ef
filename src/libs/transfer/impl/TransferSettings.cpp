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

#include "transfer/TransferSettings.hpp"

#include "core/Exception.hpp"
#include "core/IConfig.hpp"
#include "core/SizeLiterals.hpp"

namespace mtg::transfer
{
    TransferSettings readTransferSettings(core::IConfig& config)
    {
        const TransferSettings defaults;

        TransferSettings settings;
        settings.metadataTimeout = config.getDuration("metadata-timeout-ms", defaults.metadataTimeout);
        settings.readTimeout = config.getDuration("read-timeout-ms", defaults.readTimeout);
        settings.streamIdleTimeout = config.getDuration("stream-idle-timeout-ms", defaults.streamIdleTimeout);
        settings.writeTimeout = config.getDuration("write-timeout-ms", defaults.writeTimeout);
        settings.streamChunkSize = config.getULong("stream-chunk-size", defaults.streamChunkSize);
        settings.cacheControl = config.getString("cache-control", defaults.cacheControl);

        if (settings.metadataTimeout.count() == 0 || settings.readTimeout.count() == 0 || settings.streamIdleTimeout.count() == 0 || settings.writeTimeout.count() == 0)
            throw core::MtgException{ "Transfer timeouts must not be zero" };

        if (settings.streamChunkSize == 0)
            throw core::MtgException{ "stream-chunk-size must not be zero" };

        return settings;
    }

    CategoryPolicy readCategoryPolicy(core::IConfig& config, MediaCategory category)
    {
        using namespace core::literals;

        const std::string categoryName{ getCategoryName(category) };

        CategoryPolicy policy{ getDefaultCategoryPolicy(category) };
        policy.maxSizeBytes = config.getULongLong(categoryName + "-max-size-mb", policy.maxSizeBytes / 1_MiB) * 1_MiB;
        if (policy.maxSizeBytes == 0)
            throw core::MtgException{ categoryName + "-max-size-mb must not be zero" };

        const std::string contentTypesSetting{ categoryName + "-allowed-content-types" };
        if (config.hasSetting(contentTypesSetting))
        {
            policy.allowedContentTypes.clear();
            config.visitStrings(contentTypesSetting, [&](std::string_view contentType) {
                std::string normalized{ normalizeContentType(contentType) };
                if (!normalized.empty())
                    policy.allowedContentTypes.insert(std::move(normalized));
            }, {});

            if (policy.allowedContentTypes.empty())
                throw core::MtgException{ contentTypesSetting + " must not be empty" };
        }

        return policy;
    }
} // namespace mtg::transfer
