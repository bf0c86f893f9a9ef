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

#include "database/PolicyResolver.hpp"

#include <vector>

#include "core/ILogger.hpp"
#include "core/UUID.hpp"
#include "database/IDb.hpp"
#include "database/Session.hpp"
#include "database/objects/CategorySettings.hpp"
#include "database/objects/MediaRecord.hpp"
#include "transfer/TransferError.hpp"

#define LOG(sev, message) MTG_LOG(DB, sev, "[PolicyResolver] - " << message)

namespace mtg::db
{
    namespace
    {
        class PolicyResolver : public transfer::IPolicyResolver
        {
        public:
            PolicyResolver(IDb& db)
                : _db{ db }
            {
            }

        private:
            std::optional<transfer::ResolvedRecord> resolve(std::string_view recordId) override;
            transfer::CategoryPolicy getLimits(transfer::MediaCategory category) override;
            bool updateStorageKey(std::string_view recordId, std::string_view newStorageKey) override;
            void checkHealth() override;

            IDb& _db;
        };

        core::UUID parseRecordId(std::string_view recordId)
        {
            const std::optional<core::UUID> uuid{ core::UUID::fromString(recordId) };
            if (!uuid)
                throw transfer::TransferException{ transfer::TransferErrorKind::BadRequest, "Invalid record id" };

            return *uuid;
        }

        std::optional<transfer::ResolvedRecord> PolicyResolver::resolve(std::string_view recordId)
        {
            const core::UUID uuid{ parseRecordId(recordId) };

            Session& session{ _db.getTLSSession() };
            auto transaction{ session.createReadTransaction() };

            const MediaRecord::pointer record{ MediaRecord::find(session, uuid.getAsString()) };
            if (!record)
                return std::nullopt;

            const std::optional<transfer::MediaCategory> category{ transfer::parseCategoryName(record->getCategory()) };
            if (!category)
            {
                LOG(ERROR, "Record " << uuid.getAsString() << " has an unknown category '" << record->getCategory() << "'");
                throw transfer::TransferException{ transfer::TransferErrorKind::InternalError, "Invalid record category" };
            }

            return transfer::ResolvedRecord{ record->getStorageKey(), record->getOwnerId(), *category };
        }

        transfer::CategoryPolicy PolicyResolver::getLimits(transfer::MediaCategory category)
        {
            Session& session{ _db.getTLSSession() };
            auto transaction{ session.createReadTransaction() };

            const CategorySettings::pointer settings{ CategorySettings::find(session, transfer::getCategoryName(category)) };
            if (!settings)
            {
                LOG(WARNING, "No settings found for category '" << transfer::getCategoryName(category) << "', using defaults");
                return transfer::getDefaultCategoryPolicy(category);
            }

            transfer::CategoryPolicy policy;
            policy.maxSizeBytes = settings->getMaxSizeBytes();
            for (std::string_view contentType : settings->getAllowedContentTypes())
            {
                std::string normalized{ transfer::normalizeContentType(contentType) };
                if (!normalized.empty())
                    policy.allowedContentTypes.insert(std::move(normalized));
            }

            return policy;
        }

        bool PolicyResolver::updateStorageKey(std::string_view recordId, std::string_view newStorageKey)
        {
            const core::UUID uuid{ parseRecordId(recordId) };

            Session& session{ _db.getTLSSession() };
            auto transaction{ session.createWriteTransaction() };

            MediaRecord::pointer record{ MediaRecord::find(session, uuid.getAsString()) };
            if (!record)
                return false;

            record.modify()->setStorageKey(newStorageKey);
            LOG(DEBUG, "Record " << uuid.getAsString() << " now stored at '" << newStorageKey << "'");

            return true;
        }

        void PolicyResolver::checkHealth()
        {
            Session& session{ _db.getTLSSession() };
            auto transaction{ session.createReadTransaction() };

            session.execute("SELECT 1");
        }
    } // namespace

    std::unique_ptr<transfer::IPolicyResolver> createPolicyResolver(IDb& db)
    {
        return std::make_unique<PolicyResolver>(db);
    }

    void initCategorySettings(Session& session, std::function<transfer::CategoryPolicy(transfer::MediaCategory)> policyProvider)
    {
        auto transaction{ session.createWriteTransaction() };

        for (transfer::MediaCategory category : transfer::mediaCategories)
        {
            const std::string_view categoryName{ transfer::getCategoryName(category) };
            if (CategorySettings::find(session, categoryName))
                continue;

            const transfer::CategoryPolicy policy{ policyProvider(category) };
            const std::vector<std::string_view> contentTypes(std::cbegin(policy.allowedContentTypes), std::cend(policy.allowedContentTypes));

            CategorySettings::pointer settings{ session.create<CategorySettings>(categoryName) };
            settings.modify()->setMaxSizeBytes(policy.maxSizeBytes);
            settings.modify()->setAllowedContentTypes(contentTypes);

            MTG_LOG(DB, INFO, "Created settings for category '" << categoryName << "'");
        }
    }
} // namespace mtg::db
