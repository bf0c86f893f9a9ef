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

#include <Wt/WResource.h>

namespace mtg::transfer
{
    class IObjectStore;
    class IPolicyResolver;
} // namespace mtg::transfer

namespace mtg::gateway
{
    // GET /api/health: 200 when database and storage are reachable, 503 otherwise
    class HealthResource final : public Wt::WResource
    {
    public:
        HealthResource(transfer::IPolicyResolver& policyResolver, transfer::IObjectStore& store, std::chrono::milliseconds storeTimeout);
        ~HealthResource() override;
        HealthResource(const HealthResource&) = delete;
        HealthResource& operator=(const HealthResource&) = delete;

    private:
        void handleRequest(const Wt::Http::Request& request, Wt::Http::Response& response) override;

        transfer::IPolicyResolver& _policyResolver;
        transfer::IObjectStore& _store;
        const std::chrono::milliseconds _storeTimeout;
    };
} // namespace mtg::gateway
