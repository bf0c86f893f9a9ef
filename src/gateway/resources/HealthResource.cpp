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

#include "HealthResource.hpp"

#include <future>
#include <optional>
#include <string>

#include <Wt/Http/Request.h>
#include <Wt/Http/Response.h>
#include <Wt/Json/Object.h>
#include <Wt/Json/Value.h>

#include "core/ILogger.hpp"
#include "transfer/IObjectStore.hpp"
#include "transfer/IPolicyResolver.hpp"

#include "HttpUtils.hpp"

#define LOG(sev, message) MTG_LOG(HTTP, sev, "[HealthResource] - " << message)

namespace mtg::gateway
{
    namespace
    {
        struct ServiceHealth
        {
            std::optional<std::string> error; // not set if healthy
            std::chrono::milliseconds latency{};
        };

        Wt::Json::Object toJson(const ServiceHealth& health)
        {
            Wt::Json::Object res;
            res["status"] = Wt::Json::Value{ Wt::WString::fromUTF8(health.error ? "error" : "ok") };
            res["latencyMs"] = Wt::Json::Value{ static_cast<long long>(health.latency.count()) };
            if (health.error)
                res["error"] = Wt::Json::Value{ Wt::WString::fromUTF8(*health.error) };

            return res;
        }

        template<typename Func>
        ServiceHealth measure(Func&& func)
        {
            const auto start{ std::chrono::steady_clock::now() };
            std::optional<std::string> error{ func() };

            return ServiceHealth{ std::move(error), std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start) };
        }
    } // namespace

    HealthResource::HealthResource(transfer::IPolicyResolver& policyResolver, transfer::IObjectStore& store, std::chrono::milliseconds storeTimeout)
        : _policyResolver{ policyResolver }
        , _store{ store }
        , _storeTimeout{ storeTimeout }
    {
    }

    HealthResource::~HealthResource()
    {
        beingDeleted();
    }

    void HealthResource::handleRequest(const Wt::Http::Request& request, Wt::Http::Response& response)
    {
        if (request.method() != "GET")
        {
            sendMethodNotAllowed(response, "GET");
            return;
        }

        const ServiceHealth databaseHealth{ measure([this]() -> std::optional<std::string> {
            try
            {
                _policyResolver.checkHealth();
                return std::nullopt;
            }
            catch (const std::exception& e)
            {
                LOG(ERROR, "Database check failed: " << e.what());
                return "Database unreachable";
            }
        }) };

        const ServiceHealth storageHealth{ measure([this]() -> std::optional<std::string> {
            // the promise may be fulfilled after the deadline
            auto promise{ std::make_shared<std::promise<transfer::StoreResult>>() };
            std::future<transfer::StoreResult> future{ promise->get_future() };

            _store.asyncCheckHealth([promise](transfer::StoreResult result) { promise->set_value(result); });

            if (future.wait_for(_storeTimeout) != std::future_status::ready)
            {
                LOG(ERROR, "Storage check timed out");
                return "Storage timed out";
            }

            if (future.get() != transfer::StoreResult::Ok)
            {
                LOG(ERROR, "Storage check failed");
                return "Storage unreachable";
            }

            return std::nullopt;
        }) };

        const std::size_t failureCount{ static_cast<std::size_t>(databaseHealth.error.has_value()) + static_cast<std::size_t>(storageHealth.error.has_value()) };

        Wt::Json::Object services;
        services["database"] = Wt::Json::Value{ toJson(databaseHealth) };
        services["storage"] = Wt::Json::Value{ toJson(storageHealth) };

        Wt::Json::Object body;
        body["status"] = Wt::Json::Value{ Wt::WString::fromUTF8(failureCount == 0 ? "ok" : (failureCount == 2 ? "error" : "degraded")) };
        body["services"] = Wt::Json::Value{ std::move(services) };

        response.addHeader("Cache-Control", "no-store");
        sendJson(response, failureCount == 0 ? 200 : 503, body);
    }
} // namespace mtg::gateway
