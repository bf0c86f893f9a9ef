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

#include <Wt/WResource.h>

namespace mtg::transfer
{
    class IDownloadStreamer;
    class IPolicyResolver;
} // namespace mtg::transfer

namespace mtg::gateway
{
    // GET /api/stream?category=<c>&key=<k> or ?id=<recordId>, optional download=1 and filename=<name>
    class DownloadResource final : public Wt::WResource
    {
    public:
        DownloadResource(transfer::IDownloadStreamer& streamer, transfer::IPolicyResolver& policyResolver);
        ~DownloadResource() override;
        DownloadResource(const DownloadResource&) = delete;
        DownloadResource& operator=(const DownloadResource&) = delete;

    private:
        void handleRequest(const Wt::Http::Request& request, Wt::Http::Response& response) override;
        void handleAbort(const Wt::Http::Request& request) override;

        void startDownload(const Wt::Http::Request& request, Wt::Http::Response& response);

        transfer::IDownloadStreamer& _streamer;
        transfer::IPolicyResolver& _policyResolver;
    };
} // namespace mtg::gateway
