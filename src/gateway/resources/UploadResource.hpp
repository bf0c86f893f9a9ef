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
    class IPolicyResolver;
    class IUploadReceiver;
} // namespace mtg::transfer

namespace mtg::gateway
{
    // POST /api/upload?category=<c>&owner=<ownerId> or ?id=<recordId> to replace the object of a record
    // Raw body or multipart/form-data with a "file" part
    class UploadResource final : public Wt::WResource
    {
    public:
        UploadResource(transfer::IUploadReceiver& receiver, transfer::IPolicyResolver& policyResolver);
        ~UploadResource() override;
        UploadResource(const UploadResource&) = delete;
        UploadResource& operator=(const UploadResource&) = delete;

    private:
        void handleRequest(const Wt::Http::Request& request, Wt::Http::Response& response) override;
        void processUpload(const Wt::Http::Request& request, Wt::Http::Response& response);

        transfer::IUploadReceiver& _receiver;
        transfer::IPolicyResolver& _policyResolver;
    };
} // namespace mtg::gateway
