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

#include "UploadResource.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <variant>

#include <Wt/Http/Request.h>
#include <Wt/Http/Response.h>
#include <Wt/Json/Object.h>
#include <Wt/Json/Value.h>

#include "core/ILogger.hpp"
#include "core/String.hpp"
#include "transfer/IPolicyResolver.hpp"
#include "transfer/IUploadReceiver.hpp"
#include "transfer/KeyPathValidator.hpp"
#include "transfer/TransferError.hpp"

#include "HttpUtils.hpp"

#define LOG(sev, message) MTG_LOG(HTTP, sev, "[UploadResource] - " << message)

namespace mtg::gateway
{
    namespace
    {
        struct UploadTarget
        {
            transfer::MediaCategory category;
            std::string ownerId;
            std::optional<std::string> recordId;    // set for re-uploads
            std::optional<std::string> previousKey; // set for re-uploads
        };

        UploadTarget getUploadTarget(const Wt::Http::Request& request, transfer::IPolicyResolver& policyResolver)
        {
            const Wt::Http::ParameterMap& parameters{ request.getParameterMap() };
            if (const std::optional<std::string> recordId{ getParameter(parameters, "id") })
            {
                const std::optional<transfer::ResolvedRecord> record{ policyResolver.resolve(*recordId) };
                if (!record)
                    throw transfer::TransferException{ transfer::TransferErrorKind::NotFound, "Record not found" };

                return UploadTarget{ record->category, record->ownerId, *recordId, record->storageKey };
            }

            return UploadTarget{ getCategoryParameter(parameters), getMandatoryParameter(parameters, "owner"), std::nullopt, std::nullopt };
        }

        bool isMultipartRequest(const Wt::Http::Request& request)
        {
            return core::stringUtils::stringToLower(request.contentType()).starts_with("multipart/form-data");
        }
    } // namespace

    UploadResource::UploadResource(transfer::IUploadReceiver& receiver, transfer::IPolicyResolver& policyResolver)
        : _receiver{ receiver }
        , _policyResolver{ policyResolver }
    {
    }

    UploadResource::~UploadResource()
    {
        beingDeleted();
    }

    void UploadResource::handleRequest(const Wt::Http::Request& request, Wt::Http::Response& response)
    {
        if (request.method() != "POST")
        {
            sendMethodNotAllowed(response, "POST");
            return;
        }

        try
        {
            processUpload(request, response);
        }
        catch (const transfer::TransferException& e)
        {
            LOG(DEBUG, "Upload rejected: " << e.what());
            sendError(response, e.getKind(), e.what());
        }
        catch (const std::exception& e)
        {
            LOG(ERROR, "Upload failed: " << e.what());
            sendError(response, transfer::TransferErrorKind::InternalError, "Internal error");
        }
    }

    void UploadResource::processUpload(const Wt::Http::Request& request, Wt::Http::Response& response)
    {
        // body exceeded the server wide limit, Wt dropped it
        if (request.tooLarge() > 0)
            throw transfer::TransferException{ transfer::TransferErrorKind::PayloadTooLarge, "File too large" };

        const UploadTarget target{ getUploadTarget(request, _policyResolver) };
        const transfer::CategoryPolicy policy{ _policyResolver.getLimits(target.category) };

        // first gate: Wt only bounds the body with the largest category limit
        const bool multipart{ isMultipartRequest(request) };
        if (request.contentLength() > 0 && isDeclaredLengthTooLarge(static_cast<std::uint64_t>(request.contentLength()), policy.maxSizeBytes, multipart))
        {
            LOG(DEBUG, "Declared length " << request.contentLength() << " exceeds the limit of " << policy.maxSizeBytes << " bytes");
            throw transfer::TransferException{ transfer::TransferErrorKind::PayloadTooLarge, "File too large" };
        }

        transfer::UploadRequest uploadRequest;
        uploadRequest.category = target.category;
        uploadRequest.ownerId = target.ownerId;

        std::optional<transfer::UploadResult> result;
        if (multipart)
        {
            const Wt::Http::UploadedFile* file{ request.getUploadedFile("file") };
            if (!file)
                throw transfer::TransferException{ transfer::TransferErrorKind::BadRequest, "Missing 'file' part" };

            std::ifstream body{ file->spoolFileName(), std::ios::in | std::ios::binary };
            if (!body)
            {
                LOG(ERROR, "Cannot open spooled upload '" << file->spoolFileName() << "'");
                throw transfer::TransferException{ transfer::TransferErrorKind::InternalError, "Cannot read upload" };
            }

            uploadRequest.declaredContentType = file->contentType();
            uploadRequest.originalFilename = file->clientFileName();
            std::error_code ec;
            if (const std::uintmax_t fileSize{ std::filesystem::file_size(file->spoolFileName(), ec) }; !ec)
                uploadRequest.declaredContentLength = fileSize;

            result = _receiver.receive(uploadRequest, policy, body);
        }
        else
        {
            uploadRequest.declaredContentType = request.contentType();
            if (request.contentLength() > 0)
                uploadRequest.declaredContentLength = static_cast<std::uint64_t>(request.contentLength());

            result = _receiver.receive(uploadRequest, policy, request.in());
        }

        if (target.recordId)
        {
            if (!_policyResolver.updateStorageKey(*target.recordId, result->key.getAsString()))
            {
                // record removed meanwhile
                _receiver.discardObject(result->key);
                throw transfer::TransferException{ transfer::TransferErrorKind::NotFound, "Record not found" };
            }

            if (target.previousKey && !target.previousKey->empty())
            {
                transfer::KeyValidationResult previousKey{ transfer::validateStorageKey(*target.previousKey, target.category) };
                if (const transfer::StorageKey* key{ std::get_if<transfer::StorageKey>(&previousKey) })
                    _receiver.discardObject(*key);
                else
                    LOG(WARNING, "Not removing previous object '" << *target.previousKey << "': " << transfer::getRejectionReasonName(std::get<transfer::KeyRejectionReason>(previousKey)));
            }
        }

        Wt::Json::Object body;
        body["key"] = Wt::Json::Value{ Wt::WString::fromUTF8(result->key.getAsString()) };
        body["size"] = Wt::Json::Value{ static_cast<long long>(result->sizeBytes) };
        body["contentType"] = Wt::Json::Value{ Wt::WString::fromUTF8(result->contentType) };

        sendJson(response, 200, body);
    }
} // namespace mtg::gateway
