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
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <Wt/Http/Request.h>
#include <Wt/Http/Response.h>
#include <Wt/Json/Object.h>

#include "transfer/MediaCategory.hpp"
#include "transfer/TransferError.hpp"

namespace mtg::transfer
{
    struct DownloadError;
}

namespace mtg::gateway
{
    struct ErrorResponse
    {
        int status{};
        std::vector<std::pair<std::string, std::string>> headers;
        std::string body; // {"error": "<reason phrase>", "message": "<text>", "statusCode": <n>}
    };

    ErrorResponse createErrorResponse(transfer::TransferErrorKind kind, std::string_view message);
    // a non satisfiable range also carries "Content-Range: bytes */<size>"
    ErrorResponse createErrorResponse(const transfer::DownloadError& error);
    ErrorResponse createMethodNotAllowedResponse(std::string_view allowedMethods);

    void sendError(Wt::Http::Response& response, const ErrorResponse& error);
    void sendError(Wt::Http::Response& response, transfer::TransferErrorKind kind, std::string_view message);
    void sendMethodNotAllowed(Wt::Http::Response& response, std::string_view allowedMethods);
    void sendJson(Wt::Http::Response& response, int status, const Wt::Json::Object& object);

    std::optional<std::string> getParameter(const Wt::Http::ParameterMap& parameters, std::string_view name);

    // throws TransferException (BadRequest) if missing
    std::string getMandatoryParameter(const Wt::Http::ParameterMap& parameters, std::string_view name);
    // throws TransferException (BadRequest) if missing or not a known category
    transfer::MediaCategory getCategoryParameter(const Wt::Http::ParameterMap& parameters);

    // Keeps [A-Za-z0-9 .-], spaces become '_', at most 100 chars
    std::string sanitizeAttachmentFilename(std::string_view filename);

    // Uses the "filename" parameter if any, the last segment of the storage key otherwise
    std::string createContentDisposition(const Wt::Http::ParameterMap& parameters, std::string_view storageKey);

    // Server wide body limit, Wt refuses larger bodies before any resource sees them
    std::uint64_t getMaxRequestSize(std::uint64_t largestCategoryLimit);

    // Wt has already received the body at this point: bound what is read from it using the declared length
    // multipart bodies are allowed some framing overhead on top of the file itself
    bool isDeclaredLengthTooLarge(std::uint64_t declaredLength, std::uint64_t maxSizeBytes, bool multipart);
} // namespace mtg::gateway
