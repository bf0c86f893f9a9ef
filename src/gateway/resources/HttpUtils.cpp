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


#include "HttpUtils.hpp"

#include <Wt/Json/Serializer.h>
#include <Wt/Json/Value.h>

#include "core/SizeLiterals.hpp"
#include "transfer/IDownloadStreamer.hpp"

namespace mtg::gateway
{
    namespace
    {
        using namespace core::literals;

        constexpr std::size_t maxAttachmentFilenameSize{ 100 };

        // room for the multipart framing around an uploaded file
        constexpr std::uint64_t maxRequestOverhead{ 1_MiB };

        ErrorResponse createErrorResponse(int status, std::string_view reasonPhrase, std::string_view message)
        {
            Wt::Json::Object error;
            error["error"] = Wt::Json::Value{ Wt::WString::fromUTF8(std::string{ reasonPhrase }) };
            error["message"] = Wt::Json::Value{ Wt::WString::fromUTF8(std::string{ message }) };
            error["statusCode"] = Wt::Json::Value{ status };

            return ErrorResponse{ status, {}, Wt::Json::serialize(error) };
        }

        std::string_view getLastSegment(std::string_view key)
        {
            if (const std::size_t pos{ key.rfind('/') }; pos != std::string_view::npos)
                return key.substr(pos + 1);

            return key;
        }
    } // namespace

    ErrorResponse createErrorResponse(transfer::TransferErrorKind kind, std::string_view message)
    {
        return createErrorResponse(static_cast<int>(transfer::toHttpStatus(kind)), transfer::getReasonPhrase(kind), message);
    }

    ErrorResponse createErrorResponse(const transfer::DownloadError& error)
    {
        ErrorResponse response{ createErrorResponse(error.kind, error.message) };
        if (error.objectSize)
            response.headers.emplace_back("Content-Range", error.formatContentRange());

        return response;
    }

    ErrorResponse createMethodNotAllowedResponse(std::string_view allowedMethods)
    {
        ErrorResponse response{ createErrorResponse(405, "Method Not Allowed", "Method not allowed") };
        response.headers.emplace_back("Allow", std::string{ allowedMethods });

        return response;
    }

    void sendError(Wt::Http::Response& response, const ErrorResponse& error)
    {
        for (const auto& [name, value] : error.headers)
            response.addHeader(name, value);

        response.setStatus(error.status);
        response.setMimeType("application/json");
        response.out() << error.body;
    }

    void sendError(Wt::Http::Response& response, transfer::TransferErrorKind kind, std::string_view message)
    {
        sendError(response, createErrorResponse(kind, message));
    }

    void sendMethodNotAllowed(Wt::Http::Response& response, std::string_view allowedMethods)
    {
        sendError(response, createMethodNotAllowedResponse(allowedMethods));
    }

    void sendJson(Wt::Http::Response& response, int status, const Wt::Json::Object& object)
    {
        response.setStatus(status);
        response.setMimeType("application/json");
        response.out() << Wt::Json::serialize(object);
    }

    std::optional<std::string> getParameter(const Wt::Http::ParameterMap& parameters, std::string_view name)
    {
        auto it{ parameters.find(std::string{ name }) };
        if (it == std::cend(parameters) || it->second.empty())
            return std::nullopt;

        return it->second.front();
    }

    std::string getMandatoryParameter(const Wt::Http::ParameterMap& parameters, std::string_view name)
    {
        std::optional<std::string> value{ getParameter(parameters, name) };
        if (!value || value->empty())
            throw transfer::TransferException{ transfer::TransferErrorKind::BadRequest, "Missing parameter '" + std::string{ name } + "'" };

        return std::move(*value);
    }

    transfer::MediaCategory getCategoryParameter(const Wt::Http::ParameterMap& parameters)
    {
        const std::string categoryName{ getMandatoryParameter(parameters, "category") };

        const std::optional<transfer::MediaCategory> category{ transfer::parseCategoryName(categoryName) };
        if (!category)
            throw transfer::TransferException{ transfer::TransferErrorKind::BadRequest, "Invalid category" };

        return *category;
    }

    std::string sanitizeAttachmentFilename(std::string_view filename)
    {
        std::string res;
        res.reserve(filename.size());

        for (const char c : filename)
        {
            if (res.size() == maxAttachmentFilenameSize)
                break;

            if (c == ' ')
            {
                if (res.empty() || res.back() != '_')
                    res.push_back('_');
            }
            else if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '.' || c == '-')
                res.push_back(c);
        }

        return res;
    }

    std::string createContentDisposition(const Wt::Http::ParameterMap& parameters, std::string_view storageKey)
    {
        std::string filename;
        if (const std::optional<std::string> requestedFilename{ getParameter(parameters, "filename") })
            filename = sanitizeAttachmentFilename(*requestedFilename);
        if (filename.empty())
            filename = sanitizeAttachmentFilename(getLastSegment(storageKey));
        if (filename.empty())
            filename = "download";

        return "attachment; filename=\"" + filename + "\"";
    }

    std::uint64_t getMaxRequestSize(std::uint64_t largestCategoryLimit)
    {
        return largestCategoryLimit + maxRequestOverhead;
    }

    bool isDeclaredLengthTooLarge(std::uint64_t declaredLength, std::uint64_t maxSizeBytes, bool multipart)
    {
        return declaredLength > maxSizeBytes + (multipart ? maxRequestOverhead : 0);
    }
} // namespace mtg::gateway
