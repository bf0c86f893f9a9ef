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

#include "DownloadResource.hpp"

#include <functional>
#include <optional>
#include <ostream>

#include <Wt/Http/Request.h>
#include <Wt/Http/Response.h>
#include <Wt/Http/ResponseContinuation.h>

#include "core/ILogger.hpp"
#include "transfer/IDownloadStreamer.hpp"
#include "transfer/IPolicyResolver.hpp"
#include "transfer/TransferError.hpp"

#include "HttpUtils.hpp"
#include "WtDownloadSink.hpp"

#define LOG(sev, message) MTG_LOG(HTTP, sev, "[DownloadResource] - " << message)

namespace mtg::gateway
{
    namespace
    {
        class WtResponseWriter final : public IResponseWriter
        {
        public:
            WtResponseWriter(Wt::Http::Response& response)
                : _response{ response }
            {
            }

            std::ostream& out() override { return _response.out(); }

            std::function<void()> suspend() override
            {
                _continuation = _response.createContinuation();
                _continuation->waitForMoreData();

                return [continuation = _continuation] { continuation->haveMoreData(); };
            }

            Wt::Http::ResponseContinuation* getContinuation() const { return _continuation; }

        private:
            Wt::Http::Response& _response;
            Wt::Http::ResponseContinuation* _continuation{};
        };

        Wt::Http::ResponseContinuation* writeResponse(WtDownloadSink& sink, Wt::Http::Response& response)
        {
            WtResponseWriter writer{ response };
            switch (sink.writeResponse(writer))
            {
            case WtDownloadSink::WriteResult::ChunkWritten:
                return response.createContinuation();
            case WtDownloadSink::WriteResult::Suspended:
                return writer.getContinuation();
            case WtDownloadSink::WriteResult::Finished:
                break;
            }

            return nullptr;
        }

        struct DownloadContext
        {
            DownloadContext(std::shared_ptr<WtDownloadSink> downloadSink, std::shared_ptr<transfer::IDownloadSession> downloadSession)
                : sink{ std::move(downloadSink) }
                , session{ std::move(downloadSession) }
            {
            }

            ~DownloadContext()
            {
                abort();
            }

            DownloadContext(const DownloadContext&) = delete;
            DownloadContext& operator=(const DownloadContext&) = delete;

            void abort()
            {
                sink->detach();
                session->cancel();
            }

            std::shared_ptr<WtDownloadSink> sink;
            std::shared_ptr<transfer::IDownloadSession> session;
        };

        transfer::DownloadRequest createDownloadRequest(const Wt::Http::Request& request, transfer::IPolicyResolver& policyResolver)
        {
            const Wt::Http::ParameterMap& parameters{ request.getParameterMap() };
            transfer::DownloadRequest downloadRequest;

            if (const std::optional<std::string> recordId{ getParameter(parameters, "id") })
            {
                const std::optional<transfer::ResolvedRecord> record{ policyResolver.resolve(*recordId) };
                if (!record)
                    throw transfer::TransferException{ transfer::TransferErrorKind::NotFound, "Record not found" };

                downloadRequest.key = record->storageKey;
                downloadRequest.category = record->category;
            }
            else
            {
                downloadRequest.category = getCategoryParameter(parameters);
                downloadRequest.key = getMandatoryParameter(parameters, "key");
            }

            if (const std::string range{ request.headerValue("Range") }; !range.empty())
                downloadRequest.rangeHeader = range;

            return downloadRequest;
        }
    } // namespace

    DownloadResource::DownloadResource(transfer::IDownloadStreamer& streamer, transfer::IPolicyResolver& policyResolver)
        : _streamer{ streamer }
        , _policyResolver{ policyResolver }
    {
    }

    DownloadResource::~DownloadResource()
    {
        beingDeleted();
    }

    void DownloadResource::handleRequest(const Wt::Http::Request& request, Wt::Http::Response& response)
    {
        if (Wt::Http::ResponseContinuation * continuation{ request.continuation() })
        {
            auto context{ Wt::cpp17::any_cast<std::shared_ptr<DownloadContext>>(continuation->data()) };

            continuation = writeResponse(*context->sink, response);
            if (continuation)
                continuation->setData(context);
            return;
        }

        if (request.method() != "GET")
        {
            sendMethodNotAllowed(response, "GET");
            return;
        }

        try
        {
            startDownload(request, response);
        }
        catch (const transfer::TransferException& e)
        {
            LOG(DEBUG, "Cannot start download: " << e.what());
            sendError(response, e.getKind(), e.what());
        }
        catch (const std::exception& e)
        {
            LOG(ERROR, "Cannot start download: " << e.what());
            sendError(response, transfer::TransferErrorKind::InternalError, "Internal error");
        }
    }

    void DownloadResource::startDownload(const Wt::Http::Request& request, Wt::Http::Response& response)
    {
        transfer::DownloadRequest downloadRequest{ createDownloadRequest(request, _policyResolver) };
        const std::string key{ downloadRequest.key };
        LOG(DEBUG, "Download requested for '" << key << "', range = '" << downloadRequest.rangeHeader.value_or("") << "'");

        auto sink{ std::make_shared<WtDownloadSink>() };
        auto context{ std::make_shared<DownloadContext>(sink, _streamer.stream(std::move(downloadRequest), sink)) };

        sink->waitForResponseStart();

        if (const std::optional<transfer::DownloadError>& error{ sink->getError() })
        {
            sendError(response, createErrorResponse(*error));
            return;
        }

        const transfer::DownloadHeaders& headers{ *sink->getHeaders() };
        response.setStatus(static_cast<int>(headers.status));
        response.setContentLength(headers.contentLength);
        response.setMimeType(headers.contentType);
        response.addHeader("Accept-Ranges", "bytes");
        if (headers.contentRange)
            response.addHeader("Content-Range", headers.formatContentRange());
        if (!headers.cacheControl.empty())
            response.addHeader("Cache-Control", headers.cacheControl);

        if (getParameter(request.getParameterMap(), "download") == "1")
            response.addHeader("Content-Disposition", createContentDisposition(request.getParameterMap(), key));

        if (Wt::Http::ResponseContinuation * continuation{ writeResponse(*sink, response) })
            continuation->setData(context);
    }

    void DownloadResource::handleAbort(const Wt::Http::Request& request)
    {
        Wt::Http::ResponseContinuation* continuation{ request.continuation() };
        if (!continuation || !continuation->data().has_value())
            return;

        LOG(DEBUG, "Client disconnected");
        Wt::cpp17::any_cast<std::shared_ptr<DownloadContext>>(continuation->data())->abort();
    }
} // namespace mtg::gateway
