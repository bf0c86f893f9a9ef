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

#include "transfer/IDownloadStreamer.hpp"

#include "core/ITimer.hpp"
#include "transfer/IObjectStore.hpp"
#include "transfer/TransferSettings.hpp"

#include "DownloadSession.hpp"

namespace mtg::transfer
{
    namespace
    {
        class DownloadStreamer final : public IDownloadStreamer
        {
        public:
            DownloadStreamer(boost::asio::io_context& ioContext, IObjectStore& store, core::ITimerFactory& timerFactory, const TransferSettings& settings)
                : _ioContext{ ioContext }
                , _store{ store }
                , _timerFactory{ timerFactory }
                , _settings{ settings }
            {
            }

        private:
            std::shared_ptr<IDownloadSession> stream(DownloadRequest request, std::shared_ptr<IDownloadSink> sink) override
            {
                auto session{ std::make_shared<DownloadSession>(_ioContext, _store, _timerFactory, _settings, std::move(request), std::move(sink)) };
                session->start();
                return session;
            }

            boost::asio::io_context& _ioContext;
            IObjectStore& _store;
            core::ITimerFactory& _timerFactory;
            const TransferSettings _settings;
        };
    } // namespace

    std::unique_ptr<IDownloadStreamer> createDownloadStreamer(boost::asio::io_context& ioContext, IObjectStore& store, core::ITimerFactory& timerFactory, const TransferSettings& settings)
    {
        return std::make_unique<DownloadStreamer>(ioContext, store, timerFactory, settings);
    }
} // namespace mtg::transfer
