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
#include <memory>
#include <mutex>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include "core/ITimer.hpp"

namespace mtg::core
{
    class AsioTimer final : public ITimer
    {
    public:
        AsioTimer(boost::asio::io_context& ioContext);
        ~AsioTimer() override;
        AsioTimer(const AsioTimer&) = delete;
        AsioTimer& operator=(const AsioTimer&) = delete;

    private:
        void start(std::chrono::milliseconds duration, Callback callback) override;
        void cancel() override;
        bool isArmed() const override;

        // Shared with the pending wait handlers, that may outlive the timer
        struct State
        {
            std::mutex mutex;
            std::uint64_t generation{};
            bool armed{};
        };

        const std::shared_ptr<State> _state;
        boost::asio::steady_timer _timer;
    };

    class AsioTimerFactory final : public ITimerFactory
    {
    public:
        AsioTimerFactory(boost::asio::io_context& ioContext);

    private:
        std::unique_ptr<ITimer> createTimer() override;

        boost::asio::io_context& _ioContext;
    };
} // namespace mtg::core
