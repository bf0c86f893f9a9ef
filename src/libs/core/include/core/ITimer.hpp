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
#include <functional>
#include <memory>

namespace boost::asio
{
    class io_context;
}

namespace mtg::core
{
    // One-shot cancellable timer
    class ITimer
    {
    public:
        using Callback = std::function<void()>;

        virtual ~ITimer() = default;

        // Re-arming cancels any pending expiry: its callback will never be called
        // The callback may be called from any thread
        virtual void start(std::chrono::milliseconds duration, Callback callback) = 0;
        virtual void cancel() = 0;
        virtual bool isArmed() const = 0;
    };

    class ITimerFactory
    {
    public:
        virtual ~ITimerFactory() = default;

        virtual std::unique_ptr<ITimer> createTimer() = 0;
    };

    // Steady clock timers, expiries are dispatched on the io context threads
    std::unique_ptr<ITimerFactory> createAsioTimerFactory(boost::asio::io_context& ioContext);
} // namespace mtg::core
