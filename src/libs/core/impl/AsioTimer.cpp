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

#include "AsioTimer.hpp"

namespace mtg::core
{
    std::unique_ptr<ITimerFactory> createAsioTimerFactory(boost::asio::io_context& ioContext)
    {
        return std::make_unique<AsioTimerFactory>(ioContext);
    }

    AsioTimerFactory::AsioTimerFactory(boost::asio::io_context& ioContext)
        : _ioContext{ ioContext }
    {
    }

    std::unique_ptr<ITimer> AsioTimerFactory::createTimer()
    {
        return std::make_unique<AsioTimer>(_ioContext);
    }

    AsioTimer::AsioTimer(boost::asio::io_context& ioContext)
        : _state{ std::make_shared<State>() }
        , _timer{ ioContext }
    {
    }

    AsioTimer::~AsioTimer()
    {
        cancel();
    }

    void AsioTimer::start(std::chrono::milliseconds duration, Callback callback)
    {
        std::scoped_lock lock{ _state->mutex };

        const std::uint64_t generation{ ++_state->generation };
        _state->armed = true;

        _timer.expires_after(duration);
        _timer.async_wait([state = _state, generation, callback = std::move(callback)](const boost::system::error_code& ec) {
            if (ec == boost::asio::error::operation_aborted)
                return;

            {
                std::scoped_lock lock{ state->mutex };
                if (!state->armed || state->generation != generation)
                    return;

                state->armed = false;
            }

            callback();
        });
    }

    void AsioTimer::cancel()
    {
        std::scoped_lock lock{ _state->mutex };

        ++_state->generation;
        _state->armed = false;
        _timer.cancel();
    }

    bool AsioTimer::isArmed() const
    {
        std::scoped_lock lock{ _state->mutex };
        return _state->armed;
    }
} // namespace mtg::core
