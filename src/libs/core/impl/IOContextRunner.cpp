/*
 * Copyright (C) 2021 Emeric Poupon
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

#include "core/IOContextRunner.hpp"

#include <pthread.h>

#include <cstdlib>

#include "core/ILogger.hpp"

namespace mtg::core
{
    namespace
    {
        void setCurrentThreadName(const std::string& name)
        {
            // Linux limits thread names to 15 chars
            const std::string truncatedName{ name.substr(0, 15) };
            ::pthread_setname_np(::pthread_self(), truncatedName.c_str());
        }
    } // namespace

    IOContextRunner::IOContextRunner(boost::asio::io_context& ioContext, std::size_t threadCount, std::string_view name)
        : _ioContext{ ioContext }
        , _work{ boost::asio::make_work_guard(ioContext) }
        , _name{ name }
    {
        MTG_LOG(UTILS, INFO, "Starting IO context '" << _name << "' with " << threadCount << " threads...");

        for (std::size_t i{}; i < threadCount; ++i)
        {
            _threads.emplace_back([this, i] {
                if (!_name.empty())
                    setCurrentThreadName(_name + std::to_string(i));

                try
                {
                    _ioContext.run();
                }
                catch (const std::exception& e)
                {
                    MTG_LOG(UTILS, FATAL, "Exception caught in IO context '" << _name << "': " << e.what());
                    std::abort();
                }
            });
        }
    }

    void IOContextRunner::stop()
    {
        if (_stopped)
            return;

        MTG_LOG(UTILS, DEBUG, "Stopping IO context '" << _name << "'...");
        _work.reset();
        _ioContext.stop();
        _stopped = true;
        MTG_LOG(UTILS, DEBUG, "IO context '" << _name << "' stopped!");
    }

    std::size_t IOContextRunner::getThreadCount() const
    {
        return _threads.size();
    }

    IOContextRunner::~IOContextRunner()
    {
        stop();

        for (std::thread& t : _threads)
            t.join();
    }
} // namespace mtg::core
