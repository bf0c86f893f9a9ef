/*
 * Copyright (C) 2019 Emeric Poupon
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

#include <array>
#include <filesystem>
#include <iosfwd>
#include <list>
#include <mutex>

#include "core/ILogger.hpp"

namespace mtg::core::logging
{
    class Logger final : public ILogger
    {
    public:
        Logger(Severity minSeverity, const std::filesystem::path& logFilePath);
        ~Logger() override;
        Logger(const Logger&) = delete;
        Logger& operator=(const Logger&) = delete;

    private:
        bool isSeverityActive(Severity severity) const override;
        void processLog(const Log& log) override;
        void processLog(Module module, Severity severity, std::string_view message) override;

        struct OutputStream
        {
            OutputStream(std::ostream& os);

            std::mutex mutex;
            std::ostream& stream;
        };
        OutputStream& getOrCreateOutputStream(std::ostream& os);

        static constexpr std::size_t severityCount{ static_cast<std::size_t>(Severity::DEBUG) + 1 };

        std::list<OutputStream> _outputStreams;
        std::array<OutputStream*, severityCount> _outputStreamBySeverity{}; // nullptr if severity is disabled
        std::unique_ptr<std::ofstream> _logFileStream;
    };
} // namespace mtg::core::logging
