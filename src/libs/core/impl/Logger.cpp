/*
 * Copyright (C) 2013 Emeric Poupon
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

#include "Logger.hpp"

#include <Wt/WDateTime.h>

#include <algorithm>
#include <cassert>
#include <fstream>
#include <iostream>
#include <system_error>
#include <thread>

#include "core/Exception.hpp"
#include "core/String.hpp"

namespace mtg::core::logging
{
    const char* getModuleName(Module mod)
    {
        switch (mod)
        {
        case Module::DB:
            return "DB";
        case Module::DOWNLOAD:
            return "DOWNLOAD";
        case Module::HTTP:
            return "HTTP";
        case Module::MAIN:
            return "MAIN";
        case Module::STORE:
            return "STORE";
        case Module::TRANSFER:
            return "TRANSFER";
        case Module::UPLOAD:
            return "UPLOAD";
        case Module::UTILS:
            return "UTILS";
        case Module::WT:
            return "WT";
        }
        return "";
    }

    const char* getSeverityName(Severity sev)
    {
        switch (sev)
        {
        case Severity::FATAL:
            return "fatal";
        case Severity::ERROR:
            return "error";
        case Severity::WARNING:
            return "warning";
        case Severity::INFO:
            return "info";
        case Severity::DEBUG:
            return "debug";
        }
        return "";
    }

    Log::Log(ILogger& logger, Module module, Severity severity)
        : _logger{ logger }
        , _module{ module }
        , _severity{ severity }
    {
    }

    Log::~Log()
    {
        assert(_logger.isSeverityActive(_severity));
        _logger.processLog(*this);
    }

    std::string Log::getMessage() const
    {
        return _oss.str();
    }

    std::unique_ptr<ILogger> createLogger(Severity minSeverity, const std::filesystem::path& logFilePath)
    {
        return std::make_unique<Logger>(minSeverity, logFilePath);
    }

    Logger::OutputStream::OutputStream(std::ostream& os)
        : stream{ os }
    {
    }

    Logger::Logger(Severity minSeverity, const std::filesystem::path& logFilePath)
    {
        if (!logFilePath.empty())
        {
            _logFileStream = std::make_unique<std::ofstream>(logFilePath, std::ios::out | std::ios::app);
            if (!_logFileStream->is_open())
            {
                const std::error_code ec{ errno, std::generic_category() };
                throw MtgException{ "Cannot open log file '" + logFilePath.string() + "' for writing: " + ec.message() };
            }
        }

        // Severities are ordered from the most to the least important one
        for (std::size_t i{}; i <= static_cast<std::size_t>(minSeverity); ++i)
        {
            const Severity severity{ static_cast<Severity>(i) };

            std::ostream* os{ _logFileStream.get() };
            if (!os)
                os = (severity == Severity::INFO || severity == Severity::DEBUG) ? &std::cout : &std::cerr;

            _outputStreamBySeverity[i] = &getOrCreateOutputStream(*os);
        }
    }

    Logger::~Logger() = default;

    Logger::OutputStream& Logger::getOrCreateOutputStream(std::ostream& os)
    {
        auto it{ std::find_if(_outputStreams.begin(), _outputStreams.end(), [&os](const OutputStream& outputStream) { return &outputStream.stream == &os; }) };
        if (it == _outputStreams.end())
            it = _outputStreams.emplace(_outputStreams.end(), os);

        return *it;
    }

    bool Logger::isSeverityActive(Severity severity) const
    {
        return _outputStreamBySeverity[static_cast<std::size_t>(severity)] != nullptr;
    }

    void Logger::processLog(const Log& log)
    {
        processLog(log.getModule(), log.getSeverity(), log.getMessage());
    }

    void Logger::processLog(Module module, Severity severity, std::string_view message)
    {
        OutputStream* outputStream{ _outputStreamBySeverity[static_cast<std::size_t>(severity)] };
        if (!outputStream)
            return;

        const Wt::WDateTime now{ Wt::WDateTime::currentDateTime() };

        std::unique_lock lock{ outputStream->mutex };
        outputStream->stream << stringUtils::toISO8601String(now) << " " << std::this_thread::get_id() << " [" << getSeverityName(severity) << "] [" << getModuleName(module) << "] " << message << std::endl;
    }
} // namespace mtg::core::logging
