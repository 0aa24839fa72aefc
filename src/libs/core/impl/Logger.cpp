/*
 * Copyright (C) 2025 The olmover authors
 *
 * This file is part of olmover.
 *
 * olmover is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * olmover is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with olmover.  If not, see <http://www.gnu.org/licenses/>.
 */

#include "Logger.hpp"

#include <Wt/WDateTime.h>

#include <cassert>
#include <cerrno>
#include <iostream>
#include <thread>

#include "core/Exception.hpp"
#include "core/String.hpp"

namespace olmover::core::logging
{
    const char* getModuleName(Module mod)
    {
        switch (mod)
        {
        case Module::HTTP:
            return "HTTP";
        case Module::MAIN:
            return "MAIN";
        case Module::MOVER:
            return "MOVER";
        case Module::REMOTE:
            return "REMOTE";
        case Module::RETENTION:
            return "RETENTION";
        case Module::SCANNER:
            return "SCANNER";
        case Module::SERVICE:
            return "SERVICE";
        case Module::STRM:
            return "STRM";
        case Module::UTILS:
            return "UTILS";
        case Module::WATCHER:
            return "WATCHER";
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

    Logger::Logger(Severity minSeverity, const std::filesystem::path& logFilePath)
        : _minSeverity{ minSeverity }
    {
        if (!logFilePath.empty())
        {
            _logFileStream = std::make_unique<std::ofstream>(logFilePath, std::ios::out | std::ios::app);
            if (!_logFileStream->is_open())
                throw SystemException{ errno, "Cannot open log file '" + logFilePath.string() + "' for writing" };

            _fileSink.stream = _logFileStream.get();
        }

        _stdoutSink.stream = &std::cout;
        _stderrSink.stream = &std::cerr;
    }

    Logger::~Logger() = default;

    Logger::Sink& Logger::getSink(Severity severity)
    {
        if (_logFileStream)
            return _fileSink;

        switch (severity)
        {
        case Severity::DEBUG:
        case Severity::INFO:
            return _stdoutSink;
        case Severity::WARNING:
        case Severity::ERROR:
        case Severity::FATAL:
            break;
        }

        return _stderrSink;
    }

    bool Logger::isSeverityActive(Severity severity) const
    {
        // enum is ordered from most to least severe
        return static_cast<int>(severity) <= static_cast<int>(_minSeverity);
    }

    void Logger::processLog(const Log& log)
    {
        processLog(log.getModule(), log.getSeverity(), log.getMessage());
    }

    void Logger::processLog(Module module, Severity severity, std::string_view message)
    {
        assert(isSeverityActive(severity)); // should have been filtered out by a isSeverityActive call
        Sink& sink{ getSink(severity) };
        const Wt::WDateTime now{ Wt::WDateTime::currentDateTime() };

        std::unique_lock lock{ sink.mutex };
        *sink.stream << stringUtils::toISO8601String(now) << " " << std::this_thread::get_id() << " [" << getSeverityName(severity) << "] [" << getModuleName(module) << "] " << message << std::endl;
    }
} // namespace olmover::core::logging
