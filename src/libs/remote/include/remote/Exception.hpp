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

#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "core/Exception.hpp"

namespace olmover::remote
{
    class Exception : public core::OlmoverException
    {
    public:
        using OlmoverException::OlmoverException;
    };

    // Transport failure, or an application error reported by the remote API
    class RemoteApiException : public Exception
    {
    public:
        RemoteApiException(std::string_view message, std::optional<int> code = std::nullopt)
            : Exception{ code ? std::string{ message } + " (code " + std::to_string(*code) + ")" : std::string{ message } }
        {
        }
    };

    class RemoteAbortedException : public Exception
    {
    public:
        RemoteAbortedException()
            : Exception{ "Remote operation aborted" }
        {
        }
    };
} // namespace olmover::remote
