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

#include <stdexcept>
#include <string>
#include <system_error>

namespace olmover::core
{
    class OlmoverException : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    class SystemException : public OlmoverException
    {
    public:
        SystemException(int err, const std::string& errorMsg)
            : SystemException{ std::error_code{ err, std::generic_category() }, errorMsg }
        {
        }

        SystemException(std::error_code err, const std::string& errorMsg)
            : OlmoverException{ errorMsg + ": " + err.message() }
            , _err{ err }
        {
        }

        std::error_code getErrorCode() const { return _err; }

    private:
        std::error_code _err;
    };
} // namespace olmover::core
