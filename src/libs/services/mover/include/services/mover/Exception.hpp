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

#include <filesystem>

#include "core/Exception.hpp"

namespace olmover::mover
{
    class Exception : public core::OlmoverException
    {
    public:
        using OlmoverException::OlmoverException;
    };

    class NoMappingFoundException : public Exception
    {
    public:
        NoMappingFoundException(const std::filesystem::path& path)
            : Exception{ "No mapping found for '" + path.string() + "'" }
        {
        }
    };

    // Local descriptor tree operation failure
    class FilesystemException : public Exception
    {
    public:
        FilesystemException(const std::filesystem::path& path, const std::string& message)
            : Exception{ message + " '" + path.string() + "'" }
        {
        }
    };
} // namespace olmover::mover
