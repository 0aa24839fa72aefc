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

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <span>
#include <string_view>

namespace olmover::core::pathUtils
{
    // returns false if aborted by user
    bool exploreFilesRecursive(const std::filesystem::path& directory, std::function<bool(std::error_code, const std::filesystem::path&)> cb);

    // Check if file's extension is one of provided extensions (case insensitive, extensions must be lower case)
    bool hasFileAnyExtension(const std::filesystem::path& file, std::span<const std::filesystem::path> extensions);

    // Check if a path is within a directory
    // Caller responsibility to call with normalized paths
    bool isPathInRootPath(const std::filesystem::path& path, const std::filesystem::path& rootPath);

    // nullopt if the file does not exist or is not a regular file
    std::optional<std::uintmax_t> getFileSize(const std::filesystem::path& file);

    // Write to a sibling temporary file then rename it over the destination
    // Parent directories are created if needed, throws SystemException on error
    void writeFileAtomically(const std::filesystem::path& file, std::string_view content);
} // namespace olmover::core::pathUtils
