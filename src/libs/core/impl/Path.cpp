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

#include "core/Path.hpp"

#include <algorithm>
#include <cerrno>
#include <fstream>

#include "core/Exception.hpp"
#include "core/ILogger.hpp"
#include "core/String.hpp"

namespace olmover::core::pathUtils
{
    bool exploreFilesRecursive(const std::filesystem::path& directory, std::function<bool(std::error_code, const std::filesystem::path&)> cb)
    {
        std::error_code ec;
        std::filesystem::directory_iterator itPath{ directory, std::filesystem::directory_options::follow_directory_symlink, ec };

        if (ec)
        {
            cb(ec, directory);
            return true; // try to continue exploring anyway
        }

        std::filesystem::directory_iterator itEnd;
        while (itPath != itEnd)
        {
            bool continueExploring{ true };

            const std::filesystem::directory_entry& entry{ *itPath };
            const std::filesystem::path& path{ entry.path() };

            if (entry.is_regular_file(ec))
                continueExploring = cb(ec, path);
            else if (entry.is_directory(ec))
                continueExploring = exploreFilesRecursive(path, cb);
            else if (ec)
                continueExploring = cb(ec, path);

            if (!continueExploring)
                return false;

            itPath.increment(ec);
            if (ec)
            {
                cb(ec, directory);
                break;
            }
        }

        return true;
    }

    bool hasFileAnyExtension(const std::filesystem::path& file, std::span<const std::filesystem::path> supportedExtensions)
    {
        const std::filesystem::path extension{ stringUtils::stringToLower(file.extension().c_str()) };

        return (std::find(std::cbegin(supportedExtensions), std::cend(supportedExtensions), extension) != std::cend(supportedExtensions));
    }

    bool isPathInRootPath(const std::filesystem::path& path, const std::filesystem::path& rootPathArg)
    {
        std::filesystem::path curPath{ path };
        std::filesystem::path rootPath{ rootPathArg.has_filename() ? rootPathArg : rootPathArg.parent_path() };

        while (true)
        {
            if (curPath == rootPath)
                return true;

            if (curPath == curPath.root_path() || curPath.empty())
                break;

            curPath = curPath.parent_path();
        }

        return false;
    }

    std::optional<std::uintmax_t> getFileSize(const std::filesystem::path& file)
    {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(file, ec))
            return std::nullopt;

        const std::uintmax_t size{ std::filesystem::file_size(file, ec) };
        if (ec)
            return std::nullopt;

        return size;
    }

    void writeFileAtomically(const std::filesystem::path& file, std::string_view content)
    {
        std::error_code ec;
        std::filesystem::create_directories(file.parent_path(), ec);
        if (ec)
            throw SystemException{ ec, "Cannot create directory " + file.parent_path().string() };

        std::filesystem::path tmpFile{ file };
        tmpFile += ".tmp";

        {
            std::ofstream ofs{ tmpFile, std::ios::out | std::ios::binary | std::ios::trunc };
            if (!ofs)
                throw SystemException{ errno, "Cannot open " + tmpFile.string() + " for writing" };

            ofs.write(content.data(), static_cast<std::streamsize>(content.size()));
            ofs.flush();
            if (!ofs)
            {
                std::filesystem::remove(tmpFile, ec);
                throw OlmoverException{ "Cannot write " + tmpFile.string() + ", no space left?" };
            }
        }

        std::filesystem::rename(tmpFile, file, ec);
        if (ec)
        {
            const std::error_code renameError{ ec };
            std::filesystem::remove(tmpFile, ec);
            throw SystemException{ renameError, "Cannot rename " + tmpFile.string() + " to " + file.string() };
        }

        OLMOVER_LOG(UTILS, DEBUG, "Wrote " << content.size() << " bytes to " << file);
    }
} // namespace olmover::core::pathUtils
