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

#include "FileStateStore.hpp"

#include <cerrno>
#include <fstream>
#include <sstream>

#include "core/Exception.hpp"
#include "core/ILogger.hpp"
#include "core/Path.hpp"

namespace olmover::mover
{
    std::unique_ptr<IStateStore> createFileStateStore(const std::filesystem::path& directory)
    {
        return std::make_unique<FileStateStore>(directory);
    }

    FileStateStore::FileStateStore(const std::filesystem::path& directory)
        : _directory{ directory }
    {
        std::error_code ec;
        std::filesystem::create_directories(_directory, ec);
        if (ec)
            throw core::SystemException{ ec, "Cannot create state directory '" + _directory.string() + "'" };

        OLMOVER_LOG(MOVER, DEBUG, "Using state directory '" << _directory.string() << "'");
    }

    std::optional<std::string> FileStateStore::load(std::string_view key)
    {
        const std::scoped_lock lock{ _mutex };

        const std::filesystem::path filePath{ getFilePath(key) };

        std::error_code ec;
        if (!std::filesystem::exists(filePath, ec))
            return std::nullopt;

        std::ifstream ifs{ filePath, std::ios::binary };
        if (!ifs)
            throw core::SystemException{ errno, "Cannot open '" + filePath.string() + "'" };

        std::ostringstream oss;
        oss << ifs.rdbuf();
        return oss.str();
    }

    void FileStateStore::save(std::string_view key, std::string_view value)
    {
        const std::scoped_lock lock{ _mutex };

        core::pathUtils::writeFileAtomically(getFilePath(key), value);
    }

    std::filesystem::path FileStateStore::getFilePath(std::string_view key) const
    {
        return _directory / (std::string{ key } + ".json");
    }
} // namespace olmover::mover
