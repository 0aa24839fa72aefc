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
#include <mutex>

#include "services/mover/IStateStore.hpp"

namespace olmover::mover
{
    class FileStateStore final : public IStateStore
    {
    public:
        FileStateStore(const std::filesystem::path& directory);

    private:
        std::optional<std::string> load(std::string_view key) override;
        void save(std::string_view key, std::string_view value) override;

        std::filesystem::path getFilePath(std::string_view key) const;

        const std::filesystem::path _directory;
        std::mutex _mutex;
    };
} // namespace olmover::mover
