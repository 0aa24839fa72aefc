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
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace olmover::mover
{
    // Durable key/value storage
    class IStateStore
    {
    public:
        virtual ~IStateStore() = default;

        // nullopt if nothing was saved for this key
        virtual std::optional<std::string> load(std::string_view key) = 0;
        // throws on failure
        virtual void save(std::string_view key, std::string_view value) = 0;
    };

    // one file per key in directory
    std::unique_ptr<IStateStore> createFileStateStore(const std::filesystem::path& directory);
} // namespace olmover::mover
