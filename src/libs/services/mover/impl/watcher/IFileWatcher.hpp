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
#include <functional>
#include <memory>

#include <boost/asio/io_context.hpp>

namespace olmover::mover
{
    // Recursive watch of a directory tree, callbacks are invoked from the io_context threads
    class IFileWatcher
    {
    public:
        virtual ~IFileWatcher() = default;
    };

    struct FileWatcherCallbacks
    {
        // a file was created or moved into the watched tree
        std::function<void(const std::filesystem::path&)> onFileAdded;
        // some events were lost
        std::function<void()> onOverflow;
    };

    // throws core::SystemException
    std::unique_ptr<IFileWatcher> createInotifyWatcher(boost::asio::io_context& ioContext, const std::filesystem::path& rootDirectory, FileWatcherCallbacks callbacks);
} // namespace olmover::mover
