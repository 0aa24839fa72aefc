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

#include <array>
#include <unordered_map>

#include <sys/inotify.h>

#include <boost/asio/posix/stream_descriptor.hpp>

#include "IFileWatcher.hpp"

namespace olmover::mover
{
    class InotifyWatcher final : public IFileWatcher
    {
    public:
        InotifyWatcher(boost::asio::io_context& ioContext, const std::filesystem::path& rootDirectory, FileWatcherCallbacks callbacks);
        ~InotifyWatcher() override;

        InotifyWatcher(const InotifyWatcher&) = delete;
        InotifyWatcher& operator=(const InotifyWatcher&) = delete;

    private:

        void addWatchRecursive(const std::filesystem::path& directory, bool emitExistingFiles);
        void addWatch(const std::filesystem::path& directory);
        void asyncRead();
        void processEvents(std::size_t size);
        void processEvent(const inotify_event& event);

        const std::filesystem::path _rootDirectory;
        const FileWatcherCallbacks _callbacks;
        boost::asio::posix::stream_descriptor _descriptor;
        std::unordered_map<int, std::filesystem::path> _watchedDirectories;
        alignas(inotify_event) std::array<char, 64 * 1024> _buffer;
    };
} // namespace olmover::mover
