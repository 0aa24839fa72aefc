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

#include "InotifyWatcher.hpp"

#include <cerrno>
#include <cstdint>

#include <unistd.h>

#include "core/Exception.hpp"
#include "core/ILogger.hpp"
#include "core/Path.hpp"

#define LOG(sev, message) OLMOVER_LOG(WATCHER, sev, "[Watcher '" << _rootDirectory.string() << "'] - " << message)

namespace olmover::mover
{
    namespace
    {
        constexpr std::uint32_t watchMask{ IN_CREATE | IN_MOVED_TO | IN_ONLYDIR };

        int createInotifyDescriptor()
        {
            const int fd{ ::inotify_init1(IN_NONBLOCK | IN_CLOEXEC) };
            if (fd < 0)
                throw core::SystemException{ errno, "inotify_init1 failed" };

            return fd;
        }
    } // namespace

    std::unique_ptr<IFileWatcher> createInotifyWatcher(boost::asio::io_context& ioContext, const std::filesystem::path& rootDirectory, FileWatcherCallbacks callbacks)
    {
        return std::make_unique<InotifyWatcher>(ioContext, rootDirectory, std::move(callbacks));
    }

    InotifyWatcher::InotifyWatcher(boost::asio::io_context& ioContext, const std::filesystem::path& rootDirectory, FileWatcherCallbacks callbacks)
        : _rootDirectory{ rootDirectory }
        , _callbacks{ std::move(callbacks) }
        , _descriptor{ ioContext, createInotifyDescriptor() }
    {
        addWatchRecursive(_rootDirectory, false);
        LOG(INFO, "Watching " << _watchedDirectories.size() << " directories");

        asyncRead();
    }

    InotifyWatcher::~InotifyWatcher()
    {
        boost::system::error_code ec;
        _descriptor.close(ec);
        if (ec)
            LOG(ERROR, "Cannot close inotify descriptor: " << ec.message());
    }

    void InotifyWatcher::addWatchRecursive(const std::filesystem::path& directory, bool emitExistingFiles)
    {
        addWatch(directory);

        std::error_code ec;
        for (std::filesystem::recursive_directory_iterator it{ directory, std::filesystem::directory_options::skip_permission_denied, ec }; !ec && it != std::filesystem::recursive_directory_iterator{}; it.increment(ec))
        {
            if (it->is_directory(ec))
                addWatch(it->path());
            else if (emitExistingFiles && it->is_regular_file(ec))
                _callbacks.onFileAdded(it->path());
        }

        if (ec)
            LOG(ERROR, "Cannot explore '" << directory.string() << "': " << ec.message());
    }

    void InotifyWatcher::addWatch(const std::filesystem::path& directory)
    {
        const int wd{ ::inotify_add_watch(_descriptor.native_handle(), directory.c_str(), watchMask) };
        if (wd < 0)
        {
            const int err{ errno };
            if (directory == _rootDirectory)
                throw core::SystemException{ err, "Cannot watch '" + directory.string() + "'" };

            LOG(ERROR, "Cannot watch '" << directory.string() << "': " << std::error_code(err, std::generic_category()).message());
            return;
        }

        _watchedDirectories[wd] = directory;
        LOG(DEBUG, "Watching '" << directory.string() << "'");
    }

    void InotifyWatcher::asyncRead()
    {
        _descriptor.async_read_some(boost::asio::buffer(_buffer), [this](const boost::system::error_code& ec, std::size_t bytesTransferred) {
            if (ec)
            {
                // forbidden to read any member here as the watcher may already have been destroyed
                if (ec == boost::asio::error::operation_aborted)
                    return;

                LOG(ERROR, "Read failed: " << ec.message() << ", watch stopped");
                return;
            }

            processEvents(bytesTransferred);
            asyncRead();
        });
    }

    void InotifyWatcher::processEvents(std::size_t size)
    {
        std::size_t offset{};
        while (offset + sizeof(inotify_event) <= size)
        {
            const inotify_event& event{ *reinterpret_cast<const inotify_event*>(_buffer.data() + offset) };
            processEvent(event);

            offset += sizeof(inotify_event) + event.len;
        }
    }

    void InotifyWatcher::processEvent(const inotify_event& event)
    {
        if (event.mask & IN_Q_OVERFLOW)
        {
            LOG(WARNING, "Event queue overflow, some files may have been missed");
            if (_callbacks.onOverflow)
                _callbacks.onOverflow();
            return;
        }

        if (event.mask & IN_IGNORED)
        {
            _watchedDirectories.erase(event.wd);
            return;
        }

        auto it{ _watchedDirectories.find(event.wd) };
        if (it == std::cend(_watchedDirectories) || event.len == 0)
            return;

        const std::filesystem::path path{ it->second / event.name };
        if (event.mask & IN_ISDIR)
        {
            LOG(DEBUG, "New directory '" << path.string() << "'");
            // files may have been created before the watch was set
            addWatchRecursive(path, true);
            return;
        }

        LOG(DEBUG, "New file '" << path.string() << "'");
        _callbacks.onFileAdded(path);
    }
} // namespace olmover::mover
