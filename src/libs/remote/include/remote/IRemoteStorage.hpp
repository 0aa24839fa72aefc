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

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include <boost/asio/io_context.hpp>

namespace olmover::remote
{
    struct RemoteEntry
    {
        std::string name;
        bool isDirectory{};
        std::uint64_t size{};
    };

    struct MoveResult
    {
        enum class Status
        {
            Success,
            Conflict, // destination already exists (only reported when not overwriting)
            Error,
        };

        Status status{ Status::Error };
        std::string message;
    };

    // Remote storage seen as a blocking API, all calls are thread safe
    // Unless stated otherwise, errors are reported using RemoteApiException
    class IRemoteStorage
    {
    public:
        virtual ~IRemoteStorage() = default;

        // Returns once the remote side has completed (or failed) the move
        // Never throws RemoteApiException: errors are reported in the result
        virtual MoveResult move(const std::filesystem::path& sourceFile, const std::filesystem::path& destinationFile, bool overwrite) = 0;

        // refresh: ask the remote side to refresh its view of the directory
        // before listing (this is what triggers descriptor generation)
        virtual std::vector<RemoteEntry> listDirectory(const std::filesystem::path& directory, bool refresh) = 0;

        // nullopt if nothing exists at this path
        virtual std::optional<RemoteEntry> getEntry(const std::filesystem::path& path) = 0;

        virtual std::string readFile(const std::filesystem::path& file) = 0;

        // Missing entries are not an error
        virtual void remove(const std::filesystem::path& directory, std::span<const std::string> names) = 0;

        // Drops the history of succeeded move tasks on the remote side
        virtual void clearTaskHistory() = 0;

        // Make pending and future calls fail fast with RemoteAbortedException
        virtual void abort() = 0;
    };

    struct OpenListSettings
    {
        std::string url;
        std::string token;
        std::chrono::seconds requestTimeout{ 30 };
        std::chrono::seconds taskPollInterval{ 5 };
        std::chrono::seconds taskTimeout{ 3600 };
    };

    std::unique_ptr<IRemoteStorage> createOpenListStorage(boost::asio::io_context& ioContext, const OpenListSettings& settings);
} // namespace olmover::remote
