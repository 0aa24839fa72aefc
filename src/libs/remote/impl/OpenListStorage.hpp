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

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <future>
#include <memory>
#include <mutex>
#include <string>

#include <Wt/Json/Object.h>

#include "core/http/IClient.hpp"
#include "remote/IRemoteStorage.hpp"

#include "ResponseParser.hpp"

namespace olmover::remote
{
    class OpenListStorage final : public IRemoteStorage
    {
    public:
        OpenListStorage(boost::asio::io_context& ioContext, const OpenListSettings& settings);
        OpenListStorage(std::unique_ptr<core::http::IClient> client, const OpenListSettings& settings);
        ~OpenListStorage() override;

        OpenListStorage(const OpenListStorage&) = delete;
        OpenListStorage& operator=(const OpenListStorage&) = delete;

    private:
        MoveResult move(const std::filesystem::path& sourceFile, const std::filesystem::path& destinationFile, bool overwrite) override;
        std::vector<RemoteEntry> listDirectory(const std::filesystem::path& directory, bool refresh) override;
        std::optional<RemoteEntry> getEntry(const std::filesystem::path& path) override;
        std::string readFile(const std::filesystem::path& file) override;
        void remove(const std::filesystem::path& directory, std::span<const std::string> names) override;
        void clearTaskHistory() override;
        void abort() override;

        MoveResult waitForMoveTask(const std::string& taskId);

        // throws RemoteApiException if the reply code is not 200
        ApiResponse postChecked(std::string_view relativeUrl, const Wt::Json::Object& body);
        ApiResponse post(std::string_view relativeUrl, const Wt::Json::Object& body);
        std::string get(std::string_view relativeUrl);

        std::string waitForReply(std::future<std::string>& reply);
        // returns false if aborted
        bool waitFor(std::chrono::seconds duration);
        void throwIfAborted() const;

        const OpenListSettings _settings;
        std::unique_ptr<core::http::IClient> _client;

        std::atomic<bool> _abort{};
        std::mutex _abortMutex;
        std::condition_variable _abortCondition;
    };
} // namespace olmover::remote
