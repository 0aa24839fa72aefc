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

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <Wt/Json/Object.h>

#include "remote/IRemoteStorage.hpp"

namespace olmover::remote
{
    // Every OpenList reply is wrapped in {code, message, data}
    struct ApiResponse
    {
        int code{};
        std::string message;
        Wt::Json::Object data; // empty if null or not an object
    };

    // throws RemoteApiException if the body is not a valid reply
    ApiResponse parseApiResponse(std::string_view body);

    bool isConflict(int code, std::string_view message);
    // Same test on a transport error, non 200 HTTP statuses are reported as "HTTP status <status>: <body>"
    bool isHttpConflict(std::string_view error);
    bool isNotFound(std::string_view message);

    // nullopt if the remote did not create any task
    std::optional<std::string> parseMoveTaskId(const ApiResponse& response);

    struct TaskInfo
    {
        enum class State
        {
            InProgress,
            Succeeded,
            Failed,
        };

        State state{ State::InProgress };
        std::string error;
    };
    TaskInfo parseTaskInfo(const ApiResponse& response);

    std::vector<RemoteEntry> parseDirectoryListing(const ApiResponse& response);

    // throws RemoteApiException if the reply does not describe an entry
    RemoteEntry parseEntry(const ApiResponse& response);

    // throws RemoteApiException if there is no sign field
    std::string parseFileSign(const ApiResponse& response);
} // namespace olmover::remote
