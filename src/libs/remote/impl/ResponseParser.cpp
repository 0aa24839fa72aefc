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

#include "ResponseParser.hpp"

#include <Wt/Json/Array.h>
#include <Wt/Json/Parser.h>
#include <Wt/Json/Value.h>
#include <Wt/WException.h>

#include "core/ILogger.hpp"
#include "core/String.hpp"
#include "remote/Exception.hpp"

namespace olmover::remote
{
    namespace
    {
        // task states reported by the remote task manager
        constexpr int taskStateSucceeded{ 2 };
        constexpr int taskStateCanceling{ 3 };
        constexpr int taskStateCanceled{ 4 };
        constexpr int taskStateErrored{ 5 };
        constexpr int taskStateFailed{ 7 };

        std::string valueAsString(const Wt::Json::Value& value)
        {
            switch (value.type())
            {
            case Wt::Json::Type::String:
                return static_cast<std::string>(value);
            case Wt::Json::Type::Number:
                return std::to_string(static_cast<long long>(value));
            default:
                return "";
            }
        }

        RemoteEntry entryFromJson(const Wt::Json::Object& entry)
        {
            RemoteEntry res;
            res.name = static_cast<std::string>(entry.get("name").orIfNull(""));
            res.isDirectory = entry.get("is_dir").orIfNull(false);
            res.size = static_cast<std::uint64_t>(entry.get("size").orIfNull(0LL));

            return res;
        }
    } // namespace

    ApiResponse parseApiResponse(std::string_view body)
    {
        ApiResponse res;

        try
        {
            Wt::Json::Object root;
            Wt::Json::parse(std::string{ body }, root);

            if (root.type("code") != Wt::Json::Type::Number)
                throw RemoteApiException{ "Malformed reply: missing code" };

            res.code = root.get("code");
            res.message = static_cast<std::string>(root.get("message").orIfNull(""));
            if (root.type("data") == Wt::Json::Type::Object)
                res.data = static_cast<const Wt::Json::Object&>(root.get("data"));
        }
        catch (const Wt::WException& e)
        {
            OLMOVER_LOG(REMOTE, DEBUG, "Cannot parse reply '" << body << "': " << e.what());
            throw RemoteApiException{ std::string{ "Malformed reply: " } + e.what() };
        }

        return res;
    }

    bool isConflict(int code, std::string_view message)
    {
        return code == 403 && core::stringUtils::stringCaseInsensitiveContains(message, "exists");
    }

    bool isHttpConflict(std::string_view error)
    {
        return core::stringUtils::stringStartsWith(error, "HTTP status 403")
            && core::stringUtils::stringCaseInsensitiveContains(error, "exists");
    }

    bool isNotFound(std::string_view message)
    {
        return core::stringUtils::stringCaseInsensitiveContains(message, "not exist")
            || core::stringUtils::stringCaseInsensitiveContains(message, "not found");
    }

    std::optional<std::string> parseMoveTaskId(const ApiResponse& response)
    {
        if (response.data.type("tasks") != Wt::Json::Type::Array)
            return std::nullopt;

        const Wt::Json::Array& tasks = response.data.get("tasks");
        if (tasks.empty() || tasks.front().type() != Wt::Json::Type::Object)
            return std::nullopt;

        const Wt::Json::Object& task = tasks.front();
        std::string id{ valueAsString(task.get("id")) };
        if (id.empty())
            return std::nullopt;

        return id;
    }

    TaskInfo parseTaskInfo(const ApiResponse& response)
    {
        TaskInfo res;

        if (response.data.type("state") != Wt::Json::Type::Number)
            return res;

        const int state{ response.data.get("state") };
        switch (state)
        {
        case taskStateSucceeded:
            res.state = TaskInfo::State::Succeeded;
            break;
        case taskStateCanceling:
        case taskStateCanceled:
        case taskStateErrored:
        case taskStateFailed:
            res.state = TaskInfo::State::Failed;
            res.error = static_cast<std::string>(response.data.get("error").orIfNull(""));
            if (res.error.empty())
                res.error = "remote task ended in state " + std::to_string(state);
            break;
        default:
            break;
        }

        return res;
    }

    std::vector<RemoteEntry> parseDirectoryListing(const ApiResponse& response)
    {
        std::vector<RemoteEntry> entries;

        // empty directories are reported with a null content
        if (response.data.type("content") != Wt::Json::Type::Array)
            return entries;

        const Wt::Json::Array& content = response.data.get("content");
        for (const Wt::Json::Value& value : content)
        {
            if (value.type() != Wt::Json::Type::Object)
                continue;

            RemoteEntry entry{ entryFromJson(value) };
            if (!entry.name.empty())
                entries.push_back(std::move(entry));
        }

        return entries;
    }

    RemoteEntry parseEntry(const ApiResponse& response)
    {
        RemoteEntry entry{ entryFromJson(response.data) };
        if (entry.name.empty())
            throw RemoteApiException{ "Malformed reply: missing name" };

        return entry;
    }

    std::string parseFileSign(const ApiResponse& response)
    {
        if (response.data.type("sign") != Wt::Json::Type::String)
            throw RemoteApiException{ "Malformed reply: missing sign" };

        return static_cast<std::string>(response.data.get("sign"));
    }
} // namespace olmover::remote
