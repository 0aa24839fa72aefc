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

#include "OpenListStorage.hpp"

#include <array>

#include <Wt/Json/Array.h>
#include <Wt/Json/Serializer.h>
#include <Wt/Json/Value.h>
#include <Wt/Utils.h>

#include "core/ILogger.hpp"
#include "remote/Exception.hpp"

#define LOG(sev, message) OLMOVER_LOG(REMOTE, sev, "[OpenList] - " << message)

namespace olmover::remote
{
    namespace
    {
        constexpr std::string_view userAgent{ "olmover" };
        constexpr std::chrono::milliseconds abortCheckPeriod{ 100 };

        Wt::Json::Array toJsonArray(std::span<const std::string> names)
        {
            Wt::Json::Array array;
            for (const std::string& name : names)
                array.push_back(Wt::Json::Value{ name });

            return array;
        }

        Wt::Json::Object createGetBody(const std::filesystem::path& path)
        {
            Wt::Json::Object body;
            body["path"] = Wt::Json::Value{ path.string() };
            body["password"] = Wt::Json::Value{ std::string{} };

            return body;
        }
    } // namespace

    std::unique_ptr<IRemoteStorage> createOpenListStorage(boost::asio::io_context& ioContext, const OpenListSettings& settings)
    {
        return std::make_unique<OpenListStorage>(ioContext, settings);
    }

    OpenListStorage::OpenListStorage(boost::asio::io_context& ioContext, const OpenListSettings& settings)
        : OpenListStorage{ core::http::createClient(ioContext, settings.url, settings.requestTimeout), settings }
    {
    }

    OpenListStorage::OpenListStorage(std::unique_ptr<core::http::IClient> client, const OpenListSettings& settings)
        : _settings{ settings }
        , _client{ std::move(client) }
    {
        LOG(INFO, "Using remote at '" << _settings.url << "'");
    }

    OpenListStorage::~OpenListStorage()
    {
        abort();
    }

    MoveResult OpenListStorage::move(const std::filesystem::path& sourceFile, const std::filesystem::path& destinationFile, bool overwrite)
    {
        MoveResult result;

        Wt::Json::Object body;
        body["src_dir"] = Wt::Json::Value{ sourceFile.parent_path().string() };
        body["dst_dir"] = Wt::Json::Value{ destinationFile.parent_path().string() };
        body["names"] = Wt::Json::Value{ toJsonArray(std::array{ sourceFile.filename().string() }) };
        body["overwrite"] = Wt::Json::Value{ overwrite };

        LOG(DEBUG, "Moving '" << sourceFile.string() << "' to '" << destinationFile.parent_path().string() << "', overwrite = " << overwrite);

        try
        {
            const ApiResponse response{ post("/api/fs/move", body) };
            if (response.code != 200)
            {
                if (!overwrite && isConflict(response.code, response.message))
                    result.status = MoveResult::Status::Conflict;
                else
                    result.status = MoveResult::Status::Error;
                result.message = response.message + " (code " + std::to_string(response.code) + ")";
                return result;
            }

            const std::optional<std::string> taskId{ parseMoveTaskId(response) };
            if (!taskId)
            {
                LOG(WARNING, "No task id returned for '" << sourceFile.string() << "', considering move completed");
                result.status = MoveResult::Status::Success;
                return result;
            }

            return waitForMoveTask(*taskId);
        }
        catch (const RemoteAbortedException&)
        {
            throw;
        }
        catch (const RemoteApiException& e)
        {
            if (!overwrite && isHttpConflict(e.what()))
                result.status = MoveResult::Status::Conflict;
            else
                result.status = MoveResult::Status::Error;
            result.message = e.what();
        }

        return result;
    }

    MoveResult OpenListStorage::waitForMoveTask(const std::string& taskId)
    {
        MoveResult result;

        const auto deadline{ std::chrono::steady_clock::now() + _settings.taskTimeout };
        const std::string url{ "/api/admin/task/move/info?tid=" + Wt::Utils::urlEncode(taskId) };

        LOG(DEBUG, "Waiting for move task '" << taskId << "'");
        while (std::chrono::steady_clock::now() < deadline)
        {
            if (!waitFor(_settings.taskPollInterval))
                throw RemoteAbortedException{};

            TaskInfo info;
            try
            {
                const ApiResponse response{ post(url, Wt::Json::Object{}) };
                if (response.code != 200)
                {
                    LOG(DEBUG, "Cannot get info for task '" << taskId << "': " << response.message << ", will retry");
                    continue;
                }
                info = parseTaskInfo(response);
            }
            catch (const RemoteAbortedException&)
            {
                throw;
            }
            catch (const RemoteApiException& e)
            {
                // the task is still running on the remote side, keep polling
                LOG(DEBUG, "Cannot get info for task '" << taskId << "': " << e.what() << ", will retry");
                continue;
            }

            switch (info.state)
            {
            case TaskInfo::State::InProgress:
                break;

            case TaskInfo::State::Succeeded:
                LOG(DEBUG, "Move task '" << taskId << "' succeeded");
                result.status = MoveResult::Status::Success;
                return result;

            case TaskInfo::State::Failed:
                LOG(DEBUG, "Move task '" << taskId << "' failed: " << info.error);
                result.status = MoveResult::Status::Error;
                result.message = info.error;
                return result;
            }
        }

        result.status = MoveResult::Status::Error;
        result.message = "Timeout while waiting for move task '" + taskId + "'";
        return result;
    }

    std::vector<RemoteEntry> OpenListStorage::listDirectory(const std::filesystem::path& directory, bool refresh)
    {
        Wt::Json::Object body;
        body["path"] = Wt::Json::Value{ directory.string() };
        body["password"] = Wt::Json::Value{ std::string{} };
        body["page"] = Wt::Json::Value{ 1 };
        body["per_page"] = Wt::Json::Value{ 0 };
        body["refresh"] = Wt::Json::Value{ refresh };

        return parseDirectoryListing(postChecked("/api/fs/list", body));
    }

    std::optional<RemoteEntry> OpenListStorage::getEntry(const std::filesystem::path& path)
    {
        const ApiResponse response{ post("/api/fs/get", createGetBody(path)) };
        if (response.code != 200)
        {
            if (isNotFound(response.message))
                return std::nullopt;

            throw RemoteApiException{ response.message, response.code };
        }

        return parseEntry(response);
    }

    std::string OpenListStorage::readFile(const std::filesystem::path& file)
    {
        const std::string sign{ parseFileSign(postChecked("/api/fs/get", createGetBody(file))) };

        std::string url{ "/d" + Wt::Utils::urlEncode(file.string(), "/") };
        if (!sign.empty())
            url += "?sign=" + Wt::Utils::urlEncode(sign);

        return get(url);
    }

    void OpenListStorage::remove(const std::filesystem::path& directory, std::span<const std::string> names)
    {
        if (names.empty())
            return;

        Wt::Json::Object body;
        body["dir"] = Wt::Json::Value{ directory.string() };
        body["names"] = Wt::Json::Value{ toJsonArray(names) };

        const ApiResponse response{ post("/api/fs/remove", body) };
        if (response.code == 200)
            return;

        if (isNotFound(response.message))
        {
            LOG(DEBUG, "Entries already removed from '" << directory.string() << "'");
            return;
        }

        throw RemoteApiException{ response.message, response.code };
    }

    void OpenListStorage::clearTaskHistory()
    {
        postChecked("/api/admin/task/move/clear_succeeded", Wt::Json::Object{});
        LOG(DEBUG, "Cleared succeeded move tasks");
    }

    void OpenListStorage::abort()
    {
        {
            const std::scoped_lock lock{ _abortMutex };
            _abort = true;
        }
        _abortCondition.notify_all();
    }

    ApiResponse OpenListStorage::postChecked(std::string_view relativeUrl, const Wt::Json::Object& body)
    {
        ApiResponse response{ post(relativeUrl, body) };
        if (response.code != 200)
            throw RemoteApiException{ response.message, response.code };

        return response;
    }

    ApiResponse OpenListStorage::post(std::string_view relativeUrl, const Wt::Json::Object& body)
    {
        throwIfAborted();

        auto promise{ std::make_shared<std::promise<std::string>>() };
        std::future<std::string> reply{ promise->get_future() };

        core::http::ClientPOSTRequestParameters params;
        params.relativeUrl = relativeUrl;
        params.message.addHeader("Authorization", _settings.token);
        params.message.addHeader("Content-Type", "application/json");
        params.message.addHeader("User-Agent", std::string{ userAgent });
        params.message.addBodyText(Wt::Json::serialize(body));
        params.onSuccessFunc = [promise](const Wt::Http::Message& msg) {
            promise->set_value(msg.body());
        };
        params.onFailureFunc = [promise](std::string_view error) {
            promise->set_exception(std::make_exception_ptr(RemoteApiException{ error }));
        };
        params.onAbortFunc = [promise] {
            promise->set_exception(std::make_exception_ptr(RemoteAbortedException{}));
        };

        _client->sendPOSTRequest(std::move(params));

        return parseApiResponse(waitForReply(reply));
    }

    std::string OpenListStorage::get(std::string_view relativeUrl)
    {
        throwIfAborted();

        auto promise{ std::make_shared<std::promise<std::string>>() };
        std::future<std::string> reply{ promise->get_future() };

        core::http::ClientGETRequestParameters params;
        params.relativeUrl = relativeUrl;
        params.headers.emplace_back("Authorization", _settings.token);
        params.headers.emplace_back("User-Agent", std::string{ userAgent });
        params.onSuccessFunc = [promise](const Wt::Http::Message& msg) {
            promise->set_value(msg.body());
        };
        params.onFailureFunc = [promise](std::string_view error) {
            promise->set_exception(std::make_exception_ptr(RemoteApiException{ error }));
        };
        params.onAbortFunc = [promise] {
            promise->set_exception(std::make_exception_ptr(RemoteAbortedException{}));
        };

        _client->sendGETRequest(std::move(params));

        return waitForReply(reply);
    }

    std::string OpenListStorage::waitForReply(std::future<std::string>& reply)
    {
        while (reply.wait_for(abortCheckPeriod) != std::future_status::ready)
            throwIfAborted();

        return reply.get();
    }

    bool OpenListStorage::waitFor(std::chrono::seconds duration)
    {
        std::unique_lock lock{ _abortMutex };
        return !_abortCondition.wait_for(lock, duration, [this] { return _abort.load(); });
    }

    void OpenListStorage::throwIfAborted() const
    {
        if (_abort)
            throw RemoteAbortedException{};
    }
} // namespace olmover::remote
