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

#include <gtest/gtest.h>

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include <Wt/Json/Array.h>
#include <Wt/Json/Object.h>
#include <Wt/Json/Parser.h>
#include <Wt/Json/Value.h>

#include "core/http/IClient.hpp"
#include "remote/Exception.hpp"

#include "OpenListStorage.hpp"

namespace olmover::remote::tests
{
    namespace
    {
        // Replies synchronously, as scripted by the test
        class FakeClient final : public core::http::IClient
        {
        public:
            struct Request
            {
                std::string relativeUrl;
                std::string body;
                std::string authorization;
            };

            struct Reply
            {
                enum class Outcome
                {
                    Success,
                    Failure,
                    Abort,
                };

                Outcome outcome{ Outcome::Success };
                std::string content; // body on success, error otherwise
            };

            std::function<Reply(const Request&)> handler;
            std::vector<Request> requests;

        private:
            void sendGETRequest(core::http::ClientGETRequestParameters&& request) override
            {
                std::string authorization;
                for (const Wt::Http::Message::Header& header : request.headers)
                {
                    if (header.name() == "Authorization")
                        authorization = header.value();
                }

                reply(Request{ request.relativeUrl, "", authorization }, request);
            }

            void sendPOSTRequest(core::http::ClientPOSTRequestParameters&& request) override
            {
                const std::string* authorization{ request.message.getHeader("Authorization") };
                reply(Request{ request.relativeUrl, request.message.body(), authorization ? *authorization : "" }, request);
            }

            void reply(const Request& request, const core::http::ClientRequestParameters& parameters)
            {
                requests.push_back(request);

                const Reply scriptedReply{ handler(request) };
                switch (scriptedReply.outcome)
                {
                case Reply::Outcome::Success:
                {
                    Wt::Http::Message msg;
                    msg.setStatus(200);
                    msg.addBodyText(scriptedReply.content);
                    parameters.onSuccessFunc(msg);
                    break;
                }
                case Reply::Outcome::Failure:
                    parameters.onFailureFunc(scriptedReply.content);
                    break;
                case Reply::Outcome::Abort:
                    parameters.onAbortFunc();
                    break;
                }
            }
        };

        FakeClient::Reply success(std::string_view body)
        {
            return FakeClient::Reply{ FakeClient::Reply::Outcome::Success, std::string{ body } };
        }

        FakeClient::Reply failure(std::string_view error)
        {
            return FakeClient::Reply{ FakeClient::Reply::Outcome::Failure, std::string{ error } };
        }

        class OpenListStorageTest : public ::testing::Test
        {
        protected:
            void SetUp() override
            {
                _settings.url = "http://openlist:5244";
                _settings.token = "secret";
                _settings.taskPollInterval = std::chrono::seconds{ 0 };
                _settings.taskTimeout = std::chrono::seconds{ 1 };
            }

            IRemoteStorage& createStorage()
            {
                auto client{ std::make_unique<FakeClient>() };
                _client = client.get();
                _client->handler = [this](const FakeClient::Request& request) { return _handler(request); };
                _storage = std::make_unique<OpenListStorage>(std::move(client), _settings);
                return *_storage;
            }

            const std::vector<FakeClient::Request>& getRequests() const { return _client->requests; }

            OpenListSettings _settings;
            std::function<FakeClient::Reply(const FakeClient::Request&)> _handler;

        private:
            FakeClient* _client{};
            std::unique_ptr<OpenListStorage> _storage;
        };

        Wt::Json::Object parseBody(const std::string& body)
        {
            Wt::Json::Object obj;
            Wt::Json::parse(body, obj);
            return obj;
        }
    } // namespace

    TEST_F(OpenListStorageTest, move)
    {
        std::size_t infoRequestCount{};
        _handler = [&](const FakeClient::Request& request) {
            if (request.relativeUrl == "/api/fs/move")
                return success(R"({"code":200,"message":"success","data":{"tasks":[{"id":"t1"}]}})");

            EXPECT_EQ(request.relativeUrl, "/api/admin/task/move/info?tid=t1");
            if (++infoRequestCount < 3)
                return success(R"({"code":200,"message":"success","data":{"state":1}})");

            return success(R"({"code":200,"message":"success","data":{"state":2}})");
        };
        IRemoteStorage& storage{ createStorage() };

        const MoveResult result{ storage.move("/src/show/e1.mkv", "/dst/show/e1.mkv", false) };
        EXPECT_EQ(result.status, MoveResult::Status::Success);
        EXPECT_EQ(infoRequestCount, 3);

        ASSERT_EQ(getRequests().size(), 4);
        const FakeClient::Request& moveRequest{ getRequests().front() };
        EXPECT_EQ(moveRequest.authorization, "secret");

        const Wt::Json::Object body{ parseBody(moveRequest.body) };
        EXPECT_EQ(static_cast<std::string>(body.get("src_dir")), "/src/show");
        EXPECT_EQ(static_cast<std::string>(body.get("dst_dir")), "/dst/show");
        EXPECT_FALSE(static_cast<bool>(body.get("overwrite")));
        const Wt::Json::Array& names = body.get("names");
        ASSERT_EQ(names.size(), 1);
        EXPECT_EQ(static_cast<std::string>(names.front()), "e1.mkv");
    }

    TEST_F(OpenListStorageTest, move_withoutTaskId)
    {
        _handler = [](const FakeClient::Request&) { return success(R"({"code":200,"message":"success","data":null})"); };
        IRemoteStorage& storage{ createStorage() };

        EXPECT_EQ(storage.move("/src/e1.mkv", "/dst/e1.mkv", true).status, MoveResult::Status::Success);
        EXPECT_EQ(getRequests().size(), 1);
    }

    TEST_F(OpenListStorageTest, move_conflict)
    {
        _handler = [](const FakeClient::Request&) { return success(R"({"code":403,"message":"file already exists"})"); };
        IRemoteStorage& storage{ createStorage() };

        EXPECT_EQ(storage.move("/src/e1.mkv", "/dst/e1.mkv", false).status, MoveResult::Status::Conflict);

        // overwriting cannot conflict
        const MoveResult result{ storage.move("/src/e1.mkv", "/dst/e1.mkv", true) };
        EXPECT_EQ(result.status, MoveResult::Status::Error);
        EXPECT_EQ(result.message, "file already exists (code 403)");
    }

    TEST_F(OpenListStorageTest, move_conflictFromHttpStatus)
    {
        _handler = [](const FakeClient::Request&) { return failure(R"(HTTP status 403: {"message":"object already exists"})"); };
        IRemoteStorage& storage{ createStorage() };

        EXPECT_EQ(storage.move("/src/e1.mkv", "/dst/e1.mkv", false).status, MoveResult::Status::Conflict);
        EXPECT_EQ(storage.move("/src/e1.mkv", "/dst/e1.mkv", true).status, MoveResult::Status::Error);
    }

    TEST_F(OpenListStorageTest, move_transportError)
    {
        _handler = [](const FakeClient::Request&) { return failure("Connection refused"); };
        IRemoteStorage& storage{ createStorage() };

        const MoveResult result{ storage.move("/src/e1.mkv", "/dst/e1.mkv", false) };
        EXPECT_EQ(result.status, MoveResult::Status::Error);
        EXPECT_EQ(result.message, "Connection refused");
    }

    TEST_F(OpenListStorageTest, move_remoteTaskFailed)
    {
        _handler = [](const FakeClient::Request& request) {
            if (request.relativeUrl == "/api/fs/move")
                return success(R"({"code":200,"message":"success","data":{"tasks":[{"id":"t1"}]}})");

            return success(R"({"code":200,"message":"success","data":{"state":7,"error":"no space left on device"}})");
        };
        IRemoteStorage& storage{ createStorage() };

        const MoveResult result{ storage.move("/src/e1.mkv", "/dst/e1.mkv", false) };
        EXPECT_EQ(result.status, MoveResult::Status::Error);
        EXPECT_EQ(result.message, "no space left on device");
    }

    TEST_F(OpenListStorageTest, move_remoteTaskTimeout)
    {
        std::size_t infoRequestCount{};
        _handler = [&](const FakeClient::Request& request) {
            if (request.relativeUrl == "/api/fs/move")
                return success(R"({"code":200,"message":"success","data":{"tasks":[{"id":"t1"}]}})");

            // failed info requests are polled again
            if (++infoRequestCount % 2)
                return failure("HTTP status 502: Bad gateway");

            return success(R"({"code":200,"message":"success","data":{"state":1}})");
        };
        IRemoteStorage& storage{ createStorage() };

        const MoveResult result{ storage.move("/src/e1.mkv", "/dst/e1.mkv", false) };
        EXPECT_EQ(result.status, MoveResult::Status::Error);
        EXPECT_EQ(result.message, "Timeout while waiting for move task 't1'");
        EXPECT_GT(infoRequestCount, 2u);
    }

    TEST_F(OpenListStorageTest, listDirectory)
    {
        _handler = [](const FakeClient::Request& request) {
            const Wt::Json::Object body{ parseBody(request.body) };
            if (static_cast<std::string>(body.get("path")) == "/dsrc/empty")
                return success(R"({"code":200,"message":"success","data":{"content":null,"total":0}})");

            EXPECT_TRUE(static_cast<bool>(body.get("refresh")));
            return success(R"({"code":200,"message":"success","data":{"content":[{"name":"e1.strm","is_dir":false,"size":12},{"name":"extras","is_dir":true,"size":0}]}})");
        };
        IRemoteStorage& storage{ createStorage() };

        const std::vector<RemoteEntry> entries{ storage.listDirectory("/dsrc/show", true) };
        ASSERT_EQ(entries.size(), 2);
        EXPECT_EQ(entries[0].name, "e1.strm");
        EXPECT_EQ(entries[0].size, 12u);
        EXPECT_TRUE(entries[1].isDirectory);

        EXPECT_TRUE(storage.listDirectory("/dsrc/empty", false).empty());
        EXPECT_EQ(getRequests().front().relativeUrl, "/api/fs/list");
    }

    TEST_F(OpenListStorageTest, listDirectory_errors)
    {
        _handler = [](const FakeClient::Request& request) {
            if (static_cast<std::string>(parseBody(request.body).get("path")) == "/missing")
                return success(R"({"code":500,"message":"object not found"})");

            return failure("HTTP status 500: Internal error");
        };
        IRemoteStorage& storage{ createStorage() };

        EXPECT_THROW(storage.listDirectory("/missing", false), RemoteApiException);
        EXPECT_THROW(storage.listDirectory("/dsrc", true), RemoteApiException);
    }

    TEST_F(OpenListStorageTest, getEntry)
    {
        _handler = [](const FakeClient::Request& request) {
            EXPECT_EQ(request.relativeUrl, "/api/fs/get");
            const std::string path{ static_cast<std::string>(parseBody(request.body).get("path")) };
            if (path == "/dst/e1.mkv")
                return success(R"({"code":200,"message":"success","data":{"name":"e1.mkv","is_dir":false,"size":1024,"sign":"abc"}})");
            if (path == "/dst/e2.mkv")
                return success(R"({"code":500,"message":"object not found"})");

            return success(R"({"code":500,"message":"storage not available"})");
        };
        IRemoteStorage& storage{ createStorage() };

        const std::optional<RemoteEntry> entry{ storage.getEntry("/dst/e1.mkv") };
        ASSERT_TRUE(entry.has_value());
        EXPECT_EQ(entry->name, "e1.mkv");
        EXPECT_FALSE(entry->isDirectory);
        EXPECT_EQ(entry->size, 1024u);

        EXPECT_FALSE(storage.getEntry("/dst/e2.mkv").has_value());
        EXPECT_THROW(storage.getEntry("/other/e3.mkv"), RemoteApiException);
    }

    TEST_F(OpenListStorageTest, readFile)
    {
        _handler = [](const FakeClient::Request& request) {
            if (request.relativeUrl == "/api/fs/get")
            {
                EXPECT_EQ(static_cast<std::string>(parseBody(request.body).get("path")), "/dsrc/show/e1.strm");
                return success(R"({"code":200,"message":"success","data":{"name":"e1.strm","sign":"abc"}})");
            }

            EXPECT_EQ(request.relativeUrl, "/d/dsrc/show/e1.strm?sign=abc");
            return success("http://remote/dst/show/e1.mkv");
        };
        IRemoteStorage& storage{ createStorage() };

        EXPECT_EQ(storage.readFile("/dsrc/show/e1.strm"), "http://remote/dst/show/e1.mkv");
        ASSERT_EQ(getRequests().size(), 2);
        EXPECT_EQ(getRequests().back().authorization, "secret");
    }

    TEST_F(OpenListStorageTest, remove)
    {
        _handler = [](const FakeClient::Request& request) {
            const Wt::Json::Object body{ parseBody(request.body) };
            const Wt::Json::Array& names = body.get("names");
            const std::string name{ static_cast<std::string>(names.front()) };
            if (name == "e1.mkv")
                return success(R"({"code":200,"message":"success","data":null})");
            if (name == "gone.mkv")
                return success(R"({"code":500,"message":"file does not exist"})");

            return success(R"({"code":500,"message":"permission denied"})");
        };
        IRemoteStorage& storage{ createStorage() };

        const std::vector<std::string> noNames;
        storage.remove("/dst", noNames);
        EXPECT_TRUE(getRequests().empty());

        const std::vector<std::string> names{ "e1.mkv", "e1.mp4" };
        storage.remove("/dst", names);
        ASSERT_EQ(getRequests().size(), 1);
        EXPECT_EQ(getRequests().front().relativeUrl, "/api/fs/remove");
        EXPECT_EQ(static_cast<std::string>(parseBody(getRequests().front().body).get("dir")), "/dst");

        const std::vector<std::string> goneNames{ "gone.mkv" };
        EXPECT_NO_THROW(storage.remove("/dst", goneNames));

        const std::vector<std::string> protectedNames{ "locked.mkv" };
        EXPECT_THROW(storage.remove("/dst", protectedNames), RemoteApiException);
    }

    TEST_F(OpenListStorageTest, clearTaskHistory)
    {
        _handler = [](const FakeClient::Request& request) {
            EXPECT_EQ(request.relativeUrl, "/api/admin/task/move/clear_succeeded");
            return success(R"({"code":200,"message":"success","data":null})");
        };
        IRemoteStorage& storage{ createStorage() };

        storage.clearTaskHistory();
        EXPECT_EQ(getRequests().size(), 1);
    }

    TEST_F(OpenListStorageTest, abort)
    {
        _handler = [](const FakeClient::Request&) { return FakeClient::Reply{ FakeClient::Reply::Outcome::Abort, "" }; };
        IRemoteStorage& storage{ createStorage() };

        // aborted by the client
        EXPECT_THROW(storage.move("/src/e1.mkv", "/dst/e1.mkv", false), RemoteAbortedException);
        EXPECT_EQ(getRequests().size(), 1);

        storage.abort();
        EXPECT_THROW(storage.listDirectory("/dst", false), RemoteAbortedException);
        EXPECT_THROW(storage.clearTaskHistory(), RemoteAbortedException);
        EXPECT_EQ(getRequests().size(), 1);
    }
} // namespace olmover::remote::tests
