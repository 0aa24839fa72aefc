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

#include "remote/Exception.hpp"

#include "ResponseParser.hpp"

namespace olmover::remote::tests
{
    TEST(ResponseParser, apiResponse)
    {
        const ApiResponse response{ parseApiResponse(R"({"code":200,"message":"success","data":{"foo":"bar"}})") };
        EXPECT_EQ(response.code, 200);
        EXPECT_EQ(response.message, "success");
        EXPECT_EQ(response.data.type("foo"), Wt::Json::Type::String);
    }

    TEST(ResponseParser, apiResponse_nullData)
    {
        const ApiResponse response{ parseApiResponse(R"({"code":500,"message":"failed","data":null})") };
        EXPECT_EQ(response.code, 500);
        EXPECT_EQ(response.message, "failed");
        EXPECT_TRUE(response.data.empty());
    }

    TEST(ResponseParser, apiResponse_malformed)
    {
        EXPECT_THROW(parseApiResponse("<html>Bad gateway</html>"), RemoteApiException);
        EXPECT_THROW(parseApiResponse(R"({"message":"no code"})"), RemoteApiException);
        EXPECT_THROW(parseApiResponse(""), RemoteApiException);
    }

    TEST(ResponseParser, conflict)
    {
        EXPECT_TRUE(isConflict(403, "file already exists"));
        EXPECT_TRUE(isConflict(403, "object Exists"));
        EXPECT_FALSE(isConflict(403, "permission denied"));
        EXPECT_FALSE(isConflict(500, "file already exists"));
        EXPECT_FALSE(isConflict(200, "success"));
    }

    TEST(ResponseParser, httpConflict)
    {
        EXPECT_TRUE(isHttpConflict(R"(HTTP status 403: {"code":403,"message":"file already exists"})"));
        EXPECT_TRUE(isHttpConflict("HTTP status 403: object Exists"));
        EXPECT_FALSE(isHttpConflict("HTTP status 403: forbidden"));
        EXPECT_FALSE(isHttpConflict("HTTP status 500: file already exists"));
        EXPECT_FALSE(isHttpConflict("file already exists"));
    }

    TEST(ResponseParser, entry)
    {
        const RemoteEntry entry{ parseEntry(parseApiResponse(R"({"code":200,"message":"success","data":{"name":"e1.mkv","size":2048,"is_dir":false,"sign":""}})")) };
        EXPECT_EQ(entry.name, "e1.mkv");
        EXPECT_EQ(entry.size, 2048u);
        EXPECT_FALSE(entry.isDirectory);

        EXPECT_TRUE(parseEntry(parseApiResponse(R"({"code":200,"message":"success","data":{"name":"show","is_dir":true}})")).isDirectory);
        EXPECT_THROW(parseEntry(parseApiResponse(R"({"code":200,"message":"success","data":null})")), RemoteApiException);
    }

    TEST(ResponseParser, notFound)
    {
        EXPECT_TRUE(isNotFound("object not found"));
        EXPECT_TRUE(isNotFound("file does not exist"));
        EXPECT_FALSE(isNotFound("storage not available"));
    }

    TEST(ResponseParser, moveTaskId)
    {
        {
            const ApiResponse response{ parseApiResponse(R"({"code":200,"message":"success","data":{"tasks":[{"id":"jX8ab","name":"move"}]}})") };
            const auto id{ parseMoveTaskId(response) };
            ASSERT_TRUE(id.has_value());
            EXPECT_EQ(*id, "jX8ab");
        }

        {
            const ApiResponse response{ parseApiResponse(R"({"code":200,"message":"success","data":{"tasks":[{"id":42}]}})") };
            const auto id{ parseMoveTaskId(response) };
            ASSERT_TRUE(id.has_value());
            EXPECT_EQ(*id, "42");
        }

        {
            const ApiResponse response{ parseApiResponse(R"({"code":200,"message":"success","data":{"tasks":[]}})") };
            EXPECT_FALSE(parseMoveTaskId(response).has_value());
        }

        {
            const ApiResponse response{ parseApiResponse(R"({"code":200,"message":"success","data":null})") };
            EXPECT_FALSE(parseMoveTaskId(response).has_value());
        }
    }

    TEST(ResponseParser, taskInfo)
    {
        struct TestCase
        {
            std::string_view body;
            TaskInfo::State expectedState;
            std::string_view expectedError;
        };

        const TestCase tests[]{
            { R"({"code":200,"message":"success","data":{"state":0}})", TaskInfo::State::InProgress, "" },
            { R"({"code":200,"message":"success","data":{"state":1}})", TaskInfo::State::InProgress, "" },
            { R"({"code":200,"message":"success","data":{"state":2,"error":""}})", TaskInfo::State::Succeeded, "" },
            { R"({"code":200,"message":"success","data":{"state":5,"error":"disk full"}})", TaskInfo::State::Failed, "disk full" },
            { R"({"code":200,"message":"success","data":{"state":7,"error":"quota"}})", TaskInfo::State::Failed, "quota" },
            { R"({"code":200,"message":"success","data":{}})", TaskInfo::State::InProgress, "" },
        };

        for (const TestCase& test : tests)
        {
            const TaskInfo info{ parseTaskInfo(parseApiResponse(test.body)) };
            EXPECT_EQ(info.state, test.expectedState) << "Body = '" << test.body << "'";
            EXPECT_EQ(info.error, test.expectedError) << "Body = '" << test.body << "'";
        }
    }

    TEST(ResponseParser, taskInfo_failedWithoutError)
    {
        const TaskInfo info{ parseTaskInfo(parseApiResponse(R"({"code":200,"message":"success","data":{"state":4}})")) };
        EXPECT_EQ(info.state, TaskInfo::State::Failed);
        EXPECT_FALSE(info.error.empty());
    }

    TEST(ResponseParser, directoryListing)
    {
        const ApiResponse response{ parseApiResponse(R"({"code":200,"message":"success","data":{"content":[
            {"name":"Movie.mkv","size":1234567,"is_dir":false},
            {"name":"Movie.strm","size":64,"is_dir":false},
            {"name":"Extras","size":0,"is_dir":true}
        ],"total":3}})") };

        const std::vector<RemoteEntry> entries{ parseDirectoryListing(response) };
        ASSERT_EQ(entries.size(), 3);
        EXPECT_EQ(entries[0].name, "Movie.mkv");
        EXPECT_EQ(entries[0].size, 1234567);
        EXPECT_FALSE(entries[0].isDirectory);
        EXPECT_EQ(entries[1].name, "Movie.strm");
        EXPECT_EQ(entries[2].name, "Extras");
        EXPECT_TRUE(entries[2].isDirectory);
    }

    TEST(ResponseParser, directoryListing_nullContent)
    {
        const ApiResponse response{ parseApiResponse(R"({"code":200,"message":"success","data":{"content":null,"total":0}})") };
        EXPECT_TRUE(parseDirectoryListing(response).empty());
    }

    TEST(ResponseParser, fileSign)
    {
        EXPECT_EQ(parseFileSign(parseApiResponse(R"({"code":200,"message":"success","data":{"name":"a.strm","sign":"abc=:0"}})")), "abc=:0");
        EXPECT_EQ(parseFileSign(parseApiResponse(R"({"code":200,"message":"success","data":{"name":"a.strm","sign":""}})")), "");
        EXPECT_THROW(parseFileSign(parseApiResponse(R"({"code":200,"message":"success","data":{"name":"a.strm"}})")), RemoteApiException);
    }
} // namespace olmover::remote::tests
