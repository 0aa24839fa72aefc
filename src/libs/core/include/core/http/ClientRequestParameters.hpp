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

#include <cstddef>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include <Wt/Http/Message.h>

namespace olmover::core::http
{
    struct ClientRequestParameters
    {
        std::string relativeUrl;                           // relative to baseUrl used by the client
        std::size_t responseBufferSize{ 4 * 1024 * 1024 }; // bigger responses are reported as failures

        // Called only for HTTP status 200, with the full response
        using OnSuccessFunc = std::function<void(const Wt::Http::Message& msg)>;
        OnSuccessFunc onSuccessFunc;

        // Transport error after retries, or a non-200 HTTP status (status and body in error)
        using OnFailureFunc = std::function<void(std::string_view error)>;
        OnFailureFunc onFailureFunc;

        using OnAbortFunc = std::function<void()>;
        OnAbortFunc onAbortFunc;
    };

    struct ClientGETRequestParameters final : public ClientRequestParameters
    {
        std::vector<Wt::Http::Message::Header> headers;
    };

    struct ClientPOSTRequestParameters final : public ClientRequestParameters
    {
        Wt::Http::Message message;
    };
} // namespace olmover::core::http
