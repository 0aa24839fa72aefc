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
#include <memory>
#include <string_view>

#include <boost/asio/io_context.hpp>

#include "core/http/ClientRequestParameters.hpp"

namespace olmover::core::http
{
    // Requests are queued and sent one at a time, callbacks are invoked from the io_context threads
    class IClient
    {
    public:
        virtual ~IClient() = default;

        virtual void sendGETRequest(ClientGETRequestParameters&& request) = 0;
        virtual void sendPOSTRequest(ClientPOSTRequestParameters&& request) = 0;
    };

    std::unique_ptr<IClient> createClient(boost::asio::io_context& ioContext, std::string_view baseUrl, std::chrono::seconds requestTimeout);
} // namespace olmover::core::http
