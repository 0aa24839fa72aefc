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
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

#include <boost/asio/io_context.hpp>
#include <boost/asio/io_context_strand.hpp>
#include <boost/asio/steady_timer.hpp>

#include <Wt/Http/Client.h>

#include "ClientRequest.hpp"

namespace olmover::core::http
{
    // Sends queued requests one at a time, in order
    // Transport errors are retried a few times, HTTP 429 replies are retried after the advertised delay
    class SendQueue
    {
    public:
        SendQueue(boost::asio::io_context& ioContext, std::string_view baseUrl, std::chrono::seconds requestTimeout);
        ~SendQueue();

        SendQueue(const SendQueue&) = delete;
        SendQueue& operator=(const SendQueue&) = delete;

        void sendRequest(std::unique_ptr<ClientRequest> request);

        // Pending requests get their abort callback called, returns once nothing is in flight
        void abortAllRequests();

    private:
        // strand only
        void sendNext();
        bool send(const ClientRequest& request);
        void onClientDone(Wt::AsioWrapper::error_code ec, const Wt::Http::Message& msg);
        void retryLater(std::unique_ptr<ClientRequest> request, std::chrono::seconds delay);
        void updateIdleState();

        static constexpr std::size_t _maxRetryCount{ 2 };
        static constexpr std::chrono::seconds _defaultRetryDelay{ 30 };
        static constexpr std::chrono::seconds _minRetryDelay{ 1 };
        static constexpr std::chrono::seconds _maxRetryDelay{ 300 };

        boost::asio::io_context::strand _strand;
        boost::asio::steady_timer _retryTimer;
        const std::string _baseUrl;
        Wt::Http::Client _client;

        std::deque<std::unique_ptr<ClientRequest>> _pendingRequests;
        std::unique_ptr<ClientRequest> _currentRequest;
        bool _waitingForRetry{};

        std::atomic<bool> _aborting{};
        std::mutex _idleMutex;
        std::condition_variable _idleCondition;
        bool _idle{ true };
    };
} // namespace olmover::core::http
