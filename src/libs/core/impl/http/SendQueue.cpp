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

#include "SendQueue.hpp"

#include <algorithm>
#include <cassert>
#include <latch>
#include <optional>

#include <boost/asio/bind_executor.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl/error.hpp>

#include "core/ILogger.hpp"
#include "core/String.hpp"

#define LOG(sev, message) OLMOVER_LOG(HTTP, sev, "[Http SendQueue] - " << message)

namespace olmover::core::http
{
    namespace
    {
        // only the delay-seconds form is supported
        std::optional<std::chrono::seconds> getRetryAfter(const Wt::Http::Message& msg)
        {
            const std::string* value{ msg.getHeader("Retry-After") };
            if (!value)
                return std::nullopt;

            const std::optional<std::size_t> seconds{ stringUtils::readAs<std::size_t>(*value) };
            if (!seconds)
                return std::nullopt;

            return std::chrono::seconds{ *seconds };
        }

        void notifyAbort(const ClientRequest& request)
        {
            if (request.getParameters().onAbortFunc)
                request.getParameters().onAbortFunc();
        }

        void notifyFailure(const ClientRequest& request, std::string_view error)
        {
            if (request.getParameters().onFailureFunc)
                request.getParameters().onFailureFunc(error);
        }
    } // namespace

    SendQueue::SendQueue(boost::asio::io_context& ioContext, std::string_view baseUrl, std::chrono::seconds requestTimeout)
        : _strand{ ioContext }
        , _retryTimer{ ioContext }
        , _baseUrl{ stringUtils::stringTrimEnd(baseUrl, "/") }
        , _client{ ioContext }
    {
        _client.setFollowRedirect(true);
        _client.setTimeout(requestTimeout);

        _client.done().connect([this](Wt::AsioWrapper::error_code ec, const Wt::Http::Message& msg) {
            boost::asio::post(boost::asio::bind_executor(_strand, [this, ec, msg] {
                onClientDone(ec, msg);
            }));
        });
    }

    SendQueue::~SendQueue()
    {
        abortAllRequests();
    }

    void SendQueue::sendRequest(std::unique_ptr<ClientRequest> request)
    {
        boost::asio::post(_strand, [this, request = std::move(request)]() mutable {
            if (_aborting)
            {
                LOG(DEBUG, "Abort in progress, request to '" << request->getParameters().relativeUrl << "' not sent");
                notifyAbort(*request);
                return;
            }

            _pendingRequests.push_back(std::move(request));
            sendNext();
        });
    }

    void SendQueue::abortAllRequests()
    {
        LOG(DEBUG, "Aborting all requests");
        _aborting = true;

        std::latch abortPosted{ 1 };
        boost::asio::post(_strand, [this, &abortPosted] {
            for (const std::unique_ptr<ClientRequest>& request : _pendingRequests)
                notifyAbort(*request);
            _pendingRequests.clear();

            // completions come back through the strand
            if (_currentRequest)
                _client.abort();
            if (_waitingForRetry)
                _retryTimer.cancel();

            abortPosted.count_down();
        });
        abortPosted.wait();

        {
            std::unique_lock lock{ _idleMutex };
            _idleCondition.wait(lock, [this] { return _idle; });
        }

        _aborting = false;
        LOG(DEBUG, "All requests aborted");
    }

    void SendQueue::sendNext()
    {
        assert(_strand.running_in_this_thread());

        while (!_currentRequest && !_waitingForRetry && !_pendingRequests.empty())
        {
            std::unique_ptr<ClientRequest> request{ std::move(_pendingRequests.front()) };
            _pendingRequests.pop_front();

            if (send(*request))
                _currentRequest = std::move(request);
            else
                notifyFailure(*request, "bad url or unsupported scheme");
        }

        updateIdleState();
    }

    bool SendQueue::send(const ClientRequest& request)
    {
        const std::string url{ _baseUrl + request.getParameters().relativeUrl };
        LOG(DEBUG, (request.getType() == ClientRequest::Type::GET ? "GET" : "POST") << " '" << url << "'");

        _client.setMaximumResponseSize(request.getParameters().responseBufferSize);

        switch (request.getType())
        {
        case ClientRequest::Type::GET:
            return _client.get(url, request.getGETParameters().headers);

        case ClientRequest::Type::POST:
            return _client.post(url, request.getPOSTParameters().message);
        }

        return false;
    }

    void SendQueue::onClientDone(Wt::AsioWrapper::error_code ec, const Wt::Http::Message& msg)
    {
        assert(_currentRequest);
        std::unique_ptr<ClientRequest> request{ std::move(_currentRequest) };

        if (_aborting || ec == boost::asio::error::operation_aborted)
        {
            notifyAbort(*request);
        }
        else if (ec && ec != boost::asio::ssl::error::stream_truncated)
        {
            if (request->retryCount++ < _maxRetryCount)
            {
                LOG(WARNING, "Transport error '" << ec.message() << "', retry " << request->retryCount << "/" << _maxRetryCount);
                retryLater(std::move(request), _defaultRetryDelay);
                return;
            }

            LOG(ERROR, "Transport error '" << ec.message() << "', giving up");
            notifyFailure(*request, ec.message());
        }
        else if (msg.status() == 429)
        {
            LOG(WARNING, "Too many requests");
            retryLater(std::move(request), getRetryAfter(msg).value_or(_defaultRetryDelay));
            return;
        }
        else if (msg.status() != 200)
        {
            LOG(ERROR, "HTTP status " << msg.status() << ", body = '" << msg.body() << "'");
            notifyFailure(*request, "HTTP status " + std::to_string(msg.status()) + ": " + msg.body());
        }
        else if (request->getParameters().onSuccessFunc)
        {
            request->getParameters().onSuccessFunc(msg);
        }

        sendNext();
    }

    void SendQueue::retryLater(std::unique_ptr<ClientRequest> request, std::chrono::seconds delay)
    {
        const std::chrono::seconds clampedDelay{ std::clamp(delay, _minRetryDelay, _maxRetryDelay) };
        LOG(DEBUG, "Next request in " << clampedDelay.count() << "s");

        _pendingRequests.push_front(std::move(request));
        _waitingForRetry = true;

        _retryTimer.expires_after(clampedDelay);
        _retryTimer.async_wait(boost::asio::bind_executor(_strand, [this](const boost::system::error_code& ec) {
            if (ec && ec != boost::asio::error::operation_aborted)
                LOG(ERROR, "Retry timer failure: " << ec.message());

            _waitingForRetry = false;
            sendNext();
        }));

        updateIdleState();
    }

    void SendQueue::updateIdleState()
    {
        const bool idle{ !_currentRequest && !_waitingForRetry };
        {
            const std::scoped_lock lock{ _idleMutex };
            _idle = idle;
        }

        if (idle)
            _idleCondition.notify_all();
    }
} // namespace olmover::core::http
