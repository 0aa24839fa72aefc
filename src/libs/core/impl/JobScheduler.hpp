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

#include <condition_variable>
#include <mutex>
#include <string>

#include <boost/asio/io_context.hpp>

#include "core/IJobScheduler.hpp"
#include "core/IOContextRunner.hpp"

namespace olmover::core
{
    class JobScheduler final : public IJobScheduler
    {
    public:
        JobScheduler(std::string_view name, std::size_t threadCount);
        ~JobScheduler() override;
        JobScheduler(const JobScheduler&) = delete;
        JobScheduler& operator=(const JobScheduler&) = delete;

    private:
        void setShouldAbortCallback(ShouldAbortCallback callback) override;

        std::size_t getThreadCount() const override;
        void scheduleJob(std::unique_ptr<IJob> job) override;

        std::size_t getOngoingJobCount() const override;
        void waitUntilJobCountAtMost(std::size_t maxOngoingJobs) override;
        void wait() override;

        const std::string _name;
        boost::asio::io_context _ioContext;
        ShouldAbortCallback _abortCallback;

        mutable std::mutex _mutex;
        std::size_t _ongoingJobCount{};
        std::condition_variable _condVar;

        // last member: threads are joined before the rest is destroyed
        IOContextRunner _ioContextRunner;
    };
} // namespace olmover::core
