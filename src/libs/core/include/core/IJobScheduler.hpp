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
#include <memory>
#include <string_view>

namespace olmover::core
{
    class IJob;

    // Fixed-size worker pool: at most getThreadCount() jobs run at the same time
    class IJobScheduler
    {
    public:
        virtual ~IJobScheduler() = default;

        // Checked before running each queued job, aborted jobs are dropped
        using ShouldAbortCallback = std::function<bool()>;
        virtual void setShouldAbortCallback(ShouldAbortCallback callback) = 0;

        virtual std::size_t getThreadCount() const = 0;
        virtual void scheduleJob(std::unique_ptr<IJob> job) = 0;

        // queued + running
        virtual std::size_t getOngoingJobCount() const = 0;
        virtual void waitUntilJobCountAtMost(std::size_t maxOngoingJobs) = 0;
        virtual void wait() = 0;
    };

    std::unique_ptr<IJobScheduler> createJobScheduler(std::string_view name, std::size_t threadCount);
} // namespace olmover::core
