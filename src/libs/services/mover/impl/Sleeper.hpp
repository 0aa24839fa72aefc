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

#include "ISleeper.hpp"

namespace olmover::mover
{
    // Interruptible waits, once aborted all sleeps return immediately
    class Sleeper final : public ISleeper
    {
    public:
        void abort();

    private:
        bool sleepFor(std::chrono::milliseconds duration) override;

        std::mutex _mutex;
        std::condition_variable _cv;
        bool _aborted{};
    };
} // namespace olmover::mover
