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

#include "Sleeper.hpp"

namespace olmover::mover
{
    void Sleeper::abort()
    {
        {
            const std::scoped_lock lock{ _mutex };
            _aborted = true;
        }
        _cv.notify_all();
    }

    bool Sleeper::sleepFor(std::chrono::milliseconds duration)
    {
        std::unique_lock lock{ _mutex };
        return !_cv.wait_for(lock, duration, [this] { return _aborted; });
    }
} // namespace olmover::mover
