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

#include <Wt/WDateTime.h>

namespace olmover::mover
{
    struct ScanStats
    {
        Wt::WDateTime startTime;
        Wt::WDateTime stopTime;

        std::size_t filesFound{};     // qualifying files in monitor directories
        std::size_t submitted{};      // files with no task at all
        std::size_t retried{};        // failed tasks re-entered
        std::size_t skipped{};        // already synced, active or out of retries
        std::size_t errors{};         // exploration errors
    };
} // namespace olmover::mover
