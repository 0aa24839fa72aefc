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

#include "services/mover/MoveTask.hpp"
#include "services/mover/MoverSettings.hpp"

namespace olmover::mover
{
    bool isRetryableReason(FailureReason reason);

    // Whether the scanner may still re-enter this failed task
    bool isRetryCandidate(const MoveTask& task, const MoverSettings& settings);
} // namespace olmover::mover
