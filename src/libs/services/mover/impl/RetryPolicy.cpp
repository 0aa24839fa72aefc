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

#include "RetryPolicy.hpp"

namespace olmover::mover
{
    bool isRetryableReason(FailureReason reason)
    {
        switch (reason)
        {
        case FailureReason::RemoteApiError:
        case FailureReason::FilesystemError:
        case FailureReason::DescriptorNotGenerated:
        case FailureReason::SourceUnstable:
        case FailureReason::Interrupted:
            return true;

        case FailureReason::Conflict:
        case FailureReason::NoDescriptorMapping:
        case FailureReason::Aborted:
            break;
        }

        return false;
    }

    bool isRetryCandidate(const MoveTask& task, const MoverSettings& settings)
    {
        if (!isFailure(task.state) || task.state == TaskState::Aborted)
            return false;

        if (task.retryable)
            return true;

        // conflicts are only worth retrying if they can be overwritten
        return task.failureReason == FailureReason::Conflict
            && settings.washModeEnabled
            && task.retryCount < settings.maxRetryCount;
    }
} // namespace olmover::mover
