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
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include <Wt/WDateTime.h>

namespace olmover::mover
{
    enum class TaskState
    {
        Pending,
        Moving,
        MoveSucceeded,
        StrmSyncing,
        StrmSynced, // terminal success
        MoveFailed,
        Failed,
        Aborted, // terminal, source vanished
    };

    enum class FailureReason
    {
        Conflict,
        RemoteApiError,
        FilesystemError,
        NoDescriptorMapping,
        DescriptorNotGenerated,
        SourceUnstable,
        Aborted,
        Interrupted,
    };

    struct MoveTask
    {
        std::filesystem::path localPath; // identity
        std::filesystem::path remoteSourcePath;
        std::filesystem::path remoteDestPath;
        TaskState state{ TaskState::Pending };
        std::size_t retryCount{};
        Wt::WDateTime createdAt;
        Wt::WDateTime updatedAt;
        bool washApplied{};
        bool moveCompleted{};
        bool retryable{}; // may be re-entered by the scanner
        std::optional<FailureReason> failureReason;
        std::string failureMessage;
    };

    // A task is active while it is being handled by a worker
    bool isActive(TaskState state);
    bool isFailure(TaskState state);

    std::string_view toString(TaskState state);
    std::string_view toString(FailureReason reason);
    std::optional<TaskState> taskStateFromString(std::string_view str);
    std::optional<FailureReason> failureReasonFromString(std::string_view str);
} // namespace olmover::mover
