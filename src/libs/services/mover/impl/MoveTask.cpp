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

#include "services/mover/MoveTask.hpp"

#include <array>
#include <utility>

namespace olmover::mover
{
    namespace
    {
        constexpr std::array taskStateNames{
            std::pair{ TaskState::Pending, std::string_view{ "Pending" } },
            std::pair{ TaskState::Moving, std::string_view{ "Moving" } },
            std::pair{ TaskState::MoveSucceeded, std::string_view{ "MoveSucceeded" } },
            std::pair{ TaskState::StrmSyncing, std::string_view{ "StrmSyncing" } },
            std::pair{ TaskState::StrmSynced, std::string_view{ "StrmSynced" } },
            std::pair{ TaskState::MoveFailed, std::string_view{ "MoveFailed" } },
            std::pair{ TaskState::Failed, std::string_view{ "Failed" } },
            std::pair{ TaskState::Aborted, std::string_view{ "Aborted" } },
        };

        constexpr std::array failureReasonNames{
            std::pair{ FailureReason::Conflict, std::string_view{ "Conflict" } },
            std::pair{ FailureReason::RemoteApiError, std::string_view{ "RemoteApiError" } },
            std::pair{ FailureReason::FilesystemError, std::string_view{ "FilesystemError" } },
            std::pair{ FailureReason::NoDescriptorMapping, std::string_view{ "NoDescriptorMapping" } },
            std::pair{ FailureReason::DescriptorNotGenerated, std::string_view{ "DescriptorNotGenerated" } },
            std::pair{ FailureReason::SourceUnstable, std::string_view{ "SourceUnstable" } },
            std::pair{ FailureReason::Aborted, std::string_view{ "Aborted" } },
            std::pair{ FailureReason::Interrupted, std::string_view{ "Interrupted" } },
        };

        template<typename Enum, std::size_t N>
        std::string_view enumToString(const std::array<std::pair<Enum, std::string_view>, N>& names, Enum value)
        {
            for (const auto& [enumValue, name] : names)
            {
                if (enumValue == value)
                    return name;
            }

            return "";
        }

        template<typename Enum, std::size_t N>
        std::optional<Enum> enumFromString(const std::array<std::pair<Enum, std::string_view>, N>& names, std::string_view str)
        {
            for (const auto& [enumValue, name] : names)
            {
                if (name == str)
                    return enumValue;
            }

            return std::nullopt;
        }
    } // namespace

    bool isActive(TaskState state)
    {
        switch (state)
        {
        case TaskState::Pending:
        case TaskState::Moving:
        case TaskState::MoveSucceeded:
        case TaskState::StrmSyncing:
            return true;

        case TaskState::StrmSynced:
        case TaskState::MoveFailed:
        case TaskState::Failed:
        case TaskState::Aborted:
            break;
        }

        return false;
    }

    bool isFailure(TaskState state)
    {
        return state == TaskState::MoveFailed || state == TaskState::Failed || state == TaskState::Aborted;
    }

    std::string_view toString(TaskState state)
    {
        return enumToString(taskStateNames, state);
    }

    std::string_view toString(FailureReason reason)
    {
        return enumToString(failureReasonNames, reason);
    }

    std::optional<TaskState> taskStateFromString(std::string_view str)
    {
        return enumFromString(taskStateNames, str);
    }

    std::optional<FailureReason> failureReasonFromString(std::string_view str)
    {
        return enumFromString(failureReasonNames, str);
    }
} // namespace olmover::mover
