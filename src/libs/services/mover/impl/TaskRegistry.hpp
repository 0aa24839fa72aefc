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
#include <functional>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "services/mover/MoveTask.hpp"

namespace olmover::mover
{
    class IStateStore;

    // Tasks ordered by completion time, at most one task per local path
    // Every mutation is persisted under the "move_tasks" key
    class TaskRegistry
    {
    public:
        // Loads persisted tasks, tasks found active are marked as interrupted
        TaskRegistry(IStateStore& stateStore);

        TaskRegistry(const TaskRegistry&) = delete;
        TaskRegistry& operator=(const TaskRegistry&) = delete;

        // Replaces any inactive task for the same path
        // returns false if an active task already exists for this path
        bool insertIfInactive(MoveTask task);

        std::optional<MoveTask> find(const std::filesystem::path& localPath) const;

        // Returns the updated task, nullopt if not found
        // Tasks leaving the active states are moved to the end
        using TaskModifier = std::function<void(MoveTask&)>;
        std::optional<MoveTask> update(const std::filesystem::path& localPath, const TaskModifier& modifier);

        // Puts an inactive task back in the given active state, counting a retry
        // nullopt if not found or still active
        std::optional<MoveTask> reactivate(const std::filesystem::path& localPath, TaskState state);

        std::vector<MoveTask> getTasks() const;
        std::size_t getSuccessfulCount() const;
        std::size_t getActiveCount() const;

        // Keeps the keepCount most recently completed successful tasks
        // Returns the removed task count
        std::size_t pruneSuccessful(std::size_t keepCount);

        // Same for failed tasks, except those isRetryPending accepts
        using TaskPredicate = std::function<bool(const MoveTask&)>;
        std::size_t pruneFailed(std::size_t keepCount, const TaskPredicate& isRetryPending);

        static constexpr std::string_view stateKey{ "move_tasks" };

    private:
        void load();
        void save();
        std::size_t pruneOldest(std::size_t keepCount, const TaskPredicate& isPrunable);

        IStateStore& _stateStore;

        mutable std::mutex _mutex;
        std::list<MoveTask> _tasks;
        std::unordered_map<std::string, std::list<MoveTask>::iterator> _tasksByPath;
    };
} // namespace olmover::mover
