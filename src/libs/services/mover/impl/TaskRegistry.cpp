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

#include "TaskRegistry.hpp"

#include <algorithm>

#include <Wt/Json/Array.h>
#include <Wt/Json/Object.h>
#include <Wt/Json/Parser.h>
#include <Wt/Json/Serializer.h>
#include <Wt/Json/Value.h>
#include <Wt/WException.h>

#include "core/Exception.hpp"
#include "core/ILogger.hpp"
#include "core/String.hpp"
#include "services/mover/IStateStore.hpp"

namespace olmover::mover
{
    namespace
    {
        constexpr int stateFormatVersion{ 1 };

        Wt::Json::Object taskToJson(const MoveTask& task)
        {
            Wt::Json::Object obj;

            obj["local_path"] = Wt::Json::Value{ task.localPath.string() };
            obj["remote_source_path"] = Wt::Json::Value{ task.remoteSourcePath.string() };
            obj["remote_dest_path"] = Wt::Json::Value{ task.remoteDestPath.string() };
            obj["state"] = Wt::Json::Value{ std::string{ toString(task.state) } };
            obj["retry_count"] = Wt::Json::Value{ static_cast<long long int>(task.retryCount) };
            obj["created_at"] = Wt::Json::Value{ core::stringUtils::toISO8601String(task.createdAt) };
            obj["updated_at"] = Wt::Json::Value{ core::stringUtils::toISO8601String(task.updatedAt) };
            obj["wash_applied"] = Wt::Json::Value{ task.washApplied };
            obj["move_completed"] = Wt::Json::Value{ task.moveCompleted };
            obj["retryable"] = Wt::Json::Value{ task.retryable };
            if (task.failureReason)
                obj["failure_reason"] = Wt::Json::Value{ std::string{ toString(*task.failureReason) } };
            obj["failure_message"] = Wt::Json::Value{ task.failureMessage };

            return obj;
        }

        std::optional<MoveTask> taskFromJson(const Wt::Json::Object& obj)
        {
            MoveTask task;

            task.localPath = static_cast<std::string>(obj.get("local_path").orIfNull(""));
            if (task.localPath.empty())
                return std::nullopt;

            const std::optional<TaskState> state{ taskStateFromString(static_cast<std::string>(obj.get("state").orIfNull(""))) };
            if (!state)
                return std::nullopt;

            task.state = *state;
            task.remoteSourcePath = static_cast<std::string>(obj.get("remote_source_path").orIfNull(""));
            task.remoteDestPath = static_cast<std::string>(obj.get("remote_dest_path").orIfNull(""));
            task.retryCount = static_cast<std::size_t>(obj.get("retry_count").orIfNull(0LL));
            task.createdAt = core::stringUtils::fromISO8601String(static_cast<std::string>(obj.get("created_at").orIfNull("")));
            task.updatedAt = core::stringUtils::fromISO8601String(static_cast<std::string>(obj.get("updated_at").orIfNull("")));
            task.washApplied = obj.get("wash_applied").orIfNull(false);
            task.moveCompleted = obj.get("move_completed").orIfNull(false);
            task.retryable = obj.get("retryable").orIfNull(false);
            if (obj.type("failure_reason") == Wt::Json::Type::String)
                task.failureReason = failureReasonFromString(static_cast<std::string>(obj.get("failure_reason")));
            task.failureMessage = static_cast<std::string>(obj.get("failure_message").orIfNull(""));

            return task;
        }

        // The worker handling this task did not survive the restart
        bool recoverInterruptedTask(MoveTask& task)
        {
            switch (task.state)
            {
            case TaskState::Pending:
            case TaskState::Moving:
                task.state = TaskState::MoveFailed;
                break;

            case TaskState::MoveSucceeded:
            case TaskState::StrmSyncing:
                task.state = TaskState::Failed;
                break;

            default:
                return false;
            }

            task.failureReason = FailureReason::Interrupted;
            task.failureMessage = "Interrupted by restart";
            task.retryable = true;
            task.updatedAt = Wt::WDateTime::currentDateTime();

            return true;
        }
    } // namespace

    TaskRegistry::TaskRegistry(IStateStore& stateStore)
        : _stateStore{ stateStore }
    {
        load();
    }

    bool TaskRegistry::insertIfInactive(MoveTask task)
    {
        const std::scoped_lock lock{ _mutex };

        const std::string key{ task.localPath.string() };
        if (auto it{ _tasksByPath.find(key) }; it != std::end(_tasksByPath))
        {
            if (isActive(it->second->state))
                return false;

            _tasks.erase(it->second);
            _tasksByPath.erase(it);
        }

        const Wt::WDateTime now{ Wt::WDateTime::currentDateTime() };
        if (!task.createdAt.isValid())
            task.createdAt = now;
        task.updatedAt = now;

        _tasks.push_back(std::move(task));
        _tasksByPath.emplace(key, std::prev(std::end(_tasks)));

        save();
        return true;
    }

    std::optional<MoveTask> TaskRegistry::find(const std::filesystem::path& localPath) const
    {
        const std::scoped_lock lock{ _mutex };

        auto it{ _tasksByPath.find(localPath.string()) };
        if (it == std::cend(_tasksByPath))
            return std::nullopt;

        return *it->second;
    }

    std::optional<MoveTask> TaskRegistry::update(const std::filesystem::path& localPath, const TaskModifier& modifier)
    {
        const std::scoped_lock lock{ _mutex };

        auto it{ _tasksByPath.find(localPath.string()) };
        if (it == std::end(_tasksByPath))
            return std::nullopt;

        std::list<MoveTask>::iterator taskIt{ it->second };
        const bool wasActive{ isActive(taskIt->state) };

        modifier(*taskIt);
        taskIt->updatedAt = Wt::WDateTime::currentDateTime();

        if (wasActive && !isActive(taskIt->state))
            _tasks.splice(std::end(_tasks), _tasks, taskIt);

        save();
        return *taskIt;
    }

    std::optional<MoveTask> TaskRegistry::reactivate(const std::filesystem::path& localPath, TaskState state)
    {
        const std::scoped_lock lock{ _mutex };

        auto it{ _tasksByPath.find(localPath.string()) };
        if (it == std::end(_tasksByPath) || isActive(it->second->state))
            return std::nullopt;

        MoveTask& task{ *it->second };
        task.state = state;
        task.retryCount++;
        task.retryable = false;
        task.failureReason.reset();
        task.failureMessage.clear();
        task.updatedAt = Wt::WDateTime::currentDateTime();

        save();
        return task;
    }

    std::vector<MoveTask> TaskRegistry::getTasks() const
    {
        const std::scoped_lock lock{ _mutex };

        return std::vector<MoveTask>(std::cbegin(_tasks), std::cend(_tasks));
    }

    std::size_t TaskRegistry::getSuccessfulCount() const
    {
        const std::scoped_lock lock{ _mutex };

        return std::count_if(std::cbegin(_tasks), std::cend(_tasks), [](const MoveTask& task) { return task.state == TaskState::StrmSynced; });
    }

    std::size_t TaskRegistry::getActiveCount() const
    {
        const std::scoped_lock lock{ _mutex };

        return std::count_if(std::cbegin(_tasks), std::cend(_tasks), [](const MoveTask& task) { return isActive(task.state); });
    }

    std::size_t TaskRegistry::pruneSuccessful(std::size_t keepCount)
    {
        const std::scoped_lock lock{ _mutex };

        return pruneOldest(keepCount, [](const MoveTask& task) { return task.state == TaskState::StrmSynced; });
    }

    std::size_t TaskRegistry::pruneFailed(std::size_t keepCount, const TaskPredicate& isRetryPending)
    {
        const std::scoped_lock lock{ _mutex };

        return pruneOldest(keepCount, [&](const MoveTask& task) { return isFailure(task.state) && !isRetryPending(task); });
    }

    std::size_t TaskRegistry::pruneOldest(std::size_t keepCount, const TaskPredicate& isPrunable)
    {
        std::size_t removedCount{};
        std::size_t keptCount{};

        // most recent completions are at the end
        for (auto it{ std::rbegin(_tasks) }; it != std::rend(_tasks);)
        {
            if (!isPrunable(*it) || keptCount++ < keepCount)
            {
                ++it;
                continue;
            }

            _tasksByPath.erase(it->localPath.string());
            it = std::make_reverse_iterator(_tasks.erase(std::next(it).base()));
            ++removedCount;
        }

        if (removedCount > 0)
            save();

        return removedCount;
    }

    void TaskRegistry::load()
    {
        const std::optional<std::string> content{ _stateStore.load(stateKey) };
        if (!content)
            return;

        Wt::Json::Object root;
        try
        {
            Wt::Json::parse(*content, root);
        }
        catch (const Wt::WException& e)
        {
            OLMOVER_LOG(MOVER, ERROR, "Cannot parse persisted tasks, starting with an empty registry: " << e.what());
            return;
        }

        if (root.type("tasks") != Wt::Json::Type::Array)
            return;

        std::size_t recoveredCount{};
        const Wt::Json::Array& tasks = root.get("tasks");
        for (const Wt::Json::Value& value : tasks)
        {
            if (value.type() != Wt::Json::Type::Object)
                continue;

            std::optional<MoveTask> task{ taskFromJson(value) };
            if (!task)
            {
                OLMOVER_LOG(MOVER, WARNING, "Skipping malformed persisted task");
                continue;
            }

            if (recoverInterruptedTask(*task))
            {
                OLMOVER_LOG(MOVER, INFO, "Task for '" << task->localPath.string() << "' was interrupted, marked as " << toString(task->state));
                recoveredCount++;
            }

            const std::string key{ task->localPath.string() };
            if (auto it{ _tasksByPath.find(key) }; it != std::end(_tasksByPath))
            {
                _tasks.erase(it->second);
                _tasksByPath.erase(it);
            }
            _tasks.push_back(std::move(*task));
            _tasksByPath.emplace(key, std::prev(std::end(_tasks)));
        }

        OLMOVER_LOG(MOVER, INFO, "Loaded " << _tasks.size() << " task(s), " << recoveredCount << " interrupted");

        if (recoveredCount > 0)
            save();
    }

    void TaskRegistry::save()
    {
        Wt::Json::Array tasks;
        for (const MoveTask& task : _tasks)
            tasks.push_back(Wt::Json::Value{ taskToJson(task) });

        Wt::Json::Object root;
        root["version"] = Wt::Json::Value{ stateFormatVersion };
        root["tasks"] = Wt::Json::Value{ std::move(tasks) };

        try
        {
            _stateStore.save(stateKey, Wt::Json::serialize(root));
        }
        catch (const core::OlmoverException& e)
        {
            OLMOVER_LOG(MOVER, ERROR, "Cannot persist tasks: " << e.what());
        }
    }
} // namespace olmover::mover
