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

#include <gtest/gtest.h>

#include "Common.hpp"

namespace olmover::mover::tests
{
    namespace
    {
        MoveTask createTask(const std::filesystem::path& localPath, TaskState state = TaskState::Pending)
        {
            MoveTask task;
            task.localPath = localPath;
            task.remoteSourcePath = "/src" / localPath.filename();
            task.remoteDestPath = "/dst" / localPath.filename();
            task.state = state;
            return task;
        }

        std::vector<std::filesystem::path> getPaths(const std::vector<MoveTask>& tasks)
        {
            std::vector<std::filesystem::path> res;
            for (const MoveTask& task : tasks)
                res.push_back(task.localPath);
            return res;
        }
    } // namespace

    TEST(TaskRegistry, insertIfInactive)
    {
        MemoryStateStore store;
        TaskRegistry registry{ store };

        EXPECT_TRUE(registry.insertIfInactive(createTask("/watch/a.mkv")));
        EXPECT_FALSE(registry.insertIfInactive(createTask("/watch/a.mkv")));
        EXPECT_TRUE(registry.insertIfInactive(createTask("/watch/b.mkv")));

        EXPECT_EQ(registry.getTasks().size(), 2);
        EXPECT_FALSE(registry.find("/watch/c.mkv").has_value());

        const std::optional<MoveTask> task{ registry.find("/watch/a.mkv") };
        ASSERT_TRUE(task.has_value());
        EXPECT_EQ(task->state, TaskState::Pending);
        EXPECT_TRUE(task->createdAt.isValid());
        EXPECT_TRUE(task->updatedAt.isValid());
    }

    TEST(TaskRegistry, insertReplacesInactiveTask)
    {
        MemoryStateStore store;
        TaskRegistry registry{ store };

        ASSERT_TRUE(registry.insertIfInactive(createTask("/watch/a.mkv")));
        registry.update("/watch/a.mkv", [](MoveTask& task) {
            task.state = TaskState::MoveFailed;
            task.failureReason = FailureReason::RemoteApiError;
        });
        EXPECT_FALSE(isActive(registry.find("/watch/a.mkv")->state));

        MoveTask retry{ createTask("/watch/a.mkv") };
        retry.retryCount = 1;
        EXPECT_TRUE(registry.insertIfInactive(retry));

        ASSERT_EQ(registry.getTasks().size(), 1);
        const std::optional<MoveTask> task{ registry.find("/watch/a.mkv") };
        ASSERT_TRUE(task.has_value());
        EXPECT_EQ(task->state, TaskState::Pending);
        EXPECT_EQ(task->retryCount, 1);
        EXPECT_FALSE(task->failureReason.has_value());
    }

    TEST(TaskRegistry, orderedByCompletion)
    {
        MemoryStateStore store;
        TaskRegistry registry{ store };

        registry.insertIfInactive(createTask("/watch/a.mkv"));
        registry.insertIfInactive(createTask("/watch/b.mkv"));
        registry.insertIfInactive(createTask("/watch/c.mkv"));

        // still active: order unchanged
        registry.update("/watch/a.mkv", [](MoveTask& task) { task.state = TaskState::Moving; });
        EXPECT_EQ(getPaths(registry.getTasks()), (std::vector<std::filesystem::path>{ "/watch/a.mkv", "/watch/b.mkv", "/watch/c.mkv" }));

        registry.update("/watch/b.mkv", [](MoveTask& task) { task.state = TaskState::StrmSynced; });
        registry.update("/watch/a.mkv", [](MoveTask& task) { task.state = TaskState::MoveFailed; });
        EXPECT_EQ(getPaths(registry.getTasks()), (std::vector<std::filesystem::path>{ "/watch/c.mkv", "/watch/b.mkv", "/watch/a.mkv" }));

        EXPECT_EQ(registry.getSuccessfulCount(), 1);
        EXPECT_EQ(registry.getActiveCount(), 1);
        EXPECT_FALSE(registry.update("/watch/unknown.mkv", [](MoveTask&) {}).has_value());
    }

    TEST(TaskRegistry, pruneSuccessful)
    {
        MemoryStateStore store;
        TaskRegistry registry{ store };

        for (int i{}; i < 5; ++i)
        {
            const std::filesystem::path path{ "/watch/" + std::to_string(i) + ".mkv" };
            registry.insertIfInactive(createTask(path));
            registry.update(path, [](MoveTask& task) { task.state = TaskState::StrmSynced; });
        }
        registry.insertIfInactive(createTask("/watch/failed.mkv"));
        registry.update("/watch/failed.mkv", [](MoveTask& task) { task.state = TaskState::Failed; });
        registry.insertIfInactive(createTask("/watch/active.mkv"));

        EXPECT_EQ(registry.pruneSuccessful(2), 3);

        EXPECT_EQ(getPaths(registry.getTasks()), (std::vector<std::filesystem::path>{ "/watch/3.mkv", "/watch/4.mkv", "/watch/failed.mkv", "/watch/active.mkv" }));
        EXPECT_FALSE(registry.find("/watch/0.mkv").has_value());
        EXPECT_EQ(registry.getSuccessfulCount(), 2);

        EXPECT_EQ(registry.pruneSuccessful(2), 0);
        EXPECT_EQ(registry.pruneSuccessful(0), 2);
        EXPECT_EQ(registry.getTasks().size(), 2);
    }

    TEST(TaskRegistry, pruneFailed)
    {
        MemoryStateStore store;
        TaskRegistry registry{ store };

        for (const std::string name : { "a", "b", "c" })
        {
            const std::filesystem::path path{ "/watch/" + name + ".mkv" };
            registry.insertIfInactive(createTask(path));
            registry.update(path, [](MoveTask& task) { task.state = TaskState::Failed; });
        }
        registry.insertIfInactive(createTask("/watch/retry.mkv"));
        registry.update("/watch/retry.mkv", [](MoveTask& task) {
            task.state = TaskState::MoveFailed;
            task.retryable = true;
        });
        registry.insertIfInactive(createTask("/watch/done.mkv"));
        registry.update("/watch/done.mkv", [](MoveTask& task) { task.state = TaskState::StrmSynced; });

        const auto isRetryPending{ [](const MoveTask& task) { return task.retryable; } };
        EXPECT_EQ(registry.pruneFailed(1, isRetryPending), 2u);
        EXPECT_EQ(getPaths(registry.getTasks()), (std::vector<std::filesystem::path>{ "/watch/c.mkv", "/watch/retry.mkv", "/watch/done.mkv" }));
        EXPECT_EQ(getPaths(registry.getTasks()), getPaths(TaskRegistry{ store }.getTasks()));

        EXPECT_EQ(registry.pruneFailed(1, isRetryPending), 0u);
    }

    TEST(TaskRegistry, persistence)
    {
        MemoryStateStore store;

        {
            TaskRegistry registry{ store };
            MoveTask task{ createTask("/watch/show/a.mkv") };
            task.retryCount = 2;
            registry.insertIfInactive(task);
            registry.update("/watch/show/a.mkv", [](MoveTask& t) {
                t.state = TaskState::Failed;
                t.washApplied = true;
                t.moveCompleted = true;
                t.retryable = true;
                t.failureReason = FailureReason::DescriptorNotGenerated;
                t.failureMessage = "no descriptor";
            });

            registry.insertIfInactive(createTask("/watch/b.mkv"));
            registry.update("/watch/b.mkv", [](MoveTask& t) { t.state = TaskState::StrmSynced; });
        }

        ASSERT_TRUE(store.load(TaskRegistry::stateKey).has_value());

        TaskRegistry registry{ store };
        ASSERT_EQ(registry.getTasks().size(), 2);
        EXPECT_EQ(getPaths(registry.getTasks()), (std::vector<std::filesystem::path>{ "/watch/show/a.mkv", "/watch/b.mkv" }));

        const std::optional<MoveTask> task{ registry.find("/watch/show/a.mkv") };
        ASSERT_TRUE(task.has_value());
        EXPECT_EQ(task->remoteSourcePath, "/src/a.mkv");
        EXPECT_EQ(task->remoteDestPath, "/dst/a.mkv");
        EXPECT_EQ(task->state, TaskState::Failed);
        EXPECT_EQ(task->retryCount, 2);
        EXPECT_TRUE(task->washApplied);
        EXPECT_TRUE(task->moveCompleted);
        EXPECT_TRUE(task->retryable);
        EXPECT_EQ(task->failureReason, FailureReason::DescriptorNotGenerated);
        EXPECT_EQ(task->failureMessage, "no descriptor");
        EXPECT_TRUE(task->createdAt.isValid());
    }

    TEST(TaskRegistry, interruptedTasksRecovered)
    {
        MemoryStateStore store;

        {
            TaskRegistry registry{ store };
            registry.insertIfInactive(createTask("/watch/pending.mkv"));
            registry.insertIfInactive(createTask("/watch/moving.mkv"));
            registry.update("/watch/moving.mkv", [](MoveTask& t) { t.state = TaskState::Moving; });
            registry.insertIfInactive(createTask("/watch/syncing.mkv"));
            registry.update("/watch/syncing.mkv", [](MoveTask& t) {
                t.state = TaskState::StrmSyncing;
                t.moveCompleted = true;
            });
            registry.insertIfInactive(createTask("/watch/done.mkv"));
            registry.update("/watch/done.mkv", [](MoveTask& t) { t.state = TaskState::StrmSynced; });
        }

        TaskRegistry registry{ store };
        EXPECT_EQ(registry.getActiveCount(), 0);

        EXPECT_EQ(registry.find("/watch/pending.mkv")->state, TaskState::MoveFailed);
        EXPECT_EQ(registry.find("/watch/moving.mkv")->state, TaskState::MoveFailed);
        EXPECT_EQ(registry.find("/watch/syncing.mkv")->state, TaskState::Failed);
        EXPECT_EQ(registry.find("/watch/done.mkv")->state, TaskState::StrmSynced);

        for (const std::filesystem::path path : { "/watch/pending.mkv", "/watch/moving.mkv", "/watch/syncing.mkv" })
        {
            const std::optional<MoveTask> task{ registry.find(path) };
            ASSERT_TRUE(task.has_value());
            EXPECT_EQ(task->failureReason, FailureReason::Interrupted) << path;
            EXPECT_TRUE(task->retryable) << path;
        }
    }

    TEST(TaskRegistry, malformedState)
    {
        MemoryStateStore store;
        store.save(TaskRegistry::stateKey, "{not json");

        TaskRegistry registry{ store };
        EXPECT_TRUE(registry.getTasks().empty());

        store.save(TaskRegistry::stateKey, R"({"version":1,"tasks":[{"local_path":"/watch/a.mkv","state":"Unknown"},{"state":"Pending"},{"local_path":"/watch/b.mkv","state":"StrmSynced"}]})");
        TaskRegistry registry2{ store };
        ASSERT_EQ(registry2.getTasks().size(), 1);
        EXPECT_EQ(registry2.getTasks().front().localPath, "/watch/b.mkv");
    }

    TEST(TaskRegistry, reactivate)
    {
        MemoryStateStore store;
        TaskRegistry registry{ store };

        registry.insertIfInactive(createTask("/watch/a.mkv"));
        EXPECT_FALSE(registry.reactivate("/watch/a.mkv", TaskState::MoveSucceeded).has_value());
        EXPECT_FALSE(registry.reactivate("/watch/unknown.mkv", TaskState::MoveSucceeded).has_value());

        registry.update("/watch/a.mkv", [](MoveTask& t) {
            t.state = TaskState::Failed;
            t.moveCompleted = true;
            t.retryable = true;
            t.failureReason = FailureReason::DescriptorNotGenerated;
        });

        const std::optional<MoveTask> task{ registry.reactivate("/watch/a.mkv", TaskState::MoveSucceeded) };
        ASSERT_TRUE(task.has_value());
        EXPECT_EQ(task->state, TaskState::MoveSucceeded);
        EXPECT_EQ(task->retryCount, 1);
        EXPECT_FALSE(task->failureReason.has_value());
        EXPECT_TRUE(isActive(registry.find("/watch/a.mkv")->state));
    }
} // namespace olmover::mover::tests
