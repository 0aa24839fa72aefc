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

#include <filesystem>
#include <string>

#include "services/mover/MoveTask.hpp"
#include "services/mover/MoverSettings.hpp"

namespace olmover::core
{
    class IJobScheduler;
}

namespace olmover::remote
{
    class IRemoteStorage;
}

namespace olmover::mover
{
    class DescriptorSyncEngine;
    class INotifier;
    class ISleeper;
    class PathMapper;
    class TaskRegistry;
    struct Events;

    // Single entry point for file events, whatever their origin
    // Tasks are processed by the job scheduler, which bounds the concurrent remote operations
    class MoveOrchestrator
    {
    public:
        MoveOrchestrator(const MoverSettings& settings,
                         const PathMapper& pathMapper,
                         remote::IRemoteStorage& remoteStorage,
                         TaskRegistry& registry,
                         DescriptorSyncEngine& descriptorSyncEngine,
                         core::IJobScheduler& jobScheduler,
                         ISleeper& sleeper,
                         Events& events,
                         INotifier& notifier);

        MoveOrchestrator(const MoveOrchestrator&) = delete;
        MoveOrchestrator& operator=(const MoveOrchestrator&) = delete;

        enum class SubmitResult
        {
            Scheduled,
            NotQualifying, // extension filtered out
            Missing,       // not an existing regular file
            Duplicate,     // an active task exists for this path
            NoMapping,
        };
        SubmitResult submit(const std::filesystem::path& localPath);

        // Re-run the descriptor phase of a failed task whose move already completed
        bool retryDescriptorSync(const std::filesystem::path& localPath);

        // Failed task whose local file is gone: the move may have completed on the remote side
        // Returns true if a check of the remote destination was scheduled, otherwise the task is aborted
        bool resumeVanishedSource(const std::filesystem::path& localPath);

        bool isQualifyingFile(const std::filesystem::path& localPath) const;

        // Called from the job scheduler, must not throw
        void processTask(const std::filesystem::path& localPath);

    private:
        enum class FileStability
        {
            Stable,
            Vanished,
            Unstable,
            Interrupted,
        };
        FileStability waitForStableFile(const std::filesystem::path& localPath);

        // returns false if the task did not reach MoveSucceeded
        bool runMovePhase(const MoveTask& task);
        bool confirmRemoteMove(const MoveTask& task);
        void runDescriptorPhase(const MoveTask& task);
        bool removeRemoteVariants(const MoveTask& task);

        void scheduleTask(const std::filesystem::path& localPath);
        void failTask(const std::filesystem::path& localPath, TaskState state, FailureReason reason, const std::string& message);
        void onTaskSucceeded(const MoveTask& task);

        const MoverSettings& _settings;
        const PathMapper& _pathMapper;
        remote::IRemoteStorage& _remoteStorage;
        TaskRegistry& _registry;
        DescriptorSyncEngine& _descriptorSyncEngine;
        core::IJobScheduler& _jobScheduler;
        ISleeper& _sleeper;
        Events& _events;
        INotifier& _notifier;
    };
} // namespace olmover::mover
