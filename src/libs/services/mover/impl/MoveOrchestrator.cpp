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

#include "MoveOrchestrator.hpp"

#include <algorithm>
#include <vector>

#include "core/IJob.hpp"
#include "core/IJobScheduler.hpp"
#include "core/ILogger.hpp"
#include "core/Path.hpp"
#include "core/String.hpp"
#include "remote/Exception.hpp"
#include "remote/IRemoteStorage.hpp"
#include "services/mover/Exception.hpp"
#include "services/mover/IMoverService.hpp"
#include "services/mover/INotifier.hpp"

#include "DescriptorSyncEngine.hpp"
#include "ISleeper.hpp"
#include "PathMapper.hpp"
#include "RetryPolicy.hpp"
#include "TaskFailure.hpp"
#include "TaskRegistry.hpp"

#define LOG(sev, message) OLMOVER_LOG(MOVER, sev, "[Move] - " << message)

namespace olmover::mover
{
    namespace
    {
        class MoveJob : public core::IJob
        {
        public:
            MoveJob(MoveOrchestrator& orchestrator, const std::filesystem::path& localPath)
                : _orchestrator{ orchestrator }
                , _localPath{ localPath }
            {
            }

        private:
            std::string_view getName() const override { return "Move"; }
            void run() override { _orchestrator.processTask(_localPath); }

            MoveOrchestrator& _orchestrator;
            const std::filesystem::path _localPath;
        };

        bool sourceExists(const std::filesystem::path& localPath)
        {
            std::error_code ec;
            return std::filesystem::exists(localPath, ec);
        }
    } // namespace

    MoveOrchestrator::MoveOrchestrator(const MoverSettings& settings,
                                       const PathMapper& pathMapper,
                                       remote::IRemoteStorage& remoteStorage,
                                       TaskRegistry& registry,
                                       DescriptorSyncEngine& descriptorSyncEngine,
                                       core::IJobScheduler& jobScheduler,
                                       ISleeper& sleeper,
                                       Events& events,
                                       INotifier& notifier)
        : _settings{ settings }
        , _pathMapper{ pathMapper }
        , _remoteStorage{ remoteStorage }
        , _registry{ registry }
        , _descriptorSyncEngine{ descriptorSyncEngine }
        , _jobScheduler{ jobScheduler }
        , _sleeper{ sleeper }
        , _events{ events }
        , _notifier{ notifier }
    {
    }

    bool MoveOrchestrator::isQualifyingFile(const std::filesystem::path& localPath) const
    {
        if (core::pathUtils::hasFileAnyExtension(localPath, _settings.tempExtensions))
            return false;

        return core::pathUtils::hasFileAnyExtension(localPath, _settings.videoExtensions);
    }

    MoveOrchestrator::SubmitResult MoveOrchestrator::submit(const std::filesystem::path& localPathArg)
    {
        const std::filesystem::path localPath{ localPathArg.lexically_normal() };

        if (!isQualifyingFile(localPath))
        {
            LOG(DEBUG, "Ignoring '" << localPath.string() << "': not a qualifying file");
            return SubmitResult::NotQualifying;
        }

        std::error_code ec;
        if (!std::filesystem::is_regular_file(localPath, ec))
        {
            LOG(DEBUG, "Ignoring '" << localPath.string() << "': not an existing file");
            return SubmitResult::Missing;
        }

        const std::optional<MoveTask> existingTask{ _registry.find(localPath) };
        if (existingTask && isActive(existingTask->state))
        {
            LOG(DEBUG, "Ignoring '" << localPath.string() << "': already in progress");
            return SubmitResult::Duplicate;
        }

        PathMapper::MoveTarget target;
        try
        {
            target = _pathMapper.resolveMove(localPath);
        }
        catch (const NoMappingFoundException& e)
        {
            LOG(WARNING, e.what() << ", file not moved");
            return SubmitResult::NoMapping;
        }

        MoveTask task;
        task.localPath = localPath;
        task.remoteSourcePath = target.remoteSourcePath;
        task.remoteDestPath = target.remoteDestPath;
        if (existingTask && isFailure(existingTask->state))
            task.retryCount = existingTask->retryCount + 1;

        if (!_registry.insertIfInactive(std::move(task)))
        {
            LOG(DEBUG, "Ignoring '" << localPath.string() << "': already in progress");
            return SubmitResult::Duplicate;
        }

        LOG(INFO, "New task for '" << localPath.string() << "'" << (existingTask && isFailure(existingTask->state) ? " (retry " + std::to_string(existingTask->retryCount + 1) + ")" : ""));
        scheduleTask(localPath);

        return SubmitResult::Scheduled;
    }

    bool MoveOrchestrator::retryDescriptorSync(const std::filesystem::path& localPath)
    {
        const std::optional<MoveTask> task{ _registry.reactivate(localPath, TaskState::MoveSucceeded) };
        if (!task)
            return false;

        LOG(INFO, "Retrying descriptor sync for '" << localPath.string() << "' (retry " << task->retryCount << ")");
        scheduleTask(localPath);

        return true;
    }

    bool MoveOrchestrator::resumeVanishedSource(const std::filesystem::path& localPath)
    {
        const std::optional<MoveTask> task{ _registry.find(localPath) };
        if (!task || isActive(task->state) || task->moveCompleted)
            return false;

        // the move request was never sent, or could not have succeeded
        const bool moveMayHaveCompleted{ task->failureReason == FailureReason::Interrupted || task->failureReason == FailureReason::RemoteApiError };
        if (!moveMayHaveCompleted)
        {
            failTask(localPath, TaskState::Aborted, FailureReason::Aborted, "Source file vanished");
            return false;
        }

        if (!_registry.reactivate(localPath, TaskState::Moving))
            return false;

        LOG(INFO, "Source of '" << localPath.string() << "' vanished, checking '" << task->remoteDestPath.string() << "'");
        scheduleTask(localPath);

        return true;
    }

    void MoveOrchestrator::scheduleTask(const std::filesystem::path& localPath)
    {
        _jobScheduler.scheduleJob(std::make_unique<MoveJob>(*this, localPath));
    }

    void MoveOrchestrator::processTask(const std::filesystem::path& localPath)
    {
        const std::optional<MoveTask> task{ _registry.find(localPath) };
        if (!task)
            return;

        TaskState currentPhaseFailureState{ TaskState::MoveFailed };
        try
        {
            if (task->state == TaskState::Pending)
            {
                if (!runMovePhase(*task))
                    return;
            }
            else if (task->state == TaskState::Moving)
            {
                if (!confirmRemoteMove(*task))
                    return;
            }

            const std::optional<MoveTask> movedTask{ _registry.find(localPath) };
            if (!movedTask || movedTask->state != TaskState::MoveSucceeded)
                return;

            currentPhaseFailureState = TaskState::Failed;
            runDescriptorPhase(*movedTask);
        }
        catch (const remote::RemoteAbortedException& e)
        {
            LOG(DEBUG, "Task for '" << localPath.string() << "' interrupted");
            failTask(localPath, currentPhaseFailureState, FailureReason::Interrupted, e.what());
        }
        catch (const core::OlmoverException& e)
        {
            LOG(ERROR, "Unexpected error while processing '" << localPath.string() << "': " << e.what());
            failTask(localPath, currentPhaseFailureState, FailureReason::RemoteApiError, e.what());
        }
        catch (const std::exception& e)
        {
            LOG(ERROR, "Unexpected error while processing '" << localPath.string() << "': " << e.what());
            failTask(localPath, currentPhaseFailureState, FailureReason::FilesystemError, e.what());
        }
    }

    bool MoveOrchestrator::runMovePhase(const MoveTask& task)
    {
        switch (waitForStableFile(task.localPath))
        {
        case FileStability::Stable:
            break;

        case FileStability::Vanished:
            failTask(task.localPath, TaskState::Aborted, FailureReason::Aborted, "Source file vanished");
            return false;

        case FileStability::Unstable:
            failTask(task.localPath, TaskState::MoveFailed, FailureReason::SourceUnstable, "Source file did not stabilize within " + std::to_string(_settings.fileStableTimeout.count()) + "s");
            return false;

        case FileStability::Interrupted:
            failTask(task.localPath, TaskState::MoveFailed, FailureReason::Interrupted, "Interrupted while waiting for the file to stabilize");
            return false;
        }

        bool overwrite{};
        if (_settings.washModeEnabled)
            overwrite = removeRemoteVariants(task);

        // last chance to abort before the move
        if (!sourceExists(task.localPath))
        {
            failTask(task.localPath, TaskState::Aborted, FailureReason::Aborted, "Source file vanished");
            return false;
        }

        _registry.update(task.localPath, [&](MoveTask& t) {
            t.state = TaskState::Moving;
            t.washApplied = overwrite;
        });

        LOG(DEBUG, "Moving '" << task.remoteSourcePath.string() << "' to '" << task.remoteDestPath.string() << "'" << (overwrite ? " (overwrite)" : ""));
        remote::MoveResult result{ _remoteStorage.move(task.remoteSourcePath, task.remoteDestPath, overwrite) };

        if (result.status == remote::MoveResult::Status::Conflict)
        {
            if (!_settings.washModeEnabled)
            {
                LOG(WARNING, "'" << task.remoteDestPath.string() << "' already exists, wash mode disabled");
                failTask(task.localPath, TaskState::MoveFailed, FailureReason::Conflict, result.message);
                return false;
            }

            LOG(INFO, "'" << task.remoteDestPath.string() << "' already exists, overwriting (wash)");
            overwrite = true;
            _registry.update(task.localPath, [](MoveTask& t) { t.washApplied = true; });
            result = _remoteStorage.move(task.remoteSourcePath, task.remoteDestPath, overwrite);
        }

        if (result.status != remote::MoveResult::Status::Success)
        {
            LOG(ERROR, "Move of '" << task.remoteSourcePath.string() << "' failed: " << result.message);
            failTask(task.localPath, TaskState::MoveFailed, FailureReason::RemoteApiError, result.message);
            return false;
        }

        LOG(INFO, "Moved '" << task.remoteSourcePath.string() << "' to '" << task.remoteDestPath.string() << "'" << (overwrite ? " (wash)" : ""));
        _registry.update(task.localPath, [](MoveTask& t) {
            t.state = TaskState::MoveSucceeded;
            t.moveCompleted = true;
        });

        return true;
    }

    bool MoveOrchestrator::confirmRemoteMove(const MoveTask& task)
    {
        const std::optional<remote::RemoteEntry> entry{ _remoteStorage.getEntry(task.remoteDestPath) };
        if (!entry || entry->isDirectory)
        {
            failTask(task.localPath, TaskState::Aborted, FailureReason::Aborted, "Source file vanished and '" + task.remoteDestPath.string() + "' does not exist");
            return false;
        }

        LOG(INFO, "Found '" << task.remoteDestPath.string() << "', move considered completed");
        _registry.update(task.localPath, [](MoveTask& t) {
            t.state = TaskState::MoveSucceeded;
            t.moveCompleted = true;
        });

        return true;
    }

    void MoveOrchestrator::runDescriptorPhase(const MoveTask& task)
    {
        try
        {
            onTaskSucceeded(_descriptorSyncEngine.sync(task));
        }
        catch (const TaskFailureException& e)
        {
            LOG(ERROR, "Descriptor sync of '" << task.remoteDestPath.string() << "' failed: " << e.what());
            failTask(task.localPath, TaskState::Failed, e.getReason(), e.what());
        }
    }

    MoveOrchestrator::FileStability MoveOrchestrator::waitForStableFile(const std::filesystem::path& localPath)
    {
        std::optional<std::uintmax_t> previousSize{ core::pathUtils::getFileSize(localPath) };
        if (!previousSize)
            return FileStability::Vanished;

        const std::size_t maxAttemptCount{ _settings.fileStableInterval.count() > 0 ? std::max<std::size_t>(_settings.fileStableTimeout / _settings.fileStableInterval, 1) : 1 };
        for (std::size_t attempt{}; attempt < maxAttemptCount; ++attempt)
        {
            if (!_sleeper.sleepFor(_settings.fileStableInterval))
                return FileStability::Interrupted;

            const std::optional<std::uintmax_t> size{ core::pathUtils::getFileSize(localPath) };
            if (!size)
                return FileStability::Vanished;

            if (*size == *previousSize && *size > 0)
                return FileStability::Stable;

            LOG(DEBUG, "'" << localPath.string() << "' still being written (" << *previousSize << " -> " << *size << ")");
            previousSize = size;
        }

        return FileStability::Unstable;
    }

    bool MoveOrchestrator::removeRemoteVariants(const MoveTask& task)
    {
        const std::filesystem::path destinationDirectory{ task.remoteDestPath.parent_path() };
        const std::string stem{ task.remoteDestPath.stem().string() };
        const std::string extension{ core::stringUtils::stringToLower(task.remoteDestPath.extension().string()) };

        std::vector<remote::RemoteEntry> entries;
        try
        {
            entries = _remoteStorage.listDirectory(destinationDirectory, false);
        }
        catch (const remote::RemoteApiException& e)
        {
            LOG(DEBUG, "Cannot list '" << destinationDirectory.string() << "', no variant to remove: " << e.what());
            return false;
        }

        std::vector<std::string> variants;
        for (const remote::RemoteEntry& entry : entries)
        {
            if (entry.isDirectory)
                continue;

            const std::filesystem::path entryName{ entry.name };
            if (entryName.stem().string() != stem)
                continue;

            if (core::stringUtils::stringToLower(entryName.extension().string()) == extension)
                continue;

            if (core::pathUtils::hasFileAnyExtension(entryName, _settings.videoExtensions))
                variants.push_back(entry.name);
        }

        if (variants.empty())
            return false;

        try
        {
            _remoteStorage.remove(destinationDirectory, variants);
        }
        catch (const remote::RemoteApiException& e)
        {
            LOG(WARNING, "Cannot remove variants of '" << stem << "' in '" << destinationDirectory.string() << "': " << e.what());
            return false;
        }

        LOG(INFO, "Wash: removed " << variants.size() << " variant(s) of '" << stem << "' in '" << destinationDirectory.string() << "'");
        return true;
    }

    void MoveOrchestrator::failTask(const std::filesystem::path& localPath, TaskState state, FailureReason reason, const std::string& message)
    {
        bool retryBudgetExhausted{};
        const std::optional<MoveTask> task{ _registry.update(localPath, [&](MoveTask& t) {
            t.failureReason = reason;
            t.failureMessage = message;

            if (reason == FailureReason::Aborted)
            {
                t.state = TaskState::Aborted;
                t.retryable = false;
            }
            else if (!isRetryableReason(reason))
            {
                t.state = state;
                t.retryable = false;
            }
            else if (t.retryCount < _settings.maxRetryCount)
            {
                t.state = state;
                t.retryable = true;
            }
            else
            {
                t.state = TaskState::Failed;
                t.retryable = false;
                retryBudgetExhausted = true;
            }
        }) };

        if (!task)
            return;

        LOG(WARNING, "Task for '" << localPath.string() << "' " << toString(task->state) << " (" << toString(reason) << "): " << message
                                  << (task->retryable ? ", will be retried" : (retryBudgetExhausted ? ", no retry left" : "")));

        if (task->retryable)
            return;

        _events.taskFailed.emit(*task);
        if (_settings.notify)
            _notifier.notify("Move failed", "File: " + task->localPath.string() + "\nSource: " + task->remoteSourcePath.string() + "\nDestination: " + task->remoteDestPath.string() + "\nError: " + std::string{ toString(reason) } + ": " + message);
    }

    void MoveOrchestrator::onTaskSucceeded(const MoveTask& task)
    {
        _events.taskSucceeded.emit(task);
        if (_settings.notify)
            _notifier.notify(task.washApplied ? "Move succeeded (wash)" : "Move succeeded", "File: " + task.localPath.string() + "\nDestination: " + task.remoteDestPath.string());
    }
} // namespace olmover::mover
