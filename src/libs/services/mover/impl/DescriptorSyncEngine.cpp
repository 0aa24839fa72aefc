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

#include "DescriptorSyncEngine.hpp"

#include <algorithm>

#include "core/Exception.hpp"
#include "core/ILogger.hpp"
#include "core/Path.hpp"
#include "remote/Exception.hpp"
#include "remote/IRemoteStorage.hpp"
#include "services/mover/Exception.hpp"

#include "ISleeper.hpp"
#include "PathMapper.hpp"
#include "TaskFailure.hpp"
#include "TaskRegistry.hpp"

#define LOG(sev, message) OLMOVER_LOG(STRM, sev, "[Descriptor sync] - " << message)

namespace olmover::mover
{
    namespace
    {
        constexpr std::string_view mediaInfoSuffix{ "-mediainfo.json" };

        void setTaskState(TaskRegistry& registry, const std::filesystem::path& localPath, TaskState state)
        {
            registry.update(localPath, [state](MoveTask& task) { task.state = state; });
        }
    } // namespace

    DescriptorSyncEngine::DescriptorSyncEngine(const MoverSettings& settings, const PathMapper& pathMapper, remote::IRemoteStorage& remoteStorage, TaskRegistry& registry, ISleeper& sleeper)
        : _settings{ settings }
        , _pathMapper{ pathMapper }
        , _remoteStorage{ remoteStorage }
        , _registry{ registry }
        , _sleeper{ sleeper }
    {
    }

    MoveTask DescriptorSyncEngine::sync(const MoveTask& task)
    {
        PathMapper::DescriptorTarget target;
        try
        {
            target = _pathMapper.resolveDescriptor(task.remoteDestPath);
        }
        catch (const NoMappingFoundException& e)
        {
            throw TaskFailureException{ FailureReason::NoDescriptorMapping, e.what() };
        }

        setTaskState(_registry, task.localPath, TaskState::StrmSyncing);

        const std::filesystem::path sourceDirectory{ target.descriptorSourcePath.parent_path() };
        const std::filesystem::path localDirectory{ target.descriptorLocalPath.parent_path() };
        const std::string stem{ target.descriptorSourcePath.stem().string() };

        LOG(DEBUG, "Syncing descriptors of '" << task.remoteDestPath.string() << "': '" << sourceDirectory.string() << "' -> '" << localDirectory.string() << "'");

        if (task.washApplied)
        {
            removeLocalDescriptors(localDirectory, stem);

            LOG(DEBUG, "Waiting " << _settings.washDelay.count() << "s before regenerating descriptors of '" << stem << "'");
            if (!_sleeper.sleepFor(_settings.washDelay))
                throw TaskFailureException{ FailureReason::Interrupted, "Interrupted while waiting for the wash delay" };
        }

        try
        {
            // listing with refresh makes the remote side generate the descriptors
            _remoteStorage.listDirectory(sourceDirectory, true);
        }
        catch (const remote::RemoteApiException& e)
        {
            throw TaskFailureException{ FailureReason::RemoteApiError, std::string{ "Refresh failed: " } + e.what() };
        }

        if (!_sleeper.sleepFor(_settings.descriptorSettleDelay))
            throw TaskFailureException{ FailureReason::Interrupted, "Interrupted while waiting for descriptor generation" };

        const std::vector<std::string> names{ findGeneratedDescriptors(sourceDirectory, stem) };
        if (names.empty())
            throw TaskFailureException{ FailureReason::DescriptorNotGenerated, "No descriptor generated in '" + sourceDirectory.string() + "' for '" + stem + "'" };

        for (const std::string& name : names)
            mirrorDescriptor(sourceDirectory, localDirectory, name);

        LOG(INFO, "Synced " << names.size() << " descriptor(s) for '" << task.remoteDestPath.string() << "' into '" << localDirectory.string() << "'");

        std::optional<MoveTask> updatedTask{ _registry.update(task.localPath, [](MoveTask& t) {
            t.state = TaskState::StrmSynced;
            t.retryable = false;
            t.failureReason.reset();
            t.failureMessage.clear();
        }) };
        if (!updatedTask)
            throw TaskFailureException{ FailureReason::Interrupted, "Task vanished from registry" };

        return *updatedTask;
    }

    void DescriptorSyncEngine::removeLocalDescriptors(const std::filesystem::path& localDirectory, const std::string& stem)
    {
        std::vector<std::filesystem::path> files;
        for (const std::string& suffix : _settings.descriptorSuffixes)
            files.push_back(localDirectory / (stem + suffix));
        files.push_back(localDirectory / (stem + std::string{ mediaInfoSuffix }));

        for (const std::filesystem::path& file : files)
        {
            std::error_code ec;
            if (std::filesystem::remove(file, ec))
                LOG(DEBUG, "Removed stale descriptor '" << file.string() << "'");
            else if (ec)
                throw TaskFailureException{ FailureReason::FilesystemError, "Cannot remove '" + file.string() + "': " + ec.message() };
        }
    }

    std::vector<std::string> DescriptorSyncEngine::findGeneratedDescriptors(const std::filesystem::path& sourceDirectory, const std::string& stem)
    {
        std::vector<remote::RemoteEntry> entries;
        try
        {
            entries = _remoteStorage.listDirectory(sourceDirectory, false);
        }
        catch (const remote::RemoteApiException& e)
        {
            throw TaskFailureException{ FailureReason::RemoteApiError, std::string{ "Listing failed: " } + e.what() };
        }

        std::vector<std::string> names;
        for (const std::string& suffix : _settings.descriptorSuffixes)
        {
            const std::string name{ stem + suffix };
            const bool found{ std::any_of(std::cbegin(entries), std::cend(entries), [&](const remote::RemoteEntry& entry) { return !entry.isDirectory && entry.name == name; }) };
            if (found)
                names.push_back(name);
        }

        return names;
    }

    void DescriptorSyncEngine::mirrorDescriptor(const std::filesystem::path& sourceDirectory, const std::filesystem::path& localDirectory, const std::string& name)
    {
        std::string content;
        try
        {
            content = _remoteStorage.readFile(sourceDirectory / name);
        }
        catch (const remote::RemoteApiException& e)
        {
            throw TaskFailureException{ FailureReason::RemoteApiError, "Cannot read '" + (sourceDirectory / name).string() + "': " + e.what() };
        }

        try
        {
            core::pathUtils::writeFileAtomically(localDirectory / name, content);
        }
        catch (const core::OlmoverException& e)
        {
            throw TaskFailureException{ FailureReason::FilesystemError, e.what() };
        }

        LOG(DEBUG, "Mirrored '" << (sourceDirectory / name).string() << "' to '" << (localDirectory / name).string() << "'");
    }
} // namespace olmover::mover
