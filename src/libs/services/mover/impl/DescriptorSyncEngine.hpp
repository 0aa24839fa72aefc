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
#include <vector>

#include "services/mover/MoveTask.hpp"
#include "services/mover/MoverSettings.hpp"

namespace olmover::remote
{
    class IRemoteStorage;
}

namespace olmover::mover
{
    class ISleeper;
    class PathMapper;
    class TaskRegistry;

    // Mirrors the descriptors generated by the remote side for a moved file into the local descriptor tree
    class DescriptorSyncEngine
    {
    public:
        DescriptorSyncEngine(const MoverSettings& settings, const PathMapper& pathMapper, remote::IRemoteStorage& remoteStorage, TaskRegistry& registry, ISleeper& sleeper);

        DescriptorSyncEngine(const DescriptorSyncEngine&) = delete;
        DescriptorSyncEngine& operator=(const DescriptorSyncEngine&) = delete;

        // Task must be in MoveSucceeded state, ends in StrmSynced
        // throws TaskFailureException, the failure is left to the caller to record
        MoveTask sync(const MoveTask& task);

    private:
        void removeLocalDescriptors(const std::filesystem::path& localDirectory, const std::string& stem);
        std::vector<std::string> findGeneratedDescriptors(const std::filesystem::path& sourceDirectory, const std::string& stem);
        void mirrorDescriptor(const std::filesystem::path& sourceDirectory, const std::filesystem::path& localDirectory, const std::string& name);

        const MoverSettings& _settings;
        const PathMapper& _pathMapper;
        remote::IRemoteStorage& _remoteStorage;
        TaskRegistry& _registry;
        ISleeper& _sleeper;
    };
} // namespace olmover::mover
