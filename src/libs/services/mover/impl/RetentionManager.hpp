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
#include <mutex>
#include <string_view>

#include "services/mover/MoverSettings.hpp"

namespace olmover::remote
{
    class IRemoteStorage;
}

namespace olmover::mover
{
    class IStateStore;
    class TaskRegistry;

    // Bounds the remote task log and the local registry
    // The cumulative success counter is persisted under the "plugin_state" key
    class RetentionManager
    {
    public:
        RetentionManager(const MoverSettings& settings, TaskRegistry& registry, remote::IRemoteStorage& remoteStorage, IStateStore& stateStore);

        RetentionManager(const RetentionManager&) = delete;
        RetentionManager& operator=(const RetentionManager&) = delete;

        void onTaskSucceeded();
        void check();

        std::size_t getSuccessCounter() const;

        static constexpr std::string_view stateKey{ "plugin_state" };

    private:
        void load();
        void save();

        const MoverSettings& _settings;
        TaskRegistry& _registry;
        remote::IRemoteStorage& _remoteStorage;
        IStateStore& _stateStore;

        mutable std::mutex _mutex;
        std::size_t _successCounter{}; // since the last remote clear
    };
} // namespace olmover::mover
