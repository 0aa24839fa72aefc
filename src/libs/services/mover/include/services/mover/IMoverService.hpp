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
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

#include <Wt/WDateTime.h>
#include <Wt/WSignal.h>

#include "services/mover/MoveTask.hpp"
#include "services/mover/MoverSettings.hpp"
#include "services/mover/ScanStats.hpp"

namespace olmover::remote
{
    class IRemoteStorage;
}

namespace olmover::mover
{
    class INotifier;
    class IStateStore;

    struct Events
    {
        // Task reached StrmSynced
        Wt::Signal<MoveTask> taskSucceeded;
        // Task failed with no automatic retry left
        Wt::Signal<MoveTask> taskFailed;

        Wt::Signal<ScanStats> scanComplete;
        Wt::Signal<Wt::WDateTime> scanScheduled;
    };

    class IMoverService
    {
    public:
        virtual ~IMoverService() = default;

        // Entry point for the host event bus
        // kinds: "remote-index-refreshed", "global-scan", "file-created" (payload = local path)
        virtual void handleExternalSignal(std::string_view kind, std::string_view payload) = 0;

        virtual void requestImmediateScan() = 0;

        // ordered by completion time
        virtual std::vector<MoveTask> getTasks() const = 0;

        enum class State
        {
            NotScheduled,
            Scheduled,
            InProgress,
        };

        struct Status
        {
            State currentState{ State::NotScheduled };
            Wt::WDateTime nextScheduledScan;
            std::optional<ScanStats> lastScanStats;
            std::size_t activeTaskCount{};
        };

        virtual Status getStatus() const = 0;

        virtual Events& getEvents() = 0;
    };

    std::unique_ptr<IMoverService> createMoverService(const MoverSettings& settings, remote::IRemoteStorage& remoteStorage, IStateStore& stateStore, INotifier& notifier);
} // namespace olmover::mover
