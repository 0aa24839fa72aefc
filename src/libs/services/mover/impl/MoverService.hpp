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

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <vector>

#include <boost/asio/steady_timer.hpp>
#include <boost/asio/system_timer.hpp>

#include <Wt/WDateTime.h>
#include <Wt/WIOService.h>

#include "services/mover/IMoverService.hpp"

#include "DescriptorSyncEngine.hpp"
#include "GlobalScanner.hpp"
#include "MoveOrchestrator.hpp"
#include "PathMapper.hpp"
#include "RetentionManager.hpp"
#include "Sleeper.hpp"
#include "TaskRegistry.hpp"
#include "watcher/IFileWatcher.hpp"

namespace olmover::core
{
    class IJobScheduler;
}

namespace olmover::mover
{
    class MoverService : public IMoverService
    {
    public:
        MoverService(const MoverSettings& settings, remote::IRemoteStorage& remoteStorage, IStateStore& stateStore, INotifier& notifier);
        ~MoverService() override;
        MoverService(const MoverService&) = delete;
        MoverService& operator=(const MoverService&) = delete;

    private:
        void handleExternalSignal(std::string_view kind, std::string_view payload) override;
        void requestImmediateScan() override;
        std::vector<MoveTask> getTasks() const override;
        Status getStatus() const override;
        Events& getEvents() override { return _events; }

        void start();
        void stop();

        void startWatchers();
        void onFileAdded(const std::filesystem::path& path);

        // Global scan handling
        void scheduleNextScan();
        void scheduleScan(const Wt::WDateTime& dateTime = {});
        void scan();

        void scheduleRetentionCheck();

        const MoverSettings _settings;
        remote::IRemoteStorage& _remoteStorage;

        Events _events;
        Sleeper _sleeper;
        PathMapper _pathMapper;
        TaskRegistry _registry;
        RetentionManager _retentionManager;
        std::unique_ptr<core::IJobScheduler> _jobScheduler;
        DescriptorSyncEngine _descriptorSyncEngine;
        MoveOrchestrator _orchestrator;
        GlobalScanner _globalScanner;

        std::mutex _controlMutex;
        std::atomic<bool> _abort{};
        Wt::WIOService _ioService;
        boost::asio::system_timer _scheduleTimer{ _ioService };
        boost::asio::steady_timer _retentionTimer{ _ioService };
        std::vector<std::unique_ptr<IFileWatcher>> _watchers;

        mutable std::shared_mutex _statusMutex;
        State _curState{ State::NotScheduled };
        std::optional<ScanStats> _lastScanStats;
        Wt::WDateTime _nextScheduledScan;
    };
} // namespace olmover::mover
