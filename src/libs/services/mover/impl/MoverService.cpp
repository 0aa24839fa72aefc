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

#include "MoverService.hpp"

#include <ctime>

#include "core/Exception.hpp"
#include "core/IJobScheduler.hpp"
#include "core/ILogger.hpp"
#include "remote/IRemoteStorage.hpp"

namespace olmover::mover
{
    namespace
    {
        constexpr std::string_view remoteIndexRefreshedSignal{ "remote-index-refreshed" };
        constexpr std::string_view globalScanSignal{ "global-scan" };
        constexpr std::string_view fileCreatedSignal{ "file-created" };
    } // namespace

    std::unique_ptr<IMoverService> createMoverService(const MoverSettings& settings, remote::IRemoteStorage& remoteStorage, IStateStore& stateStore, INotifier& notifier)
    {
        return std::make_unique<MoverService>(settings, remoteStorage, stateStore, notifier);
    }

    MoverService::MoverService(const MoverSettings& settings, remote::IRemoteStorage& remoteStorage, IStateStore& stateStore, INotifier& notifier)
        : _settings{ settings }
        , _remoteStorage{ remoteStorage }
        , _pathMapper{ _settings.pathMappings, _settings.descriptorPathMappings }
        , _registry{ stateStore }
        , _retentionManager{ _settings, _registry, _remoteStorage, stateStore }
        , _jobScheduler{ core::createJobScheduler("Mover", _settings.maxConcurrentOperations) }
        , _descriptorSyncEngine{ _settings, _pathMapper, _remoteStorage, _registry, _sleeper }
        , _orchestrator{ _settings, _pathMapper, _remoteStorage, _registry, _descriptorSyncEngine, *_jobScheduler, _sleeper, _events, notifier }
        , _globalScanner{ _settings, _registry, _orchestrator }
    {
        _ioService.setThreadCount(1);

        OLMOVER_LOG(SERVICE, INFO, "Using " << _jobScheduler->getThreadCount() << " concurrent operation(s)");
        _jobScheduler->setShouldAbortCallback([this] { return _abort.load(); });

        _events.taskSucceeded.connect([this](const MoveTask&) {
            _retentionManager.onTaskSucceeded();
            _retentionManager.check();
        });

        start();
    }

    MoverService::~MoverService()
    {
        OLMOVER_LOG(SERVICE, INFO, "Stopping service...");
        stop();
        OLMOVER_LOG(SERVICE, INFO, "Service stopped!");
    }

    void MoverService::start()
    {
        std::scoped_lock lock{ _controlMutex };

        startWatchers();

        _ioService.post([this] {
            if (_abort)
                return;

            scheduleRetentionCheck();

            if (_settings.globalScanAtStartup)
                scheduleScan();
            else
                scheduleNextScan();
        });

        _ioService.start();
    }

    void MoverService::stop()
    {
        {
            std::scoped_lock lock{ _controlMutex };

            _abort = true;
            _sleeper.abort();
            _remoteStorage.abort();
            _scheduleTimer.cancel();
            _retentionTimer.cancel();
            _ioService.stop();
        }

        OLMOVER_LOG(SERVICE, DEBUG, "Waiting for ongoing tasks to stop...");
        _jobScheduler->wait();
        _watchers.clear();
    }

    void MoverService::startWatchers()
    {
        for (const std::filesystem::path& monitorPath : _settings.monitorPaths)
        {
            try
            {
                FileWatcherCallbacks callbacks;
                callbacks.onFileAdded = [this](const std::filesystem::path& path) { onFileAdded(path); };
                callbacks.onOverflow = [this] { requestImmediateScan(); };

                _watchers.push_back(createInotifyWatcher(_ioService, monitorPath, std::move(callbacks)));
            }
            catch (const core::SystemException& e)
            {
                OLMOVER_LOG(SERVICE, ERROR, "Cannot watch '" << monitorPath.string() << "': " << e.what() << ", only global scans will pick up its files");
            }
        }
    }

    void MoverService::onFileAdded(const std::filesystem::path& path)
    {
        if (_abort)
            return;

        _orchestrator.submit(path);
    }

    void MoverService::handleExternalSignal(std::string_view kind, std::string_view payload)
    {
        OLMOVER_LOG(SERVICE, DEBUG, "Received signal '" << kind << "'");

        if (kind == remoteIndexRefreshedSignal || kind == globalScanSignal)
        {
            requestImmediateScan();
        }
        else if (kind == fileCreatedSignal)
        {
            if (payload.empty())
            {
                OLMOVER_LOG(SERVICE, WARNING, "Ignoring '" << kind << "' signal without path");
                return;
            }

            onFileAdded(std::filesystem::path{ payload });
        }
        else
        {
            OLMOVER_LOG(SERVICE, DEBUG, "Ignoring unhandled signal '" << kind << "'");
        }
    }

    void MoverService::requestImmediateScan()
    {
        _ioService.post([this] {
            if (_abort)
                return;

            scheduleScan();
        });
    }

    std::vector<MoveTask> MoverService::getTasks() const
    {
        return _registry.getTasks();
    }

    MoverService::Status MoverService::getStatus() const
    {
        Status res;

        {
            std::shared_lock lock{ _statusMutex };

            res.currentState = _curState;
            res.nextScheduledScan = _nextScheduledScan;
            res.lastScanStats = _lastScanStats;
        }

        res.activeTaskCount = _registry.getActiveCount();

        return res;
    }

    void MoverService::scheduleNextScan()
    {
        Wt::WDateTime nextScanDateTime;

        if (_settings.globalScanEnabled)
        {
            const Wt::WDateTime now{ Wt::WDateTime::currentDateTime() };

            if (now.time() < _settings.globalScanTime)
                nextScanDateTime = { now.date(), _settings.globalScanTime };
            else
                nextScanDateTime = { now.date().addDays(1), _settings.globalScanTime };

            scheduleScan(nextScanDateTime);
        }
        else
        {
            OLMOVER_LOG(SERVICE, INFO, "Periodic global scan disabled");
        }

        {
            std::unique_lock lock{ _statusMutex };
            _curState = nextScanDateTime.isValid() ? State::Scheduled : State::NotScheduled;
            _nextScheduledScan = nextScanDateTime;
        }

        _events.scanScheduled.emit(nextScanDateTime);
    }

    void MoverService::scheduleScan(const Wt::WDateTime& dateTime)
    {
        auto cb{ [this](boost::system::error_code ec) {
            if (ec)
                return;

            scan();
        } };

        if (dateTime.isNull())
        {
            OLMOVER_LOG(SERVICE, INFO, "Scheduling global scan right now");
            _scheduleTimer.expires_after(std::chrono::seconds{ 0 });
            _scheduleTimer.async_wait(cb);
        }
        else
        {
            const std::chrono::system_clock::time_point timePoint{ dateTime.toTimePoint() };
            const std::time_t t{ std::chrono::system_clock::to_time_t(timePoint) };
            char ctimeStr[26];

            OLMOVER_LOG(SERVICE, INFO, "Scheduling next global scan at " << std::string(::ctime_r(&t, ctimeStr)));
            _scheduleTimer.expires_at(timePoint);
            _scheduleTimer.async_wait(cb);
        }
    }

    void MoverService::scan()
    {
        {
            std::unique_lock lock{ _statusMutex };
            _curState = State::InProgress;
            _nextScheduledScan = {};
        }

        const ScanStats stats{ _globalScanner.scan([this] { return _abort.load(); }) };

        {
            std::unique_lock lock{ _statusMutex };
            _curState = State::NotScheduled;
            _lastScanStats = stats;
        }

        if (_abort)
            return;

        _events.scanComplete.emit(stats);
        scheduleNextScan();
    }

    void MoverService::scheduleRetentionCheck()
    {
        _retentionTimer.expires_after(_settings.retentionCheckInterval);
        _retentionTimer.async_wait([this](boost::system::error_code ec) {
            if (ec)
                return;

            _retentionManager.check();
            scheduleRetentionCheck();
        });
    }
} // namespace olmover::mover
