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

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "core/IJobScheduler.hpp"
#include "remote/IRemoteStorage.hpp"
#include "services/mover/IMoverService.hpp"
#include "services/mover/INotifier.hpp"
#include "services/mover/IStateStore.hpp"
#include "services/mover/MoverSettings.hpp"

#include "DescriptorSyncEngine.hpp"
#include "GlobalScanner.hpp"
#include "ISleeper.hpp"
#include "MoveOrchestrator.hpp"
#include "PathMapper.hpp"
#include "RetentionManager.hpp"
#include "TaskRegistry.hpp"

namespace olmover::mover::tests
{
    class ScopedDirectory final
    {
    public:
        ScopedDirectory();
        ~ScopedDirectory();
        ScopedDirectory(const ScopedDirectory&) = delete;
        ScopedDirectory& operator=(const ScopedDirectory&) = delete;

        const std::filesystem::path& getPath() const { return _path; }

    private:
        const std::filesystem::path _path;
    };

    void writeFile(const std::filesystem::path& file, std::string_view content = "data");
    std::string readFile(const std::filesystem::path& file);

    // In memory remote tree
    class FakeRemoteStorage final : public remote::IRemoteStorage
    {
    public:
        void addFile(const std::filesystem::path& file, std::string_view content = {});
        bool hasFile(const std::filesystem::path& file) const;

        struct MoveCall
        {
            std::filesystem::path source;
            std::filesystem::path destination;
            bool overwrite{};
        };
        std::vector<MoveCall> getMoveCalls() const;
        std::vector<std::filesystem::path> getRefreshCalls() const;
        std::vector<std::string> getRemovedNames() const;
        std::size_t getClearCount() const;

        // replaces the default move behavior
        std::function<remote::MoveResult(const MoveCall&)> moveHandler;
        // called after a successful move
        std::function<void(const MoveCall&)> onMoved;
        // called on listings with refresh
        std::function<void(const std::filesystem::path&)> onRefresh;

        bool failClear{};

    private:
        remote::MoveResult move(const std::filesystem::path& sourceFile, const std::filesystem::path& destinationFile, bool overwrite) override;
        std::vector<remote::RemoteEntry> listDirectory(const std::filesystem::path& directory, bool refresh) override;
        std::optional<remote::RemoteEntry> getEntry(const std::filesystem::path& path) override;
        std::string readFile(const std::filesystem::path& file) override;
        void remove(const std::filesystem::path& directory, std::span<const std::string> names) override;
        void clearTaskHistory() override;
        void abort() override {}

        mutable std::recursive_mutex _mutex;
        std::map<std::filesystem::path, std::string> _files;
        std::vector<MoveCall> _moveCalls;
        std::vector<std::filesystem::path> _refreshCalls;
        std::vector<std::string> _removedNames;
        std::size_t _clearCount{};
    };

    class MemoryStateStore final : public IStateStore
    {
    public:
        std::optional<std::string> load(std::string_view key) override;
        void save(std::string_view key, std::string_view value) override;

    private:
        std::mutex _mutex;
        std::map<std::string, std::string, std::less<>> _values;
    };

    // Returns immediately, lets tests observe the waits
    class FakeSleeper final : public ISleeper
    {
    public:
        std::function<void(std::chrono::milliseconds)> onSleep;
        std::atomic<bool> aborted{};

    private:
        bool sleepFor(std::chrono::milliseconds duration) override;
    };

    class RecordingNotifier final : public INotifier
    {
    public:
        std::vector<std::string> getTitles() const;

    private:
        void notify(std::string_view title, std::string_view text) override;

        mutable std::mutex _mutex;
        std::vector<std::string> _titles;
    };

    // Components wired like the service does, with fakes for the outer world
    // Layout: local files in <tmp>/watch, mapped to /src -> /dst, descriptors from /dsrc mirrored in <tmp>/dlocal
    class MoverTestBase : public ::testing::Test
    {
    protected:
        MoverTestBase();
        ~MoverTestBase() override;

        // to be called once settings are tuned
        void createComponents();
        void waitForTasks();

        std::filesystem::path createLocalFile(const std::filesystem::path& relativePath, std::string_view content = "data");
        // Make the fake remote behave like OpenList: the local file disappears once moved
        // and descriptors are generated on refresh
        void simulateRemoteSide();

        ScopedDirectory _tmpDirectory;
        const std::filesystem::path _watchDirectory;
        const std::filesystem::path _descriptorLocalDirectory;

        MoverSettings _settings;
        MemoryStateStore _stateStore;
        FakeRemoteStorage _remoteStorage;
        FakeSleeper _sleeper;
        RecordingNotifier _notifier;
        Events _events;

        std::unique_ptr<PathMapper> _pathMapper;
        std::unique_ptr<TaskRegistry> _registry;
        std::unique_ptr<core::IJobScheduler> _jobScheduler;
        std::unique_ptr<DescriptorSyncEngine> _descriptorSyncEngine;
        std::unique_ptr<MoveOrchestrator> _orchestrator;
        std::unique_ptr<GlobalScanner> _globalScanner;
        std::unique_ptr<RetentionManager> _retentionManager;
    };
} // namespace olmover::mover::tests
