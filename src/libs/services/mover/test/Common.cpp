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

#include "Common.hpp"

#include <fstream>
#include <random>
#include <sstream>

#include "remote/Exception.hpp"

namespace olmover::mover::tests
{
    ScopedDirectory::ScopedDirectory()
        : _path{ std::filesystem::temp_directory_path() / ("olmover-mover-test-" + std::to_string(std::random_device{}())) }
    {
        std::filesystem::create_directories(_path);
    }

    ScopedDirectory::~ScopedDirectory()
    {
        std::error_code ec;
        std::filesystem::remove_all(_path, ec);
    }

    void writeFile(const std::filesystem::path& file, std::string_view content)
    {
        std::filesystem::create_directories(file.parent_path());
        std::ofstream{ file, std::ios::binary } << content;
    }

    std::string readFile(const std::filesystem::path& file)
    {
        std::ifstream ifs{ file, std::ios::binary };
        std::ostringstream oss;
        oss << ifs.rdbuf();
        return oss.str();
    }

    void FakeRemoteStorage::addFile(const std::filesystem::path& file, std::string_view content)
    {
        const std::scoped_lock lock{ _mutex };
        _files[file] = content;
    }

    bool FakeRemoteStorage::hasFile(const std::filesystem::path& file) const
    {
        const std::scoped_lock lock{ _mutex };
        return _files.contains(file);
    }

    std::vector<FakeRemoteStorage::MoveCall> FakeRemoteStorage::getMoveCalls() const
    {
        const std::scoped_lock lock{ _mutex };
        return _moveCalls;
    }

    std::vector<std::filesystem::path> FakeRemoteStorage::getRefreshCalls() const
    {
        const std::scoped_lock lock{ _mutex };
        return _refreshCalls;
    }

    std::vector<std::string> FakeRemoteStorage::getRemovedNames() const
    {
        const std::scoped_lock lock{ _mutex };
        return _removedNames;
    }

    std::size_t FakeRemoteStorage::getClearCount() const
    {
        const std::scoped_lock lock{ _mutex };
        return _clearCount;
    }

    remote::MoveResult FakeRemoteStorage::move(const std::filesystem::path& sourceFile, const std::filesystem::path& destinationFile, bool overwrite)
    {
        const std::scoped_lock lock{ _mutex };

        const MoveCall call{ sourceFile, destinationFile, overwrite };
        _moveCalls.push_back(call);

        remote::MoveResult result;
        if (moveHandler)
        {
            result = moveHandler(call);
        }
        else if (!overwrite && _files.contains(destinationFile))
        {
            result.status = remote::MoveResult::Status::Conflict;
            result.message = "file already exists";
        }
        else
        {
            _files[destinationFile] = "media";
            result.status = remote::MoveResult::Status::Success;
        }

        if (result.status == remote::MoveResult::Status::Success && onMoved)
            onMoved(call);

        return result;
    }

    std::vector<remote::RemoteEntry> FakeRemoteStorage::listDirectory(const std::filesystem::path& directory, bool refresh)
    {
        const std::scoped_lock lock{ _mutex };

        if (refresh)
        {
            _refreshCalls.push_back(directory);
            if (onRefresh)
                onRefresh(directory);
        }

        std::vector<remote::RemoteEntry> entries;
        for (const auto& [file, content] : _files)
        {
            if (file.parent_path() == directory)
                entries.push_back(remote::RemoteEntry{ file.filename().string(), false, content.size() });
        }

        if (entries.empty())
            throw remote::RemoteApiException{ "object not found", 500 };

        return entries;
    }

    std::optional<remote::RemoteEntry> FakeRemoteStorage::getEntry(const std::filesystem::path& path)
    {
        const std::scoped_lock lock{ _mutex };

        auto it{ _files.find(path) };
        if (it == std::cend(_files))
            return std::nullopt;

        return remote::RemoteEntry{ path.filename().string(), false, it->second.size() };
    }

    std::string FakeRemoteStorage::readFile(const std::filesystem::path& file)
    {
        const std::scoped_lock lock{ _mutex };

        auto it{ _files.find(file) };
        if (it == std::cend(_files))
            throw remote::RemoteApiException{ "object not found", 500 };

        return it->second;
    }

    void FakeRemoteStorage::remove(const std::filesystem::path& directory, std::span<const std::string> names)
    {
        const std::scoped_lock lock{ _mutex };

        for (const std::string& name : names)
        {
            _files.erase(directory / name);
            _removedNames.push_back(name);
        }
    }

    void FakeRemoteStorage::clearTaskHistory()
    {
        const std::scoped_lock lock{ _mutex };

        if (failClear)
            throw remote::RemoteApiException{ "storage unavailable", 500 };

        _clearCount++;
    }

    std::optional<std::string> MemoryStateStore::load(std::string_view key)
    {
        const std::scoped_lock lock{ _mutex };

        auto it{ _values.find(key) };
        if (it == std::cend(_values))
            return std::nullopt;

        return it->second;
    }

    void MemoryStateStore::save(std::string_view key, std::string_view value)
    {
        const std::scoped_lock lock{ _mutex };
        _values[std::string{ key }] = value;
    }

    bool FakeSleeper::sleepFor(std::chrono::milliseconds duration)
    {
        if (onSleep)
            onSleep(duration);

        return !aborted;
    }

    std::vector<std::string> RecordingNotifier::getTitles() const
    {
        const std::scoped_lock lock{ _mutex };
        return _titles;
    }

    void RecordingNotifier::notify(std::string_view title, std::string_view)
    {
        const std::scoped_lock lock{ _mutex };
        _titles.emplace_back(title);
    }

    MoverTestBase::MoverTestBase()
        : _watchDirectory{ _tmpDirectory.getPath() / "watch" }
        , _descriptorLocalDirectory{ _tmpDirectory.getPath() / "dlocal" }
    {
        std::filesystem::create_directories(_watchDirectory);

        _settings.monitorPaths = { _watchDirectory };
        _settings.pathMappings = { MappingRule{ _watchDirectory, "/src", "/dst" } };
        _settings.descriptorPathMappings = { DescriptorMappingRule{ "/dst", "/dsrc", _descriptorLocalDirectory } };
        _settings.fileStableInterval = std::chrono::seconds{ 0 };
        _settings.fileStableTimeout = std::chrono::seconds{ 0 };
        _settings.maxConcurrentOperations = 1;
    }

    MoverTestBase::~MoverTestBase()
    {
        if (_jobScheduler)
            _jobScheduler->wait();
    }

    void MoverTestBase::createComponents()
    {
        _pathMapper = std::make_unique<PathMapper>(_settings.pathMappings, _settings.descriptorPathMappings);
        _registry = std::make_unique<TaskRegistry>(_stateStore);
        _jobScheduler = core::createJobScheduler("Test", _settings.maxConcurrentOperations);
        _descriptorSyncEngine = std::make_unique<DescriptorSyncEngine>(_settings, *_pathMapper, _remoteStorage, *_registry, _sleeper);
        _orchestrator = std::make_unique<MoveOrchestrator>(_settings, *_pathMapper, _remoteStorage, *_registry, *_descriptorSyncEngine, *_jobScheduler, _sleeper, _events, _notifier);
        _globalScanner = std::make_unique<GlobalScanner>(_settings, *_registry, *_orchestrator);
        _retentionManager = std::make_unique<RetentionManager>(_settings, *_registry, _remoteStorage, _stateStore);
    }

    void MoverTestBase::waitForTasks()
    {
        _jobScheduler->wait();
    }

    std::filesystem::path MoverTestBase::createLocalFile(const std::filesystem::path& relativePath, std::string_view content)
    {
        const std::filesystem::path file{ _watchDirectory / relativePath };
        writeFile(file, content);
        return file;
    }

    void MoverTestBase::simulateRemoteSide()
    {
        _remoteStorage.onMoved = [this](const FakeRemoteStorage::MoveCall& call) {
            std::error_code ec;
            std::filesystem::remove(_watchDirectory / call.source.lexically_relative("/src"), ec);
        };

        // descriptors of every media file found in the matching /dst directory
        _remoteStorage.onRefresh = [this](const std::filesystem::path& directory) {
            const std::filesystem::path relativeDirectory{ directory.lexically_relative("/dsrc") };
            const std::filesystem::path destinationDirectory{ relativeDirectory == "." ? std::filesystem::path{ "/dst" } : std::filesystem::path{ "/dst" } / relativeDirectory };
            for (const FakeRemoteStorage::MoveCall& call : _remoteStorage.getMoveCalls())
            {
                if (call.destination.parent_path() == destinationDirectory)
                    _remoteStorage.addFile(directory / (call.destination.stem().string() + ".strm"), "http://remote" + call.destination.string());
            }
        };
    }
} // namespace olmover::mover::tests
