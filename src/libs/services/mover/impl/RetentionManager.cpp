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

#include "RetentionManager.hpp"

#include <Wt/Json/Object.h>
#include <Wt/Json/Parser.h>
#include <Wt/Json/Serializer.h>
#include <Wt/Json/Value.h>
#include <Wt/WException.h>

#include "core/Exception.hpp"
#include "core/ILogger.hpp"
#include "remote/Exception.hpp"
#include "remote/IRemoteStorage.hpp"
#include "services/mover/IStateStore.hpp"

#include "RetryPolicy.hpp"
#include "TaskRegistry.hpp"

namespace olmover::mover
{
    RetentionManager::RetentionManager(const MoverSettings& settings, TaskRegistry& registry, remote::IRemoteStorage& remoteStorage, IStateStore& stateStore)
        : _settings{ settings }
        , _registry{ registry }
        , _remoteStorage{ remoteStorage }
        , _stateStore{ stateStore }
    {
        load();
    }

    void RetentionManager::onTaskSucceeded()
    {
        const std::scoped_lock lock{ _mutex };

        _successCounter++;
        save();
    }

    void RetentionManager::check()
    {
        const std::scoped_lock lock{ _mutex };

        if (_settings.clearApiThreshold > 0 && _successCounter >= _settings.clearApiThreshold)
        {
            OLMOVER_LOG(RETENTION, INFO, _successCounter << " successful move(s) since last clear, clearing remote task history");
            try
            {
                _remoteStorage.clearTaskHistory();
                _successCounter = 0;
                save();
            }
            catch (const remote::Exception& e)
            {
                OLMOVER_LOG(RETENTION, WARNING, "Cannot clear remote task history, will retry: " << e.what());
            }
        }

        if (_settings.clearPanelThreshold > 0)
        {
            const std::size_t successfulCount{ _registry.getSuccessfulCount() };
            if (successfulCount >= _settings.clearPanelThreshold)
            {
                const std::size_t removedCount{ _registry.pruneSuccessful(_settings.keepSuccessfulTasks) };
                OLMOVER_LOG(RETENTION, INFO, "Pruned " << removedCount << " successful task(s), kept the " << _settings.keepSuccessfulTasks << " most recent");
            }

            const std::size_t removedFailedCount{ _registry.pruneFailed(_settings.keepFailedTasks, [this](const MoveTask& task) { return isRetryCandidate(task, _settings); }) };
            if (removedFailedCount > 0)
                OLMOVER_LOG(RETENTION, INFO, "Pruned " << removedFailedCount << " failed task(s), kept the " << _settings.keepFailedTasks << " most recent");
        }
    }

    std::size_t RetentionManager::getSuccessCounter() const
    {
        const std::scoped_lock lock{ _mutex };
        return _successCounter;
    }

    void RetentionManager::load()
    {
        const std::optional<std::string> content{ _stateStore.load(stateKey) };
        if (!content)
            return;

        try
        {
            Wt::Json::Object root;
            Wt::Json::parse(*content, root);
            _successCounter = static_cast<std::size_t>(root.get("successful_moves_count").orIfNull(0LL));
        }
        catch (const Wt::WException& e)
        {
            OLMOVER_LOG(RETENTION, ERROR, "Cannot parse persisted retention state: " << e.what());
        }
    }

    void RetentionManager::save()
    {
        Wt::Json::Object root;
        root["successful_moves_count"] = Wt::Json::Value{ static_cast<long long int>(_successCounter) };

        try
        {
            _stateStore.save(stateKey, Wt::Json::serialize(root));
        }
        catch (const core::OlmoverException& e)
        {
            OLMOVER_LOG(RETENTION, ERROR, "Cannot persist retention state: " << e.what());
        }
    }
} // namespace olmover::mover
