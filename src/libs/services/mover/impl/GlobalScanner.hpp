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

#include <functional>

#include "services/mover/MoveTask.hpp"
#include "services/mover/MoverSettings.hpp"
#include "services/mover/ScanStats.hpp"

namespace olmover::mover
{
    class MoveOrchestrator;
    class TaskRegistry;

    // Recovers files missed by the watchers and re-enters failed tasks that still have retries left
    // Safe to run while events are processed: everything goes through the orchestrator entry points
    class GlobalScanner
    {
    public:
        GlobalScanner(const MoverSettings& settings, TaskRegistry& registry, MoveOrchestrator& orchestrator);

        GlobalScanner(const GlobalScanner&) = delete;
        GlobalScanner& operator=(const GlobalScanner&) = delete;

        using ShouldAbortCallback = std::function<bool()>;
        ScanStats scan(const ShouldAbortCallback& shouldAbort = {});

    private:
        void retryRegisteredTasks(ScanStats& stats);
        void processFile(const std::filesystem::path& file, ScanStats& stats);

        const MoverSettings& _settings;
        TaskRegistry& _registry;
        MoveOrchestrator& _orchestrator;
    };
} // namespace olmover::mover
