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

#include "GlobalScanner.hpp"

#include "core/ILogger.hpp"
#include "core/Path.hpp"

#include "MoveOrchestrator.hpp"
#include "RetryPolicy.hpp"
#include "TaskRegistry.hpp"

#define LOG(sev, message) OLMOVER_LOG(SCANNER, sev, "[Global scan] - " << message)

namespace olmover::mover
{
    GlobalScanner::GlobalScanner(const MoverSettings& settings, TaskRegistry& registry, MoveOrchestrator& orchestrator)
        : _settings{ settings }
        , _registry{ registry }
        , _orchestrator{ orchestrator }
    {
    }

    ScanStats GlobalScanner::scan(const ShouldAbortCallback& shouldAbort)
    {
        ScanStats stats;
        stats.startTime = Wt::WDateTime::currentDateTime();

        LOG(INFO, "Scan started");

        // moved files are no longer in the monitor directories
        retryRegisteredTasks(stats);

        bool aborted{};
        for (const std::filesystem::path& monitorPath : _settings.monitorPaths)
        {
            if (aborted)
                break;

            std::error_code ec;
            if (!std::filesystem::is_directory(monitorPath, ec))
            {
                LOG(WARNING, "Monitor directory '" << monitorPath.string() << "' does not exist");
                stats.errors++;
                continue;
            }

            LOG(DEBUG, "Scanning '" << monitorPath.string() << "'");
            core::pathUtils::exploreFilesRecursive(monitorPath, [&](std::error_code ec, const std::filesystem::path& path) {
                if (shouldAbort && shouldAbort())
                {
                    aborted = true;
                    return false;
                }

                if (ec)
                {
                    LOG(ERROR, "Cannot explore '" << path.string() << "': " << ec.message());
                    stats.errors++;
                    return true;
                }

                processFile(path, stats);
                return true;
            });
        }

        stats.stopTime = Wt::WDateTime::currentDateTime();

        LOG(INFO, "Scan " << (aborted ? "aborted" : "complete") << ": found = " << stats.filesFound << ", submitted = " << stats.submitted << ", retried = " << stats.retried << ", skipped = " << stats.skipped << ", errors = " << stats.errors);

        return stats;
    }

    void GlobalScanner::retryRegisteredTasks(ScanStats& stats)
    {
        for (const MoveTask& task : _registry.getTasks())
        {
            if (!isRetryCandidate(task, _settings))
                continue;

            if (task.moveCompleted)
            {
                if (_orchestrator.retryDescriptorSync(task.localPath))
                    stats.retried++;

                continue;
            }

            // otherwise handled by the directory walk
            std::error_code ec;
            if (std::filesystem::exists(task.localPath, ec) || ec)
                continue;

            if (_orchestrator.resumeVanishedSource(task.localPath))
                stats.retried++;
            else
                stats.skipped++;
        }
    }

    void GlobalScanner::processFile(const std::filesystem::path& file, ScanStats& stats)
    {
        if (!_orchestrator.isQualifyingFile(file))
            return;

        stats.filesFound++;

        const std::optional<MoveTask> task{ _registry.find(file.lexically_normal()) };
        if (!task)
        {
            LOG(INFO, "Found unprocessed file '" << file.string() << "'");
            if (_orchestrator.submit(file) == MoveOrchestrator::SubmitResult::Scheduled)
                stats.submitted++;
            else
                stats.skipped++;

            return;
        }

        if (isActive(task->state) || !isRetryCandidate(*task, _settings))
        {
            stats.skipped++;
            return;
        }

        bool retried{};
        if (task->moveCompleted)
            retried = _orchestrator.retryDescriptorSync(task->localPath);
        else
            retried = _orchestrator.submit(file) == MoveOrchestrator::SubmitResult::Scheduled;

        if (retried)
        {
            LOG(INFO, "Retrying '" << file.string() << "' after " << toString(*task->failureReason));
            stats.retried++;
        }
        else
        {
            stats.skipped++;
        }
    }
} // namespace olmover::mover
