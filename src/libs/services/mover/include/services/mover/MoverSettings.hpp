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

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

#include <Wt/WTime.h>

namespace olmover::core
{
    class IConfig;
}

namespace olmover::mover
{
    struct MappingRule
    {
        std::filesystem::path localPrefix;
        std::filesystem::path remoteSourcePrefix;
        std::filesystem::path remoteDestPrefix;
    };

    struct DescriptorMappingRule
    {
        std::filesystem::path remoteDestPrefix;
        std::filesystem::path descriptorSourcePrefix;
        std::filesystem::path descriptorLocalPrefix;
    };

    struct MoverSettings
    {
        std::vector<std::filesystem::path> monitorPaths;
        std::vector<MappingRule> pathMappings;
        std::vector<DescriptorMappingRule> descriptorPathMappings;

        // lower case, with leading dot
        std::vector<std::filesystem::path> videoExtensions{ ".mkv", ".mp4", ".ts", ".avi", ".rmvb", ".wmv", ".mov", ".flv", ".mpg", ".mpeg", ".iso", ".bdmv", ".m2ts" };
        std::vector<std::filesystem::path> tempExtensions{ ".!qb", ".part", ".mp", ".tmp", ".temp", ".download" };
        std::vector<std::string> descriptorSuffixes{ ".strm" };

        bool washModeEnabled{};
        std::chrono::seconds washDelay{ 60 };
        std::chrono::seconds descriptorSettleDelay{ 5 };
        std::chrono::seconds fileStableInterval{ 3 };
        std::chrono::seconds fileStableTimeout{ 60 };

        std::size_t maxRetryCount{ 3 };
        std::size_t maxConcurrentOperations{ 2 };

        std::size_t clearApiThreshold{ 10 };
        std::size_t clearPanelThreshold{ 30 };
        std::size_t keepSuccessfulTasks{ 3 };
        std::size_t keepFailedTasks{ 10 }; // failures that will not be retried
        std::chrono::seconds retentionCheckInterval{ 60 };

        bool globalScanEnabled{};
        Wt::WTime globalScanTime{ 2, 0 };
        bool globalScanAtStartup{};

        bool notify{};
    };

    // throws mover::Exception if the settings are not usable
    MoverSettings readMoverSettings(core::IConfig& config);
} // namespace olmover::mover
