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

#include "services/mover/MoverSettings.hpp"

#include <algorithm>

#include "core/IConfig.hpp"
#include "core/ILogger.hpp"
#include "core/String.hpp"
#include "services/mover/Exception.hpp"

#include "PathMapper.hpp"

namespace olmover::mover
{
    namespace
    {
        std::vector<std::filesystem::path> readExtensions(core::IConfig& config, std::string_view setting, std::initializer_list<std::string_view> defaults)
        {
            std::vector<std::filesystem::path> extensions;

            config.visitStrings(setting, [&](std::string_view extension) {
                if (!core::stringUtils::stringStartsWith(extension, "."))
                {
                    OLMOVER_LOG(MOVER, WARNING, "Ignoring extension '" << extension << "' in " << setting << ": must start with a dot");
                    return;
                }

                extensions.emplace_back(core::stringUtils::stringToLower(extension));
            },
                                defaults);

            return extensions;
        }

        template<typename Rule>
        std::vector<Rule> readMappingRules(core::IConfig& config, std::string_view setting)
        {
            std::vector<Rule> rules;

            config.visitStrings(setting, [&](std::string_view line) {
                const auto parts{ parseMappingLine(line) };
                if (!parts)
                {
                    OLMOVER_LOG(MOVER, WARNING, "Skipping malformed mapping '" << line << "' in " << setting);
                    return;
                }

                rules.push_back(Rule{ (*parts)[0], (*parts)[1], (*parts)[2] });
            },
                                {});

            return rules;
        }
    } // namespace

    MoverSettings readMoverSettings(core::IConfig& config)
    {
        MoverSettings settings;

        config.visitStrings("monitor-paths", [&](std::string_view path) {
            settings.monitorPaths.emplace_back(std::filesystem::path{ path }.lexically_normal());
        },
                            {});
        if (settings.monitorPaths.empty())
            throw Exception{ "No monitor path configured (monitor-paths)" };

        settings.pathMappings = readMappingRules<MappingRule>(config, "path-mappings");
        if (settings.pathMappings.empty())
            throw Exception{ "No valid path mapping configured (path-mappings)" };

        settings.descriptorPathMappings = readMappingRules<DescriptorMappingRule>(config, "descriptor-path-mappings");
        if (settings.descriptorPathMappings.empty())
            OLMOVER_LOG(MOVER, WARNING, "No descriptor path mapping configured, descriptors will not be synced");

        settings.videoExtensions = readExtensions(config, "video-extensions", { ".mkv", ".mp4", ".ts", ".avi", ".rmvb", ".wmv", ".mov", ".flv", ".mpg", ".mpeg", ".iso", ".bdmv", ".m2ts" });
        settings.tempExtensions = readExtensions(config, "temp-extensions", { ".!qb", ".part", ".mp", ".tmp", ".temp", ".download" });

        settings.descriptorSuffixes.clear();
        config.visitStrings("descriptor-suffixes", [&](std::string_view suffix) {
            settings.descriptorSuffixes.emplace_back(suffix);
        },
                            { ".strm" });
        if (settings.descriptorSuffixes.empty())
            throw Exception{ "No descriptor suffix configured (descriptor-suffixes)" };

        settings.washModeEnabled = config.getBool("wash-mode-enabled", false);
        settings.washDelay = std::chrono::seconds{ config.getULong("wash-delay-seconds", 60) };
        settings.descriptorSettleDelay = std::chrono::seconds{ config.getULong("descriptor-settle-delay", 5) };
        settings.fileStableInterval = std::chrono::seconds{ config.getULong("file-stable-interval", 3) };
        settings.fileStableTimeout = std::chrono::seconds{ config.getULong("file-stable-timeout", 60) };

        settings.maxRetryCount = config.getULong("max-retry-count", 3);
        settings.maxConcurrentOperations = std::max<std::size_t>(config.getULong("max-concurrent-operations", 2), 1);

        settings.clearApiThreshold = config.getULong("clear-api-threshold", 10);
        settings.clearPanelThreshold = config.getULong("clear-panel-threshold", 30);
        settings.keepSuccessfulTasks = config.getULong("keep-successful-tasks", 3);
        settings.keepFailedTasks = config.getULong("keep-failed-tasks", 10);
        settings.retentionCheckInterval = std::chrono::seconds{ std::max<unsigned long>(config.getULong("retention-check-interval", 60), 1) };

        settings.globalScanEnabled = config.getBool("global-scan-enabled", false);
        const std::string_view scanTime{ config.getString("global-scan-time", "02:00") };
        settings.globalScanTime = core::stringUtils::fromHourMinuteString(scanTime);
        if (!settings.globalScanTime.isValid())
            throw Exception{ "Invalid global-scan-time '" + std::string{ scanTime } + "', expected HH:MM" };
        settings.globalScanAtStartup = config.getBool("global-scan-at-startup", false);

        settings.notify = config.getBool("notify", false);

        return settings;
    }
} // namespace olmover::mover
