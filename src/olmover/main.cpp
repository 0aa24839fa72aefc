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

#include <cstdlib>
#include <iostream>

#include <Wt/WServer.h>
#include <boost/asio/io_context.hpp>

#include "core/Exception.hpp"
#include "core/IConfig.hpp"
#include "core/ILogger.hpp"
#include "core/IOContextRunner.hpp"
#include "core/Service.hpp"
#include "remote/IRemoteStorage.hpp"
#include "services/mover/IMoverService.hpp"
#include "services/mover/INotifier.hpp"
#include "services/mover/IStateStore.hpp"
#include "services/mover/MoverSettings.hpp"

namespace olmover
{
    namespace
    {
        core::logging::Severity getLogMinSeverity()
        {
            std::string_view minSeverity{ core::Service<core::IConfig>::get()->getString("log-min-severity", "info") };

            if (minSeverity == "debug")
                return core::logging::Severity::DEBUG;
            else if (minSeverity == "info")
                return core::logging::Severity::INFO;
            else if (minSeverity == "warning")
                return core::logging::Severity::WARNING;
            else if (minSeverity == "error")
                return core::logging::Severity::ERROR;
            else if (minSeverity == "fatal")
                return core::logging::Severity::FATAL;

            throw core::OlmoverException{ "Invalid config value for 'log-min-severity'" };
        }

        remote::OpenListSettings readOpenListSettings(core::IConfig& config)
        {
            remote::OpenListSettings settings;

            settings.url = config.getString("openlist-url", "");
            if (settings.url.empty())
                throw core::OlmoverException{ "Missing config value for 'openlist-url'" };

            settings.token = config.getString("openlist-token", "");
            if (settings.token.empty())
                throw core::OlmoverException{ "Missing config value for 'openlist-token'" };

            settings.requestTimeout = std::chrono::seconds{ config.getULong("openlist-request-timeout", settings.requestTimeout.count()) };
            settings.taskPollInterval = std::chrono::seconds{ config.getULong("move-task-poll-interval", settings.taskPollInterval.count()) };
            settings.taskTimeout = std::chrono::seconds{ config.getULong("move-task-timeout", settings.taskTimeout.count()) };

            return settings;
        }
    } // namespace

    int main(int argc, char* argv[])
    {
        std::filesystem::path configFilePath{ "/etc/olmover.conf" };
        int res{ EXIT_FAILURE };

        auto displayUsage{ [&](std::ostream& os) {
            os << "Usage:\t" << argv[0] << "\t[conf_file]\n\n"
               << "Options:\n"
               << "\tconf_file:\t path to the olmover configuration file (defaults to " << configFilePath << ")\n\n";
        } };

        if (argc == 2)
        {
            const std::string_view arg{ argv[1] };
            if (arg == "-h" || arg == "--help")
            {
                displayUsage(std::cout);
                return EXIT_SUCCESS;
            }
            configFilePath = std::string(arg, 0, 256);
        }
        else if (argc > 2)
        {
            displayUsage(std::cerr);
            return EXIT_FAILURE;
        }

        try
        {
            core::Service<core::IConfig> config{ core::createConfig(configFilePath) };
            core::Service<core::logging::ILogger> logger{ core::logging::createLogger(getLogMinSeverity(), config->getPath("log-file", "")) };

            const std::filesystem::path workingDirectory{ config->getPath("working-dir", "/var/olmover") };
            std::filesystem::create_directories(workingDirectory);

            const mover::MoverSettings moverSettings{ mover::readMoverSettings(*config) };
            const remote::OpenListSettings openListSettings{ readOpenListSettings(*config) };

            // ioContext used to dispatch the HTTP requests to the remote storage
            boost::asio::io_context ioContext;
            core::IOContextRunner ioContextRunner{ ioContext, 1, "Http" };

            // Service initialization order is important (reverse-order for deinit)
            const auto remoteStorage{ remote::createOpenListStorage(ioContext, openListSettings) };
            const auto stateStore{ mover::createFileStateStore(workingDirectory / "state") };
            const auto notifier{ mover::createLogNotifier() };
            core::Service<mover::IMoverService> moverService{ mover::createMoverService(moverSettings, *remoteStorage, *stateStore, *notifier) };

            moverService->getEvents().scanComplete.connect([](const mover::ScanStats& stats) {
                OLMOVER_LOG(MAIN, INFO, "Global scan took " << stats.startTime.secsTo(stats.stopTime) << "s, " << stats.submitted << " new file(s), " << stats.retried << " retried");
            });

            OLMOVER_LOG(MAIN, INFO, "Now running...");
            Wt::WServer::waitForShutdown();

            OLMOVER_LOG(MAIN, INFO, "Quitting...");
            res = EXIT_SUCCESS;
        }
        catch (const std::exception& e)
        {
            OLMOVER_LOG(MAIN, FATAL, "Caught std::exception: " << e.what());
            std::cerr << "Caught std::exception: " << e.what() << std::endl;
            res = EXIT_FAILURE;
        }

        return res;
    }
} // namespace olmover

int main(int argc, char* argv[])
{
    return olmover::main(argc, argv);
}
