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

#include "LogNotifier.hpp"

#include "core/ILogger.hpp"

namespace olmover::mover
{
    std::unique_ptr<INotifier> createLogNotifier()
    {
        return std::make_unique<LogNotifier>();
    }

    void LogNotifier::notify(std::string_view title, std::string_view text)
    {
        OLMOVER_LOG(MOVER, INFO, "[Notification] " << title << ": " << text);
    }
} // namespace olmover::mover
