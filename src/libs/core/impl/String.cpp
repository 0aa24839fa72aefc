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

#include "core/String.hpp"

#include <algorithm>
#include <cctype>

#include <Wt/WDateTime.h>
#include <Wt/WTime.h>

namespace olmover::core::stringUtils
{
    template<>
    std::optional<std::string> readAs(std::string_view str)
    {
        return std::string{ str };
    }

    template<>
    std::optional<std::string_view> readAs(std::string_view str)
    {
        return str;
    }

    std::vector<std::string_view> splitString(std::string_view str, char separator)
    {
        return splitString(str, std::string_view{ &separator, 1 });
    }

    std::vector<std::string_view> splitString(std::string_view str, std::string_view separator)
    {
        std::vector<std::string_view> res;

        if (separator.empty())
        {
            res.push_back(str);
            return res;
        }

        std::size_t currentPos{};
        while (true)
        {
            const std::size_t nextSeparatorPos{ str.find(separator, currentPos) };
            if (nextSeparatorPos == std::string_view::npos)
                break;

            res.push_back(str.substr(currentPos, nextSeparatorPos - currentPos));
            currentPos = nextSeparatorPos + separator.size();
        }

        res.push_back(str.substr(currentPos));

        return res;
    }

    std::string_view stringTrim(std::string_view str, std::string_view whitespaces)
    {
        std::string_view res;

        const auto strBegin{ str.find_first_not_of(whitespaces) };
        if (strBegin != std::string_view::npos)
        {
            const auto strEnd{ str.find_last_not_of(whitespaces) };
            res = str.substr(strBegin, strEnd - strBegin + 1);
        }

        return res;
    }

    std::string_view stringTrimEnd(std::string_view str, std::string_view whitespaces)
    {
        return str.substr(0, str.find_last_not_of(whitespaces) + 1);
    }

    std::string stringToLower(std::string_view str)
    {
        std::string res;
        res.reserve(str.size());

        std::transform(std::cbegin(str), std::cend(str), std::back_inserter(res), [](unsigned char c) { return std::tolower(c); });

        return res;
    }

    void stringToLower(std::string& str)
    {
        std::transform(std::cbegin(str), std::cend(str), std::begin(str), [](unsigned char c) { return std::tolower(c); });
    }

    bool stringCaseInsensitiveContains(std::string_view str, std::string_view strToFind)
    {
        const auto it{ std::search(std::cbegin(str), std::cend(str), std::cbegin(strToFind), std::cend(strToFind), [](unsigned char a, unsigned char b) { return std::tolower(a) == std::tolower(b); }) };
        return it != std::cend(str);
    }

    bool stringStartsWith(std::string_view str, std::string_view prefix)
    {
        return str.substr(0, prefix.size()) == prefix;
    }

    std::string toISO8601String(const Wt::WDateTime& dateTime)
    {
        if (dateTime.isValid())
        {
            // assume UTC
            return dateTime.toString("yyyy-MM-ddThh:mm:ss.zzz", false).toUTF8() + 'Z';
        }

        return "";
    }

    Wt::WDateTime fromISO8601String(std::string_view dateTime)
    {
        // assume UTC
        if (!dateTime.empty() && dateTime.back() == 'Z')
            dateTime.remove_suffix(1);

        return Wt::WDateTime::fromString(Wt::WString{ std::string{ dateTime } }, "yyyy-MM-ddThh:mm:ss.zzz");
    }

    Wt::WTime fromHourMinuteString(std::string_view time)
    {
        const std::vector<std::string_view> parts{ splitString(stringTrim(time), ':') };
        if (parts.size() != 2)
            return {};

        const std::optional<int> hours{ readAs<int>(parts[0]) };
        const std::optional<int> minutes{ readAs<int>(parts[1]) };
        if (!hours || !minutes || *hours < 0 || *hours > 23 || *minutes < 0 || *minutes > 59)
            return {};

        return Wt::WTime{ *hours, *minutes };
    }
} // namespace olmover::core::stringUtils
