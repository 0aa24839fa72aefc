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

#include "Config.hpp"

#include "core/Exception.hpp"
#include "core/ILogger.hpp"

namespace olmover::core
{
    std::unique_ptr<IConfig> createConfig(const std::filesystem::path& p)
    {
        return std::make_unique<Config>(p);
    }

    Config::Config(const std::filesystem::path& p)
    {
        try
        {
            _config.readFile(p.c_str());
        }
        catch (const libconfig::FileIOException&)
        {
            throw OlmoverException{ "Cannot open config file '" + p.string() + "'" };
        }
        catch (const libconfig::ParseException& e)
        {
            throw OlmoverException{ "Cannot parse config file '" + p.string() + "', line = " + std::to_string(e.getLine()) + ", error = '" + e.getError() + "'" };
        }
        catch (const libconfig::ConfigException& e)
        {
            throw OlmoverException{ "Cannot open config file '" + p.string() + "': " + e.what() };
        }
    }

    template<typename T>
    T Config::lookupOr(std::string_view setting, T def) const
    {
        try
        {
            return static_cast<T>(_config.lookup(std::string{ setting }));
        }
        catch (const libconfig::ConfigException&)
        {
            return def;
        }
    }

    std::string_view Config::getString(std::string_view setting, std::string_view def)
    {
        try
        {
            return static_cast<const char*>(_config.lookup(std::string{ setting }));
        }
        catch (const libconfig::ConfigException&)
        {
            return def;
        }
    }

    void Config::visitStrings(std::string_view setting, std::function<void(std::string_view)> func, std::initializer_list<std::string_view> defs)
    {
        if (!_config.exists(std::string{ setting }))
        {
            for (std::string_view def : defs)
                func(def);
            return;
        }

        const libconfig::Setting& values{ _config.lookup(std::string{ setting }) };
        if (!values.isAggregate())
        {
            OLMOVER_LOG(UTILS, WARNING, "Config setting '" << setting << "' is not a list, ignored");
            return;
        }

        for (int i{}; i < values.getLength(); ++i)
        {
            if (values[i].getType() != libconfig::Setting::TypeString)
            {
                OLMOVER_LOG(UTILS, WARNING, "Config setting '" << setting << "': entry " << i << " is not a string, skipped");
                continue;
            }

            func(static_cast<const char*>(values[i]));
        }
    }

    std::filesystem::path Config::getPath(std::string_view setting, const std::filesystem::path& def)
    {
        const std::string_view res{ getString(setting, {}) };
        if (res.empty())
            return def;

        return std::filesystem::path{ std::string{ res } };
    }

    unsigned long Config::getULong(std::string_view setting, unsigned long def)
    {
        return lookupOr<unsigned long>(setting, def);
    }

    long Config::getLong(std::string_view setting, long def)
    {
        return lookupOr<long>(setting, def);
    }

    bool Config::getBool(std::string_view setting, bool def)
    {
        return lookupOr<bool>(setting, def);
    }
} // namespace olmover::core
