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

#include "PathMapper.hpp"

#include <algorithm>

#include "core/Path.hpp"
#include "core/String.hpp"
#include "services/mover/Exception.hpp"

namespace olmover::mover
{
    namespace
    {
        std::filesystem::path normalize(const std::filesystem::path& path)
        {
            std::filesystem::path res{ path.lexically_normal() };
            // "/a/b/" -> "/a/b"
            if (!res.has_filename() && res != res.root_path())
                res = res.parent_path();

            return res;
        }

        std::filesystem::path substitutePrefix(const std::filesystem::path& path, const std::filesystem::path& fromPrefix, const std::filesystem::path& toPrefix)
        {
            const std::filesystem::path relativePath{ path.lexically_relative(fromPrefix) };
            if (relativePath.empty() || relativePath == ".")
                return toPrefix;

            return toPrefix / relativePath;
        }

        template<typename Rule, typename PrefixGetter>
        const Rule* findBestRule(std::span<const Rule> rules, const std::filesystem::path& path, PrefixGetter getPrefix)
        {
            const Rule* bestRule{};
            std::size_t bestLength{};

            for (const Rule& rule : rules)
            {
                const std::filesystem::path& prefix{ getPrefix(rule) };
                if (!core::pathUtils::isPathInRootPath(path, prefix))
                    continue;

                // strictly greater: first rule wins ties
                const std::size_t length{ prefix.native().size() };
                if (!bestRule || length > bestLength)
                {
                    bestRule = &rule;
                    bestLength = length;
                }
            }

            return bestRule;
        }
    } // namespace

    PathMapper::PathMapper(std::span<const MappingRule> rules, std::span<const DescriptorMappingRule> descriptorRules)
    {
        for (const MappingRule& rule : rules)
            _rules.push_back(MappingRule{ normalize(rule.localPrefix), normalize(rule.remoteSourcePrefix), normalize(rule.remoteDestPrefix) });

        for (const DescriptorMappingRule& rule : descriptorRules)
            _descriptorRules.push_back(DescriptorMappingRule{ normalize(rule.remoteDestPrefix), normalize(rule.descriptorSourcePrefix), normalize(rule.descriptorLocalPrefix) });
    }

    PathMapper::MoveTarget PathMapper::resolveMove(const std::filesystem::path& localPathArg) const
    {
        const std::filesystem::path localPath{ normalize(localPathArg) };

        const MappingRule* rule{ findBestRule(std::span<const MappingRule>{ _rules }, localPath, [](const MappingRule& r) -> const std::filesystem::path& { return r.localPrefix; }) };
        if (!rule)
            throw NoMappingFoundException{ localPathArg };

        return MoveTarget{
            .remoteSourcePath = substitutePrefix(localPath, rule->localPrefix, rule->remoteSourcePrefix),
            .remoteDestPath = substitutePrefix(localPath, rule->localPrefix, rule->remoteDestPrefix),
        };
    }

    PathMapper::DescriptorTarget PathMapper::resolveDescriptor(const std::filesystem::path& remoteDestPathArg) const
    {
        const std::filesystem::path remoteDestPath{ normalize(remoteDestPathArg) };

        const DescriptorMappingRule* rule{ findBestRule(std::span<const DescriptorMappingRule>{ _descriptorRules }, remoteDestPath, [](const DescriptorMappingRule& r) -> const std::filesystem::path& { return r.remoteDestPrefix; }) };
        if (!rule)
            throw NoMappingFoundException{ remoteDestPathArg };

        return DescriptorTarget{
            .descriptorSourcePath = substitutePrefix(remoteDestPath, rule->remoteDestPrefix, rule->descriptorSourcePrefix),
            .descriptorLocalPath = substitutePrefix(remoteDestPath, rule->remoteDestPrefix, rule->descriptorLocalPrefix),
        };
    }

    std::optional<std::array<std::filesystem::path, 3>> parseMappingLine(std::string_view line)
    {
        const std::vector<std::string_view> parts{ core::stringUtils::splitString(core::stringUtils::stringTrim(line), ':') };
        if (parts.size() != 3)
            return std::nullopt;

        std::array<std::filesystem::path, 3> res;
        for (std::size_t i{}; i < parts.size(); ++i)
        {
            const std::string_view part{ core::stringUtils::stringTrim(parts[i]) };
            if (part.empty())
                return std::nullopt;

            res[i] = part;
        }

        return res;
    }
} // namespace olmover::mover
