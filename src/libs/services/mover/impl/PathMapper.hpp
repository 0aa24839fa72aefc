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

#include <array>
#include <filesystem>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

#include "services/mover/MoverSettings.hpp"

namespace olmover::mover
{
    // Longest prefix rule resolution, ties resolved to the first configured rule
    // Prefixes only match on whole path components ("/a/b" does not prefix "/a/bc")
    class PathMapper
    {
    public:
        PathMapper(std::span<const MappingRule> rules, std::span<const DescriptorMappingRule> descriptorRules);

        struct MoveTarget
        {
            std::filesystem::path remoteSourcePath;
            std::filesystem::path remoteDestPath;
        };
        // throws NoMappingFoundException
        MoveTarget resolveMove(const std::filesystem::path& localPath) const;

        struct DescriptorTarget
        {
            std::filesystem::path descriptorSourcePath;
            std::filesystem::path descriptorLocalPath;
        };
        // throws NoMappingFoundException
        DescriptorTarget resolveDescriptor(const std::filesystem::path& remoteDestPath) const;

    private:
        std::vector<MappingRule> _rules;
        std::vector<DescriptorMappingRule> _descriptorRules;
    };

    // "a:b:c", exactly two separators and no empty part
    std::optional<std::array<std::filesystem::path, 3>> parseMappingLine(std::string_view line);
} // namespace olmover::mover
