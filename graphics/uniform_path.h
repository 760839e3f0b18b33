// Copyright (C) 2020-2021 Sami Väisänen
// Copyright (C) 2020-2021 Ensisoft http://www.ensisoft.com
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <https://www.gnu.org/licenses/>.

#pragma once

#include "config.h"

#include <string>
#include <vector>

namespace gfx
{
    // One step in the reflected name of a uniform, e.g. "lights[1].color"
    // is the steps lights, 1 and color.
    struct UniformPathSegment {
        enum class Kind {
            // Last segment, a single uniform value.
            Leaf,
            // Last segment, a uniform array reported as "name[0]".
            ArrayLeaf,
            // Structure, followed by '.' and a member name.
            Member,
            // Array of structures, followed by '[' and an index.
            Element
        };
        // member name or the decimal array index.
        std::string id;
        // true when the id is an array index, i.e. it was followed by ']'
        bool is_index = false;
        Kind kind = Kind::Leaf;

        inline bool IsLeaf() const noexcept
        { return kind == Kind::Leaf || kind == Kind::ArrayLeaf; }
    };

    using UniformPath = std::vector<UniformPathSegment>;

    // Split the reflected uniform name into path segments. The last segment
    // is always a leaf. Malformed names produce an empty path.
    UniformPath ParseUniformPath(const std::string& name);

    const char* ToString(UniformPathSegment::Kind kind);

} // namespace
