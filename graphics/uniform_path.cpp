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

#include "config.h"

#include "base/logging.h"
#include "base/utility.h"
#include "graphics/uniform_path.h"

namespace gfx
{

UniformPath ParseUniformPath(const std::string& name)
{
    using Kind = UniformPathSegment::Kind;

    enum class State {
        // expecting a member name or an index
        Identifier,
        // after the identifier, expecting ']', '[', '.' or the end
        Close,
        // after the (optional) ']', expecting '[', '.' or the end
        Subscript
    };

    UniformPath path;
    UniformPathSegment segment;
    State state = State::Identifier;
    // whether the current identifier was opened with '['
    bool in_brackets = false;

    size_t pos = 0;
    while (true)
    {
        if (state == State::Identifier)
        {
            const auto start = pos;
            while (pos < name.size() && base::IsIdentifierChar(name[pos]))
                ++pos;
            if (pos == start)
                break;
            segment.id = name.substr(start, pos - start);
            segment.is_index = false;
            state = State::Close;
        }
        else if (state == State::Close)
        {
            if (pos < name.size() && name[pos] == ']')
            {
                if (!in_brackets)
                    break;
                segment.is_index = true;
                in_brackets = false;
                ++pos;
            }
            else if (in_brackets)
                break;
            state = State::Subscript;
        }
        else if (state == State::Subscript)
        {
            if (pos == name.size())
            {
                segment.kind = Kind::Leaf;
                path.push_back(std::move(segment));
                return path;
            }
            const char subscript = name[pos++];
            if (subscript == '[')
            {
                // "name[0]" is how the arrays of basic types are reported.
                // the array is a leaf when the '[' begins the last 3 characters.
                if (pos + 2 == name.size())
                {
                    segment.kind = Kind::ArrayLeaf;
                    path.push_back(std::move(segment));
                    return path;
                }
                segment.kind = Kind::Element;
                in_brackets = true;
            }
            else if (subscript == '.')
                segment.kind = Kind::Member;
            else break;

            path.push_back(std::move(segment));
            segment = UniformPathSegment();
            state = State::Identifier;
        }
    }
    WARN("Ignoring uniform with malformed name. [name='%1', pos=%2]", name, pos);
    return UniformPath();
}

const char* ToString(UniformPathSegment::Kind kind)
{
    using Kind = UniformPathSegment::Kind;
    switch (kind)
    {
        case Kind::Leaf:      return "Leaf";
        case Kind::ArrayLeaf: return "ArrayLeaf";
        case Kind::Member:    return "Member";
        case Kind::Element:   return "Element";
    }
    return "???";
}

} // namespace
