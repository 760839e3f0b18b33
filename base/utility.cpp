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

#include "base/utility.h"

namespace base
{

std::vector<std::string> SplitLines(const std::string& str)
{
    std::vector<std::string> ret;
    std::string::size_type start = 0;
    while (start < str.size())
    {
        const auto pos = str.find('\n', start);
        if (pos == std::string::npos)
        {
            ret.push_back(str.substr(start));
            break;
        }
        ret.push_back(str.substr(start, pos - start));
        start = pos + 1;
    }
    return ret;
}

std::vector<std::string> SplitString(const std::string& str, char separator)
{
    std::vector<std::string> ret;
    std::string::size_type start = 0;
    for (;;)
    {
        const auto pos = str.find(separator, start);
        if (pos == std::string::npos)
        {
            if (start < str.size())
                ret.push_back(str.substr(start));
            break;
        }
        if (pos > start)
            ret.push_back(str.substr(start, pos - start));
        start = pos + 1;
    }
    return ret;
}

std::string ReplaceIdentifier(const std::string& str, const std::string& identifier, const std::string& replacement)
{
    if (identifier.empty())
        return str;

    std::string ret;
    ret.reserve(str.size());

    std::string::size_type pos = 0;
    for (;;)
    {
        const auto hit = str.find(identifier, pos);
        if (hit == std::string::npos)
        {
            ret.append(str, pos, std::string::npos);
            break;
        }
        const auto end = hit + identifier.size();
        const bool head = hit == 0 || !IsIdentifierChar(str[hit-1]);
        const bool tail = end == str.size() || !IsIdentifierChar(str[end]);
        ret.append(str, pos, hit - pos);
        if (head && tail)
            ret.append(replacement);
        else ret.append(identifier);
        pos = end;
    }
    return ret;
}

std::string ReplaceAll(const std::string& str, const std::string& what, const std::string& replacement)
{
    if (what.empty())
        return str;

    std::string ret;
    std::string::size_type pos = 0;
    for (;;)
    {
        const auto hit = str.find(what, pos);
        if (hit == std::string::npos)
        {
            ret.append(str, pos, std::string::npos);
            break;
        }
        ret.append(str, pos, hit - pos);
        ret.append(replacement);
        pos = hit + what.size();
    }
    return ret;
}

} // base
