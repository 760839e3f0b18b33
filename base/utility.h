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

#include <memory> // for unique_ptr
#include <string>
#include <vector>
#include <algorithm>
#include <unordered_map>
#include <unordered_set>


namespace base
{

template<typename T, size_t N> inline
constexpr size_t ArraySize(const T (&array)[N])
{
    return N;
}

inline bool IsPowerOfTwo(unsigned i)
{
    return (i & (i-1)) == 0;
}

template<typename Key> inline
bool Contains(const std::unordered_set<Key>& set, const Key& k)
{ return set.find(k) != set.end(); }

template<typename Key, typename Val> inline
bool Contains(const std::unordered_map<Key, Val>& map, const Key& k)
{ return map.find(k) != map.end(); }

template<typename K, typename T>
T* SafeFind(std::unordered_map<K, T>& map, const K& key)
{
    auto it = map.find(key);
    if (it == map.end())
        return nullptr;
    return &it->second;
}

template<typename K, typename T>
T* SafeFind(std::unordered_map<K, std::unique_ptr<T>>& map, const K& key)
{
    auto it = map.find(key);
    if (it == map.end())
        return nullptr;
    return it->second.get();
}
template<typename K, typename T>
const T* SafeFind(const std::unordered_map<K, T>& map, const K& key)
{
    auto it = map.find(key);
    if (it == map.end())
        return nullptr;
    return &it->second;
}

template<typename K, typename T>
const T* SafeFind(const std::unordered_map<K, std::unique_ptr<T>>& map, const K& key)
{
    auto it = map.find(key);
    if (it == map.end())
        return nullptr;
    return it->second.get();
}

// when using these functions with narrow byte strings think about
// the string encoding and whether that can be a problem!
inline bool Contains(const std::string& str, const std::string& what)
{ return str.find(what) != std::string::npos; }
inline bool StartsWith(const std::string& str, const std::string& what)
{ return str.find(what) == 0; }
inline bool EndsWith(const std::string& str, const std::string& what)
{
    if (what.size() > str.size()) return false;
    return std::equal(what.rbegin(), what.rend(), str.rbegin());
}

// Split the string into lines. A trailing newline does not produce
// an extra empty line.
std::vector<std::string> SplitLines(const std::string& str);

std::vector<std::string> SplitString(const std::string& str, char separator = ' ');

// Replace every occurrence of the given identifier that is not part
// of a longer identifier, i.e. NUM_FOO does not match NUM_FOO_BAR.
std::string ReplaceIdentifier(const std::string& str, const std::string& identifier, const std::string& replacement);

// Replace every occurrence of the given substring.
std::string ReplaceAll(const std::string& str, const std::string& what, const std::string& replacement);

inline bool IsIdentifierChar(char c)
{
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
           (c >= '0' && c <= '9') || c == '_';
}

} // base
