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
#include <unordered_map>
#include <unordered_set>

namespace gfx
{
    // Collection of named GLSL source chunks. Shader templates refer to
    // the chunks with #include <name> and the preprocessor resolves the
    // includes against a library.
    class ShaderLibrary
    {
    public:
        // Add a new chunk or replace an existing chunk with the same name.
        void AddChunk(const std::string& name, std::string source);
        // Map a deprecated chunk name to its replacement. Includes of the
        // deprecated name resolve to the replacement chunk with a warning.
        void AddAlias(const std::string& deprecated, const std::string& replacement);

        bool HasChunk(const std::string& name) const noexcept;

        // Find the source of the named chunk. If there's no such chunk the
        // deprecated names are checked and the first lookup through each
        // alias logs a warning. Returns nullptr if nothing was found.
        const std::string* FindChunk(const std::string& name) const;

        inline std::size_t GetNumChunks() const noexcept
        { return mChunks.size(); }

        // Create a library with the built-in chunks that the fragment
        // stage prologue needs, i.e. the tone mapping operators and the
        // color space transfer functions.
        static ShaderLibrary CreateDefault();

        // Find the source of a built-in chunk. Returns nullptr if there's
        // no built-in chunk by that name.
        static const char* FindBuiltinChunk(const std::string& name) noexcept;
    private:
        std::unordered_map<std::string, std::string> mChunks;
        std::unordered_map<std::string, std::string> mAliases;
        mutable std::unordered_set<std::string> mWarnedAliases;
    };

} // namespace
