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

#include <vector>

#include "device/handle.h"
#include "device/enum.h"

namespace dev {
    class GraphicsDevice;
} // dev

namespace gfx
{
    // Hands out texture units for the sampler uniforms of a draw. The units
    // are leased in increasing order starting from the lowest free unit and
    // returned with Release or all at once with Reset between draws.
    class TextureUnitAllocator
    {
    public:
        explicit TextureUnitAllocator(unsigned max_units);

        // Lease the lowest free texture unit. Throws std::runtime_error
        // if every unit is already in use.
        unsigned Allocate();
        // Lease count texture units and write them into units. Either all
        // the units are leased or none and std::runtime_error is thrown.
        void Allocate(unsigned count, int* units);
        // Return a previously leased unit.
        void Release(unsigned unit);
        // Return all leased units.
        void Reset() noexcept;

        bool IsLeased(unsigned unit) const noexcept;

        inline unsigned GetMaxUnits() const noexcept
        { return static_cast<unsigned>(mLeased.size()); }
        inline unsigned GetNumLeased() const noexcept
        { return mNumLeased; }
    private:
        std::vector<bool> mLeased;
        unsigned mNumLeased = 0;
    };

    // 1x1 textures with zero content that are bound to sampler uniforms
    // that don't have a texture. Each texture type gets its own placeholder
    // since binding a texture of the wrong type to a sampler is an error.
    // The placeholders are allocated on first use.
    class PlaceholderTextures
    {
    public:
        explicit PlaceholderTextures(dev::GraphicsDevice* device) noexcept
          : mDevice(device)
        {}
        PlaceholderTextures(const PlaceholderTextures&) = delete;
       ~PlaceholderTextures();

        // Get the placeholder for the type of texture.
        dev::TextureObject GetTexture(dev::TextureType type);

        // Delete the placeholder textures.
        void Clear();

        PlaceholderTextures& operator=(const PlaceholderTextures&) = delete;
    private:
        dev::GraphicsDevice* mDevice = nullptr;
        std::vector<dev::TextureObject> mTextures;
    };

} // namespace
