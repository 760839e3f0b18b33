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

#include <stdexcept>

#include "base/assert.h"
#include "base/format.h"
#include "base/logging.h"
#include "device/graphics.h"
#include "graphics/texture_units.h"

namespace gfx
{

TextureUnitAllocator::TextureUnitAllocator(unsigned max_units)
  : mLeased(max_units, false)
{}

unsigned TextureUnitAllocator::Allocate()
{
    for (unsigned unit=0; unit<mLeased.size(); ++unit)
    {
        if (mLeased[unit])
            continue;
        mLeased[unit] = true;
        ++mNumLeased;
        return unit;
    }
    ERROR("Out of texture units. [max=%1]", mLeased.size());
    throw std::runtime_error(base::FormatString("Trying to use more texture units than the device supports (%1).",
                                                mLeased.size()));
}

void TextureUnitAllocator::Allocate(unsigned count, int* units)
{
    if (mNumLeased + count > mLeased.size())
    {
        ERROR("Out of texture units. [max=%1, requested=%2, leased=%3]", mLeased.size(), count, mNumLeased);
        throw std::runtime_error(base::FormatString("Trying to use more texture units than the device supports (%1).",
                                                    mLeased.size()));
    }
    for (unsigned i=0; i<count; ++i)
        units[i] = static_cast<int>(Allocate());
}

void TextureUnitAllocator::Release(unsigned unit)
{
    ASSERT(unit < mLeased.size());
    ASSERT(mLeased[unit]);
    mLeased[unit] = false;
    --mNumLeased;
}

void TextureUnitAllocator::Reset() noexcept
{
    for (size_t i=0; i<mLeased.size(); ++i)
        mLeased[i] = false;
    mNumLeased = 0;
}

bool TextureUnitAllocator::IsLeased(unsigned unit) const noexcept
{
    if (unit >= mLeased.size())
        return false;
    return mLeased[unit];
}

PlaceholderTextures::~PlaceholderTextures()
{
    Clear();
}

dev::TextureObject PlaceholderTextures::GetTexture(dev::TextureType type)
{
    for (const auto& texture : mTextures)
    {
        if (texture.GetType() == type)
            return texture;
    }
    auto texture = mDevice->AllocatePlaceholderTexture(type);
    DEBUG("Allocated placeholder texture. [type=%1, handle=%2]", dev::ToString(type), texture.GetHandle());
    // make sure the lookup finds it even if the device didn't set the type.
    texture.type = type;
    mTextures.push_back(texture);
    return texture;
}

void PlaceholderTextures::Clear()
{
    for (const auto& texture : mTextures)
    {
        if (texture.IsValid())
            mDevice->DeleteTexture(texture);
    }
    mTextures.clear();
}

} // namespace
