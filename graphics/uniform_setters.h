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

#include <cstddef>
#include <unordered_map>
#include <vector>

#include "device/enum.h"

namespace dev {
    class GraphicsDevice;
} // dev

namespace gfx
{
    class UniformLeaf;
    class UniformValue;
    class TextureUnitAllocator;
    class PlaceholderTextures;

    // Reusable temporary buffers for flattening uniform values before
    // they're handed to the device. A pointer or reference to scratch
    // memory is only valid until the next call that uses the same buffer.
    class ScratchArena
    {
    public:
        // Buffer for one square matrix, 4, 9 or 16 floats.
        float* GetMatrixBuffer(unsigned rank);
        // Buffer for size floats. Every size gets its own buffer.
        float* GetFloatArray(std::size_t size);
        // Buffer for size texture unit indices.
        int* GetUnitArray(std::size_t size);

        // Cleared vectors for flattening values.
        std::vector<float>& GetFloatTemp();
        std::vector<int>& GetIntTemp();
        std::vector<unsigned>& GetUintTemp();
    private:
        float mMat2[4]  = {0};
        float mMat3[9]  = {0};
        float mMat4[16] = {0};
        std::unordered_map<std::size_t, std::vector<float>> mFloatArrays;
        std::unordered_map<std::size_t, std::vector<int>> mUnitArrays;
        std::vector<float> mFloatTemp;
        std::vector<int> mIntTemp;
        std::vector<unsigned> mUintTemp;
    };

    // Everything the uniform setters need to upload values and bind
    // textures. The context is meant to live for the duration of the
    // renderer and get reused for every draw.
    class UniformUploadContext
    {
    public:
        UniformUploadContext(dev::GraphicsDevice* device,
                             TextureUnitAllocator* units,
                             PlaceholderTextures* placeholders) noexcept
          : mDevice(device)
          , mUnits(units)
          , mPlaceholders(placeholders)
        {}

        inline dev::GraphicsDevice& GetDevice() noexcept
        { return *mDevice; }
        inline TextureUnitAllocator& GetTextureUnits() noexcept
        { return *mUnits; }
        inline PlaceholderTextures& GetPlaceholders() noexcept
        { return *mPlaceholders; }
        inline ScratchArena& GetArena() noexcept
        { return mArena; }
    private:
        dev::GraphicsDevice* mDevice = nullptr;
        TextureUnitAllocator* mUnits = nullptr;
        PlaceholderTextures* mPlaceholders = nullptr;
        ScratchArena mArena;
    };

    using UniformSetter = void (*)(UniformLeaf& leaf, const UniformValue& value, UniformUploadContext& ctx);

    // Find the setter for a uniform that holds a single value of the type.
    // Returns nullptr for types that have no setter.
    UniformSetter FindSingleSetter(dev::UniformType type);
    // Find the setter for a uniform array of the type.
    UniformSetter FindPureArraySetter(dev::UniformType type);

    // Log a warning about a uniform type without a setter. Each type is
    // only reported once.
    void WarnUnsupportedUniformType(dev::UniformType type);

    bool IsSamplerType(dev::UniformType type) noexcept;
    // Number of scalar components in one element of the uniform type.
    // For example 3 for vec3 and 16 for mat4. Samplers are 1.
    unsigned GetComponentCount(dev::UniformType type) noexcept;
    // Get the type of placeholder texture to bind to a sampler when
    // there's no texture.
    dev::TextureType GetPlaceholderType(dev::UniformType type) noexcept;

} // namespace
