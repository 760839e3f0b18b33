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

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <mutex>
#include <unordered_set>

#include "base/assert.h"
#include "base/logging.h"
#include "device/graphics.h"
#include "graphics/texture_units.h"
#include "graphics/uniform_setters.h"
#include "graphics/uniform_tree.h"
#include "graphics/uniform_value.h"

namespace {
using namespace gfx;

// Flatten the value into the arena's temporary vector of the right type.
bool FlattenValue(const UniformValue& value, ScratchArena& arena, std::vector<float>** out)
{
    *out = &arena.GetFloatTemp();
    return value.FlattenFloat(*out);
}
bool FlattenValue(const UniformValue& value, ScratchArena& arena, std::vector<int>** out)
{
    *out = &arena.GetIntTemp();
    return value.FlattenInt(*out);
}
bool FlattenValue(const UniformValue& value, ScratchArena& arena, std::vector<unsigned>** out)
{
    *out = &arena.GetUintTemp();
    return value.FlattenUint(*out);
}

std::vector<float>& GetCache(UniformLeaf& leaf, const float*)
{ return leaf.GetFloatCache(); }
std::vector<int>& GetCache(UniformLeaf& leaf, const int*)
{ return leaf.GetIntCache(); }
std::vector<unsigned>& GetCache(UniformLeaf& leaf, const unsigned*)
{ return leaf.GetUintCache(); }

void UploadVector(dev::GraphicsDevice& device, int location, unsigned components, unsigned count, const float* data)
{ device.SetUniformFloat(location, components, count, data); }
void UploadVector(dev::GraphicsDevice& device, int location, unsigned components, unsigned count, const int* data)
{ device.SetUniformInt(location, components, count, data); }
void UploadVector(dev::GraphicsDevice& device, int location, unsigned components, unsigned count, const unsigned* data)
{ device.SetUniformUint(location, components, count, data); }

// Check whether the first count values equal the cached values.
template<typename T>
bool IsCached(UniformLeaf& leaf, const T* data, std::size_t count)
{
    if (leaf.GetNumCached() < count)
        return false;
    const auto& cache = GetCache(leaf, data);
    return std::equal(data, data + count, cache.begin());
}

template<typename T>
void UpdateCache(UniformLeaf& leaf, const T* data, std::size_t count)
{
    auto& cache = GetCache(leaf, data);
    std::copy(data, data + count, cache.begin());
    leaf.SetNumCached(std::max(leaf.GetNumCached(), count));
}

// Figure out how many elements of the leaf the flattened value covers.
// Returns 0 when the value is unusable and has been reported.
unsigned GetElementCount(const UniformLeaf& leaf, std::size_t num_values, unsigned components, bool array)
{
    const auto elements = static_cast<unsigned>(num_values / components);
    if (elements == 0)
    {
        WARN("Uniform value has too few components. [uniform='%1', type=%2, components=%3]",
             leaf.GetId(), dev::ToString(leaf.GetUniformType()), num_values);
        return 0;
    }
    if (!array)
        return 1;
    return std::min(elements, leaf.GetSize());
}

// Setter for scalars and vectors of float, int, bool and uint and the
// arrays of those.
template<typename T, unsigned Components, bool Array>
void SetVector(UniformLeaf& leaf, const UniformValue& value, UniformUploadContext& ctx)
{
    std::vector<T>* flat = nullptr;
    if (!FlattenValue(value, ctx.GetArena(), &flat))
    {
        WARN("Uniform value type mismatch. [uniform='%1', type=%2]", leaf.GetId(), dev::ToString(leaf.GetUniformType()));
        return;
    }
    const auto count = GetElementCount(leaf, flat->size(), Components, Array);
    if (count == 0)
        return;

    const auto num_values = count * Components;
    if (IsCached(leaf, flat->data(), num_values))
        return;

    UploadVector(ctx.GetDevice(), leaf.GetLocation(), Components, count, flat->data());
    UpdateCache(leaf, flat->data(), num_values);
}

// Setter for square float matrices and arrays of them. The flattened
// value is copied into the arena buffer for the upload.
template<unsigned Rank, bool Array>
void SetMatrix(UniformLeaf& leaf, const UniformValue& value, UniformUploadContext& ctx)
{
    constexpr auto Components = Rank * Rank;

    auto& arena = ctx.GetArena();
    std::vector<float>* flat = nullptr;
    if (!FlattenValue(value, arena, &flat))
    {
        WARN("Uniform value type mismatch. [uniform='%1', type=%2]", leaf.GetId(), dev::ToString(leaf.GetUniformType()));
        return;
    }
    const auto count = GetElementCount(leaf, flat->size(), Components, Array);
    if (count == 0)
        return;

    const auto num_values = count * Components;
    if (IsCached(leaf, flat->data(), num_values))
        return;

    float* buffer = Array ? arena.GetFloatArray(num_values) : arena.GetMatrixBuffer(Rank);
    std::memcpy(buffer, flat->data(), num_values * sizeof(float));

    ctx.GetDevice().SetUniformMatrix(leaf.GetLocation(), Rank, count, buffer);
    UpdateCache(leaf, buffer, num_values);
}

dev::TextureObject GetTextureOrPlaceholder(const UniformValue* value, dev::UniformType type, UniformUploadContext& ctx)
{
    if (value)
    {
        if (const auto* texture = value->GetIf<dev::TextureObject>())
        {
            if (texture->IsValid())
                return *texture;
        }
    }
    return ctx.GetPlaceholders().GetTexture(GetPlaceholderType(type));
}

// Setter for a single sampler. The texture unit is leased for the draw
// and only uploaded when it changes. The texture (or the placeholder)
// is bound every time since the unit bindings change between draws.
void SetSampler(UniformLeaf& leaf, const UniformValue& value, UniformUploadContext& ctx)
{
    const int unit = static_cast<int>(ctx.GetTextureUnits().Allocate());
    if (!IsCached(leaf, &unit, 1))
    {
        ctx.GetDevice().SetUniformInt(leaf.GetLocation(), 1, 1, &unit);
        UpdateCache(leaf, &unit, 1);
    }
    const auto& texture = GetTextureOrPlaceholder(&value, leaf.GetUniformType(), ctx);
    ctx.GetDevice().BindTexture(static_cast<unsigned>(unit), texture);
}

// Setter for an array of samplers. Every array element gets its own unit.
void SetSamplerArray(UniformLeaf& leaf, const UniformValue& value, UniformUploadContext& ctx)
{
    unsigned count = 0;
    if (value.IsArray())
        count = static_cast<unsigned>(std::min<std::size_t>(value.GetArraySize(), leaf.GetSize()));
    else if (value.IsTexture())
        count = 1;
    if (count == 0)
        return;

    int* units = ctx.GetArena().GetUnitArray(count);
    ctx.GetTextureUnits().Allocate(count, units);

    if (!IsCached(leaf, units, count))
    {
        ctx.GetDevice().SetUniformInt(leaf.GetLocation(), 1, count, units);
        UpdateCache(leaf, units, count);
    }

    for (unsigned i=0; i<count; ++i)
    {
        const auto* element = value.IsArray() ? &value.At(i) : &value;
        const auto& texture = GetTextureOrPlaceholder(element, leaf.GetUniformType(), ctx);
        ctx.GetDevice().BindTexture(static_cast<unsigned>(units[i]), texture);
    }
}

template<bool Array>
UniformSetter FindSetter(dev::UniformType type)
{
    using Type = dev::UniformType;
    switch (type)
    {
        case Type::Float:     return &SetVector<float, 1, Array>;
        case Type::FloatVec2: return &SetVector<float, 2, Array>;
        case Type::FloatVec3: return &SetVector<float, 3, Array>;
        case Type::FloatVec4: return &SetVector<float, 4, Array>;

        case Type::FloatMat2: return &SetMatrix<2, Array>;
        case Type::FloatMat3: return &SetMatrix<3, Array>;
        case Type::FloatMat4: return &SetMatrix<4, Array>;

        case Type::Int:
        case Type::Bool:
            return &SetVector<int, 1, Array>;
        case Type::IntVec2:
        case Type::BoolVec2:
            return &SetVector<int, 2, Array>;
        case Type::IntVec3:
        case Type::BoolVec3:
            return &SetVector<int, 3, Array>;
        case Type::IntVec4:
        case Type::BoolVec4:
            return &SetVector<int, 4, Array>;

        case Type::UnsignedInt:     return &SetVector<unsigned, 1, Array>;
        case Type::UnsignedIntVec2: return &SetVector<unsigned, 2, Array>;
        case Type::UnsignedIntVec3: return &SetVector<unsigned, 3, Array>;
        case Type::UnsignedIntVec4: return &SetVector<unsigned, 4, Array>;

        default: break;
    }
    if (IsSamplerType(type))
        return Array ? &SetSamplerArray : &SetSampler;
    return nullptr;
}

} // namespace

namespace gfx
{

float* ScratchArena::GetMatrixBuffer(unsigned rank)
{
    if (rank == 2)
        return mMat2;
    else if (rank == 3)
        return mMat3;
    else if (rank == 4)
        return mMat4;
    BUG("Unsupported matrix rank.");
    return nullptr;
}

float* ScratchArena::GetFloatArray(std::size_t size)
{
    auto& buffer = mFloatArrays[size];
    if (buffer.size() != size)
        buffer.resize(size);
    return buffer.data();
}

int* ScratchArena::GetUnitArray(std::size_t size)
{
    auto& buffer = mUnitArrays[size];
    if (buffer.size() != size)
        buffer.resize(size);
    return buffer.data();
}

std::vector<float>& ScratchArena::GetFloatTemp()
{
    mFloatTemp.clear();
    return mFloatTemp;
}
std::vector<int>& ScratchArena::GetIntTemp()
{
    mIntTemp.clear();
    return mIntTemp;
}
std::vector<unsigned>& ScratchArena::GetUintTemp()
{
    mUintTemp.clear();
    return mUintTemp;
}

UniformSetter FindSingleSetter(dev::UniformType type)
{
    return FindSetter<false>(type);
}

UniformSetter FindPureArraySetter(dev::UniformType type)
{
    return FindSetter<true>(type);
}

void WarnUnsupportedUniformType(dev::UniformType type)
{
    static std::mutex mutex;
    static std::unordered_set<std::uint32_t> reported;

    std::lock_guard<std::mutex> lock(mutex);
    if (!reported.insert(static_cast<std::uint32_t>(type)).second)
        return;
    WARN("Unsupported uniform type. Uniforms of this type are ignored. [type=%1, value=%2]",
         dev::ToString(type), static_cast<std::uint32_t>(type));
}

bool IsSamplerType(dev::UniformType type) noexcept
{
    using Type = dev::UniformType;
    switch (type)
    {
        case Type::Sampler2D:
        case Type::Sampler3D:
        case Type::SamplerCube:
        case Type::Sampler2DShadow:
        case Type::SamplerExternalOES:
        case Type::Sampler2DArray:
        case Type::Sampler2DArrayShadow:
        case Type::SamplerCubeShadow:
        case Type::IntSampler2D:
        case Type::IntSampler3D:
        case Type::IntSamplerCube:
        case Type::IntSampler2DArray:
        case Type::UnsignedIntSampler2D:
        case Type::UnsignedIntSampler3D:
        case Type::UnsignedIntSamplerCube:
        case Type::UnsignedIntSampler2DArray:
            return true;
        default: break;
    }
    return false;
}

unsigned GetComponentCount(dev::UniformType type) noexcept
{
    using Type = dev::UniformType;
    switch (type)
    {
        case Type::FloatVec2:
        case Type::IntVec2:
        case Type::BoolVec2:
        case Type::UnsignedIntVec2:
            return 2;
        case Type::FloatVec3:
        case Type::IntVec3:
        case Type::BoolVec3:
        case Type::UnsignedIntVec3:
            return 3;
        case Type::FloatVec4:
        case Type::IntVec4:
        case Type::BoolVec4:
        case Type::UnsignedIntVec4:
        case Type::FloatMat2:
            return 4;
        case Type::FloatMat2x3:
        case Type::FloatMat3x2:
            return 6;
        case Type::FloatMat2x4:
        case Type::FloatMat4x2:
            return 8;
        case Type::FloatMat3:
            return 9;
        case Type::FloatMat3x4:
        case Type::FloatMat4x3:
            return 12;
        case Type::FloatMat4:
            return 16;
        default: break;
    }
    return 1;
}

dev::TextureType GetPlaceholderType(dev::UniformType type) noexcept
{
    using Type = dev::UniformType;
    switch (type)
    {
        case Type::Sampler2DShadow:
            return dev::TextureType::DepthTexture2D;
        case Type::Sampler3D:
        case Type::IntSampler3D:
        case Type::UnsignedIntSampler3D:
            return dev::TextureType::Texture3D;
        case Type::SamplerCube:
        case Type::IntSamplerCube:
        case Type::UnsignedIntSamplerCube:
        case Type::SamplerCubeShadow:
            return dev::TextureType::TextureCube;
        case Type::Sampler2DArray:
        case Type::IntSampler2DArray:
        case Type::UnsignedIntSampler2DArray:
        case Type::Sampler2DArrayShadow:
            return dev::TextureType::Texture2DArray;
        default: break;
    }
    return dev::TextureType::Texture2D;
}

} // namespace
