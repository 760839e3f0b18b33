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

#include <cstdint>

namespace dev
{
    enum class ResourceType {
        GraphicsShader,
        GraphicsProgram,
        Texture
    };

    enum class TextureType {
        Invalid,
        Texture2D,
        Texture3D,
        TextureCube,
        Texture2DArray,
        // 2D depth texture with comparison mode for shadow samplers.
        DepthTexture2D
    };

    enum class ShaderType {
        Invalid, VertexShader, FragmentShader
    };

    // GLSL type of an active program uniform or attribute as reported
    // by the program reflection. The values are the GL type enumerants
    // so that the device can pass them through as-is.
    enum class UniformType : uint32_t {
        Float                     = 0x1406,
        FloatVec2                 = 0x8B50,
        FloatVec3                 = 0x8B51,
        FloatVec4                 = 0x8B52,
        Int                       = 0x1404,
        IntVec2                   = 0x8B53,
        IntVec3                   = 0x8B54,
        IntVec4                   = 0x8B55,
        Bool                      = 0x8B56,
        BoolVec2                  = 0x8B57,
        BoolVec3                  = 0x8B58,
        BoolVec4                  = 0x8B59,
        FloatMat2                 = 0x8B5A,
        FloatMat3                 = 0x8B5B,
        FloatMat4                 = 0x8B5C,
        FloatMat2x3               = 0x8B65,
        FloatMat2x4               = 0x8B66,
        FloatMat3x2               = 0x8B67,
        FloatMat3x4               = 0x8B68,
        FloatMat4x2               = 0x8B69,
        FloatMat4x3               = 0x8B6A,
        UnsignedInt               = 0x1405,
        UnsignedIntVec2           = 0x8DC6,
        UnsignedIntVec3           = 0x8DC7,
        UnsignedIntVec4           = 0x8DC8,
        Sampler2D                 = 0x8B5E,
        Sampler3D                 = 0x8B5F,
        SamplerCube               = 0x8B60,
        Sampler2DShadow           = 0x8B62,
        SamplerExternalOES        = 0x8D66,
        Sampler2DArray            = 0x8DC1,
        Sampler2DArrayShadow      = 0x8DC4,
        SamplerCubeShadow         = 0x8DC5,
        IntSampler2D              = 0x8DCA,
        IntSampler3D              = 0x8DCB,
        IntSamplerCube            = 0x8DCC,
        IntSampler2DArray         = 0x8DCF,
        UnsignedIntSampler2D      = 0x8DD2,
        UnsignedIntSampler3D      = 0x8DD3,
        UnsignedIntSamplerCube    = 0x8DD4,
        UnsignedIntSampler2DArray = 0x8DD7
    };

    // Get a human readable name (the GLSL type name) for the uniform type.
    // Returns "???" for unknown type values.
    const char* ToString(UniformType type);
    const char* ToString(ShaderType type);
    const char* ToString(TextureType type);

} // namespace
