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

#include "device/enum.h"

namespace dev
{

const char* ToString(UniformType type)
{
#define CASE(x, name) case UniformType::x: return name
    switch (type)
    {
        CASE(Float,                     "float");
        CASE(FloatVec2,                 "vec2");
        CASE(FloatVec3,                 "vec3");
        CASE(FloatVec4,                 "vec4");
        CASE(Int,                       "int");
        CASE(IntVec2,                   "ivec2");
        CASE(IntVec3,                   "ivec3");
        CASE(IntVec4,                   "ivec4");
        CASE(Bool,                      "bool");
        CASE(BoolVec2,                  "bvec2");
        CASE(BoolVec3,                  "bvec3");
        CASE(BoolVec4,                  "bvec4");
        CASE(FloatMat2,                 "mat2");
        CASE(FloatMat3,                 "mat3");
        CASE(FloatMat4,                 "mat4");
        CASE(FloatMat2x3,               "mat2x3");
        CASE(FloatMat2x4,               "mat2x4");
        CASE(FloatMat3x2,               "mat3x2");
        CASE(FloatMat3x4,               "mat3x4");
        CASE(FloatMat4x2,               "mat4x2");
        CASE(FloatMat4x3,               "mat4x3");
        CASE(UnsignedInt,               "uint");
        CASE(UnsignedIntVec2,           "uvec2");
        CASE(UnsignedIntVec3,           "uvec3");
        CASE(UnsignedIntVec4,           "uvec4");
        CASE(Sampler2D,                 "sampler2D");
        CASE(Sampler3D,                 "sampler3D");
        CASE(SamplerCube,               "samplerCube");
        CASE(Sampler2DShadow,           "sampler2DShadow");
        CASE(SamplerExternalOES,        "samplerExternalOES");
        CASE(Sampler2DArray,            "sampler2DArray");
        CASE(Sampler2DArrayShadow,      "sampler2DArrayShadow");
        CASE(SamplerCubeShadow,         "samplerCubeShadow");
        CASE(IntSampler2D,              "isampler2D");
        CASE(IntSampler3D,              "isampler3D");
        CASE(IntSamplerCube,            "isamplerCube");
        CASE(IntSampler2DArray,         "isampler2DArray");
        CASE(UnsignedIntSampler2D,      "usampler2D");
        CASE(UnsignedIntSampler3D,      "usampler3D");
        CASE(UnsignedIntSamplerCube,    "usamplerCube");
        CASE(UnsignedIntSampler2DArray, "usampler2DArray");
    }
#undef CASE
    return "???";
}

const char* ToString(ShaderType type)
{
    switch (type)
    {
        case ShaderType::Invalid:        return "Invalid";
        case ShaderType::VertexShader:   return "Vertex";
        case ShaderType::FragmentShader: return "Fragment";
    }
    return "???";
}

const char* ToString(TextureType type)
{
    switch (type)
    {
        case TextureType::Invalid:        return "Invalid";
        case TextureType::Texture2D:      return "Texture2D";
        case TextureType::Texture3D:      return "Texture3D";
        case TextureType::TextureCube:    return "TextureCube";
        case TextureType::Texture2DArray: return "Texture2DArray";
        case TextureType::DepthTexture2D: return "DepthTexture2D";
    }
    return "???";
}

} // namespace
