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
#include <cerrno>
#include <climits>
#include <cmath>
#include <cstdlib>

#include "base/assert.h"
#include "base/format.h"
#include "base/logging.h"
#include "base/utility.h"
#include "graphics/color_space.h"
#include "graphics/shader_library.h"
#include "graphics/shader_preprocessor.h"

namespace {
// Join the non-empty lines with a newline.
std::string JoinLines(const std::vector<std::string>& lines)
{
    std::vector<std::string> non_empty;
    for (const auto& line : lines)
    {
        if (!line.empty())
            non_empty.push_back(line);
    }
    return base::JoinString(non_empty, "\n");
}

std::string DefineFlag(bool on, const std::string& name)
{
    return on ? "#define " + name : std::string();
}
std::string DefineWithValue(const std::string& name, const std::string& value)
{
    return value.empty() ? std::string() : "#define " + name + " " + value;
}

bool IsSpace(char c)
{
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

bool IsIncludeNameChar(char c)
{
    return base::IsIdentifierChar(c) || c == '.' || c == '/';
}

// Parse "#include <name>" at the start of the line. Leading spaces and tabs
// are allowed. On success returns the name and the position after the '>'.
bool ParseInclude(const std::string& line, std::string* name, size_t* end)
{
    static const std::string directive = "#include";

    size_t i = 0;
    while (i < line.size() && (line[i] == ' ' || line[i] == '\t'))
        ++i;
    if (line.compare(i, directive.size(), directive))
        return false;
    i += directive.size();
    const auto spaces = i;
    while (i < line.size() && line[i] == ' ')
        ++i;
    if (i == spaces)
        return false;
    if (i >= line.size() || line[i] != '<')
        return false;
    const auto name_start = ++i;
    while (i < line.size() && IsIncludeNameChar(line[i]))
        ++i;
    if (i == name_start || i >= line.size() || line[i] != '>')
        return false;
    *name = line.substr(name_start, i - name_start);
    *end  = i + 1;
    return true;
}

// Simple cursor over the source for matching the unroll loop header.
// Upper limit for the loop bounds of an unrolled loop.
constexpr long MaxUnrollIndex = 4096;

class LoopScanner
{
public:
    LoopScanner(const std::string& str, size_t pos) noexcept
      : mStr(str)
      , mPos(pos)
    {}
    // Skip optional whitespace. Returns the number of characters skipped.
    size_t SkipSpace() noexcept
    {
        const auto start = mPos;
        while (mPos < mStr.size() && IsSpace(mStr[mPos]))
            ++mPos;
        return mPos - start;
    }
    bool Literal(const char* literal)
    {
        const std::string str(literal);
        if (mStr.compare(mPos, str.size(), str))
            return false;
        mPos += str.size();
        return true;
    }
    // Read a decimal literal. A literal that doesn't fit in a long
    // saturates to LONG_MAX.
    bool Number(long* value)
    {
        const auto start = mPos;
        while (mPos < mStr.size() && mStr[mPos] >= '0' && mStr[mPos] <= '9')
            ++mPos;
        if (mPos == start)
            return false;
        const auto& digits = mStr.substr(start, mPos - start);
        errno = 0;
        const long ret = std::strtol(digits.c_str(), nullptr, 10);
        *value = errno == ERANGE ? LONG_MAX : ret;
        return true;
    }
    size_t GetPos() const noexcept
    { return mPos; }
private:
    const std::string& mStr;
    size_t mPos = 0;
};

// Try to match the loop header and the body at pos which is the start of
// the unroll_loop_start pragma. On success returns the loop range, the
// body and the position after the unroll_loop_end pragma.
bool MatchUnrollLoop(const std::string& src, size_t pos, long* start, long* end, std::string* body, size_t* match_end)
{
    static const std::string loop_end = "#pragma unroll_loop_end";

    LoopScanner scan(src, pos);
    if (!scan.Literal("#pragma unroll_loop_start"))
        return false;
    if (!scan.SkipSpace())
        return false;
    if (!scan.Literal("for"))
        return false;
    scan.SkipSpace();
    if (!scan.Literal("("))
        return false;
    scan.SkipSpace();
    if (!scan.Literal("int"))
        return false;
    if (!scan.SkipSpace())
        return false;
    if (!scan.Literal("i"))
        return false;
    scan.SkipSpace();
    if (!scan.Literal("="))
        return false;
    scan.SkipSpace();
    if (!scan.Number(start))
        return false;
    scan.SkipSpace();
    if (!scan.Literal(";"))
        return false;
    scan.SkipSpace();
    if (!scan.Literal("i"))
        return false;
    scan.SkipSpace();
    if (!scan.Literal("<"))
        return false;
    scan.SkipSpace();
    if (!scan.Number(end))
        return false;
    scan.SkipSpace();
    if (!scan.Literal(";"))
        return false;
    scan.SkipSpace();
    if (!scan.Literal("i"))
        return false;
    scan.SkipSpace();
    if (!scan.Literal("++"))
        return false;
    scan.SkipSpace();
    if (!scan.Literal(")"))
        return false;
    scan.SkipSpace();
    if (!scan.Literal("{"))
        return false;

    // the body is the shortest non-empty run of characters that is
    // followed by '}', whitespace and the end pragma.
    const auto body_start = scan.GetPos();
    for (auto brace = src.find('}', body_start + 1); brace != std::string::npos; brace = src.find('}', brace + 1))
    {
        LoopScanner tail(src, brace + 1);
        if (!tail.SkipSpace())
            continue;
        if (!tail.Literal(loop_end.c_str()))
            continue;
        *body = src.substr(body_start, brace - body_start);
        *match_end = tail.GetPos();
        return true;
    }
    return false;
}

// Replace every "[ i ]" with any amount of whitespace inside the brackets.
std::string ReplaceLoopIndex(const std::string& str, const std::string& index)
{
    std::string ret;
    size_t pos = 0;
    while (pos < str.size())
    {
        if (str[pos] == '[')
        {
            LoopScanner scan(str, pos + 1);
            scan.SkipSpace();
            if (scan.Literal("i"))
            {
                scan.SkipSpace();
                if (scan.Literal("]"))
                {
                    ret += "[ " + index + " ]";
                    pos = scan.GetPos();
                    continue;
                }
            }
        }
        ret.push_back(str[pos++]);
    }
    return ret;
}

const char* GetShadowMapTypeDefine(gfx::ShadowMapType type)
{
    switch (type)
    {
        case gfx::ShadowMapType::Basic:   return "SHADOWMAP_TYPE_BASIC";
        case gfx::ShadowMapType::PCF:     return "SHADOWMAP_TYPE_PCF";
        case gfx::ShadowMapType::PCFSoft: return "SHADOWMAP_TYPE_PCF_SOFT";
        case gfx::ShadowMapType::VSM:     return "SHADOWMAP_TYPE_VSM";
    }
    return "SHADOWMAP_TYPE_BASIC";
}

const char* GetEnvMapTypeDefine(const gfx::FeatureConfiguration& config)
{
    if (config.env_map_mode == gfx::EnvMapMapping::CubeUVReflection)
        return "ENVMAP_TYPE_CUBE_UV";
    return "ENVMAP_TYPE_CUBE";
}

const char* GetEnvMapModeDefine(const gfx::FeatureConfiguration& config)
{
    if (config.env_map_mode == gfx::EnvMapMapping::CubeRefraction)
        return "ENVMAP_MODE_REFRACTION";
    return "ENVMAP_MODE_REFLECTION";
}

const char* GetEnvMapBlendingDefine(const gfx::FeatureConfiguration& config)
{
    switch (config.env_map_combine)
    {
        case gfx::EnvMapCombine::None:     return "ENVMAP_BLENDING_NONE";
        case gfx::EnvMapCombine::Multiply: return "ENVMAP_BLENDING_MULTIPLY";
        case gfx::EnvMapCombine::Mix:      return "ENVMAP_BLENDING_MIX";
        case gfx::EnvMapCombine::Add:      return "ENVMAP_BLENDING_ADD";
    }
    return "ENVMAP_BLENDING_NONE";
}

struct CubeUVSize {
    double texel_width  = 0.0;
    double texel_height = 0.0;
    int max_mip = 0;
};

// Compute the texel size and mip count of the cube UV environment map
// layout. Heights that aren't a power of two use the largest mip level
// that fits.
bool GetCubeUVSize(const gfx::FeatureConfiguration& config, CubeUVSize* size)
{
    if (!config.env_map_cube_uv_height.has_value())
        return false;

    const auto height = config.env_map_cube_uv_height.value();
    if (height == 0)
    {
        WARN("Ignoring cube UV environment map with zero height.");
        return false;
    }
    if (!base::IsPowerOfTwo(height))
        WARN("Cube UV environment map height is not a power of two. [height=%1]", height);

    const auto levels = static_cast<int>(std::floor(std::log2(static_cast<double>(height))));
    size->max_mip = std::max(levels - 2, 0);
    size->texel_height = 1.0 / height;
    size->texel_width  = 1.0 / (3.0 * std::max(std::pow(2.0, size->max_mip), 7.0 * 16.0));
    return true;
}

const char* PrecisionDefine(gfx::ShaderPrecision precision)
{
    switch (precision)
    {
        case gfx::ShaderPrecision::High:   return "HIGH_PRECISION";
        case gfx::ShaderPrecision::Medium: return "MEDIUM_PRECISION";
        case gfx::ShaderPrecision::Low:    return "LOW_PRECISION";
    }
    return "HIGH_PRECISION";
}

std::string ToDecimal(int value)
{
    return base::ToChars(std::max(value, 0));
}

} // namespace

namespace gfx
{

UnresolvedInclude::UnresolvedInclude(const std::string& chunk)
  : std::runtime_error("Can not resolve #include <" + chunk + ">")
  , mChunk(chunk)
{}

PreprocessedSource ShaderPreprocessor::Preprocess(const ShaderTemplate& shader,
                                                  ShaderStage stage,
                                                  const FeatureConfiguration& config) const
{
    PreprocessedSource ret;
    ret.version = GenerateVersionString(config);

    if (stage == ShaderStage::Vertex)
        ret.prefix = GenerateVertexPrefix(config);
    else ret.prefix = GenerateFragmentPrefix(config);

    ret.body = ResolveIncludes(shader.source);
    ret.body = ReplaceLightNums(ret.body, config);
    ret.body = ReplaceClippingPlaneNums(ret.body, config);
    ret.body = UnrollLoops(ret.body);

    if (config.is_raw)
        return ret;

    // GLSL ES 3.00 compatibility layer for templates written with the
    // GLSL ES 1.00 names.
    std::vector<std::string> compat;
    if (stage == ShaderStage::Vertex)
    {
        compat.push_back(GenerateVertexExtensions(config));
        compat.push_back("#define attribute in");
        compat.push_back("#define varying out");
        compat.push_back("#define texture2D texture");
    }
    else
    {
        const bool glsl3 = config.glsl_version == GLSLVersion::GLSL3;
        compat.push_back("#define varying in");
        compat.push_back(glsl3 ? "" : "layout(location = 0) out highp vec4 pc_fragColor;");
        compat.push_back(glsl3 ? "" : "#define gl_FragColor pc_fragColor");
        compat.push_back("#define gl_FragDepthEXT gl_FragDepth");
        compat.push_back("#define texture2D texture");
        compat.push_back("#define textureCube texture");
        compat.push_back("#define texture2DProj textureProj");
        compat.push_back("#define texture2DLodEXT textureLod");
        compat.push_back("#define texture2DProjLodEXT textureProjLod");
        compat.push_back("#define textureCubeLodEXT textureLod");
        compat.push_back("#define texture2DGradEXT textureGrad");
        compat.push_back("#define texture2DProjGradEXT textureProjGrad");
        compat.push_back("#define textureCubeGradEXT textureGrad");
    }
    // the compatibility lines keep their empty lines.
    ret.prefix = base::JoinString(compat, "\n") + "\n" + ret.prefix;
    return ret;
}

std::string ShaderPreprocessor::ResolveIncludes(const std::string& source) const
{
    std::string out;
    std::vector<std::string> stack;
    ResolveIncludes(source, stack, out);
    return out;
}

std::string ShaderPreprocessor::GenerateVertexPrefix(const FeatureConfiguration& config) const
{
    const auto& defines = GenerateDefines(config.defines);
    if (config.is_raw)
    {
        auto prefix = JoinLines({
            "#define SHADER_TYPE " + config.shader_type,
            "#define SHADER_NAME " + config.shader_name,
            defines
        });
        if (!prefix.empty())
            prefix += "\n";
        return prefix;
    }

    const auto& uv = [&config](TextureMap map) -> const std::string& {
        return config.GetMapUv(map);
    };
    const auto& has = [&config](TextureMap map) {
        return config.HasMap(map);
    };

    return JoinLines({
        GeneratePrecision(config.precision),

        "#define SHADER_TYPE " + config.shader_type,
        "#define SHADER_NAME " + config.shader_name,

        defines,

        DefineFlag(config.extension_clip_cull_distance, "USE_CLIP_DISTANCE"),
        DefineFlag(config.batching, "USE_BATCHING"),
        DefineFlag(config.batching_color, "USE_BATCHING_COLOR"),
        DefineFlag(config.instancing, "USE_INSTANCING"),
        DefineFlag(config.instancing_color, "USE_INSTANCING_COLOR"),
        DefineFlag(config.instancing_morph, "USE_INSTANCING_MORPH"),

        DefineFlag(config.use_fog && config.fog, "USE_FOG"),
        DefineFlag(config.use_fog && config.fog_exp2, "FOG_EXP2"),

        DefineFlag(has(TextureMap::Map), "USE_MAP"),
        DefineFlag(has(TextureMap::EnvMap), "USE_ENVMAP"),
        DefineFlag(has(TextureMap::EnvMap), GetEnvMapModeDefine(config)),
        DefineFlag(has(TextureMap::LightMap), "USE_LIGHTMAP"),
        DefineFlag(has(TextureMap::AoMap), "USE_AOMAP"),
        DefineFlag(has(TextureMap::BumpMap), "USE_BUMPMAP"),
        DefineFlag(has(TextureMap::NormalMap), "USE_NORMALMAP"),
        DefineFlag(config.normal_map_object_space, "USE_NORMALMAP_OBJECTSPACE"),
        DefineFlag(config.normal_map_tangent_space, "USE_NORMALMAP_TANGENTSPACE"),
        DefineFlag(has(TextureMap::DisplacementMap), "USE_DISPLACEMENTMAP"),
        DefineFlag(has(TextureMap::EmissiveMap), "USE_EMISSIVEMAP"),

        DefineFlag(config.anisotropy, "USE_ANISOTROPY"),
        DefineFlag(has(TextureMap::AnisotropyMap), "USE_ANISOTROPYMAP"),

        DefineFlag(has(TextureMap::ClearcoatMap), "USE_CLEARCOATMAP"),
        DefineFlag(has(TextureMap::ClearcoatRoughnessMap), "USE_CLEARCOAT_ROUGHNESSMAP"),
        DefineFlag(has(TextureMap::ClearcoatNormalMap), "USE_CLEARCOAT_NORMALMAP"),

        DefineFlag(has(TextureMap::IridescenceMap), "USE_IRIDESCENCEMAP"),
        DefineFlag(has(TextureMap::IridescenceThicknessMap), "USE_IRIDESCENCE_THICKNESSMAP"),

        DefineFlag(has(TextureMap::SpecularMap), "USE_SPECULARMAP"),
        DefineFlag(has(TextureMap::SpecularColorMap), "USE_SPECULAR_COLORMAP"),
        DefineFlag(has(TextureMap::SpecularIntensityMap), "USE_SPECULAR_INTENSITYMAP"),

        DefineFlag(has(TextureMap::RoughnessMap), "USE_ROUGHNESSMAP"),
        DefineFlag(has(TextureMap::MetalnessMap), "USE_METALNESSMAP"),
        DefineFlag(has(TextureMap::AlphaMap), "USE_ALPHAMAP"),
        DefineFlag(config.alpha_hash, "USE_ALPHAHASH"),

        DefineFlag(config.transmission, "USE_TRANSMISSION"),
        DefineFlag(has(TextureMap::TransmissionMap), "USE_TRANSMISSIONMAP"),
        DefineFlag(has(TextureMap::ThicknessMap), "USE_THICKNESSMAP"),

        DefineFlag(has(TextureMap::SheenColorMap), "USE_SHEEN_COLORMAP"),
        DefineFlag(has(TextureMap::SheenRoughnessMap), "USE_SHEEN_ROUGHNESSMAP"),

        DefineWithValue("MAP_UV", uv(TextureMap::Map)),
        DefineWithValue("ALPHAMAP_UV", uv(TextureMap::AlphaMap)),
        DefineWithValue("LIGHTMAP_UV", uv(TextureMap::LightMap)),
        DefineWithValue("AOMAP_UV", uv(TextureMap::AoMap)),
        DefineWithValue("EMISSIVEMAP_UV", uv(TextureMap::EmissiveMap)),
        DefineWithValue("BUMPMAP_UV", uv(TextureMap::BumpMap)),
        DefineWithValue("NORMALMAP_UV", uv(TextureMap::NormalMap)),
        DefineWithValue("DISPLACEMENTMAP_UV", uv(TextureMap::DisplacementMap)),

        DefineWithValue("METALNESSMAP_UV", uv(TextureMap::MetalnessMap)),
        DefineWithValue("ROUGHNESSMAP_UV", uv(TextureMap::RoughnessMap)),

        DefineWithValue("ANISOTROPYMAP_UV", uv(TextureMap::AnisotropyMap)),

        DefineWithValue("CLEARCOATMAP_UV", uv(TextureMap::ClearcoatMap)),
        DefineWithValue("CLEARCOAT_NORMALMAP_UV", uv(TextureMap::ClearcoatNormalMap)),
        DefineWithValue("CLEARCOAT_ROUGHNESSMAP_UV", uv(TextureMap::ClearcoatRoughnessMap)),

        DefineWithValue("IRIDESCENCEMAP_UV", uv(TextureMap::IridescenceMap)),
        DefineWithValue("IRIDESCENCE_THICKNESSMAP_UV", uv(TextureMap::IridescenceThicknessMap)),

        DefineWithValue("SHEEN_COLORMAP_UV", uv(TextureMap::SheenColorMap)),
        DefineWithValue("SHEEN_ROUGHNESSMAP_UV", uv(TextureMap::SheenRoughnessMap)),

        DefineWithValue("SPECULARMAP_UV", uv(TextureMap::SpecularMap)),
        DefineWithValue("SPECULAR_COLORMAP_UV", uv(TextureMap::SpecularColorMap)),
        DefineWithValue("SPECULAR_INTENSITYMAP_UV", uv(TextureMap::SpecularIntensityMap)),

        DefineWithValue("TRANSMISSIONMAP_UV", uv(TextureMap::TransmissionMap)),
        DefineWithValue("THICKNESSMAP_UV", uv(TextureMap::ThicknessMap)),

        DefineFlag(config.vertex_tangents && !config.flat_shading, "USE_TANGENT"),
        DefineFlag(config.vertex_colors, "USE_COLOR"),
        DefineFlag(config.vertex_alphas, "USE_COLOR_ALPHA"),
        DefineFlag(config.vertex_uv1s, "USE_UV1"),
        DefineFlag(config.vertex_uv2s, "USE_UV2"),
        DefineFlag(config.vertex_uv3s, "USE_UV3"),

        DefineFlag(config.points_uvs, "USE_POINTS_UV"),

        DefineFlag(config.flat_shading, "FLAT_SHADED"),

        DefineFlag(config.skinning, "USE_SKINNING"),

        DefineFlag(config.morph_targets, "USE_MORPHTARGETS"),
        DefineFlag(config.morph_normals && !config.flat_shading, "USE_MORPHNORMALS"),
        DefineFlag(config.morph_colors, "USE_MORPHCOLORS"),
        config.morph_targets_count ? DefineWithValue("MORPHTARGETS_TEXTURE_STRIDE", base::ToChars(config.morph_texture_stride)) : "",
        config.morph_targets_count ? DefineWithValue("MORPHTARGETS_COUNT", base::ToChars(config.morph_targets_count)) : "",
        DefineFlag(config.double_sided, "DOUBLE_SIDED"),
        DefineFlag(config.flip_sided, "FLIP_SIDED"),

        DefineFlag(config.shadow_map_enabled, "USE_SHADOWMAP"),
        DefineFlag(config.shadow_map_enabled, GetShadowMapTypeDefine(config.shadow_map_type)),

        DefineFlag(config.size_attenuation, "USE_SIZEATTENUATION"),

        DefineFlag(config.num_light_probes > 0, "USE_LIGHT_PROBES"),

        DefineFlag(config.logarithmic_depth_buffer, "USE_LOGARITHMIC_DEPTH_BUFFER"),
        DefineFlag(config.reversed_depth_buffer, "USE_REVERSED_DEPTH_BUFFER"),

        "uniform mat4 modelMatrix;",
        "uniform mat4 modelViewMatrix;",
        "uniform mat4 projectionMatrix;",
        "uniform mat4 viewMatrix;",
        "uniform mat3 normalMatrix;",
        "uniform vec3 cameraPosition;",
        "uniform bool isOrthographic;",

        "#ifdef USE_INSTANCING",
        "\tattribute mat4 instanceMatrix;",
        "#endif",

        "#ifdef USE_INSTANCING_COLOR",
        "\tattribute vec3 instanceColor;",
        "#endif",

        "#ifdef USE_INSTANCING_MORPH",
        "\tuniform sampler2D morphTexture;",
        "#endif",

        "attribute vec3 position;",
        "attribute vec3 normal;",
        "attribute vec2 uv;",

        "#ifdef USE_UV1",
        "\tattribute vec2 uv1;",
        "#endif",

        "#ifdef USE_UV2",
        "\tattribute vec2 uv2;",
        "#endif",

        "#ifdef USE_UV3",
        "\tattribute vec2 uv3;",
        "#endif",

        "#ifdef USE_TANGENT",
        "\tattribute vec4 tangent;",
        "#endif",

        "#if defined( USE_COLOR_ALPHA )",
        "\tattribute vec4 color;",
        "#elif defined( USE_COLOR )",
        "\tattribute vec3 color;",
        "#endif",

        "#ifdef USE_SKINNING",
        "\tattribute vec4 skinIndex;",
        "\tattribute vec4 skinWeight;",
        "#endif",

        "\n"
    });
}

std::string ShaderPreprocessor::GenerateFragmentPrefix(const FeatureConfiguration& config) const
{
    const auto& defines = GenerateDefines(config.defines);
    if (config.is_raw)
    {
        auto prefix = JoinLines({
            "#define SHADER_TYPE " + config.shader_type,
            "#define SHADER_NAME " + config.shader_name,
            defines
        });
        if (!prefix.empty())
            prefix += "\n";
        return prefix;
    }

    const auto& has = [&config](TextureMap map) {
        return config.HasMap(map);
    };

    CubeUVSize cube_uv;
    const bool have_cube_uv = GetCubeUVSize(config, &cube_uv);

    const bool tone_mapping = config.tone_mapping != ToneMapping::None;

    return JoinLines({
        GeneratePrecision(config.precision),

        "#define SHADER_TYPE " + config.shader_type,
        "#define SHADER_NAME " + config.shader_name,

        defines,

        DefineFlag(config.use_fog && config.fog, "USE_FOG"),
        DefineFlag(config.use_fog && config.fog_exp2, "FOG_EXP2"),

        DefineFlag(config.alpha_to_coverage, "ALPHA_TO_COVERAGE"),
        DefineFlag(has(TextureMap::Map), "USE_MAP"),
        DefineFlag(has(TextureMap::Matcap), "USE_MATCAP"),
        DefineFlag(has(TextureMap::EnvMap), "USE_ENVMAP"),
        DefineFlag(has(TextureMap::EnvMap), GetEnvMapTypeDefine(config)),
        DefineFlag(has(TextureMap::EnvMap), GetEnvMapModeDefine(config)),
        DefineFlag(has(TextureMap::EnvMap), GetEnvMapBlendingDefine(config)),
        have_cube_uv ? DefineWithValue("CUBEUV_TEXEL_WIDTH", base::ToCharsGeneral(cube_uv.texel_width)) : "",
        have_cube_uv ? DefineWithValue("CUBEUV_TEXEL_HEIGHT", base::ToCharsGeneral(cube_uv.texel_height)) : "",
        have_cube_uv ? DefineWithValue("CUBEUV_MAX_MIP", base::ToChars(cube_uv.max_mip) + ".0") : "",
        DefineFlag(has(TextureMap::LightMap), "USE_LIGHTMAP"),
        DefineFlag(has(TextureMap::AoMap), "USE_AOMAP"),
        DefineFlag(has(TextureMap::BumpMap), "USE_BUMPMAP"),
        DefineFlag(has(TextureMap::NormalMap), "USE_NORMALMAP"),
        DefineFlag(config.normal_map_object_space, "USE_NORMALMAP_OBJECTSPACE"),
        DefineFlag(config.normal_map_tangent_space, "USE_NORMALMAP_TANGENTSPACE"),
        DefineFlag(has(TextureMap::EmissiveMap), "USE_EMISSIVEMAP"),

        DefineFlag(config.anisotropy, "USE_ANISOTROPY"),
        DefineFlag(has(TextureMap::AnisotropyMap), "USE_ANISOTROPYMAP"),

        DefineFlag(config.clearcoat, "USE_CLEARCOAT"),
        DefineFlag(has(TextureMap::ClearcoatMap), "USE_CLEARCOATMAP"),
        DefineFlag(has(TextureMap::ClearcoatRoughnessMap), "USE_CLEARCOAT_ROUGHNESSMAP"),
        DefineFlag(has(TextureMap::ClearcoatNormalMap), "USE_CLEARCOAT_NORMALMAP"),

        DefineFlag(config.dispersion, "USE_DISPERSION"),

        DefineFlag(config.iridescence, "USE_IRIDESCENCE"),
        DefineFlag(has(TextureMap::IridescenceMap), "USE_IRIDESCENCEMAP"),
        DefineFlag(has(TextureMap::IridescenceThicknessMap), "USE_IRIDESCENCE_THICKNESSMAP"),

        DefineFlag(has(TextureMap::SpecularMap), "USE_SPECULARMAP"),
        DefineFlag(has(TextureMap::SpecularColorMap), "USE_SPECULAR_COLORMAP"),
        DefineFlag(has(TextureMap::SpecularIntensityMap), "USE_SPECULAR_INTENSITYMAP"),

        DefineFlag(has(TextureMap::RoughnessMap), "USE_ROUGHNESSMAP"),
        DefineFlag(has(TextureMap::MetalnessMap), "USE_METALNESSMAP"),

        DefineFlag(has(TextureMap::AlphaMap), "USE_ALPHAMAP"),
        DefineFlag(config.alpha_test, "USE_ALPHATEST"),
        DefineFlag(config.alpha_hash, "USE_ALPHAHASH"),

        DefineFlag(config.sheen, "USE_SHEEN"),
        DefineFlag(has(TextureMap::SheenColorMap), "USE_SHEEN_COLORMAP"),
        DefineFlag(has(TextureMap::SheenRoughnessMap), "USE_SHEEN_ROUGHNESSMAP"),

        DefineFlag(config.transmission, "USE_TRANSMISSION"),
        DefineFlag(has(TextureMap::TransmissionMap), "USE_TRANSMISSIONMAP"),
        DefineFlag(has(TextureMap::ThicknessMap), "USE_THICKNESSMAP"),

        DefineFlag(config.vertex_tangents && !config.flat_shading, "USE_TANGENT"),
        DefineFlag(config.vertex_colors || config.instancing_color || config.batching_color, "USE_COLOR"),
        DefineFlag(config.vertex_alphas, "USE_COLOR_ALPHA"),
        DefineFlag(config.vertex_uv1s, "USE_UV1"),
        DefineFlag(config.vertex_uv2s, "USE_UV2"),
        DefineFlag(config.vertex_uv3s, "USE_UV3"),

        DefineFlag(config.points_uvs, "USE_POINTS_UV"),

        DefineFlag(has(TextureMap::GradientMap), "USE_GRADIENTMAP"),

        DefineFlag(config.flat_shading, "FLAT_SHADED"),

        DefineFlag(config.double_sided, "DOUBLE_SIDED"),
        DefineFlag(config.flip_sided, "FLIP_SIDED"),

        DefineFlag(config.shadow_map_enabled, "USE_SHADOWMAP"),
        DefineFlag(config.shadow_map_enabled, GetShadowMapTypeDefine(config.shadow_map_type)),

        DefineFlag(config.premultiplied_alpha, "PREMULTIPLIED_ALPHA"),

        DefineFlag(config.num_light_probes > 0, "USE_LIGHT_PROBES"),

        DefineFlag(config.decode_video_texture, "DECODE_VIDEO_TEXTURE"),
        DefineFlag(config.decode_video_texture_emissive, "DECODE_VIDEO_TEXTURE_EMISSIVE"),

        DefineFlag(config.logarithmic_depth_buffer, "USE_LOGARITHMIC_DEPTH_BUFFER"),
        DefineFlag(config.reversed_depth_buffer, "USE_REVERSED_DEPTH_BUFFER"),

        "uniform mat4 viewMatrix;",
        "uniform vec3 cameraPosition;",
        "uniform bool isOrthographic;",

        DefineFlag(tone_mapping, "TONE_MAPPING"),
        tone_mapping ? GetPrologueChunk("tonemapping_pars_fragment") : "",
        tone_mapping ? GenerateToneMappingFunction("toneMapping", config.tone_mapping) : "",

        DefineFlag(config.dithering, "DITHERING"),
        DefineFlag(config.opaque, "OPAQUE"),

        GetPrologueChunk("colorspace_pars_fragment"),
        GenerateTexelEncodingFunction("linearToOutputTexel", config.output_color_space),
        GenerateLuminanceFunction(),

        config.use_depth_packing ? DefineWithValue("DEPTH_PACKING", base::ToChars(config.depth_packing)) : "",

        "\n"
    });
}

// static
std::string ShaderPreprocessor::ReplaceLightNums(const std::string& source, const FeatureConfiguration& config)
{
    const int spot_light_coords = static_cast<int>(config.num_spot_light_shadows) +
                                  static_cast<int>(config.num_spot_light_maps) -
                                  static_cast<int>(config.num_spot_light_shadows_with_maps);

    auto ret = source;
    ret = base::ReplaceIdentifier(ret, "NUM_DIR_LIGHTS", base::ToChars(config.num_dir_lights));
    ret = base::ReplaceIdentifier(ret, "NUM_SPOT_LIGHTS", base::ToChars(config.num_spot_lights));
    ret = base::ReplaceIdentifier(ret, "NUM_SPOT_LIGHT_MAPS", base::ToChars(config.num_spot_light_maps));
    ret = base::ReplaceIdentifier(ret, "NUM_SPOT_LIGHT_COORDS", ToDecimal(spot_light_coords));
    ret = base::ReplaceIdentifier(ret, "NUM_RECT_AREA_LIGHTS", base::ToChars(config.num_rect_area_lights));
    ret = base::ReplaceIdentifier(ret, "NUM_POINT_LIGHTS", base::ToChars(config.num_point_lights));
    ret = base::ReplaceIdentifier(ret, "NUM_HEMI_LIGHTS", base::ToChars(config.num_hemi_lights));
    ret = base::ReplaceIdentifier(ret, "NUM_DIR_LIGHT_SHADOWS", base::ToChars(config.num_dir_light_shadows));
    ret = base::ReplaceIdentifier(ret, "NUM_SPOT_LIGHT_SHADOWS_WITH_MAPS", base::ToChars(config.num_spot_light_shadows_with_maps));
    ret = base::ReplaceIdentifier(ret, "NUM_SPOT_LIGHT_SHADOWS", base::ToChars(config.num_spot_light_shadows));
    ret = base::ReplaceIdentifier(ret, "NUM_POINT_LIGHT_SHADOWS", base::ToChars(config.num_point_light_shadows));
    return ret;
}

// static
std::string ShaderPreprocessor::ReplaceClippingPlaneNums(const std::string& source, const FeatureConfiguration& config)
{
    const int union_planes = static_cast<int>(config.num_clipping_planes) -
                             static_cast<int>(config.num_clip_intersection);

    auto ret = source;
    ret = base::ReplaceIdentifier(ret, "NUM_CLIPPING_PLANES", base::ToChars(config.num_clipping_planes));
    ret = base::ReplaceIdentifier(ret, "UNION_CLIPPING_PLANES", ToDecimal(union_planes));
    return ret;
}

// static
std::string ShaderPreprocessor::UnrollLoops(const std::string& source)
{
    static const std::string loop_start = "#pragma unroll_loop_start";

    std::string ret;
    size_t pos = 0;
    while (pos < source.size())
    {
        const auto pragma = source.find(loop_start, pos);
        if (pragma == std::string::npos)
            break;

        long start = 0;
        long end   = 0;
        size_t match_end = 0;
        std::string body;
        if (!MatchUnrollLoop(source, pragma, &start, &end, &body, &match_end))
        {
            // not a loop that we can unroll, leave it as is.
            ret.append(source, pos, pragma + loop_start.size() - pos);
            pos = pragma + loop_start.size();
            continue;
        }
        if (start > MaxUnrollIndex || end > MaxUnrollIndex)
        {
            WARN("Unroll loop range is too large. [start=%1, end=%2, max=%3]", start, end, MaxUnrollIndex);
            ret.append(source, pos, pragma + loop_start.size() - pos);
            pos = pragma + loop_start.size();
            continue;
        }
        ret.append(source, pos, pragma - pos);
        for (long i=start; i<end; ++i)
        {
            const auto& index = base::ToChars(static_cast<int>(i));
            ret += base::ReplaceAll(ReplaceLoopIndex(body, index), "UNROLLED_LOOP_INDEX", index);
        }
        pos = match_end;
    }
    if (pos < source.size())
        ret.append(source, pos, std::string::npos);
    return ret;
}

// static
std::string ShaderPreprocessor::GenerateDefines(const std::vector<ShaderDefine>& defines)
{
    std::vector<std::string> lines;
    for (const auto& define : defines)
    {
        if (const auto* ptr = std::get_if<bool>(&define.value))
        {
            if (*ptr == false)
                continue;
        }
        lines.push_back("#define " + define.name + " " + ToString(define.value));
    }
    return base::JoinString(lines, "\n");
}

// static
std::string ShaderPreprocessor::GeneratePrecision(ShaderPrecision precision)
{
    static const char* types[] = {
        "float", "int",
        "sampler2D", "samplerCube", "sampler3D", "sampler2DArray",
        "sampler2DShadow", "samplerCubeShadow", "sampler2DArrayShadow",
        "isampler2D", "isampler3D", "isamplerCube", "isampler2DArray",
        "usampler2D", "usampler3D", "usamplerCube", "usampler2DArray"
    };
    const std::string qualifier = ToString(precision);

    std::string ret;
    for (size_t i=0; i<base::ArraySize(types); ++i)
    {
        if (i > 0)
            ret += "\t";
        ret += "precision " + qualifier + " " + types[i] + ";\n";
    }
    ret += "\t\n#define ";
    ret += PrecisionDefine(precision);
    return ret;
}

// static
std::string ShaderPreprocessor::GenerateVertexExtensions(const FeatureConfiguration& config)
{
    return JoinLines({
        config.extension_clip_cull_distance ? "#extension GL_ANGLE_clip_cull_distance : require" : "",
        config.extension_multi_draw ? "#extension GL_ANGLE_multi_draw : require" : ""
    });
}

// static
std::string ShaderPreprocessor::GenerateToneMappingFunction(const std::string& function_name, ToneMapping mapping)
{
    std::string name;
    if (mapping == ToneMapping::None)
    {
        WARN("Unsupported tone mapping. [mapping=%1]", ToString(mapping));
        name = "Linear";
    }
    else name = ToString(mapping);
    return "vec3 " + function_name + "( vec3 color ) { return " + name + "ToneMapping( color ); }";
}

// static
std::string ShaderPreprocessor::GenerateVersionString(const FeatureConfiguration& config)
{
    if (!config.is_raw)
        return "#version 300 es\n";
    if (config.glsl_version == GLSLVersion::GLSL3)
        return "#version 300 es\n";
    else if (config.glsl_version == GLSLVersion::GLSL1)
        return "#version 100\n";
    return "";
}

void ShaderPreprocessor::ResolveIncludes(const std::string& source,
                                         std::vector<std::string>& stack,
                                         std::string& out) const
{
    size_t pos = 0;
    while (true)
    {
        const auto newline = source.find('\n', pos);
        const auto& line = source.substr(pos, newline == std::string::npos ? std::string::npos : newline - pos);

        std::string name;
        size_t end = 0;
        if (ParseInclude(line, &name, &end))
        {
            if (std::find(stack.begin(), stack.end(), name) != stack.end())
            {
                ERROR("Shader chunk includes itself recursively. [chunk='%1']", name);
                throw UnresolvedInclude(name);
            }
            const auto& chunk = GetChunk(name);
            stack.push_back(name);
            ResolveIncludes(chunk, stack, out);
            stack.pop_back();
            out.append(line, end, std::string::npos);
        }
        else out += line;

        if (newline == std::string::npos)
            break;
        out.push_back('\n');
        pos = newline + 1;
    }
}

std::string ShaderPreprocessor::GetChunk(const std::string& name) const
{
    const auto* chunk = mLibrary->FindChunk(name);
    if (chunk == nullptr)
    {
        ERROR("No such shader chunk. [chunk='%1']", name);
        throw UnresolvedInclude(name);
    }
    return *chunk;
}

std::string ShaderPreprocessor::GetPrologueChunk(const std::string& name) const
{
    if (const auto* chunk = mLibrary->FindChunk(name))
        return *chunk;
    const auto* builtin = ShaderLibrary::FindBuiltinChunk(name);
    if (builtin == nullptr)
        BUG("Prologue chunk is not a built-in chunk.");
    return builtin;
}

} // namespace
