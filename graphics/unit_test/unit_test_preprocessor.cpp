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

#include <string>

#include "base/test_minimal.h"
#include "base/logging.h"
#include "base/utility.h"
#include "graphics/color_space.h"
#include "graphics/feature_config.h"
#include "graphics/shader_library.h"
#include "graphics/shader_preprocessor.h"

namespace {
size_t CountWarnings(const base::BufferLogger<base::NullLogger>& logger, const std::string& what)
{
    size_t count = 0;
    for (size_t i=0; i<logger.GetBufferMsgCount(); ++i)
    {
        const auto& msg = logger.GetMessage(i);
        if (msg.type == base::LogEvent::Warning && base::Contains(msg.msg, what))
            ++count;
    }
    return count;
}

size_t CountOccurrences(const std::string& str, const std::string& what)
{
    size_t count = 0;
    size_t pos = 0;
    while ((pos = str.find(what, pos)) != std::string::npos)
    {
        ++count;
        pos += what.size();
    }
    return count;
}

gfx::FeatureConfiguration MakeConfig()
{
    gfx::FeatureConfiguration config;
    config.shader_type = "MeshStandardMaterial";
    config.shader_name = "Crate";
    return config;
}
} // namespace

void unit_test_library()
{
    TEST_CASE(test::Type::Feature)

    base::BufferLogger<base::NullLogger> logger;
    logger.EnableWrite(base::Logger::WriteType::WriteFormatted, false);
    base::SetGlobalLog(&logger);

    gfx::ShaderLibrary library;
    library.AddChunk("common", "float pow2( const in float x ) { return x*x; }");
    library.AddAlias("common_old", "common");
    TEST_REQUIRE(library.GetNumChunks() == 1);
    TEST_REQUIRE(library.HasChunk("common"));
    TEST_REQUIRE(library.HasChunk("common_old") == false);
    TEST_REQUIRE(library.FindChunk("nope") == nullptr);
    TEST_REQUIRE(*library.FindChunk("common") == "float pow2( const in float x ) { return x*x; }");
    TEST_REQUIRE(CountWarnings(logger, "deprecated") == 0);

    // the deprecated name resolves to the replacement and warns once.
    TEST_REQUIRE(library.FindChunk("common_old") == library.FindChunk("common"));
    TEST_REQUIRE(library.FindChunk("common_old") == library.FindChunk("common"));
    TEST_REQUIRE(CountWarnings(logger, "deprecated") == 1);

    // replace
    library.AddChunk("common", "// nothing");
    TEST_REQUIRE(*library.FindChunk("common") == "// nothing");

    const auto& defaults = gfx::ShaderLibrary::CreateDefault();
    TEST_REQUIRE(defaults.HasChunk("tonemapping_pars_fragment"));
    TEST_REQUIRE(defaults.HasChunk("colorspace_pars_fragment"));
    TEST_REQUIRE(base::Contains(*defaults.FindChunk("tonemapping_pars_fragment"), "ACESFilmicToneMapping"));
    TEST_REQUIRE(base::Contains(*defaults.FindChunk("colorspace_pars_fragment"), "sRGBTransferOETF"));

    base::SetGlobalLog(nullptr);
}

void unit_test_includes()
{
    TEST_CASE(test::Type::Feature)

    base::BufferLogger<base::NullLogger> logger;
    logger.EnableWrite(base::Logger::WriteType::WriteFormatted, false);
    base::SetGlobalLog(&logger);

    gfx::ShaderLibrary library;
    library.AddChunk("a", "A1\n#include <b>");
    library.AddChunk("b", "B1");
    library.AddChunk("c", "#include <d>");
    library.AddChunk("d", "#include <c>");
    library.AddChunk("e", "#include <e>");
    library.AddChunk("lights/common.glsl", "L");
    library.AddChunk("f", "#include <missing>");
    library.AddAlias("b_old", "b");

    gfx::ShaderPreprocessor pp(library);

    // nested includes, the text after the directive is kept.
    TEST_REQUIRE(pp.ResolveIncludes("x\n#include <a> // tail\ny") == "x\nA1\nB1 // tail\ny");
    // leading whitespace
    TEST_REQUIRE(pp.ResolveIncludes("  \t#include <b>") == "B1");
    // the include name can have dots and slashes.
    TEST_REQUIRE(pp.ResolveIncludes("#include <lights/common.glsl>\n") == "L\n");
    // not an include directive, left as is
    TEST_REQUIRE(pp.ResolveIncludes("#include<b>") == "#include<b>");
    TEST_REQUIRE(pp.ResolveIncludes("// #include <b>") == "// #include <b>");
    TEST_REQUIRE(pp.ResolveIncludes("#include \"b\"") == "#include \"b\"");
    // the same chunk can be included many times.
    TEST_REQUIRE(pp.ResolveIncludes("#include <b>\n#include <b>") == "B1\nB1");
    // no directives at all
    TEST_REQUIRE(pp.ResolveIncludes("void main() {}\n") == "void main() {}\n");
    TEST_REQUIRE(pp.ResolveIncludes("") == "");

    // deprecated name
    TEST_REQUIRE(pp.ResolveIncludes("#include <b_old>") == "B1");
    TEST_REQUIRE(CountWarnings(logger, "deprecated") == 1);

    // missing chunk
    TEST_EXCEPTION(pp.ResolveIncludes("#include <foobar>"));
    try
    {
        pp.ResolveIncludes("void main() {\n#include <f>\n}");
        TEST_REQUIRE(!"Exception was expected");
    }
    catch (const gfx::UnresolvedInclude& e)
    {
        TEST_REQUIRE(e.GetChunkName() == "missing");
        TEST_REQUIRE(std::string(e.what()) == "Can not resolve #include <missing>");
    }

    // recursive includes
    TEST_EXCEPTION(pp.ResolveIncludes("#include <c>"));
    TEST_EXCEPTION(pp.ResolveIncludes("#include <e>"));

    base::SetGlobalLog(nullptr);
}

void unit_test_unroll()
{
    TEST_CASE(test::Type::Feature)

    using pp = gfx::ShaderPreprocessor;

    // basic loop
    {
        const std::string src =
            "void main() {\n"
            "\t#pragma unroll_loop_start\n"
            "\tfor ( int i = 0; i < 3; i ++ ) {\n"
            "\t\tfoo( lights[ i ], UNROLLED_LOOP_INDEX );\n"
            "\t}\n"
            "\t#pragma unroll_loop_end\n"
            "}\n";
        const auto& ret = pp::UnrollLoops(src);
        TEST_REQUIRE(CountOccurrences(ret, "foo(") == 3);
        TEST_REQUIRE(base::Contains(ret, "foo( lights[ 0 ], 0 );"));
        TEST_REQUIRE(base::Contains(ret, "foo( lights[ 1 ], 1 );"));
        TEST_REQUIRE(base::Contains(ret, "foo( lights[ 2 ], 2 );"));
        TEST_REQUIRE(!base::Contains(ret, "#pragma"));
        TEST_REQUIRE(!base::Contains(ret, "for ("));
        TEST_REQUIRE(!base::Contains(ret, "UNROLLED_LOOP_INDEX"));
        TEST_REQUIRE(ret.find("void main() {\n") == 0);
        TEST_REQUIRE(ret.substr(ret.size() - 2) == "}\n");
        // the bodies are in order
        TEST_REQUIRE(ret.find("lights[ 0 ]") < ret.find("lights[ 1 ]"));
        TEST_REQUIRE(ret.find("lights[ 1 ]") < ret.find("lights[ 2 ]"));
    }

    // non-zero start
    {
        const auto& ret = pp::UnrollLoops(
            "#pragma unroll_loop_start\n"
            "for(int i=2;i<4;i++){\n"
            "  a[i] = b[ i ];\n"
            "}\n"
            "#pragma unroll_loop_end");
        TEST_REQUIRE(CountOccurrences(ret, "a[ ") == 2);
        TEST_REQUIRE(base::Contains(ret, "a[ 2 ] = b[ 2 ];"));
        TEST_REQUIRE(base::Contains(ret, "a[ 3 ] = b[ 3 ];"));
        TEST_REQUIRE(!base::Contains(ret, "[ 0 ]"));
    }

    // end <= start produces nothing.
    {
        const auto& ret = pp::UnrollLoops(
            "A\n"
            "#pragma unroll_loop_start\n"
            "for ( int i = 3; i < 3; i ++ ) {\n"
            "  foo( i );\n"
            "}\n"
            "#pragma unroll_loop_end\n"
            "B");
        TEST_REQUIRE(ret == "A\n\nB");
    }

    // two loops, the body ends at the first matching end pragma.
    {
        const auto& ret = pp::UnrollLoops(
            "#pragma unroll_loop_start\n"
            "for ( int i = 0; i < 2; i ++ ) {\n"
            "  x( UNROLLED_LOOP_INDEX );\n"
            "}\n"
            "#pragma unroll_loop_end\n"
            "#pragma unroll_loop_start\n"
            "for ( int i = 0; i < 1; i ++ ) {\n"
            "  y( UNROLLED_LOOP_INDEX );\n"
            "}\n"
            "#pragma unroll_loop_end\n");
        TEST_REQUIRE(CountOccurrences(ret, "x(") == 2);
        TEST_REQUIRE(CountOccurrences(ret, "y(") == 1);
        TEST_REQUIRE(base::Contains(ret, "x( 1 );"));
        TEST_REQUIRE(base::Contains(ret, "y( 0 );"));
    }

    // not a loop that can be unrolled, left as is.
    {
        const std::string src =
            "#pragma unroll_loop_start\n"
            "for ( int j = 0; j < 2; j ++ ) {\n"
            "}\n"
            "#pragma unroll_loop_end\n";
        TEST_REQUIRE(pp::UnrollLoops(src) == src);
    }

    // a range that is too large or doesn't fit in an integer is left
    // as is with a warning.
    {
        base::BufferLogger<base::NullLogger> logger;
        logger.EnableWrite(base::Logger::WriteType::WriteFormatted, false);
        base::SetGlobalLog(&logger);

        const std::string huge =
            "#pragma unroll_loop_start\n"
            "for ( int i = 0; i < 2000000000; i ++ ) {\n"
            "  foo( i );\n"
            "}\n"
            "#pragma unroll_loop_end\n";
        TEST_REQUIRE(pp::UnrollLoops(huge) == huge);
        TEST_REQUIRE(CountWarnings(logger, "too large") == 1);

        const std::string overflow =
            "#pragma unroll_loop_start\n"
            "for ( int i = 99999999999999999999999999; i < 2; i ++ ) {\n"
            "  foo( i );\n"
            "}\n"
            "#pragma unroll_loop_end\n";
        TEST_REQUIRE(pp::UnrollLoops(overflow) == overflow);
        TEST_REQUIRE(CountWarnings(logger, "too large") == 2);

        base::SetGlobalLog(nullptr);
    }

    // nothing to unroll
    TEST_REQUIRE(pp::UnrollLoops("void main() {}") == "void main() {}");
}

void unit_test_replace_nums()
{
    TEST_CASE(test::Type::Feature)

    using pp = gfx::ShaderPreprocessor;

    auto config = MakeConfig();
    config.num_dir_lights = 2;
    config.num_dir_light_shadows = 1;
    config.num_point_lights = 3;
    config.num_spot_lights = 4;
    config.num_spot_light_maps = 2;
    config.num_spot_light_shadows = 1;
    config.num_spot_light_shadows_with_maps = 1;
    config.num_hemi_lights = 5;
    config.num_rect_area_lights = 6;
    config.num_clipping_planes = 3;
    config.num_clip_intersection = 1;

    TEST_REQUIRE(pp::ReplaceLightNums("NUM_DIR_LIGHTS NUM_DIR_LIGHT_SHADOWS", config) == "2 1");
    TEST_REQUIRE(pp::ReplaceLightNums("DirectionalLight lights[ NUM_DIR_LIGHTS ];", config) == "DirectionalLight lights[ 2 ];");
    TEST_REQUIRE(pp::ReplaceLightNums("NUM_POINT_LIGHTS,NUM_HEMI_LIGHTS,NUM_RECT_AREA_LIGHTS", config) == "3,5,6");
    TEST_REQUIRE(pp::ReplaceLightNums("NUM_SPOT_LIGHTS NUM_SPOT_LIGHT_MAPS NUM_SPOT_LIGHT_SHADOWS", config) == "4 2 1");
    TEST_REQUIRE(pp::ReplaceLightNums("NUM_SPOT_LIGHT_COORDS NUM_SPOT_LIGHT_SHADOWS_WITH_MAPS", config) == "2 1");
    // identifiers that only contain the name are not touched.
    TEST_REQUIRE(pp::ReplaceLightNums("MY_NUM_DIR_LIGHTS NUM_DIR_LIGHTS_X", config) == "MY_NUM_DIR_LIGHTS NUM_DIR_LIGHTS_X");

    TEST_REQUIRE(pp::ReplaceClippingPlaneNums("NUM_CLIPPING_PLANES UNION_CLIPPING_PLANES", config) == "3 2");
    config.num_clip_intersection = 5;
    TEST_REQUIRE(pp::ReplaceClippingPlaneNums("UNION_CLIPPING_PLANES", config) == "0");
}

void unit_test_defines()
{
    TEST_CASE(test::Type::Feature)

    using pp = gfx::ShaderPreprocessor;

    std::vector<gfx::ShaderDefine> defines;
    defines.push_back({"A", true});
    defines.push_back({"B", false});
    defines.push_back({"C", 3});
    defines.push_back({"D", 1.5f});
    defines.push_back({"E", std::string("foo")});
    TEST_REQUIRE(pp::GenerateDefines(defines) == "#define A true\n#define C 3\n#define D 1.5\n#define E foo");
    TEST_REQUIRE(pp::GenerateDefines({}) == "");

    // the user defines go into both stages in the given order.
    gfx::ShaderLibrary library = gfx::ShaderLibrary::CreateDefault();
    gfx::ShaderPreprocessor preprocessor(library);

    auto config = MakeConfig();
    config.AddDefine("USE_FOO", true);
    config.AddDefine("FOO_COUNT", 4);
    config.AddDefine("USE_BAR", false);
    const auto& vertex = preprocessor.GenerateVertexPrefix(config);
    const auto& fragment = preprocessor.GenerateFragmentPrefix(config);
    TEST_REQUIRE(base::Contains(vertex, "#define USE_FOO true\n#define FOO_COUNT 4\n"));
    TEST_REQUIRE(base::Contains(fragment, "#define USE_FOO true\n#define FOO_COUNT 4\n"));
    TEST_REQUIRE(!base::Contains(vertex, "USE_BAR"));
    TEST_REQUIRE(!base::Contains(fragment, "USE_BAR"));
    TEST_REQUIRE(base::Contains(vertex, "#define SHADER_TYPE MeshStandardMaterial\n#define SHADER_NAME Crate\n"));
}

void unit_test_feature_gating()
{
    TEST_CASE(test::Type::Feature)

    gfx::ShaderLibrary library = gfx::ShaderLibrary::CreateDefault();
    gfx::ShaderPreprocessor pp(library);

    // fog requires both use_fog and fog.
    {
        auto config = MakeConfig();
        config.fog = true;
        TEST_REQUIRE(!base::Contains(pp.GenerateFragmentPrefix(config), "USE_FOG"));
        config.use_fog = true;
        TEST_REQUIRE(base::Contains(pp.GenerateFragmentPrefix(config), "#define USE_FOG\n"));
        TEST_REQUIRE(base::Contains(pp.GenerateVertexPrefix(config), "#define USE_FOG\n"));
        TEST_REQUIRE(!base::Contains(pp.GenerateFragmentPrefix(config), "FOG_EXP2"));
        config.fog_exp2 = true;
        TEST_REQUIRE(base::Contains(pp.GenerateFragmentPrefix(config), "#define FOG_EXP2\n"));
    }

    // maps and their uv channels
    {
        auto config = MakeConfig();
        TEST_REQUIRE(!base::Contains(pp.GenerateVertexPrefix(config), "USE_MAP"));
        TEST_REQUIRE(!base::Contains(pp.GenerateVertexPrefix(config), "MAP_UV"));
        config.SetMap(gfx::TextureMap::Map);
        config.SetMapUv(gfx::TextureMap::Map, "uv");
        config.SetMap(gfx::TextureMap::NormalMap);
        config.SetMapUv(gfx::TextureMap::NormalMap, "uv1");
        const auto& vertex = pp.GenerateVertexPrefix(config);
        TEST_REQUIRE(base::Contains(vertex, "#define USE_MAP\n"));
        TEST_REQUIRE(base::Contains(vertex, "#define USE_NORMALMAP\n"));
        TEST_REQUIRE(base::Contains(vertex, "#define MAP_UV uv\n"));
        TEST_REQUIRE(base::Contains(vertex, "#define NORMALMAP_UV uv1\n"));
        TEST_REQUIRE(!base::Contains(vertex, "AOMAP_UV"));
    }

    // env map
    {
        auto config = MakeConfig();
        config.SetMap(gfx::TextureMap::EnvMap);
        config.env_map_mode = gfx::EnvMapMapping::CubeRefraction;
        config.env_map_combine = gfx::EnvMapCombine::Mix;
        const auto& fragment = pp.GenerateFragmentPrefix(config);
        TEST_REQUIRE(base::Contains(fragment, "#define USE_ENVMAP\n"));
        TEST_REQUIRE(base::Contains(fragment, "#define ENVMAP_TYPE_CUBE\n"));
        TEST_REQUIRE(base::Contains(fragment, "#define ENVMAP_MODE_REFRACTION\n"));
        TEST_REQUIRE(base::Contains(fragment, "#define ENVMAP_BLENDING_MIX\n"));
    }

    // shadows
    {
        auto config = MakeConfig();
        config.shadow_map_type = gfx::ShadowMapType::PCFSoft;
        TEST_REQUIRE(!base::Contains(pp.GenerateFragmentPrefix(config), "SHADOWMAP"));
        config.shadow_map_enabled = true;
        TEST_REQUIRE(base::Contains(pp.GenerateFragmentPrefix(config), "#define USE_SHADOWMAP\n#define SHADOWMAP_TYPE_PCF_SOFT\n"));
    }

    // morph targets
    {
        auto config = MakeConfig();
        config.morph_targets = true;
        config.morph_normals = true;
        config.morph_targets_count = 4;
        config.morph_texture_stride = 2;
        auto vertex = pp.GenerateVertexPrefix(config);
        TEST_REQUIRE(base::Contains(vertex, "#define USE_MORPHTARGETS\n"));
        TEST_REQUIRE(base::Contains(vertex, "#define USE_MORPHNORMALS\n"));
        TEST_REQUIRE(base::Contains(vertex, "#define MORPHTARGETS_TEXTURE_STRIDE 2\n"));
        TEST_REQUIRE(base::Contains(vertex, "#define MORPHTARGETS_COUNT 4\n"));
        // flat shading turns off the morphed normals
        config.flat_shading = true;
        vertex = pp.GenerateVertexPrefix(config);
        TEST_REQUIRE(!base::Contains(vertex, "USE_MORPHNORMALS"));
        TEST_REQUIRE(base::Contains(vertex, "#define FLAT_SHADED\n"));
    }

    // tone mapping
    {
        auto config = MakeConfig();
        TEST_REQUIRE(!base::Contains(pp.GenerateFragmentPrefix(config), "TONE_MAPPING"));
        config.tone_mapping = gfx::ToneMapping::AgX;
        const auto& fragment = pp.GenerateFragmentPrefix(config);
        TEST_REQUIRE(base::Contains(fragment, "#define TONE_MAPPING\n"));
        TEST_REQUIRE(base::Contains(fragment, "vec3 toneMapping( vec3 color ) { return AgXToneMapping( color ); }"));
        // the helper chunk comes before the function
        TEST_REQUIRE(fragment.find("toneMappingExposure") < fragment.find("vec3 toneMapping("));
    }

    // light probes and depth packing
    {
        auto config = MakeConfig();
        config.num_light_probes = 1;
        config.use_depth_packing = true;
        config.depth_packing = 3201;
        const auto& fragment = pp.GenerateFragmentPrefix(config);
        TEST_REQUIRE(base::Contains(fragment, "#define USE_LIGHT_PROBES\n"));
        TEST_REQUIRE(base::Contains(fragment, "#define DEPTH_PACKING 3201\n"));
    }
}

void unit_test_cube_uv()
{
    TEST_CASE(test::Type::Feature)

    base::BufferLogger<base::NullLogger> logger;
    logger.EnableWrite(base::Logger::WriteType::WriteFormatted, false);
    base::SetGlobalLog(&logger);

    gfx::ShaderLibrary library = gfx::ShaderLibrary::CreateDefault();
    gfx::ShaderPreprocessor pp(library);

    auto config = MakeConfig();
    config.SetMap(gfx::TextureMap::EnvMap);
    config.env_map_mode = gfx::EnvMapMapping::CubeUVReflection;

    // no height, no defines.
    TEST_REQUIRE(!base::Contains(pp.GenerateFragmentPrefix(config), "CUBEUV_"));

    config.env_map_cube_uv_height = 256u;
    auto fragment = pp.GenerateFragmentPrefix(config);
    TEST_REQUIRE(base::Contains(fragment, "#define ENVMAP_TYPE_CUBE_UV\n"));
    TEST_REQUIRE(base::Contains(fragment, "#define CUBEUV_TEXEL_WIDTH 0.00297619048\n"));
    TEST_REQUIRE(base::Contains(fragment, "#define CUBEUV_TEXEL_HEIGHT 0.00390625\n"));
    TEST_REQUIRE(base::Contains(fragment, "#define CUBEUV_MAX_MIP 6.0\n"));
    TEST_REQUIRE(CountWarnings(logger, "Cube UV") == 0);

    // not a power of two
    config.env_map_cube_uv_height = 300u;
    fragment = pp.GenerateFragmentPrefix(config);
    TEST_REQUIRE(base::Contains(fragment, "#define CUBEUV_MAX_MIP 6.0\n"));
    TEST_REQUIRE(CountWarnings(logger, "power of two") == 1);

    // small heights clamp the mip count to zero.
    config.env_map_cube_uv_height = 2u;
    fragment = pp.GenerateFragmentPrefix(config);
    TEST_REQUIRE(base::Contains(fragment, "#define CUBEUV_MAX_MIP 0.0\n"));
    TEST_REQUIRE(base::Contains(fragment, "#define CUBEUV_TEXEL_HEIGHT 0.5\n"));

    // zero height is ignored.
    config.env_map_cube_uv_height = 0u;
    fragment = pp.GenerateFragmentPrefix(config);
    TEST_REQUIRE(!base::Contains(fragment, "CUBEUV_"));
    TEST_REQUIRE(CountWarnings(logger, "zero height") == 1);

    base::SetGlobalLog(nullptr);
}

void unit_test_prologue_functions()
{
    TEST_CASE(test::Type::Feature)

    using pp = gfx::ShaderPreprocessor;

    const auto& precision = pp::GeneratePrecision(gfx::ShaderPrecision::High);
    TEST_REQUIRE(precision.find("precision highp float;\n\tprecision highp int;\n") == 0);
    TEST_REQUIRE(base::Contains(precision, "\tprecision highp usampler2DArray;\n\t\n#define HIGH_PRECISION"));
    TEST_REQUIRE(base::Contains(pp::GeneratePrecision(gfx::ShaderPrecision::Medium), "precision mediump sampler2D;"));
    TEST_REQUIRE(base::Contains(pp::GeneratePrecision(gfx::ShaderPrecision::Low), "#define LOW_PRECISION"));

    TEST_REQUIRE(pp::GenerateToneMappingFunction("toneMapping", gfx::ToneMapping::ACESFilmic) ==
                 "vec3 toneMapping( vec3 color ) { return ACESFilmicToneMapping( color ); }");
    TEST_REQUIRE(pp::GenerateToneMappingFunction("toneMapping", gfx::ToneMapping::Custom) ==
                 "vec3 toneMapping( vec3 color ) { return CustomToneMapping( color ); }");

    auto config = MakeConfig();
    TEST_REQUIRE(pp::GenerateVertexExtensions(config) == "");
    config.extension_clip_cull_distance = true;
    config.extension_multi_draw = true;
    TEST_REQUIRE(pp::GenerateVertexExtensions(config) ==
                 "#extension GL_ANGLE_clip_cull_distance : require\n"
                 "#extension GL_ANGLE_multi_draw : require");

    config = MakeConfig();
    TEST_REQUIRE(pp::GenerateVersionString(config) == "#version 300 es\n");
    config.is_raw = true;
    TEST_REQUIRE(pp::GenerateVersionString(config) == "");
    config.glsl_version = gfx::GLSLVersion::GLSL1;
    TEST_REQUIRE(pp::GenerateVersionString(config) == "#version 100\n");
    config.glsl_version = gfx::GLSLVersion::GLSL3;
    TEST_REQUIRE(pp::GenerateVersionString(config) == "#version 300 es\n");
}

void unit_test_color_space()
{
    TEST_CASE(test::Type::Feature)

    TEST_REQUIRE(gfx::GenerateTexelEncodingFunction("linearToOutputTexel", gfx::ColorSpace::SRGB) ==
        "vec4 linearToOutputTexel( vec4 value ) {\n"
        "\treturn sRGBTransferOETF( vec4( value.rgb * mat3( 1.0000,0.0000,0.0000,0.0000,1.0000,0.0000,0.0000,0.0000,1.0000 ), value.a ) );\n"
        "}");
    TEST_REQUIRE(gfx::GenerateTexelEncodingFunction("linearToOutputTexel", gfx::ColorSpace::LinearSRGB) ==
        "vec4 linearToOutputTexel( vec4 value ) {\n"
        "\treturn LinearTransferOETF( vec4( value.rgb * mat3( 1.0000,0.0000,0.0000,0.0000,1.0000,0.0000,0.0000,0.0000,1.0000 ), value.a ) );\n"
        "}");

    // Display P3 output needs a real conversion.
    const auto& p3 = gfx::GenerateTexelEncodingFunction("linearToOutputTexel", gfx::ColorSpace::DisplayP3);
    TEST_REQUIRE(base::Contains(p3, "sRGBTransferOETF"));
    TEST_REQUIRE(!base::Contains(p3, "mat3( 1.0000,0.0000,0.0000,"));
    TEST_REQUIRE(base::Contains(p3, "mat3( 0.822"));

    const auto& m = gfx::GetColorConversionMatrix(gfx::ColorSpace::LinearSRGB, gfx::ColorSpace::SRGB);
    TEST_REQUIRE(m == glm::mat3(1.0f));

    TEST_REQUIRE(gfx::GetColorTransfer(gfx::ColorSpace::SRGB) == gfx::ColorTransfer::SRGB);
    TEST_REQUIRE(gfx::GetColorTransfer(gfx::ColorSpace::LinearDisplayP3) == gfx::ColorTransfer::Linear);
    TEST_REQUIRE(gfx::IsSupportedColorSpace(gfx::ColorSpace::NoColorSpace) == false);

    TEST_REQUIRE(base::Contains(gfx::GenerateLuminanceFunction(), "vec3( 0.2126, 0.7152, 0.0722 )"));
}

void unit_test_preprocess()
{
    TEST_CASE(test::Type::Feature)

    gfx::ShaderLibrary library = gfx::ShaderLibrary::CreateDefault();
    library.AddChunk("common", "#define PI 3.141592653589793");
    library.AddChunk("lights_pars", "uniform DirectionalLight directionalLights[ NUM_DIR_LIGHTS ];");
    gfx::ShaderPreprocessor pp(library);

    gfx::ShaderTemplate vertex;
    vertex.id = "basic";
    vertex.source = "#include <common>\nvoid main() {\n\tgl_Position = vec4(position, 1.0);\n}\n";

    gfx::ShaderTemplate fragment;
    fragment.id = "basic";
    fragment.source =
        "#include <common>\n"
        "#include <lights_pars>\n"
        "void main() {\n"
        "\t#pragma unroll_loop_start\n"
        "\tfor ( int i = 0; i < NUM_DIR_LIGHTS; i ++ ) {\n"
        "\t\tcolor += directionalLights[ i ].color;\n"
        "\t}\n"
        "\t#pragma unroll_loop_end\n"
        "\tgl_FragColor = vec4(color, 1.0);\n"
        "}\n";

    auto config = MakeConfig();
    config.num_dir_lights = 2;

    // determinism
    {
        const auto& a = pp.Preprocess(fragment, gfx::ShaderStage::Fragment, config);
        const auto& b = pp.Preprocess(fragment, gfx::ShaderStage::Fragment, config);
        TEST_REQUIRE(a.GetSource() == b.GetSource());
        TEST_REQUIRE(a.version == "#version 300 es\n");
        TEST_REQUIRE(a.GetSource() == a.version + a.prefix + a.body);

        // the light count is replaced before the loop is unrolled.
        TEST_REQUIRE(base::Contains(a.body, "#define PI 3.141592653589793"));
        TEST_REQUIRE(base::Contains(a.body, "directionalLights[ 2 ];"));
        TEST_REQUIRE(base::Contains(a.body, "color += directionalLights[ 0 ].color;"));
        TEST_REQUIRE(base::Contains(a.body, "color += directionalLights[ 1 ].color;"));
        TEST_REQUIRE(!base::Contains(a.body, "#pragma"));
        TEST_REQUIRE(!base::Contains(a.body, "#include"));

        // compatibility layer
        TEST_REQUIRE(a.prefix.find("#define varying in\n") == 0);
        TEST_REQUIRE(base::Contains(a.prefix, "layout(location = 0) out highp vec4 pc_fragColor;\n#define gl_FragColor pc_fragColor\n"));
        TEST_REQUIRE(base::Contains(a.prefix, "#define SHADER_NAME Crate\n"));
        TEST_REQUIRE(base::Contains(a.prefix, "vec4 linearToOutputTexel( vec4 value )"));
        TEST_REQUIRE(base::Contains(a.prefix, "float luminance( const in vec3 rgb )"));
    }

    // different configuration gives different source.
    {
        auto other = config;
        other.dithering = true;
        const auto& a = pp.Preprocess(fragment, gfx::ShaderStage::Fragment, config);
        const auto& b = pp.Preprocess(fragment, gfx::ShaderStage::Fragment, other);
        TEST_REQUIRE(a.GetSource() != b.GetSource());
        TEST_REQUIRE(a.body == b.body);
        TEST_REQUIRE(base::Contains(b.prefix, "#define DITHERING\n"));
    }

    // vertex stage
    {
        config.extension_multi_draw = true;
        const auto& v = pp.Preprocess(vertex, gfx::ShaderStage::Vertex, config);
        TEST_REQUIRE(v.prefix.find("#extension GL_ANGLE_multi_draw : require\n#define attribute in\n#define varying out\n") == 0);
        TEST_REQUIRE(base::Contains(v.prefix, "precision highp float;"));
        TEST_REQUIRE(base::Contains(v.prefix, "uniform mat4 modelViewMatrix;\n"));
        TEST_REQUIRE(base::Contains(v.prefix, "attribute vec3 position;\n"));
        TEST_REQUIRE(v.body.find("#define PI") == 0);
    }

    // GLSL3 templates declare their own outputs.
    {
        auto glsl3 = config;
        glsl3.glsl_version = gfx::GLSLVersion::GLSL3;
        const auto& f = pp.Preprocess(fragment, gfx::ShaderStage::Fragment, glsl3);
        TEST_REQUIRE(!base::Contains(f.prefix, "pc_fragColor"));
        TEST_REQUIRE(f.prefix.find("#define varying in\n\n\n#define gl_FragDepthEXT gl_FragDepth\n") == 0);
    }

    // raw shaders only get the minimal prefix.
    {
        auto raw = MakeConfig();
        raw.is_raw = true;
        raw.glsl_version = gfx::GLSLVersion::GLSL3;
        raw.AddDefine("FOO", 1);
        const auto& f = pp.Preprocess(fragment, gfx::ShaderStage::Fragment, raw);
        TEST_REQUIRE(f.version == "#version 300 es\n");
        TEST_REQUIRE(f.prefix == "#define SHADER_TYPE MeshStandardMaterial\n#define SHADER_NAME Crate\n#define FOO 1\n");
        // the substitutions still apply to the body, no lights in a raw config.
        TEST_REQUIRE(base::Contains(f.body, "directionalLights[ 0 ];"));
        TEST_REQUIRE(!base::Contains(f.body, "color += directionalLights"));
    }

    // missing chunks propagate out.
    {
        gfx::ShaderTemplate broken;
        broken.id = "broken";
        broken.source = "#include <nope>\n";
        TEST_EXCEPTION(pp.Preprocess(broken, gfx::ShaderStage::Vertex, config));
    }

    // the prologue chunks fall back to the built-in source when the
    // library doesn't have them, so only includes in the body can fail.
    {
        gfx::ShaderLibrary minimal;
        minimal.AddChunk("common", "#define PI 3.141592653589793");
        minimal.AddChunk("lights_pars", "uniform DirectionalLight directionalLights[ NUM_DIR_LIGHTS ];");
        gfx::ShaderPreprocessor other(minimal);

        auto mapped = config;
        mapped.tone_mapping = gfx::ToneMapping::ACESFilmic;
        const auto& a = other.Preprocess(fragment, gfx::ShaderStage::Fragment, mapped);
        const auto& b = pp.Preprocess(fragment, gfx::ShaderStage::Fragment, mapped);
        TEST_REQUIRE(a.GetSource() == b.GetSource());
        TEST_REQUIRE(base::Contains(a.prefix, "sRGBTransferOETF"));
        TEST_REQUIRE(base::Contains(a.prefix, "ACESFilmicToneMapping"));

        // a library chunk replaces the built-in one.
        minimal.AddChunk("colorspace_pars_fragment", "// custom transfer functions");
        const auto& c = other.Preprocess(fragment, gfx::ShaderStage::Fragment, config);
        TEST_REQUIRE(base::Contains(c.prefix, "// custom transfer functions"));
        TEST_REQUIRE(!base::Contains(c.prefix, "vec4 sRGBTransferOETF"));
    }
}

void unit_test_cache_key()
{
    TEST_CASE(test::Type::Feature)

    auto a = MakeConfig();
    auto b = MakeConfig();
    TEST_REQUIRE(a == b);
    TEST_REQUIRE(a.GetCacheKey() == b.GetCacheKey());

    // the key only depends on the values.
    a.AddDefine("FOO", 1);
    TEST_REQUIRE(a != b);
    TEST_REQUIRE(a.GetCacheKey() != b.GetCacheKey());
    b.AddDefine("FOO", 1);
    TEST_REQUIRE(a == b);
    TEST_REQUIRE(a.GetCacheKey() == b.GetCacheKey());
    TEST_REQUIRE(a.GetCacheKey().find("FOO,1,") == 0);

    b.use_fog = true;
    TEST_REQUIRE(a.GetCacheKey() != b.GetCacheKey());
    b.use_fog = false;

    b.SetMap(gfx::TextureMap::AoMap);
    TEST_REQUIRE(a.GetCacheKey() != b.GetCacheKey());
    b.SetMap(gfx::TextureMap::AoMap, false);
    TEST_REQUIRE(a.GetCacheKey() == b.GetCacheKey());

    b.num_point_lights = 1;
    TEST_REQUIRE(a.GetCacheKey() != b.GetCacheKey());
    b.num_point_lights = 0;

    b.custom_program_cache_key = "outline";
    TEST_REQUIRE(a.GetCacheKey() != b.GetCacheKey());
    TEST_REQUIRE(b.GetCacheKey().substr(b.GetCacheKey().size() - 8) == ",outline");
    b.custom_program_cache_key.clear();

    // the name is not part of the key
    b.shader_name = "Barrel";
    TEST_REQUIRE(a != b);
    TEST_REQUIRE(a.GetCacheKey() == b.GetCacheKey());

    // raw configurations only use the defines, the custom key and the
    // parameters that still change a raw program.
    gfx::FeatureConfiguration raw;
    raw.is_raw = true;
    raw.AddDefine("X", true);
    raw.custom_program_cache_key = "k";
    const auto raw_key = raw.GetCacheKey();
    TEST_REQUIRE(raw_key.find("X,true,") == 0);
    TEST_REQUIRE(raw_key.substr(raw_key.size() - 2) == ",k");
    raw.use_fog = true;
    raw.dithering = true;
    raw.tone_mapping = gfx::ToneMapping::AgX;
    TEST_REQUIRE(raw.GetCacheKey() == raw_key);
    raw.glsl_version = gfx::GLSLVersion::GLSL3;
    TEST_REQUIRE(raw.GetCacheKey() != raw_key);
    raw.glsl_version = gfx::GLSLVersion::Unspecified;
    raw.num_dir_lights = 1;
    TEST_REQUIRE(raw.GetCacheKey() != raw_key);
    raw.num_dir_lights = 0;
    raw.num_clipping_planes = 2;
    TEST_REQUIRE(raw.GetCacheKey() != raw_key);
    raw.num_clipping_planes = 0;
    TEST_REQUIRE(raw.GetCacheKey() == raw_key);
}

EXPORT_TEST_MAIN(
int test_main(int argc, char* argv[])
{
    unit_test_library();
    unit_test_includes();
    unit_test_unroll();
    unit_test_replace_nums();
    unit_test_defines();
    unit_test_feature_gating();
    unit_test_cube_uv();
    unit_test_prologue_functions();
    unit_test_color_space();
    unit_test_preprocess();
    unit_test_cache_key();
    return 0;
}
) // TEST_MAIN
