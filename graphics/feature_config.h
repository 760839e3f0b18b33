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

#include <array>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "base/bitflag.h"
#include "graphics/color_space.h"

namespace gfx
{
    enum class ShaderPrecision {
        Low, Medium, High
    };

    enum class GLSLVersion {
        // No version line is written for raw templates. Built-in templates
        // always get "#version 300 es".
        Unspecified,
        // GLSL ES 1.00
        GLSL1,
        // GLSL ES 3.00
        GLSL3
    };

    enum class ToneMapping {
        None, Linear, Reinhard, Cineon, ACESFilmic, AgX, Neutral, Custom
    };

    enum class ShadowMapType {
        Basic, PCF, PCFSoft, VSM
    };

    enum class EnvMapMapping {
        CubeReflection, CubeRefraction, CubeUVReflection
    };

    enum class EnvMapCombine {
        None, Multiply, Mix, Add
    };

    // Texture maps that a material can sample. The maps up to and
    // including ThicknessMap can select their texture coordinate channel.
    enum class TextureMap : unsigned {
        Map,
        AlphaMap,
        LightMap,
        AoMap,
        EmissiveMap,
        BumpMap,
        NormalMap,
        DisplacementMap,
        MetalnessMap,
        RoughnessMap,
        AnisotropyMap,
        ClearcoatMap,
        ClearcoatNormalMap,
        ClearcoatRoughnessMap,
        IridescenceMap,
        IridescenceThicknessMap,
        SheenColorMap,
        SheenRoughnessMap,
        SpecularMap,
        SpecularColorMap,
        SpecularIntensityMap,
        TransmissionMap,
        ThicknessMap,
        Matcap,
        EnvMap,
        GradientMap
    };
    constexpr unsigned NumUvTextureMaps = static_cast<unsigned>(TextureMap::ThicknessMap) + 1;

    // Value of a user defined preprocessor symbol. A false boolean
    // omits the symbol completely.
    using DefineValue = std::variant<bool, int, float, std::string>;

    struct ShaderDefine {
        std::string name;
        DefineValue value;
    };

    // The full set of parameters that selects one variant of a shader
    // template. Every parameter ends up either in the generated prologue
    // or in the substitutions done on the template body.
    struct FeatureConfiguration {
        // identity, written as SHADER_TYPE and SHADER_NAME
        std::string shader_type;
        std::string shader_name;
        // Raw templates get only the identity and the user defines as the
        // prologue. No precision, feature defines or compatibility layer.
        bool is_raw = false;
        GLSLVersion glsl_version = GLSLVersion::Unspecified;
        // user defines in the order they were added.
        std::vector<ShaderDefine> defines;
        ShaderPrecision precision = ShaderPrecision::High;

        bool extension_clip_cull_distance = false;
        bool extension_multi_draw = false;

        bool batching = false;
        bool batching_color = false;
        bool instancing = false;
        bool instancing_color = false;
        bool instancing_morph = false;

        bool use_fog = false;
        bool fog = false;
        bool fog_exp2 = false;

        base::bitflag<TextureMap> maps;
        // texture coordinate channel name per map, for example "uv" or "uv1".
        // An empty name writes no channel define.
        std::array<std::string, NumUvTextureMaps> map_uv;

        EnvMapMapping env_map_mode = EnvMapMapping::CubeReflection;
        EnvMapCombine env_map_combine = EnvMapCombine::None;
        // height of the pre-filtered cube UV environment map in texels.
        std::optional<unsigned> env_map_cube_uv_height;

        bool normal_map_object_space = false;
        bool normal_map_tangent_space = false;
        bool anisotropy = false;
        bool clearcoat = false;
        bool dispersion = false;
        bool iridescence = false;
        bool sheen = false;
        bool transmission = false;
        bool alpha_test = false;
        bool alpha_hash = false;
        bool alpha_to_coverage = false;
        bool premultiplied_alpha = false;
        bool opaque = false;

        bool vertex_tangents = false;
        bool vertex_colors = false;
        bool vertex_alphas = false;
        bool vertex_uv1s = false;
        bool vertex_uv2s = false;
        bool vertex_uv3s = false;
        bool points_uvs = false;
        bool flat_shading = false;
        bool double_sided = false;
        bool flip_sided = false;
        bool size_attenuation = false;

        bool skinning = false;
        bool morph_targets = false;
        bool morph_normals = false;
        bool morph_colors = false;
        unsigned morph_targets_count = 0;
        unsigned morph_texture_stride = 0;

        bool shadow_map_enabled = false;
        ShadowMapType shadow_map_type = ShadowMapType::Basic;

        unsigned num_dir_lights = 0;
        unsigned num_point_lights = 0;
        unsigned num_spot_lights = 0;
        unsigned num_spot_light_maps = 0;
        unsigned num_rect_area_lights = 0;
        unsigned num_hemi_lights = 0;
        unsigned num_dir_light_shadows = 0;
        unsigned num_point_light_shadows = 0;
        unsigned num_spot_light_shadows = 0;
        unsigned num_spot_light_shadows_with_maps = 0;
        unsigned num_light_probes = 0;
        unsigned num_clipping_planes = 0;
        unsigned num_clip_intersection = 0;

        bool logarithmic_depth_buffer = false;
        bool reversed_depth_buffer = false;
        bool use_depth_packing = false;
        int depth_packing = 0;

        ToneMapping tone_mapping = ToneMapping::None;
        ColorSpace output_color_space = ColorSpace::SRGB;
        bool dithering = false;

        bool decode_video_texture = false;
        bool decode_video_texture_emissive = false;

        // Attribute to bind to location 0 before linking. When empty and
        // morph targets are used "position" is bound to location 0.
        std::string index0_attribute_name;
        // Extra discriminator appended to the cache key.
        std::string custom_program_cache_key;

        inline bool HasMap(TextureMap map) const noexcept
        { return maps.test(map); }
        inline void SetMap(TextureMap map, bool on = true) noexcept
        { maps.set(map, on); }
        inline void SetMapUv(TextureMap map, std::string channel)
        { map_uv[static_cast<unsigned>(map)] = std::move(channel); }
        inline const std::string& GetMapUv(TextureMap map) const
        { return map_uv[static_cast<unsigned>(map)]; }

        inline void AddDefine(std::string name, DefineValue value)
        { defines.push_back({std::move(name), std::move(value)}); }

        // Compute the deterministic key that identifies the program variant
        // that these parameters produce. Two configurations that compare
        // equal always produce the same key.
        std::string GetCacheKey() const;
    };

    bool operator==(const ShaderDefine& lhs, const ShaderDefine& rhs);
    bool operator==(const FeatureConfiguration& lhs, const FeatureConfiguration& rhs);
    bool operator!=(const FeatureConfiguration& lhs, const FeatureConfiguration& rhs);

    // Format a define value the way it is written into the source.
    std::string ToString(const DefineValue& value);
    const char* ToString(ShaderPrecision precision);
    const char* ToString(ToneMapping mapping);

} // namespace
