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
#include <vector>

#include "base/assert.h"
#include "base/format.h"
#include "graphics/feature_config.h"

namespace {
using namespace gfx;

// Every value parameter that selects a different variant, in a fixed order.
std::vector<std::string> CollectParameters(const FeatureConfiguration& config)
{
    std::vector<std::string> ret;
    ret.push_back(ToString(config.output_color_space));
    for (const auto& uv : config.map_uv)
        ret.push_back(uv);
    ret.push_back(base::ToString(config.env_map_mode));
    ret.push_back(base::ToString(config.env_map_combine));
    ret.push_back(config.env_map_cube_uv_height.has_value()
                  ? base::ToString(config.env_map_cube_uv_height.value()) : "-");
    ret.push_back(base::ToString(config.morph_targets_count));
    ret.push_back(base::ToString(config.morph_texture_stride));
    ret.push_back(base::ToString(config.num_dir_lights));
    ret.push_back(base::ToString(config.num_point_lights));
    ret.push_back(base::ToString(config.num_spot_lights));
    ret.push_back(base::ToString(config.num_spot_light_maps));
    ret.push_back(base::ToString(config.num_rect_area_lights));
    ret.push_back(base::ToString(config.num_hemi_lights));
    ret.push_back(base::ToString(config.num_dir_light_shadows));
    ret.push_back(base::ToString(config.num_point_light_shadows));
    ret.push_back(base::ToString(config.num_spot_light_shadows));
    ret.push_back(base::ToString(config.num_spot_light_shadows_with_maps));
    ret.push_back(base::ToString(config.num_light_probes));
    ret.push_back(base::ToString(config.num_clipping_planes));
    ret.push_back(base::ToString(config.num_clip_intersection));
    ret.push_back(base::ToString(config.depth_packing));
    ret.push_back(ToString(config.tone_mapping));
    ret.push_back(ToString(config.precision));
    ret.push_back(base::ToString(config.glsl_version));
    ret.push_back(base::ToString(config.shadow_map_type));
    ret.push_back(config.index0_attribute_name);
    return ret;
}

// The parameters that still change the source of a raw template. Raw
// templates get the version line, the light and clipping plane count
// substitutions and the attribute 0 binding but no feature defines.
std::vector<std::string> CollectRawParameters(const FeatureConfiguration& config)
{
    std::vector<std::string> ret;
    ret.push_back(base::ToString(config.glsl_version));
    ret.push_back(base::ToString(config.num_dir_lights));
    ret.push_back(base::ToString(config.num_point_lights));
    ret.push_back(base::ToString(config.num_spot_lights));
    ret.push_back(base::ToString(config.num_spot_light_maps));
    ret.push_back(base::ToString(config.num_rect_area_lights));
    ret.push_back(base::ToString(config.num_hemi_lights));
    ret.push_back(base::ToString(config.num_dir_light_shadows));
    ret.push_back(base::ToString(config.num_point_light_shadows));
    ret.push_back(base::ToString(config.num_spot_light_shadows));
    ret.push_back(base::ToString(config.num_spot_light_shadows_with_maps));
    ret.push_back(base::ToString(config.num_clipping_planes));
    ret.push_back(base::ToString(config.num_clip_intersection));
    // attribute bound to location 0 before linking.
    ret.push_back(config.index0_attribute_name);
    ret.push_back(base::ToString(config.morph_targets));
    return ret;
}

// Every boolean flag, in a fixed order.
std::vector<bool> CollectFlags(const FeatureConfiguration& config)
{
    return {
        config.extension_clip_cull_distance,
        config.extension_multi_draw,
        config.batching,
        config.batching_color,
        config.instancing,
        config.instancing_color,
        config.instancing_morph,
        config.use_fog,
        config.fog,
        config.fog_exp2,
        config.normal_map_object_space,
        config.normal_map_tangent_space,
        config.anisotropy,
        config.clearcoat,
        config.dispersion,
        config.iridescence,
        config.sheen,
        config.transmission,
        config.alpha_test,
        config.alpha_hash,
        config.alpha_to_coverage,
        config.premultiplied_alpha,
        config.opaque,
        config.vertex_tangents,
        config.vertex_colors,
        config.vertex_alphas,
        config.vertex_uv1s,
        config.vertex_uv2s,
        config.vertex_uv3s,
        config.points_uvs,
        config.flat_shading,
        config.double_sided,
        config.flip_sided,
        config.size_attenuation,
        config.skinning,
        config.morph_targets,
        config.morph_normals,
        config.morph_colors,
        config.shadow_map_enabled,
        config.logarithmic_depth_buffer,
        config.reversed_depth_buffer,
        config.use_depth_packing,
        config.dithering,
        config.decode_video_texture,
        config.decode_video_texture_emissive
    };
}

// Pack the flags into 32bit masks.
std::vector<unsigned> PackFlags(const std::vector<bool>& flags)
{
    std::vector<unsigned> masks;
    for (size_t i=0; i<flags.size(); ++i)
    {
        if (i % 32 == 0)
            masks.push_back(0u);
        if (flags[i])
            masks.back() |= (1u << (i % 32));
    }
    return masks;
}

} // namespace

namespace gfx
{

std::string FeatureConfiguration::GetCacheKey() const
{
    std::vector<std::string> parts;
    for (const auto& define : defines)
    {
        parts.push_back(define.name);
        parts.push_back(ToString(define.value));
    }

    if (!is_raw)
    {
        for (auto& param : CollectParameters(*this))
            parts.push_back(std::move(param));
        for (auto mask : PackFlags(CollectFlags(*this)))
            parts.push_back(base::ToString(mask));
        parts.push_back(base::ToString(maps.value()));
    }
    else
    {
        for (auto& param : CollectRawParameters(*this))
            parts.push_back(std::move(param));
    }
    parts.push_back(custom_program_cache_key);
    return base::JoinString(parts, ",");
}

bool operator==(const ShaderDefine& lhs, const ShaderDefine& rhs)
{
    return lhs.name == rhs.name && lhs.value == rhs.value;
}

bool operator==(const FeatureConfiguration& lhs, const FeatureConfiguration& rhs)
{
    if (lhs.shader_type != rhs.shader_type ||
        lhs.shader_name != rhs.shader_name ||
        lhs.is_raw != rhs.is_raw ||
        lhs.custom_program_cache_key != rhs.custom_program_cache_key)
        return false;
    if (lhs.defines != rhs.defines)
        return false;
    if (!(lhs.maps == rhs.maps))
        return false;
    return CollectParameters(lhs) == CollectParameters(rhs) &&
           CollectFlags(lhs) == CollectFlags(rhs);
}

bool operator!=(const FeatureConfiguration& lhs, const FeatureConfiguration& rhs)
{
    return !(lhs == rhs);
}

std::string ToString(const DefineValue& value)
{
    if (const auto* ptr = std::get_if<bool>(&value))
        return *ptr ? "true" : "false";
    else if (const auto* ptr = std::get_if<int>(&value))
        return base::ToChars(*ptr);
    else if (const auto* ptr = std::get_if<float>(&value))
        return base::ToCharsGeneral(*ptr);
    else if (const auto* ptr = std::get_if<std::string>(&value))
        return *ptr;
    BUG("Unhandled define value type.");
    return "";
}

const char* ToString(ShaderPrecision precision)
{
    switch (precision)
    {
        case ShaderPrecision::Low:    return "lowp";
        case ShaderPrecision::Medium: return "mediump";
        case ShaderPrecision::High:   return "highp";
    }
    return "???";
}

const char* ToString(ToneMapping mapping)
{
    switch (mapping)
    {
        case ToneMapping::None:       return "None";
        case ToneMapping::Linear:     return "Linear";
        case ToneMapping::Reinhard:   return "Reinhard";
        case ToneMapping::Cineon:     return "Cineon";
        case ToneMapping::ACESFilmic: return "ACESFilmic";
        case ToneMapping::AgX:        return "AgX";
        case ToneMapping::Neutral:    return "Neutral";
        case ToneMapping::Custom:     return "Custom";
    }
    return "???";
}

} // namespace
