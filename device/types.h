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

#include <string>

#include "device/enum.h"

namespace dev
{
    struct GraphicsDeviceCaps {
        // number of texture units available for the fragment shader.
        unsigned num_texture_units = 0;
        // KHR_parallel_shader_compile, program completion can be polled
        // without blocking.
        bool parallel_shader_compile = false;
        // ANGLE_clip_cull_distance
        bool clip_cull_distance = false;
        // ANGLE_multi_draw
        bool multi_draw = false;
    };

    // Active uniform as reported by the linked program.
    // Array uniforms are reported once with the name of the first
    // element, i.e. "foo[0]", and the size of the array.
    struct ActiveUniform {
        std::string name;
        UniformType type = UniformType::Float;
        unsigned size = 1;
        int location = -1;
    };

    // Active vertex attribute as reported by the linked program.
    struct ActiveAttribute {
        std::string name;
        UniformType type = UniformType::Float;
        unsigned size = 1;
        int location = -1;
    };

} // dev
