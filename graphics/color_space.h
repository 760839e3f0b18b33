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

#include "warnpush.h"
#  include <glm/mat3x3.hpp>
#  include <glm/vec3.hpp>
#include "warnpop.h"

#include <string>

namespace gfx
{
    enum class ColorSpace {
        // No color management, values are passed through as is.
        NoColorSpace,
        // Rec.709 primaries, D65 white point, linear transfer.
        LinearSRGB,
        // Rec.709 primaries, D65 white point, sRGB transfer.
        SRGB,
        // P3 primaries, D65 white point, linear transfer.
        LinearDisplayP3,
        // P3 primaries, D65 white point, sRGB transfer.
        DisplayP3
    };

    enum class ColorTransfer {
        Linear, SRGB
    };

    // The color space in which the shaders do their lighting computations.
    constexpr ColorSpace WorkingColorSpace = ColorSpace::LinearSRGB;

    // Check whether the color space is one that the color management
    // knows how to convert to and from.
    bool IsSupportedColorSpace(ColorSpace space) noexcept;

    ColorTransfer GetColorTransfer(ColorSpace space) noexcept;

    // Get the matrix that converts linear color values in the source space
    // into linear color values in the target space.
    glm::mat3 GetColorConversionMatrix(ColorSpace source, ColorSpace target);

    // Get the relative luminance weights of the primaries of the color space.
    glm::vec3 GetLuminanceCoefficients(ColorSpace space);

    // Generate a GLSL function with the given name that converts a linear
    // working space color into the output color space. The matrix values
    // are written with 4 decimals in column major order.
    std::string GenerateTexelEncodingFunction(const std::string& function_name, ColorSpace output_space);

    // Generate the GLSL luminance( const in vec3 rgb ) function for the
    // working color space.
    std::string GenerateLuminanceFunction();

    const char* ToString(ColorSpace space);

} // namespace
