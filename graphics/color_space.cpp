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

#include "warnpush.h"
#  include <glm/mat3x3.hpp>
#  include <glm/vec3.hpp>
#include "warnpop.h"

#include <vector>

#include "base/format.h"
#include "base/logging.h"
#include "graphics/color_space.h"

namespace {
// glm matrices are column major so the constructor arguments are
// given one column at a time.
const glm::mat3 LinearRec709ToXYZ(
    0.4123908f, 0.2126390f, 0.0193308f,
    0.3575843f, 0.7151687f, 0.1191948f,
    0.1804808f, 0.0721923f, 0.9505322f);

const glm::mat3 XYZToLinearRec709(
     3.2409699f, -0.9692436f,  0.0556301f,
    -1.5373832f,  1.8759675f, -0.2039770f,
    -0.4986108f,  0.0415551f,  1.0569715f);

const glm::mat3 LinearP3ToXYZ(
    0.4865709f, 0.2289746f, 0.0000000f,
    0.2656677f, 0.6917385f, 0.0451134f,
    0.1982173f, 0.0792869f, 1.0439444f);

const glm::mat3 XYZToLinearP3(
     2.4934969f, -0.8294890f,  0.0358458f,
    -0.9313836f,  1.7626641f, -0.0761724f,
    -0.4027108f,  0.0236247f,  0.9568845f);

const glm::vec3 Rec709LuminanceCoefficients(0.2126f, 0.7152f, 0.0722f);
const glm::vec3 P3LuminanceCoefficients(0.2289f, 0.6917f, 0.0793f);

bool IsP3(gfx::ColorSpace space)
{
    return space == gfx::ColorSpace::DisplayP3 ||
           space == gfx::ColorSpace::LinearDisplayP3;
}

glm::mat3 GetToXYZ(gfx::ColorSpace space)
{ return IsP3(space) ? LinearP3ToXYZ : LinearRec709ToXYZ; }
glm::mat3 GetFromXYZ(gfx::ColorSpace space)
{ return IsP3(space) ? XYZToLinearP3 : XYZToLinearRec709; }

} // namespace

namespace gfx
{

bool IsSupportedColorSpace(ColorSpace space) noexcept
{
    return space == ColorSpace::LinearSRGB ||
           space == ColorSpace::SRGB ||
           space == ColorSpace::LinearDisplayP3 ||
           space == ColorSpace::DisplayP3;
}

ColorTransfer GetColorTransfer(ColorSpace space) noexcept
{
    if (space == ColorSpace::SRGB || space == ColorSpace::DisplayP3)
        return ColorTransfer::SRGB;
    return ColorTransfer::Linear;
}

glm::mat3 GetColorConversionMatrix(ColorSpace source, ColorSpace target)
{
    if (!IsSupportedColorSpace(source) || !IsSupportedColorSpace(target))
        return glm::mat3(1.0f);
    // same primaries, only the transfer differs.
    if (IsP3(source) == IsP3(target))
        return glm::mat3(1.0f);
    return GetFromXYZ(target) * GetToXYZ(source);
}

glm::vec3 GetLuminanceCoefficients(ColorSpace space)
{
    return IsP3(space) ? P3LuminanceCoefficients : Rec709LuminanceCoefficients;
}

std::string GenerateTexelEncodingFunction(const std::string& function_name, ColorSpace output_space)
{
    const auto& matrix = GetColorConversionMatrix(WorkingColorSpace, output_space);

    std::vector<std::string> elements;
    for (int col=0; col<3; ++col)
    {
        for (int row=0; row<3; ++row)
            elements.push_back(base::ToChars(matrix[col][row], 4));
    }

    std::string transfer = "LinearTransferOETF";
    if (!IsSupportedColorSpace(output_space))
        WARN("Unsupported output color space. [space=%1]", ToString(output_space));
    else if (GetColorTransfer(output_space) == ColorTransfer::SRGB)
        transfer = "sRGBTransferOETF";

    std::string ret;
    ret += "vec4 " + function_name + "( vec4 value ) {\n";
    ret += "\treturn " + transfer + "( vec4( value.rgb * mat3( " + base::JoinString(elements, ",") + " ), value.a ) );\n";
    ret += "}";
    return ret;
}

std::string GenerateLuminanceFunction()
{
    const auto& weights = GetLuminanceCoefficients(WorkingColorSpace);
    std::string ret;
    ret += "float luminance( const in vec3 rgb ) {\n";
    ret += base::FormatString("\tconst vec3 weights = vec3( %1, %2, %3 );\n",
                              base::ToChars(weights.x, 4),
                              base::ToChars(weights.y, 4),
                              base::ToChars(weights.z, 4));
    ret += "\treturn dot( weights, rgb );\n";
    ret += "}";
    return ret;
}

const char* ToString(ColorSpace space)
{
    switch (space)
    {
        case ColorSpace::NoColorSpace:    return "NoColorSpace";
        case ColorSpace::LinearSRGB:      return "LinearSRGB";
        case ColorSpace::SRGB:            return "SRGB";
        case ColorSpace::LinearDisplayP3: return "LinearDisplayP3";
        case ColorSpace::DisplayP3:       return "DisplayP3";
    }
    return "???";
}

} // namespace
