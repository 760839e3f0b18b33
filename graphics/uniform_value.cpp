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
#  include <glm/gtc/type_ptr.hpp>
#include "warnpop.h"

#include <stdexcept>

#include "base/format.h"
#include "graphics/uniform_value.h"

namespace {
template<typename T, typename Vector>
void Append(const Vector& vector, int components, std::vector<T>* out)
{
    for (int i=0; i<components; ++i)
        out->push_back(static_cast<T>(vector[i]));
}

template<typename T, typename Matrix>
void AppendMatrix(const Matrix& matrix, std::vector<T>* out)
{
    const auto* ptr = glm::value_ptr(matrix);
    const auto size = sizeof(Matrix) / sizeof(float);
    for (std::size_t i=0; i<size; ++i)
        out->push_back(static_cast<T>(ptr[i]));
}

template<typename T>
bool Flatten(const gfx::UniformValue& value, std::vector<T>* out)
{
    if (const auto* ptr = value.GetIf<bool>())
        out->push_back(static_cast<T>(*ptr ? 1 : 0));
    else if (const auto* ptr = value.GetIf<int>())
        out->push_back(static_cast<T>(*ptr));
    else if (const auto* ptr = value.GetIf<unsigned>())
        out->push_back(static_cast<T>(*ptr));
    else if (const auto* ptr = value.GetIf<float>())
        out->push_back(static_cast<T>(*ptr));
    else if (const auto* ptr = value.GetIf<glm::vec2>())
        Append(*ptr, 2, out);
    else if (const auto* ptr = value.GetIf<glm::vec3>())
        Append(*ptr, 3, out);
    else if (const auto* ptr = value.GetIf<glm::vec4>())
        Append(*ptr, 4, out);
    else if (const auto* ptr = value.GetIf<glm::ivec2>())
        Append(*ptr, 2, out);
    else if (const auto* ptr = value.GetIf<glm::ivec3>())
        Append(*ptr, 3, out);
    else if (const auto* ptr = value.GetIf<glm::ivec4>())
        Append(*ptr, 4, out);
    else if (const auto* ptr = value.GetIf<glm::uvec2>())
        Append(*ptr, 2, out);
    else if (const auto* ptr = value.GetIf<glm::uvec3>())
        Append(*ptr, 3, out);
    else if (const auto* ptr = value.GetIf<glm::uvec4>())
        Append(*ptr, 4, out);
    else if (const auto* ptr = value.GetIf<glm::mat2>())
        AppendMatrix(*ptr, out);
    else if (const auto* ptr = value.GetIf<glm::mat3>())
        AppendMatrix(*ptr, out);
    else if (const auto* ptr = value.GetIf<glm::mat4>())
        AppendMatrix(*ptr, out);
    else if (const auto* ptr = value.GetIf<std::vector<float>>())
    {
        for (auto f : *ptr)
            out->push_back(static_cast<T>(f));
    }
    else if (const auto* ptr = value.GetIf<std::vector<int>>())
    {
        for (auto i : *ptr)
            out->push_back(static_cast<T>(i));
    }
    else if (value.IsArray())
    {
        for (std::size_t i=0; i<value.GetArraySize(); ++i)
        {
            if (!Flatten(value.At(i), out))
                return false;
        }
    }
    else return false;
    return true;
}

} // namespace

namespace gfx
{

std::size_t UniformValue::GetArraySize() const noexcept
{
    if (const auto* ptr = std::get_if<std::shared_ptr<const UniformArray>>(&mValue))
        return (*ptr)->size();
    return 0;
}

const UniformValue& UniformValue::At(std::size_t index) const
{
    const auto* ptr = std::get_if<std::shared_ptr<const UniformArray>>(&mValue);
    if (ptr == nullptr)
        throw std::out_of_range("Uniform value is not an array.");

    const auto& array = **ptr;
    if (index >= array.size())
        throw std::out_of_range(base::FormatString("Uniform array index %1 is out of range (size %2).",
                                                   index, array.size()));
    return array[index];
}

const UniformValue* UniformValue::FindMember(const std::string& name) const
{
    const auto* ptr = std::get_if<std::shared_ptr<const UniformObject>>(&mValue);
    if (ptr == nullptr)
        return nullptr;

    const auto& object = **ptr;
    auto it = object.find(name);
    if (it == object.end())
        return nullptr;
    return &it->second;
}

bool UniformValue::FlattenFloat(std::vector<float>* out) const
{
    return Flatten(*this, out);
}
bool UniformValue::FlattenInt(std::vector<int>* out) const
{
    return Flatten(*this, out);
}
bool UniformValue::FlattenUint(std::vector<unsigned>* out) const
{
    return Flatten(*this, out);
}

} // namespace
