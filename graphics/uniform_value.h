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
#  include <glm/vec2.hpp>
#  include <glm/vec3.hpp>
#  include <glm/vec4.hpp>
#  include <glm/mat2x2.hpp>
#  include <glm/mat3x3.hpp>
#  include <glm/mat4x4.hpp>
#include "warnpop.h"

#include <memory>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <variant>
#include <vector>

#include "device/handle.h"

namespace gfx
{
    class UniformValue;

    using UniformArray  = std::vector<UniformValue>;
    using UniformObject = std::unordered_map<std::string, UniformValue>;

    // Engine side value for a uniform. Scalars, glm vectors and matrices,
    // flat numeric sequences, textures and the composite array/object
    // values that structured uniforms and uniform arrays take.
    class UniformValue
    {
    public:
        using Variant = std::variant<std::monostate,
            bool, int, unsigned, float,
            glm::vec2, glm::vec3, glm::vec4,
            glm::ivec2, glm::ivec3, glm::ivec4,
            glm::uvec2, glm::uvec3, glm::uvec4,
            glm::mat2, glm::mat3, glm::mat4,
            std::vector<float>,
            std::vector<int>,
            dev::TextureObject,
            std::shared_ptr<const UniformArray>,
            std::shared_ptr<const UniformObject>>;

        UniformValue() = default;
        template<typename T, typename = std::enable_if_t<
            !std::is_same<std::decay_t<T>, UniformValue>::value>>
        UniformValue(T value) : mValue(std::move(value))
        {}
        UniformValue(UniformArray array)
          : mValue(std::make_shared<const UniformArray>(std::move(array)))
        {}
        UniformValue(UniformObject object)
          : mValue(std::make_shared<const UniformObject>(std::move(object)))
        {}

        inline bool IsEmpty() const noexcept
        { return std::holds_alternative<std::monostate>(mValue); }
        inline bool IsArray() const noexcept
        { return std::holds_alternative<std::shared_ptr<const UniformArray>>(mValue); }
        inline bool IsObject() const noexcept
        { return std::holds_alternative<std::shared_ptr<const UniformObject>>(mValue); }
        inline bool IsTexture() const noexcept
        { return std::holds_alternative<dev::TextureObject>(mValue); }

        template<typename T>
        inline const T* GetIf() const noexcept
        { return std::get_if<T>(&mValue); }
        inline const Variant& GetVariant() const noexcept
        { return mValue; }

        // Number of elements in an array value, 0 for anything else.
        std::size_t GetArraySize() const noexcept;
        // Access an array element. Throws std::out_of_range if the value is
        // not an array or the index is past the end.
        const UniformValue& At(std::size_t index) const;
        // Find an object member. Returns nullptr if the value is not an
        // object or there's no such member.
        const UniformValue* FindMember(const std::string& name) const;

        // Write the numeric content of the value into the vector as floats.
        // Arrays are flattened recursively. Returns false if the value
        // contains something that isn't numeric.
        bool FlattenFloat(std::vector<float>* out) const;
        bool FlattenInt(std::vector<int>* out) const;
        bool FlattenUint(std::vector<unsigned>* out) const;
    private:
        Variant mValue;
    };

} // namespace
