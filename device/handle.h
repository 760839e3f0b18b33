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

#include "device/enum.h"

namespace dev
{
    namespace detail {
        template<dev::ResourceType type>
        struct ResourceHandle {
            inline bool IsValid() const noexcept
            { return handle != 0; }
            inline auto GetHandle() const noexcept
            { return handle; }

            unsigned handle = 0;
        };

        template<>
        struct ResourceHandle<dev::ResourceType::GraphicsShader> {
            inline bool IsValid() const noexcept
            { return handle != 0; }
            inline auto GetHandle() const noexcept
            { return handle; }
            inline auto GetType() const noexcept
            { return type; }

            unsigned handle = 0;
            ShaderType type = ShaderType::Invalid;
        };

        template<>
        struct ResourceHandle<dev::ResourceType::Texture> {
            bool IsValid() const noexcept
            { return handle != 0; }
            auto GetHandle() const noexcept
            { return handle; }
            auto GetType() const noexcept
            { return type; }

            TextureType type = TextureType::Invalid;
            unsigned handle = 0;
            unsigned texture_width  = 0;
            unsigned texture_height = 0;
            unsigned texture_depth  = 0;
        };

        template<dev::ResourceType type>
        inline bool operator==(const ResourceHandle<type>& lhs, const ResourceHandle<type>& rhs) noexcept
        { return lhs.handle == rhs.handle; }

        template<dev::ResourceType type>
        inline bool operator!=(const ResourceHandle<type>& lhs, const ResourceHandle<type>& rhs) noexcept
        { return lhs.handle != rhs.handle; }

    } // detail

    using GraphicsShader  = detail::ResourceHandle<ResourceType::GraphicsShader>;
    using GraphicsProgram = detail::ResourceHandle<ResourceType::GraphicsProgram>;
    using TextureObject   = detail::ResourceHandle<ResourceType::Texture>;

} // namespace
