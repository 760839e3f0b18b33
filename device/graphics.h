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
#include <vector>

#include "device/handle.h"
#include "device/enum.h"
#include "device/types.h"

namespace dev
{
    // Graphics device interface for building shader programs and for
    // setting their uniform state. The device does nothing clever, every
    // call maps onto the underlying API. Any caching and state tracking
    // is the responsibility of the caller.
    class GraphicsDevice
    {
    public:
        // Create a new shader object and submit the source for compilation.
        // The compilation status is *not* queried since that could stall
        // when the driver compiles in parallel. Use GetShaderCompileStatus
        // and GetShaderInfoLog afterwards.
        virtual GraphicsShader CompileShader(const std::string& source, ShaderType type) = 0;
        virtual bool GetShaderCompileStatus(const GraphicsShader& shader) const = 0;
        virtual std::string GetShaderInfoLog(const GraphicsShader& shader) const = 0;

        // Create a new program object, attach the shaders and link.
        // If index0_attribute is not empty the attribute is bound to
        // location 0 before linking. Like with CompileShader the link
        // status is not queried.
        virtual GraphicsProgram BuildProgram(const std::vector<GraphicsShader>& shaders,
                                             const std::string& index0_attribute) = 0;
        virtual bool GetProgramLinkStatus(const GraphicsProgram& program) const = 0;
        virtual bool GetProgramValidateStatus(const GraphicsProgram& program) const = 0;
        virtual std::string GetProgramInfoLog(const GraphicsProgram& program) const = 0;
        // Non-blocking check for whether the parallel compile and link
        // of the program has completed. Only meaningful when the device
        // caps report parallel_shader_compile.
        virtual bool IsProgramCompletionReady(const GraphicsProgram& program) const = 0;
        // Get the current (pending) API error code, 0 for no error.
        virtual unsigned GetError() const = 0;

        virtual std::vector<ActiveUniform> EnumerateUniforms(const GraphicsProgram& program) const = 0;
        virtual std::vector<ActiveAttribute> EnumerateAttributes(const GraphicsProgram& program) const = 0;

        // Make the program the current program. The SetUniform functions
        // operate on the current program.
        virtual void UseProgram(const GraphicsProgram& program) = 0;

        // Upload count elements of float/int/uint vectors with 1-4 components.
        virtual void SetUniformFloat(int location, unsigned components, unsigned count, const float* data) = 0;
        virtual void SetUniformInt(int location, unsigned components, unsigned count, const int* data) = 0;
        virtual void SetUniformUint(int location, unsigned components, unsigned count, const unsigned* data) = 0;
        // Upload count elements of square column major matrices of rank 2, 3 or 4.
        virtual void SetUniformMatrix(int location, unsigned rank, unsigned count, const float* data) = 0;

        // Bind the texture to the given texture unit. A texture object
        // with an invalid handle unbinds the unit.
        virtual void BindTexture(unsigned unit, const TextureObject& texture) = 0;
        // Allocate a 1x1(x1) texture of the given type with zero content.
        virtual TextureObject AllocatePlaceholderTexture(TextureType type) = 0;

        virtual void DeleteShader(const GraphicsShader& shader) = 0;
        virtual void DeleteProgram(const GraphicsProgram& program) = 0;
        virtual void DeleteTexture(const TextureObject& texture) = 0;

        virtual void GetDeviceCaps(GraphicsDeviceCaps* caps) const = 0;

    protected:
        virtual ~GraphicsDevice() = default;
    };
} // namespace
