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

#include <map>
#include <string>
#include <vector>

#include "device/graphics.h"

// Graphics device that records every call instead of talking to a driver.
// The test sets up the reflection data, the compile/link results and the
// logs and then checks the recorded uploads, bindings and deletions.
class TestDevice : public dev::GraphicsDevice
{
public:
    struct Upload {
        enum class Kind {
            Float, Int, Uint, Matrix
        };
        Kind kind = Kind::Float;
        int location = -1;
        // number of vector components or the matrix rank.
        unsigned components = 0;
        unsigned count = 0;
        std::vector<float> floats;
        std::vector<int> ints;
        std::vector<unsigned> uints;
    };
    struct Binding {
        unsigned unit = 0;
        dev::TextureObject texture;
    };
    struct ShaderRecord {
        std::string source;
        dev::ShaderType type = dev::ShaderType::Invalid;
        bool deleted = false;
    };
    struct ProgramRecord {
        std::vector<unsigned> shaders;
        std::string index0_attribute;
        bool deleted = false;
    };

    // reflection data reported for every program.
    std::vector<dev::ActiveUniform> uniforms;
    std::vector<dev::ActiveAttribute> attributes;

    bool compile_status = true;
    bool link_status = true;
    bool validate_status = true;
    std::string vertex_log;
    std::string fragment_log;
    std::string program_log;
    bool completion_ready = false;
    dev::GraphicsDeviceCaps caps;

    std::vector<Upload> uploads;
    std::vector<Binding> bindings;
    std::map<unsigned, ShaderRecord> shaders;
    std::map<unsigned, ProgramRecord> programs;
    std::vector<dev::TextureObject> placeholders;
    std::vector<unsigned> deleted_textures;
    unsigned current_program = 0;
    mutable unsigned num_log_queries = 0;
    mutable unsigned num_uniform_queries = 0;

    TestDevice()
    {
        caps.num_texture_units = 16;
    }

    void ClearRecords()
    {
        uploads.clear();
        bindings.clear();
    }

    dev::ActiveUniform& AddUniform(const std::string& name, dev::UniformType type, unsigned size = 1)
    {
        dev::ActiveUniform uniform;
        uniform.name = name;
        uniform.type = type;
        uniform.size = size;
        uniform.location = static_cast<int>(uniforms.size());
        uniforms.push_back(uniform);
        return uniforms.back();
    }

    unsigned GetNumLiveShaders() const
    {
        unsigned count = 0;
        for (const auto& pair : shaders)
            count += pair.second.deleted ? 0 : 1;
        return count;
    }
    unsigned GetNumLivePrograms() const
    {
        unsigned count = 0;
        for (const auto& pair : programs)
            count += pair.second.deleted ? 0 : 1;
        return count;
    }

    virtual dev::GraphicsShader CompileShader(const std::string& source, dev::ShaderType type) override
    {
        const auto handle = mNextHandle++;
        ShaderRecord record;
        record.source = source;
        record.type   = type;
        shaders[handle] = record;

        dev::GraphicsShader shader;
        shader.handle = handle;
        shader.type   = type;
        return shader;
    }
    virtual bool GetShaderCompileStatus(const dev::GraphicsShader& shader) const override
    { return compile_status; }
    virtual std::string GetShaderInfoLog(const dev::GraphicsShader& shader) const override
    {
        ++num_log_queries;
        if (shader.GetType() == dev::ShaderType::VertexShader)
            return vertex_log;
        return fragment_log;
    }

    virtual dev::GraphicsProgram BuildProgram(const std::vector<dev::GraphicsShader>& list,
                                              const std::string& index0_attribute) override
    {
        const auto handle = mNextHandle++;
        ProgramRecord record;
        for (const auto& shader : list)
            record.shaders.push_back(shader.GetHandle());
        record.index0_attribute = index0_attribute;
        programs[handle] = record;

        dev::GraphicsProgram program;
        program.handle = handle;
        return program;
    }
    virtual bool GetProgramLinkStatus(const dev::GraphicsProgram& program) const override
    { return link_status; }
    virtual bool GetProgramValidateStatus(const dev::GraphicsProgram& program) const override
    { return validate_status; }
    virtual std::string GetProgramInfoLog(const dev::GraphicsProgram& program) const override
    {
        ++num_log_queries;
        return program_log;
    }
    virtual bool IsProgramCompletionReady(const dev::GraphicsProgram& program) const override
    { return completion_ready; }
    virtual unsigned GetError() const override
    { return 0; }

    virtual std::vector<dev::ActiveUniform> EnumerateUniforms(const dev::GraphicsProgram& program) const override
    {
        ++num_uniform_queries;
        return uniforms;
    }
    virtual std::vector<dev::ActiveAttribute> EnumerateAttributes(const dev::GraphicsProgram& program) const override
    { return attributes; }

    virtual void UseProgram(const dev::GraphicsProgram& program) override
    { current_program = program.GetHandle(); }

    virtual void SetUniformFloat(int location, unsigned components, unsigned count, const float* data) override
    {
        Upload upload;
        upload.kind = Upload::Kind::Float;
        upload.location = location;
        upload.components = components;
        upload.count = count;
        upload.floats.assign(data, data + components * count);
        uploads.push_back(std::move(upload));
    }
    virtual void SetUniformInt(int location, unsigned components, unsigned count, const int* data) override
    {
        Upload upload;
        upload.kind = Upload::Kind::Int;
        upload.location = location;
        upload.components = components;
        upload.count = count;
        upload.ints.assign(data, data + components * count);
        uploads.push_back(std::move(upload));
    }
    virtual void SetUniformUint(int location, unsigned components, unsigned count, const unsigned* data) override
    {
        Upload upload;
        upload.kind = Upload::Kind::Uint;
        upload.location = location;
        upload.components = components;
        upload.count = count;
        upload.uints.assign(data, data + components * count);
        uploads.push_back(std::move(upload));
    }
    virtual void SetUniformMatrix(int location, unsigned rank, unsigned count, const float* data) override
    {
        Upload upload;
        upload.kind = Upload::Kind::Matrix;
        upload.location = location;
        upload.components = rank;
        upload.count = count;
        upload.floats.assign(data, data + rank * rank * count);
        uploads.push_back(std::move(upload));
    }

    virtual void BindTexture(unsigned unit, const dev::TextureObject& texture) override
    {
        Binding binding;
        binding.unit = unit;
        binding.texture = texture;
        bindings.push_back(binding);
    }
    virtual dev::TextureObject AllocatePlaceholderTexture(dev::TextureType type) override
    {
        dev::TextureObject texture;
        texture.type   = type;
        texture.handle = mNextHandle++;
        texture.texture_width  = 1;
        texture.texture_height = 1;
        texture.texture_depth  = 1;
        placeholders.push_back(texture);
        return texture;
    }

    virtual void DeleteShader(const dev::GraphicsShader& shader) override
    { shaders[shader.GetHandle()].deleted = true; }
    virtual void DeleteProgram(const dev::GraphicsProgram& program) override
    { programs[program.GetHandle()].deleted = true; }
    virtual void DeleteTexture(const dev::TextureObject& texture) override
    { deleted_textures.push_back(texture.GetHandle()); }

    virtual void GetDeviceCaps(dev::GraphicsDeviceCaps* out) const override
    { *out = caps; }

    dev::TextureObject MakeTexture(dev::TextureType type)
    {
        dev::TextureObject texture;
        texture.type = type;
        texture.handle = mNextHandle++;
        texture.texture_width  = 64;
        texture.texture_height = 64;
        return texture;
    }
private:
    unsigned mNextHandle = 1;
};
