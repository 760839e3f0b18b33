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

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>

#include "device/enum.h"
#include "device/handle.h"
#include "graphics/shader_preprocessor.h"

namespace dev {
    class GraphicsDevice;
} // dev

namespace gfx
{
    class UniformContainer;
    class CompiledProgram;

    struct ShaderStageDiagnostics {
        // the shader info log, trimmed.
        std::string log;
        // the generated prologue of the stage source.
        std::string prefix;
    };

    // Information captured from the driver after the program has been
    // compiled and linked.
    struct ProgramDiagnostics {
        bool runnable = true;
        std::string program_log;
        ShaderStageDiagnostics vertex_shader;
        ShaderStageDiagnostics fragment_shader;
    };

    // Vertex attribute of a linked program.
    struct ProgramAttribute {
        dev::UniformType type = dev::UniformType::Float;
        int location = -1;
        // number of consecutive attribute locations, 2, 3 or 4 for
        // matrix attributes and 1 otherwise.
        unsigned location_size = 1;
    };
    using ProgramAttributeMap = std::unordered_map<std::string, ProgramAttribute>;

    // Called when a program fails to link. The diagnostics contain the
    // driver logs and the stage prologues.
    using ShaderErrorCallback = std::function<void (const CompiledProgram& program,
                                                    const ProgramDiagnostics& diagnostics)>;

    struct ProgramCompileOptions {
        // When false the driver logs are never queried and the program
        // is assumed to be runnable.
        bool check_shader_errors = true;
        // Replaces the default error log of a failed program.
        ShaderErrorCallback error_callback;
        // Attribute to bind to location 0 before linking. Empty for none.
        std::string index0_attribute;
    };

    // GPU program built from a pair of preprocessed shader sources.
    // The compilation and linking happens asynchronously on drivers that
    // support parallel compilation, so nothing about the result is queried
    // until the program is used the first time. The first use captures the
    // diagnostics, releases the shader objects and builds the uniform tree.
    class CompiledProgram
    {
    public:
        enum class State {
            Pending, Ready, Failed
        };

        ~CompiledProgram();
        CompiledProgram(const CompiledProgram&) = delete;
        CompiledProgram& operator=(const CompiledProgram&) = delete;

        // Submit both stages for compilation and link the program.
        static std::unique_ptr<CompiledProgram> Compile(dev::GraphicsDevice* device,
                                                        const std::string& name,
                                                        const std::string& type,
                                                        const PreprocessedSource& vertex,
                                                        const PreprocessedSource& fragment,
                                                        const ProgramCompileOptions& options);

        // Check whether the driver has finished compiling the program
        // without blocking. Once true stays true.
        bool PollReady();

        // Get the diagnostics. Returns nullptr when shader errors are
        // not being checked.
        const ProgramDiagnostics* GetDiagnostics();
        // Get the uniform tree of the program. Built on the first call.
        UniformContainer& GetUniforms();
        // Get the active vertex attributes. Queried on the first call.
        const ProgramAttributeMap& GetAttributes();

        // Delete the GPU program. Calling Destroy again does nothing.
        void Destroy();

        // Increment the use count and return the new count.
        std::size_t Retain() noexcept
        { return ++mUsedTimes; }
        // Decrement the use count and return the new count.
        std::size_t Release() noexcept;

        inline unsigned GetId() const noexcept
        { return mId; }
        inline const std::string& GetName() const noexcept
        { return mName; }
        inline const std::string& GetType() const noexcept
        { return mType; }
        inline const std::string& GetCacheKey() const noexcept
        { return mCacheKey; }
        inline void SetCacheKey(std::string key) noexcept
        { mCacheKey = std::move(key); }
        inline std::size_t GetUsedTimes() const noexcept
        { return mUsedTimes; }
        inline State GetState() const noexcept
        { return mState; }
        inline bool IsDestroyed() const noexcept
        { return !mProgram.IsValid(); }
        inline const dev::GraphicsProgram& GetProgram() const noexcept
        { return mProgram; }
        // True unless the first use step has found that the program
        // failed to link.
        inline bool IsRunnable() const noexcept
        { return mState != State::Failed; }

        // Format the error report of one stage with the source lines
        // around the line reported in the log. Returns the log as-is if
        // no line number can be found and an empty string when there are
        // no errors.
        static std::string FormatShaderErrors(const std::string& stage,
                                              const std::string& log,
                                              const std::string& source);
    private:
        CompiledProgram(dev::GraphicsDevice* device, std::string name, std::string type);
        void CheckDiagnostics();
        std::string GetStageErrors(const dev::GraphicsShader& shader, const std::string& stage,
                                   const std::string& source) const;
    private:
        dev::GraphicsDevice* mDevice = nullptr;
        const unsigned mId = 0;
        const std::string mName;
        const std::string mType;
        std::string mCacheKey;
        ProgramCompileOptions mOptions;
        dev::GraphicsProgram mProgram;
        dev::GraphicsShader mVertexShader;
        dev::GraphicsShader mFragmentShader;
        // sources for the error report, released after the first use.
        std::string mVertexSource;
        std::string mFragmentSource;
        std::string mVertexPrefix;
        std::string mFragmentPrefix;
        std::size_t mUsedTimes = 1;
        State mState = State::Pending;
        bool mFirstUseDone = false;
        bool mReadyLatch = false;
        std::optional<ProgramDiagnostics> mDiagnostics;
        std::unique_ptr<UniformContainer> mUniforms;
        std::optional<ProgramAttributeMap> mAttributes;
    };

    const char* ToString(CompiledProgram::State state);

} // namespace
