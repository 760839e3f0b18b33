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

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "graphics/compiled_program.h"
#include "graphics/feature_config.h"
#include "graphics/shader_preprocessor.h"

namespace dev {
    class GraphicsDevice;
} // dev

namespace gfx
{
    class ShaderLibrary;

    // Cache of compiled programs keyed by the shader templates and the
    // feature configuration. Programs are reference counted, every
    // CompileOrReuse must be paired with a Release.
    class ProgramCache
    {
    public:
        struct Options {
            bool check_shader_errors = true;
            ShaderErrorCallback error_callback;
        };

        ProgramCache(dev::GraphicsDevice* device, const ShaderLibrary& library, Options options);
        ProgramCache(dev::GraphicsDevice* device, const ShaderLibrary& library);
        ~ProgramCache();
        ProgramCache(const ProgramCache&) = delete;
        ProgramCache& operator=(const ProgramCache&) = delete;

        // Return the program for the templates and the configuration.
        // If a program with the same key exists its use count is incremented,
        // otherwise a new program is compiled. Throws UnresolvedInclude if
        // the templates can't be preprocessed.
        CompiledProgram* CompileOrReuse(const ShaderTemplate& vertex,
                                        const ShaderTemplate& fragment,
                                        const FeatureConfiguration& config);

        // Increment the use count of the program.
        void Retain(CompiledProgram* program);
        // Decrement the use count of the program. When the count reaches
        // zero the program is destroyed and removed from the cache.
        void Release(CompiledProgram* program);

        // Find a program by its cache key. Returns nullptr if not found.
        CompiledProgram* FindProgram(const std::string& key) const;

        inline std::size_t GetNumPrograms() const noexcept
        { return mPrograms.size(); }
        inline const Options& GetOptions() const noexcept
        { return mOptions; }
        inline void SetOptions(const Options& options)
        { mOptions = options; }

        static std::string GetProgramCacheKey(const ShaderTemplate& vertex,
                                              const ShaderTemplate& fragment,
                                              const FeatureConfiguration& config);
    private:
        dev::GraphicsDevice* mDevice = nullptr;
        ShaderPreprocessor mPreprocessor;
        Options mOptions;
        std::vector<std::unique_ptr<CompiledProgram>> mPrograms;
        std::unordered_map<std::string, CompiledProgram*> mKeyMap;
    };

} // namespace
