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

#include <stdexcept>
#include <string>
#include <vector>

#include "graphics/feature_config.h"

namespace gfx
{
    class ShaderLibrary;

    enum class ShaderStage {
        Vertex, Fragment
    };

    // Source template for one shader stage. The source can contain
    // #include <chunk> directives and unrollable loops marked with
    // #pragma unroll_loop_start / #pragma unroll_loop_end.
    struct ShaderTemplate {
        // identifies the template in the program cache key.
        std::string id;
        std::string source;
    };

    // The final GLSL source for one stage split into its parts.
    struct PreprocessedSource {
        // "#version ..." line including the newline or empty.
        std::string version;
        // compatibility layer, precision, defines and declarations.
        std::string prefix;
        // the template source after the substitutions.
        std::string body;

        inline std::string GetSource() const
        { return version + prefix + body; }
    };

    // Thrown when an #include directive names a chunk that the library
    // doesn't have or when the chunks include each other recursively.
    class UnresolvedInclude : public std::runtime_error
    {
    public:
        explicit UnresolvedInclude(const std::string& chunk);

        inline const std::string& GetChunkName() const noexcept
        { return mChunk; }
    private:
        std::string mChunk;
    };

    // Turns a shader template and a feature configuration into the final
    // GLSL source. The output depends only on the inputs and the contents
    // of the shader library, same inputs always produce identical source.
    class ShaderPreprocessor
    {
    public:
        explicit ShaderPreprocessor(const ShaderLibrary& library) noexcept
          : mLibrary(&library)
        {}

        // Run all the preprocessing steps on the template.
        // Throws UnresolvedInclude if an include can't be resolved.
        PreprocessedSource Preprocess(const ShaderTemplate& shader,
                                      ShaderStage stage,
                                      const FeatureConfiguration& config) const;

        // Replace every #include <name> line with the contents of the named
        // chunk recursively. Anything following the directive on the same
        // line is kept.
        std::string ResolveIncludes(const std::string& source) const;

        // Generate the stage prologue (without the version line and
        // the compatibility layer).
        std::string GenerateVertexPrefix(const FeatureConfiguration& config) const;
        std::string GenerateFragmentPrefix(const FeatureConfiguration& config) const;

        // Replace the light count identifiers (NUM_DIR_LIGHTS etc.) with
        // the decimal counts from the configuration.
        static std::string ReplaceLightNums(const std::string& source, const FeatureConfiguration& config);
        // Replace NUM_CLIPPING_PLANES and UNION_CLIPPING_PLANES.
        static std::string ReplaceClippingPlaneNums(const std::string& source, const FeatureConfiguration& config);
        // Expand the loops between unroll_loop_start and unroll_loop_end
        // pragmas into a sequence of loop bodies. Occurrences of [ i ] are
        // replaced with [ N ] and UNROLLED_LOOP_INDEX with N.
        static std::string UnrollLoops(const std::string& source);
        // Generate #define lines for the user defines. False values are
        // skipped.
        static std::string GenerateDefines(const std::vector<ShaderDefine>& defines);
        static std::string GeneratePrecision(ShaderPrecision precision);
        static std::string GenerateVertexExtensions(const FeatureConfiguration& config);
        static std::string GenerateToneMappingFunction(const std::string& function_name, ToneMapping mapping);
        static std::string GenerateVersionString(const FeatureConfiguration& config);
    private:
        void ResolveIncludes(const std::string& source,
                             std::vector<std::string>& stack,
                             std::string& out) const;
        std::string GetChunk(const std::string& name) const;
        // Chunks that the prologue needs. The library can replace them
        // and the built-in source is used otherwise.
        std::string GetPrologueChunk(const std::string& name) const;
    private:
        const ShaderLibrary* mLibrary = nullptr;
    };

} // namespace
