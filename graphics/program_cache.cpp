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

#include <algorithm>

#include "base/assert.h"
#include "base/format.h"
#include "base/logging.h"
#include "base/utility.h"
#include "graphics/program_cache.h"
#include "graphics/shader_library.h"

namespace gfx
{

ProgramCache::ProgramCache(dev::GraphicsDevice* device, const ShaderLibrary& library, Options options)
  : mDevice(device)
  , mPreprocessor(library)
  , mOptions(std::move(options))
{}

ProgramCache::ProgramCache(dev::GraphicsDevice* device, const ShaderLibrary& library)
  : ProgramCache(device, library, Options{})
{}

ProgramCache::~ProgramCache()
{
    if (!mPrograms.empty())
        WARN("Program cache destroyed with programs still in use. [count=%1]", mPrograms.size());
    for (auto& program : mPrograms)
        program->Destroy();
}

CompiledProgram* ProgramCache::CompileOrReuse(const ShaderTemplate& vertex,
                                              const ShaderTemplate& fragment,
                                              const FeatureConfiguration& config)
{
    auto key = GetProgramCacheKey(vertex, fragment, config);
    if (auto* program = FindProgram(key))
    {
        program->Retain();
        return program;
    }

    const auto& vertex_source   = mPreprocessor.Preprocess(vertex, ShaderStage::Vertex, config);
    const auto& fragment_source = mPreprocessor.Preprocess(fragment, ShaderStage::Fragment, config);

    ProgramCompileOptions options;
    options.check_shader_errors = mOptions.check_shader_errors;
    options.error_callback = mOptions.error_callback;
    if (!config.index0_attribute_name.empty())
        options.index0_attribute = config.index0_attribute_name;
    else if (config.morph_targets)
        options.index0_attribute = "position";

    auto program = CompiledProgram::Compile(mDevice, config.shader_name, config.shader_type,
                                            vertex_source, fragment_source, options);
    program->SetCacheKey(key);

    auto* ret = program.get();
    mKeyMap[std::move(key)] = ret;
    mPrograms.push_back(std::move(program));
    DEBUG("Added new program to cache. [name='%1', id=%2, programs=%3]", ret->GetName(), ret->GetId(), mPrograms.size());
    return ret;
}

void ProgramCache::Retain(CompiledProgram* program)
{
    ASSERT(FindProgram(program->GetCacheKey()) == program);
    program->Retain();
}

void ProgramCache::Release(CompiledProgram* program)
{
    auto it = std::find_if(mPrograms.begin(), mPrograms.end(), [program](const auto& p) {
        return p.get() == program;
    });
    ASSERT(it != mPrograms.end());

    if (program->Release())
        return;

    DEBUG("Program is no longer used. [name='%1', id=%2]", program->GetName(), program->GetId());
    mKeyMap.erase(program->GetCacheKey());
    program->Destroy();
    mPrograms.erase(it);
}

CompiledProgram* ProgramCache::FindProgram(const std::string& key) const
{
    auto it = mKeyMap.find(key);
    if (it == mKeyMap.end())
        return nullptr;
    return it->second;
}

// static
std::string ProgramCache::GetProgramCacheKey(const ShaderTemplate& vertex,
                                             const ShaderTemplate& fragment,
                                             const FeatureConfiguration& config)
{
    return base::JoinString({vertex.id, fragment.id, config.GetCacheKey()}, ",");
}

} // namespace
