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
#include <atomic>
#include <cstdlib>

#include "base/assert.h"
#include "base/format.h"
#include "base/logging.h"
#include "base/utility.h"
#include "device/graphics.h"
#include "device/types.h"
#include "graphics/compiled_program.h"
#include "graphics/uniform_tree.h"

namespace {
unsigned NextProgramId()
{
    static std::atomic<unsigned> counter(0);
    return counter++;
}

// Find the line number from a driver message such as "ERROR: 0:12: ..."
// Returns 0 if there's none.
unsigned FindErrorLine(const std::string& log)
{
    const std::string marker = "ERROR: 0:";
    std::string::size_type pos = 0;
    while ((pos = log.find(marker, pos)) != std::string::npos)
    {
        pos += marker.size();
        unsigned line = 0;
        std::string::size_type end = pos;
        while (end < log.size() && log[end] >= '0' && log[end] <= '9')
            line = line * 10 + static_cast<unsigned>(log[end++] - '0');
        if (end > pos)
            return line;
    }
    return 0;
}

unsigned GetLocationSize(dev::UniformType type)
{
    if (type == dev::UniformType::FloatMat2)
        return 2;
    else if (type == dev::UniformType::FloatMat3)
        return 3;
    else if (type == dev::UniformType::FloatMat4)
        return 4;
    return 1;
}

} // namespace

namespace gfx
{

CompiledProgram::CompiledProgram(dev::GraphicsDevice* device, std::string name, std::string type)
  : mDevice(device)
  , mId(NextProgramId())
  , mName(std::move(name))
  , mType(std::move(type))
{}

CompiledProgram::~CompiledProgram()
{
    Destroy();
}

// static
std::unique_ptr<CompiledProgram> CompiledProgram::Compile(dev::GraphicsDevice* device,
                                                          const std::string& name,
                                                          const std::string& type,
                                                          const PreprocessedSource& vertex,
                                                          const PreprocessedSource& fragment,
                                                          const ProgramCompileOptions& options)
{
    std::unique_ptr<CompiledProgram> program(new CompiledProgram(device, name, type));
    program->mOptions        = options;
    program->mVertexSource   = vertex.GetSource();
    program->mFragmentSource = fragment.GetSource();
    program->mVertexPrefix   = vertex.prefix;
    program->mFragmentPrefix = fragment.prefix;

    program->mVertexShader   = device->CompileShader(program->mVertexSource, dev::ShaderType::VertexShader);
    program->mFragmentShader = device->CompileShader(program->mFragmentSource, dev::ShaderType::FragmentShader);
    program->mProgram = device->BuildProgram({program->mVertexShader, program->mFragmentShader},
                                             options.index0_attribute);

    DEBUG("Submitted program for compilation. [id=%1, name='%2', type='%3', handle=%4]",
          program->mId, name, type, program->mProgram.GetHandle());
    return program;
}

bool CompiledProgram::PollReady()
{
    if (mReadyLatch)
        return true;

    dev::GraphicsDeviceCaps caps;
    mDevice->GetDeviceCaps(&caps);
    if (!caps.parallel_shader_compile)
        mReadyLatch = true;
    else mReadyLatch = mDevice->IsProgramCompletionReady(mProgram);

    if (mReadyLatch && mState == State::Pending)
        mState = State::Ready;
    return mReadyLatch;
}

const ProgramDiagnostics* CompiledProgram::GetDiagnostics()
{
    CheckDiagnostics();
    return mDiagnostics ? &mDiagnostics.value() : nullptr;
}

UniformContainer& CompiledProgram::GetUniforms()
{
    CheckDiagnostics();
    if (!mUniforms)
    {
        ASSERT(!IsDestroyed());
        mUniforms = UniformContainer::Build(*mDevice, mProgram);
    }
    return *mUniforms;
}

const ProgramAttributeMap& CompiledProgram::GetAttributes()
{
    CheckDiagnostics();
    if (!mAttributes)
    {
        ASSERT(!IsDestroyed());
        ProgramAttributeMap map;
        for (const auto& attr : mDevice->EnumerateAttributes(mProgram))
        {
            ProgramAttribute attribute;
            attribute.type = attr.type;
            attribute.location = attr.location;
            attribute.location_size = GetLocationSize(attr.type);
            map[attr.name] = attribute;
        }
        mAttributes = std::move(map);
    }
    return mAttributes.value();
}

void CompiledProgram::Destroy()
{
    if (!mProgram.IsValid())
        return;

    if (mVertexShader.IsValid())
        mDevice->DeleteShader(mVertexShader);
    if (mFragmentShader.IsValid())
        mDevice->DeleteShader(mFragmentShader);
    mDevice->DeleteProgram(mProgram);
    DEBUG("Deleted program. [id=%1, name='%2']", mId, mName);

    mVertexShader   = dev::GraphicsShader {};
    mFragmentShader = dev::GraphicsShader {};
    mProgram = dev::GraphicsProgram {};
    mUniforms.reset();
    mAttributes.reset();
}

std::size_t CompiledProgram::Release() noexcept
{
    ASSERT(mUsedTimes > 0);
    return --mUsedTimes;
}

// static
std::string CompiledProgram::FormatShaderErrors(const std::string& stage,
                                                const std::string& log,
                                                const std::string& source)
{
    if (log.empty())
        return "";

    const auto error_line = FindErrorLine(log);
    if (error_line == 0)
        return log;

    const auto& lines = base::SplitLines(source);
    const std::size_t from = error_line > 6 ? error_line - 6 : 0;
    const std::size_t to   = std::min<std::size_t>(error_line + 6, lines.size());

    std::vector<std::string> context;
    for (std::size_t i=from; i<to; ++i)
    {
        const auto line = i + 1;
        context.push_back(base::FormatString("%1 %2: %3", line == error_line ? ">" : " ", line, lines[i]));
    }
    return base::ToUpper(stage) + "\n\n" + log + "\n\n" + base::JoinString(context, "\n");
}

void CompiledProgram::CheckDiagnostics()
{
    if (mFirstUseDone || IsDestroyed())
        return;
    mFirstUseDone = true;

    if (mOptions.check_shader_errors)
    {
        ProgramDiagnostics diagnostics;
        diagnostics.program_log = base::TrimString(mDevice->GetProgramInfoLog(mProgram));
        diagnostics.vertex_shader.log = base::TrimString(mDevice->GetShaderInfoLog(mVertexShader));
        diagnostics.vertex_shader.prefix = mVertexPrefix;
        diagnostics.fragment_shader.log = base::TrimString(mDevice->GetShaderInfoLog(mFragmentShader));
        diagnostics.fragment_shader.prefix = mFragmentPrefix;
        diagnostics.runnable = mDevice->GetProgramLinkStatus(mProgram);

        if (!diagnostics.runnable)
        {
            mState = State::Failed;
            if (mOptions.error_callback)
            {
                mOptions.error_callback(*this, diagnostics);
            }
            else
            {
                const auto& vertex_errors = GetStageErrors(mVertexShader, "vertex", mVertexSource);
                const auto& fragment_errors = GetStageErrors(mFragmentShader, "fragment", mFragmentSource);
                ERROR("Shader program failed to link. [name='%1', type='%2', error=%3, valid=%4]\n"
                      "Program Info Log: %5\n%6\n%7",
                      mName, mType, mDevice->GetError(),
                      mDevice->GetProgramValidateStatus(mProgram) ? "true" : "false",
                      diagnostics.program_log, vertex_errors, fragment_errors);
            }
        }
        else
        {
            mState = State::Ready;
            if (!diagnostics.program_log.empty())
                WARN("Shader program info log is not empty. [name='%1', log='%2']", mName, diagnostics.program_log);
        }
        mDiagnostics = std::move(diagnostics);
    }
    else
    {
        mState = State::Ready;
    }

    mDevice->DeleteShader(mVertexShader);
    mDevice->DeleteShader(mFragmentShader);
    mVertexShader   = dev::GraphicsShader {};
    mFragmentShader = dev::GraphicsShader {};
    mVertexSource.clear();
    mFragmentSource.clear();
    mReadyLatch = true;
}

std::string CompiledProgram::GetStageErrors(const dev::GraphicsShader& shader, const std::string& stage,
                                            const std::string& source) const
{
    const auto status = mDevice->GetShaderCompileStatus(shader);
    const auto& log = base::TrimString(mDevice->GetShaderInfoLog(shader));
    if (status && log.empty())
        return "";
    return FormatShaderErrors(stage, log, source);
}

const char* ToString(CompiledProgram::State state)
{
    using State = CompiledProgram::State;
    switch (state)
    {
        case State::Pending: return "Pending";
        case State::Ready:   return "Ready";
        case State::Failed:  return "Failed";
    }
    BUG("Unknown program state.");
    return "";
}

} // namespace
