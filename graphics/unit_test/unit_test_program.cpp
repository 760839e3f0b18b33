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
#  include <glm/vec3.hpp>
#include "warnpop.h"

#include <string>

#include "base/test_minimal.h"
#include "base/logging.h"
#include "base/utility.h"
#include "graphics/compiled_program.h"
#include "graphics/feature_config.h"
#include "graphics/program_cache.h"
#include "graphics/shader_library.h"
#include "graphics/shader_preprocessor.h"
#include "graphics/texture_units.h"
#include "graphics/uniform_setters.h"
#include "graphics/uniform_tree.h"
#include "graphics/unit_test/test_device.h"

namespace {
size_t CountMessages(const base::BufferLogger<base::NullLogger>& logger, base::LogEvent type, const std::string& what)
{
    size_t count = 0;
    for (size_t i=0; i<logger.GetBufferMsgCount(); ++i)
    {
        const auto& msg = logger.GetMessage(i);
        if (msg.type == type && base::Contains(msg.msg, what))
            ++count;
    }
    return count;
}

gfx::PreprocessedSource MakeVertexSource()
{
    gfx::PreprocessedSource source;
    source.version = "#version 300 es\n";
    source.prefix  = "precision highp float;\n";
    source.body    = "void main() {\n  oops\n}\n";
    return source;
}
gfx::PreprocessedSource MakeFragmentSource()
{
    gfx::PreprocessedSource source;
    source.version = "#version 300 es\n";
    source.prefix  = "precision mediump float;\n";
    source.body    = "out vec4 color;\nvoid main() {\n  color = vec4(1.0);\n}\n";
    return source;
}

std::unique_ptr<gfx::CompiledProgram> Compile(TestDevice& device, gfx::ProgramCompileOptions options = gfx::ProgramCompileOptions())
{
    return gfx::CompiledProgram::Compile(&device, "Crate", "MeshStandardMaterial",
                                         MakeVertexSource(), MakeFragmentSource(), options);
}

gfx::ShaderTemplate MakeTemplate(const std::string& id, const std::string& source)
{
    gfx::ShaderTemplate shader;
    shader.id = id;
    shader.source = source;
    return shader;
}

gfx::FeatureConfiguration MakeConfig()
{
    gfx::FeatureConfiguration config;
    config.shader_type = "MeshStandardMaterial";
    config.shader_name = "Crate";
    return config;
}
} // namespace

void unit_test_compile()
{
    TEST_CASE(test::Type::Feature)

    TestDevice device;
    auto program = Compile(device);
    TEST_REQUIRE(program->GetName() == "Crate");
    TEST_REQUIRE(program->GetType() == "MeshStandardMaterial");
    TEST_REQUIRE(program->GetState() == gfx::CompiledProgram::State::Pending);
    TEST_REQUIRE(program->GetUsedTimes() == 1);
    TEST_REQUIRE(program->IsDestroyed() == false);
    TEST_REQUIRE(program->IsRunnable());
    TEST_REQUIRE(device.GetNumLiveShaders() == 2);
    TEST_REQUIRE(device.GetNumLivePrograms() == 1);

    // the sources are the concatenation of the parts
    const auto& record = device.programs[program->GetProgram().GetHandle()];
    TEST_REQUIRE(record.shaders.size() == 2);
    TEST_REQUIRE(device.shaders[record.shaders[0]].type == dev::ShaderType::VertexShader);
    TEST_REQUIRE(device.shaders[record.shaders[0]].source == MakeVertexSource().GetSource());
    TEST_REQUIRE(device.shaders[record.shaders[1]].type == dev::ShaderType::FragmentShader);
    TEST_REQUIRE(device.shaders[record.shaders[1]].source == MakeFragmentSource().GetSource());
    TEST_REQUIRE(record.index0_attribute.empty());

    // nothing is asked from the driver before the first use
    TEST_REQUIRE(device.num_log_queries == 0);
    TEST_REQUIRE(device.num_uniform_queries == 0);

    TEST_REQUIRE(program->PollReady());
    TEST_REQUIRE(program->GetState() == gfx::CompiledProgram::State::Ready);
    TEST_REQUIRE(device.num_log_queries == 0);

    // first use
    device.AddUniform("diffuse", dev::UniformType::FloatVec3);
    auto& uniforms = program->GetUniforms();
    TEST_REQUIRE(uniforms.GetNumNodes() == 1);
    TEST_REQUIRE(device.num_log_queries == 3);
    TEST_REQUIRE(device.num_uniform_queries == 1);
    TEST_REQUIRE(device.GetNumLiveShaders() == 0);
    TEST_REQUIRE(device.GetNumLivePrograms() == 1);

    const auto* diagnostics = program->GetDiagnostics();
    TEST_REQUIRE(diagnostics);
    TEST_REQUIRE(diagnostics->runnable);
    TEST_REQUIRE(diagnostics->program_log.empty());
    TEST_REQUIRE(diagnostics->vertex_shader.prefix == "precision highp float;\n");
    TEST_REQUIRE(diagnostics->fragment_shader.prefix == "precision mediump float;\n");

    // the results are kept
    TEST_REQUIRE(&program->GetUniforms() == &uniforms);
    TEST_REQUIRE(program->GetDiagnostics() == diagnostics);
    TEST_REQUIRE(device.num_log_queries == 3);
    TEST_REQUIRE(device.num_uniform_queries == 1);

    // every program gets its own id
    auto other = Compile(device);
    TEST_REQUIRE(other->GetId() != program->GetId());
}

void unit_test_poll_ready()
{
    TEST_CASE(test::Type::Feature)

    TestDevice device;
    device.caps.parallel_shader_compile = true;
    device.completion_ready = false;

    auto program = Compile(device);
    TEST_REQUIRE(program->PollReady() == false);
    TEST_REQUIRE(program->PollReady() == false);
    TEST_REQUIRE(program->GetState() == gfx::CompiledProgram::State::Pending);

    device.completion_ready = true;
    TEST_REQUIRE(program->PollReady());
    TEST_REQUIRE(program->GetState() == gfx::CompiledProgram::State::Ready);

    // once ready stays ready
    device.completion_ready = false;
    TEST_REQUIRE(program->PollReady());

    // first use makes the program ready regardless
    auto second = Compile(device);
    TEST_REQUIRE(second->PollReady() == false);
    TEST_REQUIRE(second->GetDiagnostics());
    TEST_REQUIRE(second->PollReady());
    TEST_REQUIRE(second->GetState() == gfx::CompiledProgram::State::Ready);
}

void unit_test_link_failure()
{
    TEST_CASE(test::Type::Feature)

    // with a callback
    {
        TestDevice device;
        device.link_status = false;
        device.compile_status = false;
        device.program_log = "  Link failed.\n";
        device.vertex_log = "ERROR: 0:4: 'oops' : syntax error";

        unsigned calls = 0;
        std::string log;
        bool runnable = true;
        gfx::ProgramCompileOptions options;
        options.error_callback = [&](const gfx::CompiledProgram& program, const gfx::ProgramDiagnostics& diagnostics) {
            ++calls;
            log = diagnostics.vertex_shader.log;
            runnable = diagnostics.runnable;
            TEST_REQUIRE(program.GetName() == "Crate");
        };
        auto program = Compile(device, options);
        TEST_REQUIRE(calls == 0);

        const auto* diagnostics = program->GetDiagnostics();
        TEST_REQUIRE(calls == 1);
        TEST_REQUIRE(runnable == false);
        TEST_REQUIRE(log == "ERROR: 0:4: 'oops' : syntax error");
        TEST_REQUIRE(diagnostics->runnable == false);
        TEST_REQUIRE(diagnostics->program_log == "Link failed.");
        TEST_REQUIRE(program->GetState() == gfx::CompiledProgram::State::Failed);
        TEST_REQUIRE(program->IsRunnable() == false);
        TEST_REQUIRE(device.GetNumLiveShaders() == 0);

        program->GetUniforms();
        program->GetAttributes();
        TEST_REQUIRE(calls == 1);
        // the failed state is not reset by polling
        TEST_REQUIRE(program->PollReady());
        TEST_REQUIRE(program->GetState() == gfx::CompiledProgram::State::Failed);
    }

    // without a callback the errors are logged
    {
        base::BufferLogger<base::NullLogger> logger;
        logger.EnableWrite(base::Logger::WriteType::WriteFormatted, false);
        base::SetGlobalLog(&logger);

        TestDevice device;
        device.link_status = false;
        device.compile_status = false;
        device.program_log = "Link failed.";
        device.vertex_log = "ERROR: 0:4: 'oops' : syntax error";

        auto program = Compile(device);
        program->GetDiagnostics();
        TEST_REQUIRE(CountMessages(logger, base::LogEvent::Error, "failed to link") == 1);
        TEST_REQUIRE(CountMessages(logger, base::LogEvent::Error, "name='Crate'") == 1);
        TEST_REQUIRE(CountMessages(logger, base::LogEvent::Error, "Program Info Log: Link failed.") == 1);
        TEST_REQUIRE(CountMessages(logger, base::LogEvent::Error, "VERTEX") == 1);
        TEST_REQUIRE(CountMessages(logger, base::LogEvent::Error, "> 4:   oops") == 1);

        program->GetDiagnostics();
        TEST_REQUIRE(CountMessages(logger, base::LogEvent::Error, "failed to link") == 1);

        base::SetGlobalLog(nullptr);
    }

    // linked fine but with a log
    {
        base::BufferLogger<base::NullLogger> logger;
        logger.EnableWrite(base::Logger::WriteType::WriteFormatted, false);
        base::SetGlobalLog(&logger);

        TestDevice device;
        device.program_log = "warning: varying not written";
        auto program = Compile(device);
        TEST_REQUIRE(program->GetDiagnostics()->runnable);
        TEST_REQUIRE(program->IsRunnable());
        TEST_REQUIRE(CountMessages(logger, base::LogEvent::Warning, "varying not written") == 1);

        base::SetGlobalLog(nullptr);
    }
}

void unit_test_unchecked()
{
    TEST_CASE(test::Type::Feature)

    TestDevice device;
    device.link_status = false;

    unsigned calls = 0;
    gfx::ProgramCompileOptions options;
    options.check_shader_errors = false;
    options.error_callback = [&calls](const gfx::CompiledProgram&, const gfx::ProgramDiagnostics&) {
        ++calls;
    };
    auto program = Compile(device, options);
    TEST_REQUIRE(program->GetDiagnostics() == nullptr);
    TEST_REQUIRE(program->GetState() == gfx::CompiledProgram::State::Ready);
    TEST_REQUIRE(program->IsRunnable());
    TEST_REQUIRE(device.num_log_queries == 0);
    TEST_REQUIRE(device.GetNumLiveShaders() == 0);
    TEST_REQUIRE(calls == 0);
}

void unit_test_format_errors()
{
    TEST_CASE(test::Type::Feature)

    std::string source;
    for (int i=1; i<=20; ++i)
        source += "line" + std::to_string(i) + "\n";

    TEST_REQUIRE(gfx::CompiledProgram::FormatShaderErrors("vertex", "", source) == "");
    TEST_REQUIRE(gfx::CompiledProgram::FormatShaderErrors("vertex", "something odd", source) == "something odd");

    {
        const auto& ret = gfx::CompiledProgram::FormatShaderErrors("fragment", "ERROR: 0:3: 'x' : undeclared identifier", source);
        TEST_REQUIRE(ret ==
            "FRAGMENT\n\n"
            "ERROR: 0:3: 'x' : undeclared identifier\n\n"
            "  1: line1\n"
            "  2: line2\n"
            "> 3: line3\n"
            "  4: line4\n"
            "  5: line5\n"
            "  6: line6\n"
            "  7: line7\n"
            "  8: line8\n"
            "  9: line9");
    }
    {
        const auto& ret = gfx::CompiledProgram::FormatShaderErrors("vertex", "ERROR: 0:10: 'y' : syntax error", source);
        TEST_REQUIRE(base::StartsWith(ret, "VERTEX\n\nERROR: 0:10: 'y' : syntax error\n\n  5: line5\n"));
        TEST_REQUIRE(base::Contains(ret, "> 10: line10\n"));
        TEST_REQUIRE(base::EndsWith(ret, "  16: line16"));
        TEST_REQUIRE(base::Contains(ret, "line4") == false);
        TEST_REQUIRE(base::Contains(ret, "line17") == false);
    }
    {
        // error at the end of the source
        const auto& ret = gfx::CompiledProgram::FormatShaderErrors("vertex", "ERROR: 0:20: '}' : syntax error", source);
        TEST_REQUIRE(base::EndsWith(ret, "> 20: line20"));
    }
}

void unit_test_attributes()
{
    TEST_CASE(test::Type::Feature)

    TestDevice device;
    dev::ActiveAttribute position;
    position.name = "position";
    position.type = dev::UniformType::FloatVec3;
    position.location = 0;
    dev::ActiveAttribute instance;
    instance.name = "instanceMatrix";
    instance.type = dev::UniformType::FloatMat4;
    instance.location = 1;
    dev::ActiveAttribute normal;
    normal.name = "normalMatrix";
    normal.type = dev::UniformType::FloatMat3;
    normal.location = 5;
    device.attributes = {position, instance, normal};

    auto program = Compile(device);
    const auto& attributes = program->GetAttributes();
    TEST_REQUIRE(attributes.size() == 3);
    TEST_REQUIRE(attributes.at("position").location == 0);
    TEST_REQUIRE(attributes.at("position").location_size == 1);
    TEST_REQUIRE(attributes.at("position").type == dev::UniformType::FloatVec3);
    TEST_REQUIRE(attributes.at("instanceMatrix").location == 1);
    TEST_REQUIRE(attributes.at("instanceMatrix").location_size == 4);
    TEST_REQUIRE(attributes.at("normalMatrix").location_size == 3);
    TEST_REQUIRE(device.GetNumLiveShaders() == 0);
}

void unit_test_destroy()
{
    TEST_CASE(test::Type::Feature)

    TestDevice device;
    {
        auto program = Compile(device);
        program->Destroy();
        TEST_REQUIRE(program->IsDestroyed());
        TEST_REQUIRE(device.GetNumLiveShaders() == 0);
        TEST_REQUIRE(device.GetNumLivePrograms() == 0);
        program->Destroy();
        TEST_REQUIRE(device.GetNumLivePrograms() == 0);
        // nothing to check anymore
        TEST_REQUIRE(program->GetDiagnostics() == nullptr);
        TEST_REQUIRE(device.num_log_queries == 0);
    }
    {
        auto program = Compile(device);
        program->GetUniforms();
        TEST_REQUIRE(device.GetNumLivePrograms() == 1);
    }
    // the destructor releases the program
    TEST_REQUIRE(device.GetNumLivePrograms() == 0);

    auto program = Compile(device);
    TEST_REQUIRE(program->Retain() == 2);
    TEST_REQUIRE(program->Retain() == 3);
    TEST_REQUIRE(program->Release() == 2);
    TEST_REQUIRE(program->GetUsedTimes() == 2);
}

void unit_test_cache()
{
    TEST_CASE(test::Type::Feature)

    base::BufferLogger<base::NullLogger> logger;
    logger.EnableWrite(base::Logger::WriteType::WriteFormatted, false);
    base::SetGlobalLog(&logger);

    auto library = gfx::ShaderLibrary::CreateDefault();
    library.AddChunk("common", "#define PI 3.141592653589793");

    TestDevice device;
    gfx::ProgramCache cache(&device, library);

    const auto& vertex = MakeTemplate("standard", "#include <common>\nvoid main() {\n\tgl_Position = vec4(position, 1.0);\n}\n");
    const auto& fragment = MakeTemplate("standard", "#include <common>\nvoid main() {\n\tgl_FragColor = vec4(1.0);\n}\n");

    auto config = MakeConfig();
    auto* first = cache.CompileOrReuse(vertex, fragment, config);
    TEST_REQUIRE(first);
    TEST_REQUIRE(cache.GetNumPrograms() == 1);
    TEST_REQUIRE(first->GetUsedTimes() == 1);
    TEST_REQUIRE(first->GetName() == "Crate");
    TEST_REQUIRE(first->GetType() == "MeshStandardMaterial");
    TEST_REQUIRE(first->GetCacheKey() == gfx::ProgramCache::GetProgramCacheKey(vertex, fragment, config));
    TEST_REQUIRE(cache.FindProgram(first->GetCacheKey()) == first);
    TEST_REQUIRE(device.programs.size() == 1);

    // same key, reused
    TEST_REQUIRE(cache.CompileOrReuse(vertex, fragment, config) == first);
    TEST_REQUIRE(first->GetUsedTimes() == 2);
    TEST_REQUIRE(device.programs.size() == 1);

    // the name is not part of the key
    auto renamed = config;
    renamed.shader_name = "Barrel";
    TEST_REQUIRE(cache.CompileOrReuse(vertex, fragment, renamed) == first);
    TEST_REQUIRE(first->GetUsedTimes() == 3);

    // different features, different program
    auto lit = config;
    lit.num_dir_lights = 1;
    auto* second = cache.CompileOrReuse(vertex, fragment, lit);
    TEST_REQUIRE(second != first);
    TEST_REQUIRE(second->GetCacheKey() != first->GetCacheKey());
    TEST_REQUIRE(cache.GetNumPrograms() == 2);
    TEST_REQUIRE(device.programs.size() == 2);

    // different template, different program
    const auto& other_fragment = MakeTemplate("basic", fragment.source);
    auto* third = cache.CompileOrReuse(vertex, other_fragment, config);
    TEST_REQUIRE(third != first);
    TEST_REQUIRE(cache.GetNumPrograms() == 3);

    cache.Retain(third);
    TEST_REQUIRE(third->GetUsedTimes() == 2);
    cache.Release(third);
    cache.Release(third);
    TEST_REQUIRE(cache.GetNumPrograms() == 2);
    TEST_REQUIRE(device.GetNumLivePrograms() == 2);

    const auto key = first->GetCacheKey();
    cache.Release(first);
    cache.Release(first);
    TEST_REQUIRE(cache.FindProgram(key) == first);
    cache.Release(first);
    TEST_REQUIRE(cache.FindProgram(key) == nullptr);
    TEST_REQUIRE(cache.GetNumPrograms() == 1);
    TEST_REQUIRE(device.GetNumLivePrograms() == 1);

    // compiling again after the release creates a new program
    first = cache.CompileOrReuse(vertex, fragment, config);
    TEST_REQUIRE(first->GetUsedTimes() == 1);
    TEST_REQUIRE(device.programs.size() == 4);

    cache.Release(first);
    cache.Release(second);
    TEST_REQUIRE(cache.GetNumPrograms() == 0);
    TEST_REQUIRE(device.GetNumLivePrograms() == 0);
    TEST_REQUIRE(CountMessages(logger, base::LogEvent::Warning, "still in use") == 0);

    base::SetGlobalLog(nullptr);
}

void unit_test_cache_index0()
{
    TEST_CASE(test::Type::Feature)

    auto library = gfx::ShaderLibrary::CreateDefault();
    TestDevice device;
    gfx::ProgramCache cache(&device, library);

    const auto& vertex = MakeTemplate("standard", "void main() {\n\tgl_Position = vec4(position, 1.0);\n}\n");
    const auto& fragment = MakeTemplate("standard", "void main() {\n\tgl_FragColor = vec4(1.0);\n}\n");

    auto config = MakeConfig();
    auto* plain = cache.CompileOrReuse(vertex, fragment, config);
    TEST_REQUIRE(device.programs[plain->GetProgram().GetHandle()].index0_attribute.empty());

    config.morph_targets = true;
    auto* morphed = cache.CompileOrReuse(vertex, fragment, config);
    TEST_REQUIRE(device.programs[morphed->GetProgram().GetHandle()].index0_attribute == "position");

    config.index0_attribute_name = "uv";
    auto* custom = cache.CompileOrReuse(vertex, fragment, config);
    TEST_REQUIRE(device.programs[custom->GetProgram().GetHandle()].index0_attribute == "uv");

    cache.Release(plain);
    cache.Release(morphed);
    cache.Release(custom);
}

void unit_test_cache_raw()
{
    TEST_CASE(test::Type::Feature)

    auto library = gfx::ShaderLibrary::CreateDefault();
    TestDevice device;
    gfx::ProgramCache cache(&device, library);

    const auto& vertex = MakeTemplate("raw", "uniform vec3 lights[NUM_DIR_LIGHTS];\nvoid main() {}\n");
    const auto& fragment = MakeTemplate("raw", "void main() {}\n");

    auto gles2 = MakeConfig();
    gles2.is_raw = true;
    gles2.glsl_version = gfx::GLSLVersion::GLSL1;
    auto gles3 = gles2;
    gles3.glsl_version = gfx::GLSLVersion::GLSL3;
    TEST_REQUIRE(gles2 != gles3);
    TEST_REQUIRE(gles2.GetCacheKey() != gles3.GetCacheKey());

    auto* first = cache.CompileOrReuse(vertex, fragment, gles2);
    auto* second = cache.CompileOrReuse(vertex, fragment, gles3);
    TEST_REQUIRE(first != second);
    TEST_REQUIRE(cache.GetNumPrograms() == 2);

    const auto& first_vs = device.shaders[device.programs[first->GetProgram().GetHandle()].shaders[0]].source;
    const auto& second_vs = device.shaders[device.programs[second->GetProgram().GetHandle()].shaders[0]].source;
    TEST_REQUIRE(base::StartsWith(first_vs, "#version 100\n"));
    TEST_REQUIRE(base::StartsWith(second_vs, "#version 300 es\n"));

    // light counts are substituted into raw bodies too.
    auto lit = gles3;
    lit.num_dir_lights = 2;
    auto* third = cache.CompileOrReuse(vertex, fragment, lit);
    TEST_REQUIRE(third != second);
    const auto& third_vs = device.shaders[device.programs[third->GetProgram().GetHandle()].shaders[0]].source;
    TEST_REQUIRE(base::Contains(third_vs, "lights[2]"));

    // the labels do not select a different program.
    auto renamed = gles3;
    renamed.shader_name = "Other";
    TEST_REQUIRE(cache.CompileOrReuse(vertex, fragment, renamed) == second);

    cache.Release(first);
    cache.Release(second);
    cache.Release(second);
    cache.Release(third);
    TEST_REQUIRE(cache.GetNumPrograms() == 0);
}

void unit_test_cache_errors()
{
    TEST_CASE(test::Type::Feature)

    auto library = gfx::ShaderLibrary::CreateDefault();
    TestDevice device;
    gfx::ProgramCache cache(&device, library);

    const auto& vertex = MakeTemplate("broken", "#include <missing_chunk>\nvoid main() {}\n");
    const auto& fragment = MakeTemplate("standard", "void main() {}\n");

    try
    {
        cache.CompileOrReuse(vertex, fragment, MakeConfig());
        TEST_REQUIRE(!"Exception was expected");
    }
    catch (const gfx::UnresolvedInclude& e)
    {
        TEST_REQUIRE(e.GetChunkName() == "missing_chunk");
    }
    TEST_REQUIRE(cache.GetNumPrograms() == 0);
    TEST_REQUIRE(device.shaders.empty());

    // the cache options go into the programs it compiles
    device.link_status = false;
    unsigned calls = 0;
    gfx::ProgramCache::Options options;
    options.error_callback = [&calls](const gfx::CompiledProgram&, const gfx::ProgramDiagnostics&) {
        ++calls;
    };
    cache.SetOptions(options);
    auto* program = cache.CompileOrReuse(fragment, fragment, MakeConfig());
    TEST_REQUIRE(program->GetDiagnostics()->runnable == false);
    TEST_REQUIRE(calls == 1);
    cache.Release(program);

    options.check_shader_errors = false;
    cache.SetOptions(options);
    program = cache.CompileOrReuse(fragment, fragment, MakeConfig());
    TEST_REQUIRE(program->GetDiagnostics() == nullptr);
    TEST_REQUIRE(calls == 1);
    cache.Release(program);
}

void unit_test_program_uniforms()
{
    TEST_CASE(test::Type::Feature)

    auto library = gfx::ShaderLibrary::CreateDefault();
    TestDevice device;
    device.AddUniform("diffuse", dev::UniformType::FloatVec3);
    device.AddUniform("map", dev::UniformType::Sampler2D);

    gfx::ProgramCache cache(&device, library);
    const auto& vertex = MakeTemplate("standard", "void main() {}\n");
    const auto& fragment = MakeTemplate("standard", "void main() {}\n");

    auto config = MakeConfig();
    auto* first = cache.CompileOrReuse(vertex, fragment, config);
    config.SetMap(gfx::TextureMap::Map);
    auto* second = cache.CompileOrReuse(vertex, fragment, config);
    TEST_REQUIRE(first != second);

    gfx::TextureUnitAllocator units(device.caps.num_texture_units);
    gfx::PlaceholderTextures placeholders(&device);
    gfx::UniformUploadContext ctx(&device, &units, &placeholders);

    // the programs don't share the uniform state
    device.UseProgram(first->GetProgram());
    first->GetUniforms().SetValue("diffuse", glm::vec3(1.0f), ctx);
    device.UseProgram(second->GetProgram());
    second->GetUniforms().SetValue("diffuse", glm::vec3(1.0f), ctx);
    TEST_REQUIRE(device.uploads.size() == 2);
    first->GetUniforms().SetValue("diffuse", glm::vec3(1.0f), ctx);
    TEST_REQUIRE(device.uploads.size() == 2);

    cache.Release(first);
    cache.Release(second);
}

EXPORT_TEST_MAIN(
int test_main(int argc, char* argv[])
{
    unit_test_compile();
    unit_test_poll_ready();
    unit_test_link_failure();
    unit_test_unchecked();
    unit_test_format_errors();
    unit_test_attributes();
    unit_test_destroy();
    unit_test_cache();
    unit_test_cache_index0();
    unit_test_cache_raw();
    unit_test_cache_errors();
    unit_test_program_uniforms();
    return 0;
}
) // TEST_MAIN
