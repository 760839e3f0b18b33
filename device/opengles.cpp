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

#include <GLES3/gl3.h>

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <vector>
#include <string>

#include "base/assert.h"
#include "base/logging.h"

#include "device/device.h"
#include "device/graphics.h"

// https://registry.khronos.org/OpenGL/extensions/KHR/KHR_parallel_shader_compile.txt
// Accepted by the <pname> parameter of GetShaderiv and GetProgramiv:
#define GL_COMPLETION_STATUS_KHR                                0x91B1

// https://registry.khronos.org/OpenGL/extensions/KHR/KHR_debug.txt
// Tokens accepted by the <target> parameters of Enable, Disable, and IsEnabled:
#define GL_DEBUG_OUTPUT_KHR                                     0x92E0
// Tokens accepted or provided by the <type> parameters of
// DebugMessageControl, DebugMessageInsert and DEBUGPROC, and the <types>
// parameter of GetDebugMessageLog:
#define GL_DEBUG_TYPE_ERROR_KHR                                 0x824C
#define GL_DEBUG_TYPE_DEPRECATED_BEHAVIOR_KHR                   0x824D
#define GL_DEBUG_TYPE_UNDEFINED_BEHAVIOR_KHR                    0x824E
#define GL_DEBUG_TYPE_PERFORMANCE_KHR                           0x8250

static_assert(sizeof(GLint) == sizeof(int) && sizeof(GLuint) == sizeof(unsigned) && sizeof(GLfloat) == sizeof(float),
              "Basic OpenGL type sanity check");

// KHR_debug
typedef void (GL_APIENTRY *GLDEBUGPROC)(GLenum source, GLenum type, GLuint id,GLenum severity, GLsizei length,
                                        const GLchar* message, const void* userParam);
typedef void (GL_APIENTRY *PFNGLDEBUGMESSAGECALLBACKPROC)(GLDEBUGPROC proc, const void* user);

#if !defined(GRAPHICS_CHECK_OPENGL)
#  define GL_CALL(x) mGL.x
#else
#define GL_CALL(x)                                      \
do {                                                    \
    mGL.x;                                              \
    const auto err = mGL.glGetError();                  \
    if (err != GL_NO_ERROR) {                           \
        std::printf("GL Error %s @ %s,%d\n",            \
            GLEnumToStr(err), __FILE__, __LINE__);      \
        std::fflush(stdout);                            \
        std::abort();                                   \
    }                                                   \
} while(0)
#endif

namespace
{

const char* GLEnumToStr(GLenum eval)
{
#define CASE(x) case x: return #x
    switch (eval)
    {
        CASE(GL_NO_ERROR);
        CASE(GL_INVALID_ENUM);
        CASE(GL_INVALID_VALUE);
        CASE(GL_INVALID_OPERATION);
        CASE(GL_OUT_OF_MEMORY);
        CASE(GL_FRAGMENT_SHADER);
        CASE(GL_VERTEX_SHADER);
        CASE(GL_TEXTURE_2D);
        CASE(GL_TEXTURE_3D);
        CASE(GL_TEXTURE_CUBE_MAP);
        CASE(GL_TEXTURE_2D_ARRAY);
    }
    return "???";
#undef CASE
}

void GL_APIENTRY DebugCallback(GLenum source,
                               GLenum type,
                               GLuint id,
                               GLenum severity,
                               GLsizei length, const GLchar* message,
                               const void* user)
{
    if (type == GL_DEBUG_TYPE_PERFORMANCE_KHR)
        WARN("GL perf warning. %1", message);
    else if (type == GL_DEBUG_TYPE_DEPRECATED_BEHAVIOR_KHR)
        WARN("GL deprecated behaviour detected. %1", message);
    else if (type == GL_DEBUG_TYPE_UNDEFINED_BEHAVIOR_KHR)
        WARN("GL undefined behavior detected. %1", message);
    else if (type == GL_DEBUG_TYPE_ERROR_KHR)
        ERROR("GL error detected. %1", message);
}

// The OpenGL ES 3.0 entry points used by the device. The pointers
// are members instead of globals since they can differ from one
// context to another depending on the context configuration.
// All functions are resolved through the context, i.e. nothing
// is expected to be exported by a GL library we link against.
struct OpenGLFunctions
{
    PFNGLCREATEPROGRAMPROC           glCreateProgram;
    PFNGLCREATESHADERPROC            glCreateShader;
    PFNGLSHADERSOURCEPROC            glShaderSource;
    PFNGLGETERRORPROC                glGetError;
    PFNGLCOMPILESHADERPROC           glCompileShader;
    PFNGLATTACHSHADERPROC            glAttachShader;
    PFNGLDELETESHADERPROC            glDeleteShader;
    PFNGLBINDATTRIBLOCATIONPROC      glBindAttribLocation;
    PFNGLLINKPROGRAMPROC             glLinkProgram;
    PFNGLUSEPROGRAMPROC              glUseProgram;
    PFNGLVALIDATEPROGRAMPROC         glValidateProgram;
    PFNGLDELETEPROGRAMPROC           glDeleteProgram;
    PFNGLGETSTRINGPROC               glGetString;
    PFNGLGETSTRINGIPROC              glGetStringi;
    PFNGLGETACTIVEUNIFORMPROC        glGetActiveUniform;
    PFNGLGETACTIVEATTRIBPROC         glGetActiveAttrib;
    PFNGLGETUNIFORMLOCATIONPROC      glGetUniformLocation;
    PFNGLGETATTRIBLOCATIONPROC       glGetAttribLocation;
    PFNGLUNIFORM1FVPROC              glUniform1fv;
    PFNGLUNIFORM2FVPROC              glUniform2fv;
    PFNGLUNIFORM3FVPROC              glUniform3fv;
    PFNGLUNIFORM4FVPROC              glUniform4fv;
    PFNGLUNIFORM1IVPROC              glUniform1iv;
    PFNGLUNIFORM2IVPROC              glUniform2iv;
    PFNGLUNIFORM3IVPROC              glUniform3iv;
    PFNGLUNIFORM4IVPROC              glUniform4iv;
    PFNGLUNIFORM1UIVPROC             glUniform1uiv;
    PFNGLUNIFORM2UIVPROC             glUniform2uiv;
    PFNGLUNIFORM3UIVPROC             glUniform3uiv;
    PFNGLUNIFORM4UIVPROC             glUniform4uiv;
    PFNGLUNIFORMMATRIX2FVPROC        glUniformMatrix2fv;
    PFNGLUNIFORMMATRIX3FVPROC        glUniformMatrix3fv;
    PFNGLUNIFORMMATRIX4FVPROC        glUniformMatrix4fv;
    PFNGLGETPROGRAMIVPROC            glGetProgramiv;
    PFNGLGETSHADERIVPROC             glGetShaderiv;
    PFNGLGETPROGRAMINFOLOGPROC       glGetProgramInfoLog;
    PFNGLGETSHADERINFOLOGPROC        glGetShaderInfoLog;
    PFNGLDELETETEXTURESPROC          glDeleteTextures;
    PFNGLGENTEXTURESPROC             glGenTextures;
    PFNGLBINDTEXTUREPROC             glBindTexture;
    PFNGLACTIVETEXTUREPROC           glActiveTexture;
    PFNGLTEXIMAGE2DPROC              glTexImage2D;
    PFNGLTEXIMAGE3DPROC              glTexImage3D;
    PFNGLTEXPARAMETERIPROC           glTexParameteri;
    PFNGLPIXELSTOREIPROC             glPixelStorei;
    PFNGLENABLEPROC                  glEnable;
    PFNGLGETINTEGERVPROC             glGetIntegerv;

    // KHR_debug
    PFNGLDEBUGMESSAGECALLBACKPROC    glDebugMessageCallback;
};

// OpenGL ES 3.0 based graphics device implementation. Keep this free
// of any windowing system specifics, everything comes through the context.
class OpenGLES3GraphicsDevice : public dev::GraphicsDevice
{
public:
    explicit OpenGLES3GraphicsDevice(std::shared_ptr<dev::Context> context) noexcept
       : mContext(std::move(context))
    {
#define RESOLVE(x) mGL.x = reinterpret_cast<decltype(mGL.x)>(mContext->Resolve(#x));
        RESOLVE(glCreateProgram);
        RESOLVE(glCreateShader);
        RESOLVE(glShaderSource);
        RESOLVE(glGetError);
        RESOLVE(glCompileShader);
        RESOLVE(glAttachShader);
        RESOLVE(glDeleteShader);
        RESOLVE(glBindAttribLocation);
        RESOLVE(glLinkProgram);
        RESOLVE(glUseProgram);
        RESOLVE(glValidateProgram);
        RESOLVE(glDeleteProgram);
        RESOLVE(glGetString);
        RESOLVE(glGetStringi);
        RESOLVE(glGetActiveUniform);
        RESOLVE(glGetActiveAttrib);
        RESOLVE(glGetUniformLocation);
        RESOLVE(glGetAttribLocation);
        RESOLVE(glUniform1fv);
        RESOLVE(glUniform2fv);
        RESOLVE(glUniform3fv);
        RESOLVE(glUniform4fv);
        RESOLVE(glUniform1iv);
        RESOLVE(glUniform2iv);
        RESOLVE(glUniform3iv);
        RESOLVE(glUniform4iv);
        RESOLVE(glUniform1uiv);
        RESOLVE(glUniform2uiv);
        RESOLVE(glUniform3uiv);
        RESOLVE(glUniform4uiv);
        RESOLVE(glUniformMatrix2fv);
        RESOLVE(glUniformMatrix3fv);
        RESOLVE(glUniformMatrix4fv);
        RESOLVE(glGetProgramiv);
        RESOLVE(glGetShaderiv);
        RESOLVE(glGetProgramInfoLog);
        RESOLVE(glGetShaderInfoLog);
        RESOLVE(glDeleteTextures);
        RESOLVE(glGenTextures);
        RESOLVE(glBindTexture);
        RESOLVE(glActiveTexture);
        RESOLVE(glTexImage2D);
        RESOLVE(glTexImage3D);
        RESOLVE(glTexParameteri);
        RESOLVE(glPixelStorei);
        RESOLVE(glEnable);
        RESOLVE(glGetIntegerv);
        // KHR_debug
        RESOLVE(glDebugMessageCallback);
#undef RESOLVE

        GLint max_texture_units = 0;
        GLint num_extensions = 0;
        GL_CALL(glGetIntegerv(GL_MAX_TEXTURE_IMAGE_UNITS, &max_texture_units));
        GL_CALL(glGetIntegerv(GL_NUM_EXTENSIONS, &num_extensions));

        for (GLint i=0; i<num_extensions; ++i)
        {
            const std::string extension = (const char*)mGL.glGetStringi(GL_EXTENSIONS, i);
            if (extension == "GL_KHR_parallel_shader_compile")
                mExtensions.KHR_parallel_shader_compile = true;
            else if (extension == "GL_ANGLE_clip_cull_distance")
                mExtensions.ANGLE_clip_cull_distance = true;
            else if (extension == "GL_ANGLE_multi_draw")
                mExtensions.ANGLE_multi_draw = true;
            DEBUG("Found extension '%1'", extension);
        }

        // print the device information only once.
        static bool have_printed_info = false;
        if (!have_printed_info)
        {
            INFO("GL %1 Vendor: %2, %3",
                 (const char*)mGL.glGetString(GL_VERSION),
                 (const char*)mGL.glGetString(GL_VENDOR),
                 (const char*)mGL.glGetString(GL_RENDERER));
            INFO("Fragment shader texture units: %1", max_texture_units);
            INFO("Parallel shader compile: %1", mExtensions.KHR_parallel_shader_compile ? "YES" : "NO");
            INFO("Clip cull distance: %1", mExtensions.ANGLE_clip_cull_distance ? "YES" : "NO");
            INFO("Multi draw: %1", mExtensions.ANGLE_multi_draw ? "YES" : "NO");
            have_printed_info = true;
        }

        if (mContext->IsDebug() && mGL.glDebugMessageCallback)
        {
            GL_CALL(glDebugMessageCallback(DebugCallback, nullptr));
            GL_CALL(glEnable(GL_DEBUG_OUTPUT_KHR));
            INFO("Debug output is enabled.");
        }
        mTextureUnitCount = static_cast<unsigned>(max_texture_units);

        GL_CALL(glPixelStorei(GL_UNPACK_ALIGNMENT, 1));
    }

    ~OpenGLES3GraphicsDevice() override
    {
        DEBUG("Destroy OpenGLES3GraphicsDevice");
    }

    dev::GraphicsShader CompileShader(const std::string& source, dev::ShaderType type) override
    {
        GLuint shader = mGL.glCreateShader(GetEnum(type));
        if (shader == 0)
            ERROR_RETURN(dev::GraphicsShader {}, "Failed to create shader object. [type=%1]", dev::ToString(type));

        const char* source_ptr = source.c_str();
        GL_CALL(glShaderSource(shader, 1, &source_ptr, nullptr));
        GL_CALL(glCompileShader(shader));

        dev::GraphicsShader ret;
        ret.handle = shader;
        ret.type   = type;
        return ret;
    }

    bool GetShaderCompileStatus(const dev::GraphicsShader& shader) const override
    {
        GLint status = 0;
        GL_CALL(glGetShaderiv(shader.handle, GL_COMPILE_STATUS, &status));
        return status == GL_TRUE;
    }

    std::string GetShaderInfoLog(const dev::GraphicsShader& shader) const override
    {
        GLint length = 0;
        GL_CALL(glGetShaderiv(shader.handle, GL_INFO_LOG_LENGTH, &length));
        if (length <= 0)
            return "";

        std::string info;
        info.resize(length);
        GL_CALL(glGetShaderInfoLog(shader.handle, length, nullptr, &info[0]));
        // the log length includes the null terminator.
        if (!info.empty() && info.back() == 0)
            info.pop_back();
        return info;
    }

    dev::GraphicsProgram BuildProgram(const std::vector<dev::GraphicsShader>& shaders,
                                      const std::string& index0_attribute) override
    {
        GLuint program = mGL.glCreateProgram();
        if (program == 0)
            ERROR_RETURN(dev::GraphicsProgram {}, "Failed to create program object.");

        for (const auto& shader: shaders)
        {
            ASSERT(shader.IsValid());
            GL_CALL(glAttachShader(program, shader.GetHandle()));
        }
        if (!index0_attribute.empty())
        {
            GL_CALL(glBindAttribLocation(program, 0, index0_attribute.c_str()));
        }
        GL_CALL(glLinkProgram(program));

        dev::GraphicsProgram ret;
        ret.handle = program;
        return ret;
    }

    bool GetProgramLinkStatus(const dev::GraphicsProgram& program) const override
    {
        GLint status = 0;
        GL_CALL(glGetProgramiv(program.handle, GL_LINK_STATUS, &status));
        return status == GL_TRUE;
    }

    bool GetProgramValidateStatus(const dev::GraphicsProgram& program) const override
    {
        GLint status = 0;
        GL_CALL(glGetProgramiv(program.handle, GL_VALIDATE_STATUS, &status));
        return status == GL_TRUE;
    }

    std::string GetProgramInfoLog(const dev::GraphicsProgram& program) const override
    {
        GLint length = 0;
        GL_CALL(glGetProgramiv(program.handle, GL_INFO_LOG_LENGTH, &length));
        if (length <= 0)
            return "";

        std::string info;
        info.resize(length);
        GL_CALL(glGetProgramInfoLog(program.handle, length, nullptr, &info[0]));
        if (!info.empty() && info.back() == 0)
            info.pop_back();
        return info;
    }

    bool IsProgramCompletionReady(const dev::GraphicsProgram& program) const override
    {
        if (!mExtensions.KHR_parallel_shader_compile)
            return true;

        GLint status = 0;
        GL_CALL(glGetProgramiv(program.handle, GL_COMPLETION_STATUS_KHR, &status));
        return status == GL_TRUE;
    }

    unsigned GetError() const override
    {
        return mGL.glGetError();
    }

    std::vector<dev::ActiveUniform> EnumerateUniforms(const dev::GraphicsProgram& program) const override
    {
        GLint count = 0;
        GLint max_length = 0;
        GL_CALL(glGetProgramiv(program.handle, GL_ACTIVE_UNIFORMS, &count));
        GL_CALL(glGetProgramiv(program.handle, GL_ACTIVE_UNIFORM_MAX_LENGTH, &max_length));

        std::vector<dev::ActiveUniform> ret;
        std::vector<GLchar> name(max_length + 1);
        for (GLint i=0; i<count; ++i)
        {
            GLsizei length = 0;
            GLint size = 0;
            GLenum type = GL_NONE;
            GL_CALL(glGetActiveUniform(program.handle, i, (GLsizei)name.size(), &length, &size, &type, &name[0]));

            dev::ActiveUniform uniform;
            uniform.name     = std::string(&name[0], length);
            uniform.type     = static_cast<dev::UniformType>(type);
            uniform.size     = static_cast<unsigned>(size);
            uniform.location = mGL.glGetUniformLocation(program.handle, uniform.name.c_str());
            ret.push_back(std::move(uniform));
        }
        return ret;
    }

    std::vector<dev::ActiveAttribute> EnumerateAttributes(const dev::GraphicsProgram& program) const override
    {
        GLint count = 0;
        GLint max_length = 0;
        GL_CALL(glGetProgramiv(program.handle, GL_ACTIVE_ATTRIBUTES, &count));
        GL_CALL(glGetProgramiv(program.handle, GL_ACTIVE_ATTRIBUTE_MAX_LENGTH, &max_length));

        std::vector<dev::ActiveAttribute> ret;
        std::vector<GLchar> name(max_length + 1);
        for (GLint i=0; i<count; ++i)
        {
            GLsizei length = 0;
            GLint size = 0;
            GLenum type = GL_NONE;
            GL_CALL(glGetActiveAttrib(program.handle, i, (GLsizei)name.size(), &length, &size, &type, &name[0]));

            dev::ActiveAttribute attribute;
            attribute.name     = std::string(&name[0], length);
            attribute.type     = static_cast<dev::UniformType>(type);
            attribute.size     = static_cast<unsigned>(size);
            attribute.location = mGL.glGetAttribLocation(program.handle, attribute.name.c_str());
            ret.push_back(std::move(attribute));
        }
        return ret;
    }

    void UseProgram(const dev::GraphicsProgram& program) override
    {
        GL_CALL(glUseProgram(program.handle));
    }

    // if the glUniformXYZ gives GL_INVALID_OPERATION a possible
    // cause is using wrong API for the uniform. for example
    // calling glUniform1fv when the uniform is an int.

    void SetUniformFloat(int location, unsigned components, unsigned count, const float* data) override
    {
        if (components == 1)
            GL_CALL(glUniform1fv(location, count, data));
        else if (components == 2)
            GL_CALL(glUniform2fv(location, count, data));
        else if (components == 3)
            GL_CALL(glUniform3fv(location, count, data));
        else if (components == 4)
            GL_CALL(glUniform4fv(location, count, data));
        else BUG("Unsupported float vector size.");
    }
    void SetUniformInt(int location, unsigned components, unsigned count, const int* data) override
    {
        if (components == 1)
            GL_CALL(glUniform1iv(location, count, data));
        else if (components == 2)
            GL_CALL(glUniform2iv(location, count, data));
        else if (components == 3)
            GL_CALL(glUniform3iv(location, count, data));
        else if (components == 4)
            GL_CALL(glUniform4iv(location, count, data));
        else BUG("Unsupported int vector size.");
    }
    void SetUniformUint(int location, unsigned components, unsigned count, const unsigned* data) override
    {
        if (components == 1)
            GL_CALL(glUniform1uiv(location, count, data));
        else if (components == 2)
            GL_CALL(glUniform2uiv(location, count, data));
        else if (components == 3)
            GL_CALL(glUniform3uiv(location, count, data));
        else if (components == 4)
            GL_CALL(glUniform4uiv(location, count, data));
        else BUG("Unsupported uint vector size.");
    }
    void SetUniformMatrix(int location, unsigned rank, unsigned count, const float* data) override
    {
        if (rank == 2)
            GL_CALL(glUniformMatrix2fv(location, count, GL_FALSE /* transpose */, data));
        else if (rank == 3)
            GL_CALL(glUniformMatrix3fv(location, count, GL_FALSE /* transpose */, data));
        else if (rank == 4)
            GL_CALL(glUniformMatrix4fv(location, count, GL_FALSE /* transpose */, data));
        else BUG("Unsupported matrix rank.");
    }

    void BindTexture(unsigned unit, const dev::TextureObject& texture) override
    {
        ASSERT(unit < mTextureUnitCount);
        GL_CALL(glActiveTexture(GL_TEXTURE0 + unit));
        GL_CALL(glBindTexture(GetTarget(texture.type), texture.handle));
    }

    dev::TextureObject AllocatePlaceholderTexture(dev::TextureType type) override
    {
        GLuint handle = 0;
        GL_CALL(glGenTextures(1, &handle));

        const GLenum target = GetTarget(type);
        // use the last unit for the allocation in order to not disturb
        // the bindings on the units the programs use.
        GL_CALL(glActiveTexture(GL_TEXTURE0 + mTextureUnitCount - 1));
        GL_CALL(glBindTexture(target, handle));

        const unsigned char rgba[4] = {0, 0, 0, 0};
        const unsigned short depth = 0;
        if (type == dev::TextureType::Texture2D)
        {
            GL_CALL(glTexImage2D(GL_TEXTURE_2D, 0, GL_RGBA8, 1, 1, 0, GL_RGBA, GL_UNSIGNED_BYTE, rgba));
        }
        else if (type == dev::TextureType::DepthTexture2D)
        {
            GL_CALL(glTexImage2D(GL_TEXTURE_2D, 0, GL_DEPTH_COMPONENT16, 1, 1, 0, GL_DEPTH_COMPONENT, GL_UNSIGNED_SHORT, &depth));
            GL_CALL(glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_COMPARE_MODE, GL_COMPARE_REF_TO_TEXTURE));
            GL_CALL(glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_COMPARE_FUNC, GL_LEQUAL));
        }
        else if (type == dev::TextureType::Texture3D || type == dev::TextureType::Texture2DArray)
        {
            GL_CALL(glTexImage3D(target, 0, GL_RGBA8, 1, 1, 1, 0, GL_RGBA, GL_UNSIGNED_BYTE, rgba));
        }
        else if (type == dev::TextureType::TextureCube)
        {
            for (unsigned face=0; face<6; ++face)
            {
                GL_CALL(glTexImage2D(GL_TEXTURE_CUBE_MAP_POSITIVE_X + face, 0, GL_RGBA8, 1, 1, 0, GL_RGBA, GL_UNSIGNED_BYTE, rgba));
            }
        } else BUG("Unsupported placeholder texture type.");

        // no mips, texture must use a non-mipmap filter to be complete.
        GL_CALL(glTexParameteri(target, GL_TEXTURE_MIN_FILTER, GL_NEAREST));
        GL_CALL(glTexParameteri(target, GL_TEXTURE_MAG_FILTER, GL_NEAREST));
        GL_CALL(glBindTexture(target, 0));

        DEBUG("Allocated placeholder texture. [type=%1, handle=%2]", dev::ToString(type), handle);

        dev::TextureObject ret;
        ret.type   = type;
        ret.handle = handle;
        ret.texture_width  = 1;
        ret.texture_height = 1;
        ret.texture_depth  = 1;
        return ret;
    }

    void DeleteShader(const dev::GraphicsShader& shader) override
    {
        GL_CALL(glDeleteShader(shader.handle));
    }

    void DeleteProgram(const dev::GraphicsProgram& program) override
    {
        GL_CALL(glDeleteProgram(program.handle));
    }

    void DeleteTexture(const dev::TextureObject& texture) override
    {
        GL_CALL(glDeleteTextures(1, &texture.handle));
    }

    void GetDeviceCaps(dev::GraphicsDeviceCaps* caps) const override
    {
        caps->num_texture_units       = mTextureUnitCount;
        caps->parallel_shader_compile = mExtensions.KHR_parallel_shader_compile;
        caps->clip_cull_distance      = mExtensions.ANGLE_clip_cull_distance;
        caps->multi_draw              = mExtensions.ANGLE_multi_draw;
    }
private:
    static GLenum GetEnum(dev::ShaderType type)
    {
        if (type == dev::ShaderType::VertexShader)
            return GL_VERTEX_SHADER;
        else if (type == dev::ShaderType::FragmentShader)
            return GL_FRAGMENT_SHADER;

        BUG("Bug on shader type.");
        return GL_NONE;
    }
    static GLenum GetTarget(dev::TextureType type)
    {
        if (type == dev::TextureType::Texture2D || type == dev::TextureType::DepthTexture2D)
            return GL_TEXTURE_2D;
        else if (type == dev::TextureType::Texture3D)
            return GL_TEXTURE_3D;
        else if (type == dev::TextureType::TextureCube)
            return GL_TEXTURE_CUBE_MAP;
        else if (type == dev::TextureType::Texture2DArray)
            return GL_TEXTURE_2D_ARRAY;

        BUG("Bug on texture type.");
        return GL_NONE;
    }
private:
    std::shared_ptr<dev::Context> mContext;
    OpenGLFunctions mGL;
    unsigned mTextureUnitCount = 0;

    struct Extensions {
        bool KHR_parallel_shader_compile = false;
        bool ANGLE_clip_cull_distance = false;
        bool ANGLE_multi_draw = false;
    } mExtensions;
};

} // namespace

namespace dev {

std::shared_ptr<GraphicsDevice> CreateDevice(std::shared_ptr<dev::Context> context)
{
    if (context->GetVersion() == Context::Version::OpenGL_ES3 ||
        context->GetVersion() == Context::Version::WebGL_2)
        return std::make_shared<OpenGLES3GraphicsDevice>(std::move(context));
    else BUG("No such device implemented.");
    return nullptr;
}

} // namespace
