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
#  include <glm/mat4x4.hpp>
#  include <glm/vec2.hpp>
#  include <glm/vec3.hpp>
#include "warnpop.h"

#include <stdexcept>
#include <string>

#include "base/test_minimal.h"
#include "base/logging.h"
#include "base/utility.h"
#include "graphics/texture_units.h"
#include "graphics/uniform_path.h"
#include "graphics/uniform_setters.h"
#include "graphics/uniform_tree.h"
#include "graphics/uniform_value.h"
#include "graphics/unit_test/test_device.h"

namespace {
struct Fixture {
    TestDevice device;
    gfx::TextureUnitAllocator units;
    gfx::PlaceholderTextures placeholders;
    gfx::UniformUploadContext ctx;

    explicit Fixture(unsigned max_units = 16)
      : units(max_units)
      , placeholders(&device)
      , ctx(&device, &units, &placeholders)
    {}

    std::unique_ptr<gfx::UniformContainer> Build(unsigned handle = 1)
    {
        dev::GraphicsProgram program;
        program.handle = handle;
        return gfx::UniformContainer::Build(device, program);
    }
};

size_t CountWarnings(const base::BufferLogger<base::NullLogger>& logger, const std::string& what)
{
    size_t count = 0;
    for (size_t i=0; i<logger.GetBufferMsgCount(); ++i)
    {
        const auto& msg = logger.GetMessage(i);
        if (msg.type == base::LogEvent::Warning && base::Contains(msg.msg, what))
            ++count;
    }
    return count;
}

gfx::StructuredUniform& AsStruct(gfx::UniformNode* node)
{
    TEST_REQUIRE(node);
    TEST_REQUIRE(node->GetType() == gfx::UniformNode::Type::Structured);
    return *static_cast<gfx::StructuredUniform*>(node);
}
gfx::UniformLeaf& AsLeaf(gfx::UniformNode* node)
{
    TEST_REQUIRE(node);
    TEST_REQUIRE(node->GetType() != gfx::UniformNode::Type::Structured);
    return *static_cast<gfx::UniformLeaf*>(node);
}
} // namespace

void unit_test_path()
{
    TEST_CASE(test::Type::Feature)

    using Kind = gfx::UniformPathSegment::Kind;

    {
        const auto& path = gfx::ParseUniformPath("diffuse");
        TEST_REQUIRE(path.size() == 1);
        TEST_REQUIRE(path[0].id == "diffuse");
        TEST_REQUIRE(path[0].kind == Kind::Leaf);
        TEST_REQUIRE(path[0].is_index == false);
    }
    {
        const auto& path = gfx::ParseUniformPath("boneMatrices[0]");
        TEST_REQUIRE(path.size() == 1);
        TEST_REQUIRE(path[0].id == "boneMatrices");
        TEST_REQUIRE(path[0].kind == Kind::ArrayLeaf);
    }
    {
        const auto& path = gfx::ParseUniformPath("light.shadow.mapSize");
        TEST_REQUIRE(path.size() == 3);
        TEST_REQUIRE(path[0].id == "light");
        TEST_REQUIRE(path[0].kind == Kind::Member);
        TEST_REQUIRE(path[1].id == "shadow");
        TEST_REQUIRE(path[1].kind == Kind::Member);
        TEST_REQUIRE(path[2].id == "mapSize");
        TEST_REQUIRE(path[2].kind == Kind::Leaf);
    }
    {
        const auto& path = gfx::ParseUniformPath("pointLights[12].color");
        TEST_REQUIRE(path.size() == 3);
        TEST_REQUIRE(path[0].id == "pointLights");
        TEST_REQUIRE(path[0].kind == Kind::Element);
        TEST_REQUIRE(path[0].is_index == false);
        TEST_REQUIRE(path[1].id == "12");
        TEST_REQUIRE(path[1].kind == Kind::Member);
        TEST_REQUIRE(path[1].is_index == true);
        TEST_REQUIRE(path[2].id == "color");
        TEST_REQUIRE(path[2].kind == Kind::Leaf);
    }
    {
        const auto& path = gfx::ParseUniformPath("spotLights[1].shadowMatrix[0]");
        TEST_REQUIRE(path.size() == 3);
        TEST_REQUIRE(path[1].id == "1");
        TEST_REQUIRE(path[1].is_index);
        TEST_REQUIRE(path[2].id == "shadowMatrix");
        TEST_REQUIRE(path[2].kind == Kind::ArrayLeaf);
        TEST_REQUIRE(path[2].IsLeaf());
    }
    {
        // array of arrays of structs
        const auto& path = gfx::ParseUniformPath("a[1][2].b");
        TEST_REQUIRE(path.size() == 4);
        TEST_REQUIRE(path[1].id == "1");
        TEST_REQUIRE(path[1].kind == Kind::Element);
        TEST_REQUIRE(path[2].id == "2");
        TEST_REQUIRE(path[2].kind == Kind::Member);
        TEST_REQUIRE(path[3].id == "b");
    }

    base::BufferLogger<base::NullLogger> logger;
    logger.EnableWrite(base::Logger::WriteType::WriteFormatted, false);
    base::SetGlobalLog(&logger);

    TEST_REQUIRE(gfx::ParseUniformPath("").empty());
    TEST_REQUIRE(gfx::ParseUniformPath("a..b").empty());
    TEST_REQUIRE(gfx::ParseUniformPath("a]").empty());
    TEST_REQUIRE(gfx::ParseUniformPath("a[0").empty());
    TEST_REQUIRE(gfx::ParseUniformPath("a b").empty());
    TEST_REQUIRE(gfx::ParseUniformPath("a.").empty());
    TEST_REQUIRE(gfx::ParseUniformPath("a[0]x").empty());
    TEST_REQUIRE(CountWarnings(logger, "malformed") == 7);

    base::SetGlobalLog(nullptr);
}

void unit_test_value()
{
    TEST_CASE(test::Type::Feature)

    gfx::UniformValue empty;
    TEST_REQUIRE(empty.IsEmpty());
    TEST_REQUIRE(empty.GetArraySize() == 0);
    TEST_EXCEPTION(empty.At(0));

    gfx::UniformValue array(gfx::UniformArray { 1.0f, glm::vec2(2.0f, 3.0f), std::vector<float>{4.0f, 5.0f} });
    TEST_REQUIRE(array.IsArray());
    TEST_REQUIRE(array.GetArraySize() == 3);
    TEST_REQUIRE(*array.At(0).GetIf<float>() == 1.0f);
    TEST_EXCEPTION(array.At(3));

    std::vector<float> floats;
    TEST_REQUIRE(array.FlattenFloat(&floats));
    TEST_REQUIRE(floats == std::vector<float>({1.0f, 2.0f, 3.0f, 4.0f, 5.0f}));

    gfx::UniformValue object(gfx::UniformObject { {"color", glm::vec3(1.0f)}, {"visible", true} });
    TEST_REQUIRE(object.IsObject());
    TEST_REQUIRE(object.FindMember("color"));
    TEST_REQUIRE(object.FindMember("nope") == nullptr);
    TEST_REQUIRE(array.FindMember("color") == nullptr);

    std::vector<int> ints;
    TEST_REQUIRE(object.FindMember("visible")->FlattenInt(&ints));
    TEST_REQUIRE(ints == std::vector<int>({1}));

    // matrices are column major
    glm::mat2 mat(1.0f, 2.0f, 3.0f, 4.0f);
    floats.clear();
    TEST_REQUIRE(gfx::UniformValue(mat).FlattenFloat(&floats));
    TEST_REQUIRE(floats == std::vector<float>({1.0f, 2.0f, 3.0f, 4.0f}));

    // not numeric
    floats.clear();
    TEST_REQUIRE(gfx::UniformValue(dev::TextureObject{}).FlattenFloat(&floats) == false);
    TEST_REQUIRE(object.FlattenFloat(&floats) == false);

    // copies share the composite content
    gfx::UniformValue copy = array;
    TEST_REQUIRE(&copy.At(0) == &array.At(0));
}

void unit_test_build_tree()
{
    TEST_CASE(test::Type::Feature)

    base::BufferLogger<base::NullLogger> logger;
    logger.EnableWrite(base::Logger::WriteType::WriteFormatted, false);
    base::SetGlobalLog(&logger);

    Fixture fix;
    fix.device.AddUniform("diffuse", dev::UniformType::FloatVec3);
    fix.device.AddUniform("boneMatrices[0]", dev::UniformType::FloatMat4, 4);
    fix.device.AddUniform("light.shadow.mapSize", dev::UniformType::FloatVec2);
    fix.device.AddUniform("light.intensity", dev::UniformType::Float);
    fix.device.AddUniform("lights[0].color", dev::UniformType::FloatVec3);
    fix.device.AddUniform("lights[0].direction", dev::UniformType::FloatVec3);
    fix.device.AddUniform("lights[1].color", dev::UniformType::FloatVec3);
    fix.device.AddUniform("lights[1].direction", dev::UniformType::FloatVec3);
    fix.device.AddUniform("map", dev::UniformType::Sampler2D);
    fix.device.AddUniform("bad name", dev::UniformType::Float);
    fix.device.AddUniform("inactive", dev::UniformType::Float).location = -1;
    // conflicts with the structure above
    fix.device.AddUniform("light", dev::UniformType::Float);

    auto tree = fix.Build();
    TEST_REQUIRE(tree->GetNumNodes() == 5);
    TEST_REQUIRE(tree->GetNode(0).GetId() == "diffuse");
    TEST_REQUIRE(tree->GetNode(1).GetId() == "boneMatrices");
    TEST_REQUIRE(tree->GetNode(2).GetId() == "light");
    TEST_REQUIRE(tree->GetNode(3).GetId() == "lights");
    TEST_REQUIRE(tree->GetNode(4).GetId() == "map");
    TEST_EXCEPTION(tree->GetNode(5));
    TEST_REQUIRE(tree->FindNode("inactive") == nullptr);
    TEST_REQUIRE(tree->FindNode("bad name") == nullptr);
    TEST_REQUIRE(tree->FindNode("bad") == nullptr);
    TEST_REQUIRE(CountWarnings(logger, "malformed") == 1);
    TEST_REQUIRE(CountWarnings(logger, "conflicts") == 1);

    TEST_REQUIRE(tree->FindNode("diffuse")->GetType() == gfx::UniformNode::Type::Single);
    auto& bones = AsLeaf(tree->FindNode("boneMatrices"));
    TEST_REQUIRE(bones.GetType() == gfx::UniformNode::Type::PureArray);
    TEST_REQUIRE(bones.GetSize() == 4);
    TEST_REQUIRE(bones.GetLocation() == 1);
    TEST_REQUIRE(bones.GetFloatCache().size() == 64);
    TEST_REQUIRE(bones.GetNumCached() == 0);

    auto& light = AsStruct(tree->FindNode("light"));
    TEST_REQUIRE(light.GetChildren().GetNumNodes() == 2);
    auto& shadow = AsStruct(light.GetChildren().FindNode("shadow"));
    auto& size = AsLeaf(shadow.GetChildren().FindNode("mapSize"));
    TEST_REQUIRE(size.GetLocation() == 2);
    TEST_REQUIRE(size.GetUniformType() == dev::UniformType::FloatVec2);
    TEST_REQUIRE(size.GetFloatCache().size() == 2);

    auto& lights = AsStruct(tree->FindNode("lights"));
    TEST_REQUIRE(lights.GetChildren().GetNumNodes() == 2);
    TEST_REQUIRE(lights.GetChildren().GetNode(0).GetId() == "0");
    TEST_REQUIRE(lights.GetChildren().GetNode(0).IsIndex());
    TEST_REQUIRE(lights.GetChildren().GetNode(1).GetId() == "1");
    auto& second = AsStruct(lights.GetChildren().FindNode("1"));
    TEST_REQUIRE(AsLeaf(second.GetChildren().FindNode("direction")).GetLocation() == 7);

    auto& map = AsLeaf(tree->FindNode("map"));
    TEST_REQUIRE(map.GetIntCache().size() == 1);
    TEST_REQUIRE(map.GetFloatCache().empty());

    base::SetGlobalLog(nullptr);
}

void unit_test_diff_cache()
{
    TEST_CASE(test::Type::Feature)

    Fixture fix;
    fix.device.AddUniform("diffuse", dev::UniformType::FloatVec3);
    fix.device.AddUniform("opacity", dev::UniformType::Float);
    fix.device.AddUniform("flag", dev::UniformType::Bool);
    fix.device.AddUniform("mask", dev::UniformType::UnsignedInt);
    fix.device.AddUniform("offset", dev::UniformType::IntVec2);
    fix.device.AddUniform("normalMatrix", dev::UniformType::FloatMat3);
    auto tree = fix.Build();
    auto& ctx = fix.ctx;
    auto& uploads = fix.device.uploads;

    tree->SetValue("diffuse", glm::vec3(1.0f, 2.0f, 3.0f), ctx);
    TEST_REQUIRE(uploads.size() == 1);
    TEST_REQUIRE(uploads[0].kind == TestDevice::Upload::Kind::Float);
    TEST_REQUIRE(uploads[0].location == 0);
    TEST_REQUIRE(uploads[0].components == 3);
    TEST_REQUIRE(uploads[0].count == 1);
    TEST_REQUIRE(uploads[0].floats == std::vector<float>({1.0f, 2.0f, 3.0f}));

    // same value again, nothing is uploaded
    tree->SetValue("diffuse", glm::vec3(1.0f, 2.0f, 3.0f), ctx);
    TEST_REQUIRE(uploads.size() == 1);
    // same value as a flat sequence
    tree->SetValue("diffuse", std::vector<float>{1.0f, 2.0f, 3.0f}, ctx);
    TEST_REQUIRE(uploads.size() == 1);
    // changed component
    tree->SetValue("diffuse", glm::vec3(1.0f, 2.0f, 4.0f), ctx);
    TEST_REQUIRE(uploads.size() == 2);
    TEST_REQUIRE(uploads[1].floats == std::vector<float>({1.0f, 2.0f, 4.0f}));

    tree->SetValue("opacity", 0.5f, ctx);
    tree->SetValue("opacity", 0.5f, ctx);
    TEST_REQUIRE(uploads.size() == 3);
    TEST_REQUIRE(uploads[2].floats == std::vector<float>({0.5f}));

    tree->SetValue("flag", true, ctx);
    tree->SetValue("flag", true, ctx);
    TEST_REQUIRE(uploads.size() == 4);
    TEST_REQUIRE(uploads[3].kind == TestDevice::Upload::Kind::Int);
    TEST_REQUIRE(uploads[3].ints == std::vector<int>({1}));
    tree->SetValue("flag", false, ctx);
    TEST_REQUIRE(uploads.size() == 5);
    TEST_REQUIRE(uploads[4].ints == std::vector<int>({0}));

    tree->SetValue("mask", 7u, ctx);
    TEST_REQUIRE(uploads.size() == 6);
    TEST_REQUIRE(uploads[5].kind == TestDevice::Upload::Kind::Uint);
    TEST_REQUIRE(uploads[5].uints == std::vector<unsigned>({7u}));

    tree->SetValue("offset", glm::ivec2(-1, 2), ctx);
    TEST_REQUIRE(uploads.size() == 7);
    TEST_REQUIRE(uploads[6].kind == TestDevice::Upload::Kind::Int);
    TEST_REQUIRE(uploads[6].components == 2);
    TEST_REQUIRE(uploads[6].ints == std::vector<int>({-1, 2}));

    glm::mat3 normal(1.0f);
    tree->SetValue("normalMatrix", normal, ctx);
    tree->SetValue("normalMatrix", normal, ctx);
    TEST_REQUIRE(uploads.size() == 8);
    TEST_REQUIRE(uploads[7].kind == TestDevice::Upload::Kind::Matrix);
    TEST_REQUIRE(uploads[7].components == 3);
    TEST_REQUIRE(uploads[7].count == 1);
    TEST_REQUIRE(uploads[7].floats.size() == 9);
    TEST_REQUIRE(uploads[7].floats[0] == 1.0f);
    TEST_REQUIRE(uploads[7].floats[1] == 0.0f);
    normal[2][1] = 5.0f;
    tree->SetValue("normalMatrix", normal, ctx);
    TEST_REQUIRE(uploads.size() == 9);
    TEST_REQUIRE(uploads[8].floats[7] == 5.0f);

    // unknown names are ignored
    tree->SetValue("nope", 1.0f, ctx);
    TEST_REQUIRE(uploads.size() == 9);

    // values that don't fit are ignored with a warning
    base::BufferLogger<base::NullLogger> logger;
    logger.EnableWrite(base::Logger::WriteType::WriteFormatted, false);
    base::SetGlobalLog(&logger);
    tree->SetValue("diffuse", 1.0f, ctx);
    tree->SetValue("diffuse", dev::TextureObject{}, ctx);
    TEST_REQUIRE(uploads.size() == 9);
    TEST_REQUIRE(CountWarnings(logger, "too few components") == 1);
    TEST_REQUIRE(CountWarnings(logger, "type mismatch") == 1);
    base::SetGlobalLog(nullptr);
}

void unit_test_pure_array()
{
    TEST_CASE(test::Type::Feature)

    Fixture fix;
    fix.device.AddUniform("boneMatrices[0]", dev::UniformType::FloatMat4, 4);
    fix.device.AddUniform("weights[0]", dev::UniformType::Float, 3);
    auto tree = fix.Build();
    auto& uploads = fix.device.uploads;

    TEST_REQUIRE(tree->GetNumNodes() == 2);

    gfx::UniformArray bones;
    for (int i=0; i<4; ++i)
        bones.push_back(glm::mat4(static_cast<float>(i + 1)));

    // the whole array goes up in one call
    tree->SetValue("boneMatrices", bones, fix.ctx);
    TEST_REQUIRE(uploads.size() == 1);
    TEST_REQUIRE(uploads[0].kind == TestDevice::Upload::Kind::Matrix);
    TEST_REQUIRE(uploads[0].location == 0);
    TEST_REQUIRE(uploads[0].components == 4);
    TEST_REQUIRE(uploads[0].count == 4);
    TEST_REQUIRE(uploads[0].floats.size() == 64);
    TEST_REQUIRE(uploads[0].floats[0] == 1.0f);
    TEST_REQUIRE(uploads[0].floats[48] == 4.0f);

    // same content, no upload
    tree->SetValue("boneMatrices", bones, fix.ctx);
    TEST_REQUIRE(uploads.size() == 1);

    // one element changes, the whole array is uploaded
    bones[2] = glm::mat4(10.0f);
    tree->SetValue("boneMatrices", bones, fix.ctx);
    TEST_REQUIRE(uploads.size() == 2);
    TEST_REQUIRE(uploads[1].count == 4);
    TEST_REQUIRE(uploads[1].floats[32] == 10.0f);

    // flat numeric array
    tree->SetValue("weights", std::vector<float>{0.1f, 0.2f, 0.3f}, fix.ctx);
    TEST_REQUIRE(uploads.size() == 3);
    TEST_REQUIRE(uploads[2].components == 1);
    TEST_REQUIRE(uploads[2].count == 3);
    tree->SetValue("weights", std::vector<float>{0.1f, 0.2f, 0.3f}, fix.ctx);
    TEST_REQUIRE(uploads.size() == 3);

    // longer than the uniform, clamped to the uniform size
    tree->SetValue("weights", std::vector<float>{0.5f, 0.2f, 0.3f, 0.4f}, fix.ctx);
    TEST_REQUIRE(uploads.size() == 4);
    TEST_REQUIRE(uploads[3].count == 3);
    TEST_REQUIRE(uploads[3].floats == std::vector<float>({0.5f, 0.2f, 0.3f}));

    // shorter, only the given elements
    tree->SetValue("weights", std::vector<float>{0.9f}, fix.ctx);
    TEST_REQUIRE(uploads.size() == 5);
    TEST_REQUIRE(uploads[4].count == 1);
}

void unit_test_structured()
{
    TEST_CASE(test::Type::Feature)

    Fixture fix;
    fix.device.AddUniform("light.shadow.mapSize", dev::UniformType::FloatVec2);
    fix.device.AddUniform("light.intensity", dev::UniformType::Float);
    fix.device.AddUniform("lights[0].color", dev::UniformType::FloatVec3);
    fix.device.AddUniform("lights[0].direction", dev::UniformType::FloatVec3);
    fix.device.AddUniform("lights[1].color", dev::UniformType::FloatVec3);
    fix.device.AddUniform("lights[1].direction", dev::UniformType::FloatVec3);
    auto tree = fix.Build();
    auto& uploads = fix.device.uploads;

    gfx::UniformObject shadow;
    shadow["mapSize"] = glm::vec2(512.0f, 512.0f);
    gfx::UniformObject light;
    light["shadow"] = shadow;
    light["intensity"] = 2.0f;
    light["unused"] = 1.0f;

    tree->SetValue("light", light, fix.ctx);
    TEST_REQUIRE(uploads.size() == 2);
    TEST_REQUIRE(uploads[0].location == 0);
    TEST_REQUIRE(uploads[0].floats == std::vector<float>({512.0f, 512.0f}));
    TEST_REQUIRE(uploads[1].location == 1);
    TEST_REQUIRE(uploads[1].floats == std::vector<float>({2.0f}));

    // only the changed member is uploaded
    shadow["mapSize"] = glm::vec2(1024.0f, 1024.0f);
    light["shadow"] = shadow;
    tree->SetValue("light", light, fix.ctx);
    TEST_REQUIRE(uploads.size() == 3);
    TEST_REQUIRE(uploads[2].location == 0);

    // missing members are skipped
    fix.device.ClearRecords();
    tree->SetValue("light", gfx::UniformObject { {"intensity", 3.0f} }, fix.ctx);
    TEST_REQUIRE(uploads.size() == 1);
    TEST_REQUIRE(uploads[0].location == 1);

    // arrays of structures
    fix.device.ClearRecords();
    gfx::UniformArray lights;
    lights.push_back(gfx::UniformObject { {"color", glm::vec3(1.0f, 0.0f, 0.0f)} });
    lights.push_back(gfx::UniformObject { {"color", glm::vec3(0.0f, 1.0f, 0.0f)},
                                          {"direction", glm::vec3(0.0f, 0.0f, -1.0f)} });
    tree->SetValue("lights", lights, fix.ctx);
    TEST_REQUIRE(uploads.size() == 3);
    TEST_REQUIRE(uploads[0].location == 2);
    TEST_REQUIRE(uploads[1].location == 4);
    TEST_REQUIRE(uploads[2].location == 5);

    // fewer elements than in the program
    fix.device.ClearRecords();
    lights.resize(1);
    lights[0] = gfx::UniformObject { {"color", glm::vec3(0.5f)} };
    tree->SetValue("lights", lights, fix.ctx);
    TEST_REQUIRE(uploads.size() == 1);
    TEST_REQUIRE(uploads[0].location == 2);

    // SetOptional picks the member by name
    fix.device.ClearRecords();
    gfx::UniformObject material;
    material["light"] = gfx::UniformObject { {"intensity", 4.0f} };
    tree->SetOptional(material, "light", fix.ctx);
    tree->SetOptional(material, "lights", fix.ctx);
    TEST_REQUIRE(uploads.size() == 1);
    TEST_REQUIRE(uploads[0].floats == std::vector<float>({4.0f}));
}

void unit_test_textures()
{
    TEST_CASE(test::Type::Feature)

    Fixture fix;
    fix.device.AddUniform("map", dev::UniformType::Sampler2D);
    fix.device.AddUniform("envMap", dev::UniformType::SamplerCube);
    fix.device.AddUniform("shadowMap", dev::UniformType::Sampler2DShadow);
    fix.device.AddUniform("maps[0]", dev::UniformType::Sampler2D, 3);
    auto tree = fix.Build();
    auto& device = fix.device;

    const auto& tex0 = device.MakeTexture(dev::TextureType::Texture2D);
    const auto& tex1 = device.MakeTexture(dev::TextureType::Texture2D);

    tree->SetValue("map", tex0, fix.ctx);
    TEST_REQUIRE(device.uploads.size() == 1);
    TEST_REQUIRE(device.uploads[0].kind == TestDevice::Upload::Kind::Int);
    TEST_REQUIRE(device.uploads[0].ints == std::vector<int>({0}));
    TEST_REQUIRE(device.bindings.size() == 1);
    TEST_REQUIRE(device.bindings[0].unit == 0);
    TEST_REQUIRE(device.bindings[0].texture == tex0);
    TEST_REQUIRE(fix.units.IsLeased(0));

    // next draw, same unit. the unit isn't uploaded again but the
    // texture is always bound.
    fix.units.Reset();
    device.ClearRecords();
    tree->SetValue("map", tex1, fix.ctx);
    TEST_REQUIRE(device.uploads.empty());
    TEST_REQUIRE(device.bindings.size() == 1);
    TEST_REQUIRE(device.bindings[0].unit == 0);
    TEST_REQUIRE(device.bindings[0].texture == tex1);

    fix.units.Reset();
    device.ClearRecords();
    tree->SetValue("map", tex1, fix.ctx);
    TEST_REQUIRE(device.uploads.empty());
    TEST_REQUIRE(device.bindings.size() == 1);

    // two samplers in the same draw get their own units
    fix.units.Reset();
    device.ClearRecords();
    tree->SetValue("envMap", gfx::UniformValue(), fix.ctx);
    tree->SetValue("map", tex0, fix.ctx);
    TEST_REQUIRE(device.bindings.size() == 2);
    TEST_REQUIRE(device.bindings[0].unit == 0);
    TEST_REQUIRE(device.bindings[1].unit == 1);
    TEST_REQUIRE(device.bindings[1].texture == tex0);
    // map moved to unit 1
    TEST_REQUIRE(device.uploads.size() == 2);
    TEST_REQUIRE(device.uploads[1].location == 0);
    TEST_REQUIRE(device.uploads[1].ints == std::vector<int>({1}));

    // missing texture binds a placeholder of the right type
    TEST_REQUIRE(device.placeholders.size() == 1);
    TEST_REQUIRE(device.placeholders[0].GetType() == dev::TextureType::TextureCube);
    TEST_REQUIRE(device.bindings[0].texture == device.placeholders[0]);

    fix.units.Reset();
    device.ClearRecords();
    tree->SetValue("envMap", dev::TextureObject{}, fix.ctx);
    tree->SetValue("shadowMap", gfx::UniformValue(), fix.ctx);
    TEST_REQUIRE(device.placeholders.size() == 2);
    TEST_REQUIRE(device.placeholders[1].GetType() == dev::TextureType::DepthTexture2D);
    TEST_REQUIRE(device.bindings[0].texture == device.placeholders[0]);
    TEST_REQUIRE(device.bindings[1].texture == device.placeholders[1]);

    // sampler array
    fix.units.Reset();
    device.ClearRecords();
    tree->SetValue("maps", gfx::UniformArray { tex0, gfx::UniformValue(), tex1 }, fix.ctx);
    TEST_REQUIRE(device.uploads.size() == 1);
    TEST_REQUIRE(device.uploads[0].count == 3);
    TEST_REQUIRE(device.uploads[0].ints == std::vector<int>({0, 1, 2}));
    TEST_REQUIRE(device.bindings.size() == 3);
    TEST_REQUIRE(device.bindings[0].texture == tex0);
    TEST_REQUIRE(device.bindings[1].texture.GetType() == dev::TextureType::Texture2D);
    TEST_REQUIRE(device.bindings[1].unit == 1);
    TEST_REQUIRE(device.bindings[2].texture == tex1);
    TEST_REQUIRE(fix.units.GetNumLeased() == 3);

    fix.units.Reset();
    device.ClearRecords();
    tree->SetValue("maps", gfx::UniformArray { tex1, tex0, tex1 }, fix.ctx);
    TEST_REQUIRE(device.uploads.empty());
    TEST_REQUIRE(device.bindings.size() == 3);
    TEST_REQUIRE(device.bindings[0].texture == tex1);

    // the units are leased straight into the arena buffer of that size
    // and the buffer is reused between draws.
    const int* buffer = fix.ctx.GetArena().GetUnitArray(3);
    TEST_REQUIRE(buffer[0] == 0);
    TEST_REQUIRE(buffer[1] == 1);
    TEST_REQUIRE(buffer[2] == 2);
    fix.units.Reset();
    fix.units.Allocate();
    device.ClearRecords();
    tree->SetValue("maps", gfx::UniformArray { tex1, tex0, tex1 }, fix.ctx);
    TEST_REQUIRE(fix.ctx.GetArena().GetUnitArray(3) == buffer);
    TEST_REQUIRE(buffer[0] == 1);
    TEST_REQUIRE(buffer[2] == 3);
    TEST_REQUIRE(device.uploads.size() == 1);
    TEST_REQUIRE(device.uploads[0].ints == std::vector<int>({1, 2, 3}));
    TEST_REQUIRE(device.bindings[0].unit == 1);

    // placeholders are released with the owner
    const auto num_placeholders = device.placeholders.size();
    fix.placeholders.Clear();
    TEST_REQUIRE(device.deleted_textures.size() == num_placeholders);
}

void unit_test_texture_units()
{
    TEST_CASE(test::Type::Feature)

    base::BufferLogger<base::NullLogger> logger;
    logger.EnableWrite(base::Logger::WriteType::WriteFormatted, false);
    base::SetGlobalLog(&logger);

    gfx::TextureUnitAllocator units(4);
    TEST_REQUIRE(units.GetMaxUnits() == 4);
    TEST_REQUIRE(units.Allocate() == 0);
    TEST_REQUIRE(units.Allocate() == 1);
    TEST_REQUIRE(units.Allocate() == 2);
    units.Release(1);
    TEST_REQUIRE(units.IsLeased(1) == false);
    TEST_REQUIRE(units.GetNumLeased() == 2);
    // lowest free unit first
    TEST_REQUIRE(units.Allocate() == 1);
    TEST_REQUIRE(units.Allocate() == 3);
    TEST_EXCEPTION(units.Allocate());
    TEST_REQUIRE(units.GetNumLeased() == 4);

    units.Reset();
    TEST_REQUIRE(units.GetNumLeased() == 0);
    TEST_REQUIRE(units.IsLeased(0) == false);
    TEST_REQUIRE(units.IsLeased(100) == false);

    int three[3] = {-1, -1, -1};
    units.Allocate(3, three);
    TEST_REQUIRE(three[0] == 0);
    TEST_REQUIRE(three[1] == 1);
    TEST_REQUIRE(three[2] == 2);
    // all or nothing, the output is not touched on failure.
    int two[2] = {-1, -1};
    TEST_EXCEPTION(units.Allocate(2, two));
    TEST_REQUIRE(two[0] == -1);
    TEST_REQUIRE(two[1] == -1);
    TEST_REQUIRE(units.GetNumLeased() == 3);
    TEST_REQUIRE(units.IsLeased(3) == false);

    // exhaustion through the uniforms
    Fixture fix(2);
    fix.device.AddUniform("a", dev::UniformType::Sampler2D);
    fix.device.AddUniform("b", dev::UniformType::Sampler2D);
    fix.device.AddUniform("c", dev::UniformType::Sampler2D);
    auto tree = fix.Build();
    tree->SetValue("a", gfx::UniformValue(), fix.ctx);
    tree->SetValue("b", gfx::UniformValue(), fix.ctx);
    try
    {
        tree->SetValue("c", gfx::UniformValue(), fix.ctx);
        TEST_REQUIRE(!"Exception was expected");
    }
    catch (const std::runtime_error& e)
    {
        TEST_REQUIRE(base::Contains(e.what(), "(2)"));
    }

    base::SetGlobalLog(nullptr);
}

void unit_test_program_isolation()
{
    TEST_CASE(test::Type::Feature)

    Fixture fix;
    fix.device.AddUniform("diffuse", dev::UniformType::FloatVec3);
    auto first  = fix.Build(1);
    auto second = fix.Build(2);

    first->SetValue("diffuse", glm::vec3(1.0f), fix.ctx);
    TEST_REQUIRE(fix.device.uploads.size() == 1);
    // the other program has its own cache
    second->SetValue("diffuse", glm::vec3(1.0f), fix.ctx);
    TEST_REQUIRE(fix.device.uploads.size() == 2);
    first->SetValue("diffuse", glm::vec3(1.0f), fix.ctx);
    second->SetValue("diffuse", glm::vec3(1.0f), fix.ctx);
    TEST_REQUIRE(fix.device.uploads.size() == 2);
}

void unit_test_batch_upload()
{
    TEST_CASE(test::Type::Feature)

    Fixture fix;
    fix.device.AddUniform("diffuse", dev::UniformType::FloatVec3);
    fix.device.AddUniform("opacity", dev::UniformType::Float);
    fix.device.AddUniform("light.intensity", dev::UniformType::Float);
    fix.device.AddUniform("time", dev::UniformType::Float);
    auto tree = fix.Build();

    gfx::UniformEntryMap values;
    values["diffuse"].value = glm::vec3(1.0f);
    values["opacity"].value = 0.5f;
    values["opacity"].needs_update = false;
    values["light"].value = gfx::UniformObject { {"intensity", 2.0f} };
    values["light"].needs_update = true;
    values["unknown"].value = 1.0f;

    const auto& seq = gfx::UniformContainer::SeqWithValue(tree->GetSequence(), values);
    TEST_REQUIRE(seq.size() == 3);
    TEST_REQUIRE(seq[0]->GetId() == "diffuse");
    TEST_REQUIRE(seq[1]->GetId() == "opacity");
    TEST_REQUIRE(seq[2]->GetId() == "light");

    gfx::UniformContainer::Upload(seq, values, fix.ctx);
    TEST_REQUIRE(fix.device.uploads.size() == 2);
    TEST_REQUIRE(fix.device.uploads[0].location == 0);
    TEST_REQUIRE(fix.device.uploads[1].location == 2);

    // the full sequence, the uniforms without a value are skipped.
    fix.device.ClearRecords();
    values["opacity"].needs_update.reset();
    gfx::UniformContainer::Upload(tree->GetSequence(), values, fix.ctx);
    TEST_REQUIRE(fix.device.uploads.size() == 1);
    TEST_REQUIRE(fix.device.uploads[0].location == 1);
}

void unit_test_unsupported_type()
{
    TEST_CASE(test::Type::Feature)

    base::BufferLogger<base::NullLogger> logger;
    logger.EnableWrite(base::Logger::WriteType::WriteFormatted, false);
    base::SetGlobalLog(&logger);

    Fixture fix;
    fix.device.AddUniform("m23", dev::UniformType::FloatMat2x3);
    fix.device.AddUniform("m23s[0]", dev::UniformType::FloatMat2x3, 2);
    auto first  = fix.Build(1);
    auto second = fix.Build(2);
    TEST_REQUIRE(first->GetNumNodes() == 2);
    TEST_REQUIRE(AsLeaf(first->FindNode("m23")).HasSetter() == false);
    TEST_REQUIRE(AsLeaf(first->FindNode("m23s")).HasSetter() == false);

    first->SetValue("m23", std::vector<float>{1.0f, 2.0f, 3.0f, 4.0f, 5.0f, 6.0f}, fix.ctx);
    TEST_REQUIRE(fix.device.uploads.empty());
    TEST_REQUIRE(CountWarnings(logger, "Unsupported uniform type") == 1);

    base::SetGlobalLog(nullptr);
}

void unit_test_type_info()
{
    TEST_CASE(test::Type::Feature)

    TEST_REQUIRE(gfx::GetComponentCount(dev::UniformType::Float) == 1);
    TEST_REQUIRE(gfx::GetComponentCount(dev::UniformType::BoolVec3) == 3);
    TEST_REQUIRE(gfx::GetComponentCount(dev::UniformType::FloatMat2) == 4);
    TEST_REQUIRE(gfx::GetComponentCount(dev::UniformType::FloatMat3) == 9);
    TEST_REQUIRE(gfx::GetComponentCount(dev::UniformType::FloatMat4) == 16);
    TEST_REQUIRE(gfx::GetComponentCount(dev::UniformType::SamplerCube) == 1);

    TEST_REQUIRE(gfx::IsSamplerType(dev::UniformType::SamplerExternalOES));
    TEST_REQUIRE(gfx::IsSamplerType(dev::UniformType::UnsignedIntSampler2DArray));
    TEST_REQUIRE(gfx::IsSamplerType(dev::UniformType::IntVec2) == false);

    TEST_REQUIRE(gfx::GetPlaceholderType(dev::UniformType::Sampler2D) == dev::TextureType::Texture2D);
    TEST_REQUIRE(gfx::GetPlaceholderType(dev::UniformType::SamplerExternalOES) == dev::TextureType::Texture2D);
    TEST_REQUIRE(gfx::GetPlaceholderType(dev::UniformType::IntSampler2D) == dev::TextureType::Texture2D);
    TEST_REQUIRE(gfx::GetPlaceholderType(dev::UniformType::Sampler2DShadow) == dev::TextureType::DepthTexture2D);
    TEST_REQUIRE(gfx::GetPlaceholderType(dev::UniformType::Sampler3D) == dev::TextureType::Texture3D);
    TEST_REQUIRE(gfx::GetPlaceholderType(dev::UniformType::UnsignedIntSamplerCube) == dev::TextureType::TextureCube);
    TEST_REQUIRE(gfx::GetPlaceholderType(dev::UniformType::Sampler2DArrayShadow) == dev::TextureType::Texture2DArray);

    TEST_REQUIRE(gfx::FindSingleSetter(dev::UniformType::FloatVec4) != nullptr);
    TEST_REQUIRE(gfx::FindPureArraySetter(dev::UniformType::Sampler3D) != nullptr);
    TEST_REQUIRE(gfx::FindSingleSetter(dev::UniformType::FloatMat4x3) == nullptr);
    TEST_REQUIRE(gfx::FindSingleSetter(dev::UniformType::FloatVec4) != gfx::FindPureArraySetter(dev::UniformType::FloatVec4));
}

EXPORT_TEST_MAIN(
int test_main(int argc, char* argv[])
{
    unit_test_path();
    unit_test_value();
    unit_test_build_tree();
    unit_test_diff_cache();
    unit_test_pure_array();
    unit_test_structured();
    unit_test_textures();
    unit_test_texture_units();
    unit_test_program_isolation();
    unit_test_batch_upload();
    unit_test_unsupported_type();
    unit_test_type_info();
    return 0;
}
) // TEST_MAIN
