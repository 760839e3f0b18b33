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

#include <stdexcept>

#include "base/assert.h"
#include "base/format.h"
#include "base/logging.h"
#include "device/graphics.h"
#include "graphics/uniform_path.h"
#include "graphics/uniform_tree.h"

namespace {
bool ParseIndex(const std::string& id, std::size_t* index)
{
    if (id.empty())
        return false;
    std::size_t value = 0;
    for (char c : id)
    {
        if (c < '0' || c > '9')
            return false;
        value = value * 10 + static_cast<std::size_t>(c - '0');
    }
    *index = value;
    return true;
}
} // namespace

namespace gfx
{

UniformNode* UniformGroup::AddNode(std::unique_ptr<UniformNode> node)
{
    auto* ptr = node.get();
    ASSERT(mMap.find(ptr->GetId()) == mMap.end());
    mMap[ptr->GetId()] = ptr;
    mSeq.push_back(ptr);
    mNodes.push_back(std::move(node));
    return ptr;
}

UniformNode* UniformGroup::FindNode(const std::string& id) const
{
    auto it = mMap.find(id);
    if (it == mMap.end())
        return nullptr;
    return it->second;
}

UniformNode& UniformGroup::GetNode(std::size_t index) const
{
    if (index >= mSeq.size())
        throw std::out_of_range(base::FormatString("Uniform node index %1 is out of range (size %2).",
                                                   index, mSeq.size()));
    return *mSeq[index];
}

UniformLeaf::UniformLeaf(std::string id, bool is_index, const dev::ActiveUniform& info, UniformSetter setter)
  : UniformNode(std::move(id), is_index)
  , mType(info.type)
  , mLocation(info.location)
  , mSize(info.size)
  , mSetter(setter)
{
    if (mSetter == nullptr)
    {
        WarnUnsupportedUniformType(mType);
        return;
    }
    const auto cache_size = mSize * GetComponentCount(mType);
    if (IsSamplerType(mType))
        mIntCache.resize(cache_size);
    else if (mType == dev::UniformType::UnsignedInt ||
             mType == dev::UniformType::UnsignedIntVec2 ||
             mType == dev::UniformType::UnsignedIntVec3 ||
             mType == dev::UniformType::UnsignedIntVec4)
        mUintCache.resize(cache_size);
    else if (mType == dev::UniformType::Int  || mType == dev::UniformType::Bool ||
             mType == dev::UniformType::IntVec2 || mType == dev::UniformType::BoolVec2 ||
             mType == dev::UniformType::IntVec3 || mType == dev::UniformType::BoolVec3 ||
             mType == dev::UniformType::IntVec4 || mType == dev::UniformType::BoolVec4)
        mIntCache.resize(cache_size);
    else mFloatCache.resize(cache_size);
}

void UniformLeaf::SetValue(const UniformValue& value, UniformUploadContext& ctx)
{
    if (mSetter)
        mSetter(*this, value, ctx);
}

void StructuredUniform::SetValue(const UniformValue& value, UniformUploadContext& ctx)
{
    for (auto* child : mChildren.GetSequence())
    {
        const UniformValue* child_value = nullptr;
        std::size_t index = 0;
        if (child->IsIndex() && value.IsArray() && ParseIndex(child->GetId(), &index))
        {
            if (index < value.GetArraySize())
                child_value = &value.At(index);
        }
        else child_value = value.FindMember(child->GetId());

        if (child_value)
            child->SetValue(*child_value, ctx);
    }
}

// static
std::unique_ptr<UniformContainer> UniformContainer::Build(const dev::GraphicsDevice& device,
                                                          const dev::GraphicsProgram& program)
{
    auto container = std::make_unique<UniformContainer>();

    for (const auto& uniform : device.EnumerateUniforms(program))
    {
        if (uniform.location == -1)
        {
            DEBUG("Skipping uniform without location. [name='%1']", uniform.name);
            continue;
        }
        container->AddUniform(uniform);
    }
    DEBUG("Built program uniform tree. [program=%1, uniforms=%2]", program.GetHandle(), container->GetNumNodes());
    return container;
}

void UniformContainer::AddUniform(const dev::ActiveUniform& info)
{
    const auto& path = ParseUniformPath(info.name);
    if (path.empty())
        return;

    UniformGroup* group = &mRoot;
    for (const auto& segment : path)
    {
        if (segment.IsLeaf() && group->FindNode(segment.id))
        {
            WARN("Uniform name conflicts with an existing uniform. [name='%1', id='%2']", info.name, segment.id);
            return;
        }

        if (segment.kind == UniformPathSegment::Kind::Leaf)
        {
            group->AddNode(std::make_unique<SingleUniform>(segment.id, segment.is_index, info));
            return;
        }
        else if (segment.kind == UniformPathSegment::Kind::ArrayLeaf)
        {
            group->AddNode(std::make_unique<PureArrayUniform>(segment.id, segment.is_index, info));
            return;
        }

        auto* node = group->FindNode(segment.id);
        if (node == nullptr)
            node = group->AddNode(std::make_unique<StructuredUniform>(segment.id, segment.is_index));
        else if (node->GetType() != UniformNode::Type::Structured)
        {
            WARN("Uniform name conflicts with an existing uniform. [name='%1', id='%2']", info.name, segment.id);
            return;
        }
        group = &static_cast<StructuredUniform*>(node)->GetChildren();
    }
    BUG("Uniform path without a leaf.");
}

void UniformContainer::SetValue(const std::string& name, const UniformValue& value, UniformUploadContext& ctx)
{
    if (auto* node = mRoot.FindNode(name))
        node->SetValue(value, ctx);
}

void UniformContainer::SetOptional(const UniformObject& object, const std::string& name, UniformUploadContext& ctx)
{
    auto it = object.find(name);
    if (it == object.end())
        return;
    SetValue(name, it->second, ctx);
}

// static
void UniformContainer::Upload(const std::vector<UniformNode*>& seq,
                              const UniformEntryMap& values,
                              UniformUploadContext& ctx)
{
    for (auto* node : seq)
    {
        auto it = values.find(node->GetId());
        if (it == values.end())
            continue;
        const auto& entry = it->second;
        if (entry.needs_update.value_or(true) == false)
            continue;
        node->SetValue(entry.value, ctx);
    }
}

// static
std::vector<UniformNode*> UniformContainer::SeqWithValue(const std::vector<UniformNode*>& seq,
                                                         const UniformEntryMap& values)
{
    std::vector<UniformNode*> ret;
    for (auto* node : seq)
    {
        if (values.find(node->GetId()) != values.end())
            ret.push_back(node);
    }
    return ret;
}

} // namespace
