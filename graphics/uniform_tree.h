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
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "device/enum.h"
#include "device/handle.h"
#include "device/types.h"
#include "graphics/uniform_setters.h"
#include "graphics/uniform_value.h"

namespace dev {
    class GraphicsDevice;
} // dev

namespace gfx
{
    // Node in the tree of uniforms of a program. The tree follows the
    // structure of the reflected uniform names, a plain uniform or a
    // uniform array is a leaf and a struct or an array of structs is an
    // inner node with the members/elements as children.
    class UniformNode
    {
    public:
        enum class Type {
            Single, PureArray, Structured
        };
        UniformNode(std::string id, bool is_index)
          : mId(std::move(id))
          , mIsIndex(is_index)
        {}
        virtual ~UniformNode() = default;

        virtual Type GetType() const = 0;
        // Upload the value to the program. The program must be the
        // current program on the device.
        virtual void SetValue(const UniformValue& value, UniformUploadContext& ctx) = 0;

        // The member name or the decimal array index.
        inline const std::string& GetId() const noexcept
        { return mId; }
        // True when the node is an element of an array of structures.
        inline bool IsIndex() const noexcept
        { return mIsIndex; }
    private:
        const std::string mId;
        const bool mIsIndex = false;
    };

    // Ordered collection of nodes with lookup by id.
    class UniformGroup
    {
    public:
        UniformNode* AddNode(std::unique_ptr<UniformNode> node);

        // Find a node by its id. Returns nullptr if not found.
        UniformNode* FindNode(const std::string& id) const;
        // Get a node by its position. Throws std::out_of_range if the
        // index is not valid.
        UniformNode& GetNode(std::size_t index) const;

        inline std::size_t GetNumNodes() const noexcept
        { return mSeq.size(); }
        inline const std::vector<UniformNode*>& GetSequence() const noexcept
        { return mSeq; }
    private:
        std::vector<std::unique_ptr<UniformNode>> mNodes;
        std::vector<UniformNode*> mSeq;
        std::unordered_map<std::string, UniformNode*> mMap;
    };

    // Leaf uniform with a slot in the program. Keeps a copy of the last
    // uploaded value and skips uploads that wouldn't change anything.
    class UniformLeaf : public UniformNode
    {
    public:
        UniformLeaf(std::string id, bool is_index, const dev::ActiveUniform& info, UniformSetter setter);

        virtual void SetValue(const UniformValue& value, UniformUploadContext& ctx) override;

        inline dev::UniformType GetUniformType() const noexcept
        { return mType; }
        inline int GetLocation() const noexcept
        { return mLocation; }
        // Number of array elements, 1 for a single uniform.
        inline unsigned GetSize() const noexcept
        { return mSize; }
        inline bool HasSetter() const noexcept
        { return mSetter != nullptr; }

        // Diff cache for the last uploaded values. The caches are sized for
        // the whole uniform (size * components) and never resized.
        // Only the first GetNumCached() values have been uploaded.
        inline std::vector<float>& GetFloatCache() noexcept
        { return mFloatCache; }
        inline std::vector<int>& GetIntCache() noexcept
        { return mIntCache; }
        inline std::vector<unsigned>& GetUintCache() noexcept
        { return mUintCache; }
        inline std::size_t GetNumCached() const noexcept
        { return mNumCached; }
        inline void SetNumCached(std::size_t count) noexcept
        { mNumCached = count; }
    private:
        const dev::UniformType mType;
        const int mLocation = -1;
        const unsigned mSize = 1;
        const UniformSetter mSetter = nullptr;
        std::vector<float> mFloatCache;
        std::vector<int> mIntCache;
        std::vector<unsigned> mUintCache;
        std::size_t mNumCached = 0;
    };

    // A uniform that holds a single value, a scalar, vector, matrix or sampler.
    class SingleUniform final : public UniformLeaf
    {
    public:
        SingleUniform(std::string id, bool is_index, const dev::ActiveUniform& info)
          : UniformLeaf(std::move(id), is_index, info, FindSingleSetter(info.type))
        {}
        virtual Type GetType() const override
        { return Type::Single; }
    };

    // A uniform array of a basic type, reported by the program as "name[0]".
    class PureArrayUniform final : public UniformLeaf
    {
    public:
        PureArrayUniform(std::string id, bool is_index, const dev::ActiveUniform& info)
          : UniformLeaf(std::move(id), is_index, info, FindPureArraySetter(info.type))
        {}
        virtual Type GetType() const override
        { return Type::PureArray; }
    };

    // A struct or an array of structs. Setting the value sets every child
    // whose id is found in the value.
    class StructuredUniform final : public UniformNode
    {
    public:
        StructuredUniform(std::string id, bool is_index)
          : UniformNode(std::move(id), is_index)
        {}
        virtual Type GetType() const override
        { return Type::Structured; }
        virtual void SetValue(const UniformValue& value, UniformUploadContext& ctx) override;

        inline UniformGroup& GetChildren() noexcept
        { return mChildren; }
        inline const UniformGroup& GetChildren() const noexcept
        { return mChildren; }
    private:
        UniformGroup mChildren;
    };

    // Value for a uniform in a batch upload.
    struct UniformEntry {
        UniformValue value;
        // When explicitly false the uniform is skipped, when not set
        // the uniform is always uploaded.
        std::optional<bool> needs_update;
    };
    using UniformEntryMap = std::unordered_map<std::string, UniformEntry>;

    // The root of the uniform tree of a program.
    class UniformContainer
    {
    public:
        // Build the uniform tree from the active uniforms of the linked
        // program. Uniforms without a location and uniforms with names
        // that can't be parsed are skipped.
        static std::unique_ptr<UniformContainer> Build(const dev::GraphicsDevice& device,
                                                       const dev::GraphicsProgram& program);

        // Add one reflected uniform to the tree.
        void AddUniform(const dev::ActiveUniform& info);

        // Set the value of a top level uniform. Does nothing if there's
        // no uniform by that name.
        void SetValue(const std::string& name, const UniformValue& value, UniformUploadContext& ctx);
        // Set the value of a top level uniform from the object member with
        // the same name. Does nothing if the object has no such member.
        void SetOptional(const UniformObject& object, const std::string& name, UniformUploadContext& ctx);

        // Find a top level uniform by name. Returns nullptr if not found.
        inline UniformNode* FindNode(const std::string& name) const
        { return mRoot.FindNode(name); }
        // Get a top level uniform by position. Throws std::out_of_range.
        inline UniformNode& GetNode(std::size_t index) const
        { return mRoot.GetNode(index); }
        inline std::size_t GetNumNodes() const noexcept
        { return mRoot.GetNumNodes(); }
        inline const std::vector<UniformNode*>& GetSequence() const noexcept
        { return mRoot.GetSequence(); }

        // Upload the values of the uniforms in the sequence. Uniforms
        // without an entry or with needs_update set to false are skipped.
        static void Upload(const std::vector<UniformNode*>& seq,
                           const UniformEntryMap& values,
                           UniformUploadContext& ctx);
        // Select the uniforms in the sequence that have an entry in the values.
        static std::vector<UniformNode*> SeqWithValue(const std::vector<UniformNode*>& seq,
                                                      const UniformEntryMap& values);
    private:
        UniformGroup mRoot;
    };

} // namespace
