#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <drawcore/resources/TextureFormat.h>

namespace drawcore {

    enum class ValueType : uint8_t {
        Float,
        Vec2,
        Vec3,
        Vec4,
        Int,
        IVec2,
        IVec3,
        IVec4,
        UInt,
        UVec2,
        UVec3,
        UVec4,
        Bool,
        Mat2,
        Mat3,
        Mat4,
        Sampler2D,
        Sampler2DArray,
        Sampler3D,
        SamplerCube,
        Sampler2DShadow,
        ISampler2D,
        USampler2D
    };

    enum class ScalarKind : uint8_t {
        Float,
        Int,
        UInt,
        Bool,
        Sampler
    };

    [[nodiscard]] bool isSamplerType(ValueType type) noexcept;
    [[nodiscard]] ScalarKind scalarKind(ValueType type) noexcept;
    [[nodiscard]] uint32_t componentCount(ValueType type) noexcept;
    [[nodiscard]] uint32_t valueByteSize(ValueType type) noexcept;
    [[nodiscard]] const char* valueTypeToString(ValueType type) noexcept;

    // Texture target and texel class a sampler type expects. Empty for non-samplers.
    [[nodiscard]] std::optional<TextureTarget> samplerTarget(ValueType type) noexcept;
    [[nodiscard]] std::optional<SampleClass> samplerClass(ValueType type) noexcept;

    struct AttributeInfo {
        std::string name{};
        uint32_t location{ 0 };
        ValueType type{ ValueType::Vec4 };
    };

    struct UniformInfo {
        std::string name{};
        int32_t location{ -1 };
        ValueType type{ ValueType::Float };
    };

    struct BlockMember {
        std::string name{};
        uint32_t offset{ 0 };
        ValueType type{ ValueType::Float };
        uint32_t arraySize{ 1 };
        uint32_t arrayStride{ 0 };

        friend bool operator==(const BlockMember&, const BlockMember&) = default;
    };

    struct UniformBlockInfo {
        std::string name{};
        uint32_t binding{ 0 };
        uint64_t size{ 0 };
        std::vector<BlockMember> members{};
    };

    // Produced by the shader-compilation layer and consumed as-is.
    struct ProgramReflection {
        std::vector<AttributeInfo> attributes{};
        std::vector<UniformInfo> uniforms{};
        std::vector<UniformBlockInfo> uniformBlocks{};
        bool hasTessellation{ false };

        [[nodiscard]] const AttributeInfo* findAttribute(const std::string& name) const noexcept;
        [[nodiscard]] const UniformInfo* findUniform(const std::string& name) const noexcept;
        [[nodiscard]] const UniformBlockInfo* findBlock(const std::string& name) const noexcept;
    };

} // namespace drawcore
