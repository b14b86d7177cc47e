#include <algorithm>

#include <drawcore/draw/ProgramReflection.h>

namespace drawcore {

    bool isSamplerType(ValueType type) noexcept
    {
        return type >= ValueType::Sampler2D;
    }

    ScalarKind scalarKind(ValueType type) noexcept
    {
        switch (type) {
        case ValueType::Float:
        case ValueType::Vec2:
        case ValueType::Vec3:
        case ValueType::Vec4:
        case ValueType::Mat2:
        case ValueType::Mat3:
        case ValueType::Mat4:
            return ScalarKind::Float;
        case ValueType::Int:
        case ValueType::IVec2:
        case ValueType::IVec3:
        case ValueType::IVec4:
            return ScalarKind::Int;
        case ValueType::UInt:
        case ValueType::UVec2:
        case ValueType::UVec3:
        case ValueType::UVec4:
            return ScalarKind::UInt;
        case ValueType::Bool:
            return ScalarKind::Bool;
        default:
            return ScalarKind::Sampler;
        }
    }

    uint32_t componentCount(ValueType type) noexcept
    {
        switch (type) {
        case ValueType::Vec2:
        case ValueType::IVec2:
        case ValueType::UVec2:
            return 2;
        case ValueType::Vec3:
        case ValueType::IVec3:
        case ValueType::UVec3:
            return 3;
        case ValueType::Vec4:
        case ValueType::IVec4:
        case ValueType::UVec4:
        case ValueType::Mat2:
            return 4;
        case ValueType::Mat3:
            return 9;
        case ValueType::Mat4:
            return 16;
        default:
            return 1;
        }
    }

    uint32_t valueByteSize(ValueType type) noexcept
    {
        return isSamplerType(type) ? 4u : componentCount(type) * 4u;
    }

    const char* valueTypeToString(ValueType type) noexcept
    {
        switch (type) {
        case ValueType::Float: return "float";
        case ValueType::Vec2: return "vec2";
        case ValueType::Vec3: return "vec3";
        case ValueType::Vec4: return "vec4";
        case ValueType::Int: return "int";
        case ValueType::IVec2: return "ivec2";
        case ValueType::IVec3: return "ivec3";
        case ValueType::IVec4: return "ivec4";
        case ValueType::UInt: return "uint";
        case ValueType::UVec2: return "uvec2";
        case ValueType::UVec3: return "uvec3";
        case ValueType::UVec4: return "uvec4";
        case ValueType::Bool: return "bool";
        case ValueType::Mat2: return "mat2";
        case ValueType::Mat3: return "mat3";
        case ValueType::Mat4: return "mat4";
        case ValueType::Sampler2D: return "sampler2D";
        case ValueType::Sampler2DArray: return "sampler2DArray";
        case ValueType::Sampler3D: return "sampler3D";
        case ValueType::SamplerCube: return "samplerCube";
        case ValueType::Sampler2DShadow: return "sampler2DShadow";
        case ValueType::ISampler2D: return "isampler2D";
        case ValueType::USampler2D: return "usampler2D";
        default: return "unknown";
        }
    }

    std::optional<TextureTarget> samplerTarget(ValueType type) noexcept
    {
        switch (type) {
        case ValueType::Sampler2D:
        case ValueType::Sampler2DShadow:
        case ValueType::ISampler2D:
        case ValueType::USampler2D:
            return TextureTarget::Tex2D;
        case ValueType::Sampler2DArray: return TextureTarget::Tex2DArray;
        case ValueType::Sampler3D: return TextureTarget::Tex3D;
        case ValueType::SamplerCube: return TextureTarget::Cube;
        default: return std::nullopt;
        }
    }

    std::optional<SampleClass> samplerClass(ValueType type) noexcept
    {
        switch (type) {
        case ValueType::Sampler2D:
        case ValueType::Sampler2DArray:
        case ValueType::Sampler3D:
        case ValueType::SamplerCube:
            return SampleClass::Float;
        case ValueType::Sampler2DShadow: return SampleClass::Depth;
        case ValueType::ISampler2D: return SampleClass::Int;
        case ValueType::USampler2D: return SampleClass::UInt;
        default: return std::nullopt;
        }
    }

    const AttributeInfo* ProgramReflection::findAttribute(const std::string& name) const noexcept
    {
        const auto it = std::find_if(attributes.begin(), attributes.end(),
            [&](const AttributeInfo& a) { return a.name == name; });
        return it == attributes.end() ? nullptr : &*it;
    }

    const UniformInfo* ProgramReflection::findUniform(const std::string& name) const noexcept
    {
        const auto it = std::find_if(uniforms.begin(), uniforms.end(),
            [&](const UniformInfo& u) { return u.name == name; });
        return it == uniforms.end() ? nullptr : &*it;
    }

    const UniformBlockInfo* ProgramReflection::findBlock(const std::string& name) const noexcept
    {
        const auto it = std::find_if(uniformBlocks.begin(), uniformBlocks.end(),
            [&](const UniformBlockInfo& b) { return b.name == name; });
        return it == uniformBlocks.end() ? nullptr : &*it;
    }

} // namespace drawcore
