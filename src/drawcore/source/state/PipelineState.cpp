#include <iterator>
#include <variant>

#include <drawcore/state/PipelineState.h>

namespace drawcore {

    ValueType uniformValueType(const UniformValue& value) noexcept
    {
        static constexpr ValueType kTypes[] = {
            ValueType::Float, ValueType::Vec2, ValueType::Vec3, ValueType::Vec4,
            ValueType::Int, ValueType::IVec2, ValueType::IVec3, ValueType::IVec4,
            ValueType::UInt, ValueType::UVec2, ValueType::UVec3, ValueType::UVec4,
            ValueType::Bool,
            ValueType::Mat2, ValueType::Mat3, ValueType::Mat4
        };
        static_assert(std::size(kTypes) == std::variant_size_v<UniformValue>);
        return kTypes[value.index()];
    }

    PipelineState makeDefaultPipelineState(uint32_t textureUnits, uint32_t uniformBufferBindings)
    {
        PipelineState state{};
        state.textureUnits.resize(textureUnits);
        state.uniformBuffers.resize(uniformBufferBindings);
        return state;
    }

} // namespace drawcore
