#pragma once

#include <cstdint>
#include <optional>
#include <variant>
#include <vector>

#include <glm/glm.hpp>

#include <drawcore/core/Handle.h>
#include <drawcore/draw/ProgramReflection.h>
#include <drawcore/resources/TextureFormat.h>

namespace drawcore {

    struct Rect {
        glm::ivec2 origin{ 0, 0 };
        glm::ivec2 size{ 0, 0 };

        friend bool operator==(const Rect&, const Rect&) = default;
    };

    enum class CompareFunc : uint8_t {
        Never,
        Less,
        Equal,
        LessEqual,
        Greater,
        NotEqual,
        GreaterEqual,
        Always
    };

    enum class StencilOp : uint8_t {
        Keep,
        Zero,
        Replace,
        Increment,
        IncrementWrap,
        Decrement,
        DecrementWrap,
        Invert
    };

    enum class BlendEquation : uint8_t {
        Add,
        Subtract,
        ReverseSubtract,
        Min,
        Max
    };

    enum class BlendFactor : uint8_t {
        Zero,
        One,
        SrcColor,
        OneMinusSrcColor,
        DstColor,
        OneMinusDstColor,
        SrcAlpha,
        OneMinusSrcAlpha,
        DstAlpha,
        OneMinusDstAlpha,
        ConstantColor,
        OneMinusConstantColor,
        ConstantAlpha,
        OneMinusConstantAlpha,
        SrcAlphaSaturate
    };

    enum class CullMode : uint8_t { None, Front, Back, FrontAndBack };
    enum class FrontFace : uint8_t { CounterClockwise, Clockwise };
    enum class PolygonMode : uint8_t { Fill, Line, Point };
    enum class IndexType : uint8_t { U16, U32 };

    enum class SamplerFilter : uint8_t { Nearest, Linear };
    enum class SamplerWrap : uint8_t { Repeat, MirroredRepeat, ClampToEdge, ClampToBorder };

    struct SamplerState {
        SamplerFilter minify{ SamplerFilter::Linear };
        SamplerFilter magnify{ SamplerFilter::Linear };
        SamplerFilter mipmap{ SamplerFilter::Linear };
        SamplerWrap wrapS{ SamplerWrap::Repeat };
        SamplerWrap wrapT{ SamplerWrap::Repeat };
        SamplerWrap wrapR{ SamplerWrap::Repeat };
        std::optional<CompareFunc> depthCompare{};

        friend bool operator==(const SamplerState&, const SamplerState&) = default;
    };

    struct DepthTest {
        bool enabled{ false };
        CompareFunc func{ CompareFunc::Less };

        friend bool operator==(const DepthTest& lhs, const DepthTest& rhs) noexcept
        {
            return lhs.enabled == rhs.enabled && (!lhs.enabled || lhs.func == rhs.func);
        }
    };

    struct StencilFace {
        CompareFunc func{ CompareFunc::Always };
        int32_t reference{ 0 };
        uint32_t readMask{ 0xFFFFFFFFu };
        uint32_t writeMask{ 0xFFFFFFFFu };
        StencilOp fail{ StencilOp::Keep };
        StencilOp depthFail{ StencilOp::Keep };
        StencilOp pass{ StencilOp::Keep };

        friend bool operator==(const StencilFace&, const StencilFace&) = default;
    };

    struct StencilState {
        bool enabled{ false };
        StencilFace front{};
        StencilFace back{};

        friend bool operator==(const StencilState&, const StencilState&) = default;
    };

    struct BlendState {
        bool enabled{ false };
        BlendEquation colorEquation{ BlendEquation::Add };
        BlendEquation alphaEquation{ BlendEquation::Add };
        BlendFactor srcColor{ BlendFactor::One };
        BlendFactor dstColor{ BlendFactor::Zero };
        BlendFactor srcAlpha{ BlendFactor::One };
        BlendFactor dstAlpha{ BlendFactor::Zero };
        glm::vec4 constant{ 0.0F };

        friend bool operator==(const BlendState&, const BlendState&) = default;

        [[nodiscard]] bool usesMinMax() const noexcept
        {
            const auto minMax = [](BlendEquation e) { return e == BlendEquation::Min || e == BlendEquation::Max; };
            return enabled && (minMax(colorEquation) || minMax(alphaEquation));
        }
    };

    struct ColorMask {
        bool r{ true };
        bool g{ true };
        bool b{ true };
        bool a{ true };

        friend bool operator==(const ColorMask&, const ColorMask&) = default;
    };

    // Rect is ignored while disabled, so toggling scissor off does not depend on the old rect.
    struct ScissorState {
        bool enabled{ false };
        Rect rect{};

        friend bool operator==(const ScissorState& lhs, const ScissorState& rhs) noexcept
        {
            return lhs.enabled == rhs.enabled && (!lhs.enabled || lhs.rect == rhs.rect);
        }
    };

    struct VertexAttributeBinding {
        uint32_t location{ 0 };
        StorageId buffer{ kNullStorage };
        uint64_t offset{ 0 };
        uint32_t stride{ 0 };
        ValueType type{ ValueType::Vec4 };
        uint32_t divisor{ 0 };

        friend bool operator==(const VertexAttributeBinding&, const VertexAttributeBinding&) = default;
    };

    struct IndexBinding {
        StorageId buffer{ kNullStorage };
        IndexType type{ IndexType::U16 };

        friend bool operator==(const IndexBinding&, const IndexBinding&) = default;
    };

    struct TextureUnitBinding {
        StorageId texture{ kNullStorage };
        TextureTarget target{ TextureTarget::Tex2D };
        SamplerState sampler{};

        [[nodiscard]] bool empty() const noexcept { return texture == kNullStorage; }

        friend bool operator==(const TextureUnitBinding&, const TextureUnitBinding&) = default;
    };

    struct UniformBufferBinding {
        StorageId buffer{ kNullStorage };
        uint64_t offset{ 0 };
        uint64_t size{ 0 };

        friend bool operator==(const UniformBufferBinding&, const UniformBufferBinding&) = default;
    };

    using UniformValue = std::variant<
        float, glm::vec2, glm::vec3, glm::vec4,
        int32_t, glm::ivec2, glm::ivec3, glm::ivec4,
        uint32_t, glm::uvec2, glm::uvec3, glm::uvec4,
        bool,
        glm::mat2, glm::mat3, glm::mat4>;

    [[nodiscard]] ValueType uniformValueType(const UniformValue& value) noexcept;

    // Every piece of device state a draw depends on. Program uniform values live in the
    // StateCache per program, since the device keeps them per program object.
    struct PipelineState {
        StorageId program{ kNullStorage };
        StorageId framebuffer{ kNullStorage };
        // Empty means the device value is unknown (e.g. after a resize); it always differs.
        std::optional<Rect> viewport{};
        std::optional<ScissorState> scissor{ ScissorState{} };
        DepthTest depthTest{};
        bool depthWrite{ true };
        glm::vec2 depthRange{ 0.0F, 1.0F };
        bool depthClamp{ false };
        StencilState stencil{};
        BlendState blend{};
        ColorMask colorMask{};
        CullMode cullMode{ CullMode::None };
        FrontFace frontFace{ FrontFace::CounterClockwise };
        PolygonMode polygonMode{ PolygonMode::Fill };
        float lineWidth{ 1.0F };
        float pointSize{ 1.0F };
        bool multisample{ true };
        bool dither{ true };
        uint32_t clipDistanceMask{ 0 };
        bool rasterizerDiscard{ false };
        bool primitiveRestart{ false };
        std::vector<VertexAttributeBinding> vertexLayout{};
        IndexBinding indexBuffer{};
        std::vector<TextureUnitBinding> textureUnits{};
        std::vector<UniformBufferBinding> uniformBuffers{};

        friend bool operator==(const PipelineState&, const PipelineState&) = default;
    };

    [[nodiscard]] PipelineState makeDefaultPipelineState(uint32_t textureUnits, uint32_t uniformBufferBindings);

} // namespace drawcore
