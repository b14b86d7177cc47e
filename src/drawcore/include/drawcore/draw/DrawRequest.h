#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <glm/glm.hpp>

#include <drawcore/command/Command.h>
#include <drawcore/core/Handle.h>
#include <drawcore/draw/ProgramReflection.h>
#include <drawcore/resources/TextureFormat.h>
#include <drawcore/state/PipelineState.h>
#include <drawcore/sync/FenceTracker.h>

namespace drawcore {

    struct TextureBinding {
        Handle texture{};
        SamplerState sampler{};
    };

    struct BlockBinding {
        Handle buffer{};
        uint64_t offset{ 0 };
        uint64_t size{ 0 };  // 0 = the rest of the buffer
        // Layout the caller wrote the data with. Empty = trust the program's layout.
        std::vector<BlockMember> layout{};
    };

    using UniformBinding = std::variant<UniformValue, TextureBinding, BlockBinding>;

    struct VertexAttributeSource {
        std::string name{};
        ValueType type{ ValueType::Vec4 };
        uint64_t offset{ 0 };  // within one element
    };

    // One buffer of interleaved elements. divisor > 0 makes it per-instance.
    struct VertexSource {
        Handle buffer{};
        uint64_t offset{ 0 };
        uint32_t stride{ 0 };
        uint32_t elementCount{ 0 };
        uint32_t divisor{ 0 };
        std::vector<VertexAttributeSource> attributes{};
    };

    struct IndexSource {
        Handle buffer{};
        uint64_t offset{ 0 };
        uint32_t count{ 0 };
        IndexType type{ IndexType::U16 };
    };

    // Fixed-function state a draw asks for. Anything left at its default is requested as the default.
    struct DrawParameters {
        std::optional<Rect> viewport{};  // empty = the whole render target
        std::optional<Rect> scissor{};   // empty = scissor test off
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
    };

    struct DrawRequest {
        Handle program{};
        Handle framebuffer{};  // null = the default framebuffer
        std::vector<VertexSource> vertices{};
        std::optional<IndexSource> indices{};
        PrimitiveType primitive{ PrimitiveType::Triangles };
        uint32_t firstVertex{ 0 };
        uint32_t vertexCount{ 0 };    // 0 = everything the sources (or indices) provide
        uint32_t instanceCount{ 0 };  // 0 = derived from per-instance sources, or 1
        uint32_t patchVertices{ 0 };
        std::map<std::string, UniformBinding> uniforms{};
        DrawParameters parameters{};
    };

    struct ClearRequest {
        Handle framebuffer{};
        std::optional<glm::vec4> color{};
        std::optional<float> depth{};
        std::optional<int32_t> stencil{};
        std::optional<Rect> scissor{};
    };

    struct ReadRequest {
        Handle source{};  // framebuffer or texture; null = the default framebuffer
        Rect region{};
        TextureFormat format{ TextureFormat::RGBA8 };
    };

    // A storage range the emitted commands will touch, fenced atomically with emission.
    struct TrackedAccess {
        StorageId storage{ kNullStorage };
        ByteRange range{};
        AccessMode mode{ AccessMode::Read };
        bool mapped{ false };
    };

    struct ResolvedTexture {
        int32_t location{ -1 };
        StorageId storage{ kNullStorage };
        TextureTarget target{ TextureTarget::Tex2D };
        SamplerState sampler{};
    };

    struct ResolvedBlock {
        uint32_t binding{ 0 };
        UniformBufferBinding buffer{};
    };

    // Everything the emitter needs, resolved to storage ids. Only DrawValidator builds these.
    struct ValidatedDraw {
        StorageId program{ kNullStorage };
        StorageId framebuffer{ kNullStorage };
        RenderTargetInfo target{};
        std::vector<VertexAttributeBinding> vertexLayout{};
        IndexBinding indexBuffer{};
        std::vector<std::pair<int32_t, UniformValue>> uniforms{};
        std::vector<ResolvedTexture> textures{};
        std::vector<ResolvedBlock> blocks{};
        DrawParameters parameters{};
        DrawCmd draw{};
        std::vector<TrackedAccess> accesses{};
    };

} // namespace drawcore
