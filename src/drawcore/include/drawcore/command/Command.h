#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <variant>
#include <vector>

#include <glm/glm.hpp>

#include <drawcore/core/Handle.h>
#include <drawcore/resources/ResourceDescriptor.h>
#include <drawcore/state/PipelineState.h>

namespace drawcore {

    enum class StateField : uint8_t {
        Program,
        Framebuffer,
        Viewport,
        Scissor,
        DepthTest,
        DepthWrite,
        DepthRange,
        DepthClamp,
        Stencil,
        Blend,
        ColorMask,
        CullMode,
        FrontFace,
        PolygonMode,
        LineWidth,
        PointSize,
        Multisample,
        Dither,
        ClipDistances,
        RasterizerDiscard,
        PrimitiveRestart,
        VertexLayout,
        IndexBuffer,
        TextureUnit,    // slot = unit
        UniformBuffer,  // slot = binding point
        Uniform         // slot = location in the bound program
    };

    [[nodiscard]] const char* stateFieldToString(StateField field) noexcept;

    using StateValue = std::variant<
        bool,
        float,
        uint32_t,
        StorageId,
        glm::vec2,
        Rect,
        ScissorState,
        DepthTest,
        StencilState,
        BlendState,
        ColorMask,
        CullMode,
        FrontFace,
        PolygonMode,
        std::vector<VertexAttributeBinding>,
        IndexBinding,
        TextureUnitBinding,
        UniformBufferBinding,
        UniformValue>;

    struct StateChangeCmd {
        StateField field{ StateField::Program };
        uint32_t slot{ 0 };
        StateValue value{};
    };

    enum class PrimitiveType : uint8_t {
        Points,
        Lines,
        LineStrip,
        Triangles,
        TriangleStrip,
        TriangleFan,
        Patches
    };

    struct DrawCmd {
        PrimitiveType primitive{ PrimitiveType::Triangles };
        uint32_t firstVertex{ 0 };
        uint32_t vertexCount{ 0 };
        uint32_t instanceCount{ 1 };
        bool indexed{ false };
        uint64_t indexOffset{ 0 };
        uint32_t patchVertices{ 0 };
    };

    struct ClearCmd {
        std::optional<glm::vec4> color{};
        std::optional<float> depth{};
        std::optional<int32_t> stencil{};
    };

    struct CreateStorageCmd {
        StorageId storage{ kNullStorage };
        ResourceKind kind{ ResourceKind::Buffer };
        uint64_t byteSize{ 0 };
        std::optional<TextureDesc> texture{};
        std::vector<StorageId> attachments{};
        // Persistent buffers only: memory shared between the CPU and the device.
        std::shared_ptr<std::vector<std::byte>> mapped{};
        std::vector<std::byte> initialData{};
    };

    struct ReleaseStorageCmd {
        StorageId storage{ kNullStorage };
        ResourceKind kind{ ResourceKind::Buffer };
    };

    struct CopyStorageCmd {
        StorageId source{ kNullStorage };
        StorageId destination{ kNullStorage };
        uint64_t sourceOffset{ 0 };
        uint64_t destinationOffset{ 0 };
        uint64_t size{ 0 };
    };

    struct BufferWriteCmd {
        StorageId storage{ kNullStorage };
        uint64_t offset{ 0 };
        std::vector<std::byte> data{};
    };

    struct TextureUploadCmd {
        StorageId storage{ kNullStorage };
        TextureUpload upload{};
    };

    // Filled by the consumer thread; read back only after the covering fence is satisfied.
    struct ReadbackSlot {
        std::vector<std::byte> data{};
        std::atomic<bool> filled{ false };
    };

    struct ReadBufferCmd {
        StorageId storage{ kNullStorage };
        uint64_t offset{ 0 };
        uint64_t size{ 0 };
        std::shared_ptr<ReadbackSlot> slot{};
    };

    struct ReadPixelsCmd {
        StorageId source{ kNullStorage };  // framebuffer storage, 0 = default framebuffer
        ResourceKind sourceKind{ ResourceKind::Framebuffer };
        Rect region{};
        TextureFormat format{ TextureFormat::RGBA8 };
        std::shared_ptr<ReadbackSlot> slot{};
    };

    struct SignalFenceCmd {
        uint64_t value{ 0 };
    };

    struct PresentCmd {
        uint64_t frame{ 0 };
    };

    using CommandPayload = std::variant<
        StateChangeCmd,
        DrawCmd,
        ClearCmd,
        CreateStorageCmd,
        ReleaseStorageCmd,
        CopyStorageCmd,
        BufferWriteCmd,
        TextureUploadCmd,
        ReadBufferCmd,
        ReadPixelsCmd,
        SignalFenceCmd,
        PresentCmd>;

    struct Command {
        uint64_t sequence{ 0 };
        uint32_t producerId{ 0 };
        CommandPayload payload{};
    };

    enum class CommandCategory : uint8_t {
        StateChange,
        Draw,
        Resource,
        Sync,
        Readback,
        Present
    };

    [[nodiscard]] CommandCategory commandCategory(const CommandPayload& payload) noexcept;
    [[nodiscard]] const char* commandName(const CommandPayload& payload) noexcept;

} // namespace drawcore
