#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <drawcore/core/Handle.h>
#include <drawcore/draw/ProgramReflection.h>
#include <drawcore/resources/TextureFormat.h>

namespace drawcore {

    enum class BufferUsage : uint8_t {
        Static,     // rarely rewritten; rewrites wait for the GPU
        Dynamic,    // streamed; busy rewrites get fresh storage
        Persistent  // CPU-mapped for its whole lifetime
    };

    enum BufferBindFlags : uint32_t {
        BufferBindVertex = 1u << 0,
        BufferBindIndex = 1u << 1,
        BufferBindUniform = 1u << 2,
        BufferBindPixelPack = 1u << 3
    };

    struct BufferDesc {
        uint64_t size{ 0 };
        BufferUsage usage{ BufferUsage::Static };
        uint32_t bindFlags{ BufferBindVertex };
    };

    struct TextureDesc {
        TextureTarget target{ TextureTarget::Tex2D };
        TextureFormat format{ TextureFormat::RGBA8 };
        uint32_t width{ 0 };
        uint32_t height{ 1 };
        uint32_t depth{ 1 };  // layers for arrays, 6 for cubes
        uint32_t mipLevels{ 1 };
        uint32_t samples{ 1 };
    };

    struct ProgramDesc {
        std::shared_ptr<const ProgramReflection> reflection{};
    };

    struct FramebufferAttachment {
        Handle texture{};
        uint32_t mipLevel{ 0 };
        uint32_t layer{ 0 };
    };

    struct FramebufferDesc {
        std::vector<FramebufferAttachment> colorAttachments{};
        std::optional<FramebufferAttachment> depthAttachment{};
        std::optional<FramebufferAttachment> stencilAttachment{};
    };

    // Resolved render-target shape; for the default framebuffer it comes from the window layer.
    struct RenderTargetInfo {
        uint32_t width{ 0 };
        uint32_t height{ 0 };
        uint32_t samples{ 1 };
        uint32_t colorAttachmentCount{ 1 };
        bool hasDepth{ false };
        bool hasStencil{ false };
    };

    // Registry-owned metadata for a live handle. describe() hands out copies.
    struct ResourceDescriptor {
        Handle handle{};
        StorageId storage{ kNullStorage };
        std::variant<BufferDesc, TextureDesc, ProgramDesc, FramebufferDesc> desc{};
        // Framebuffers only.
        RenderTargetInfo target{};
        std::vector<StorageId> attachmentStorage{};
        uint64_t byteSize{ 0 };
        uint32_t swapCount{ 0 };

        [[nodiscard]] ResourceKind kind() const noexcept { return handle.kind; }
        [[nodiscard]] const BufferDesc* buffer() const noexcept { return std::get_if<BufferDesc>(&desc); }
        [[nodiscard]] const TextureDesc* texture() const noexcept { return std::get_if<TextureDesc>(&desc); }
        [[nodiscard]] const ProgramDesc* program() const noexcept { return std::get_if<ProgramDesc>(&desc); }
        [[nodiscard]] const FramebufferDesc* framebuffer() const noexcept { return std::get_if<FramebufferDesc>(&desc); }
    };

    // Pixel data handed over by the image-decoding layer.
    struct TextureUpload {
        uint32_t mipLevel{ 0 };
        uint32_t x{ 0 };
        uint32_t y{ 0 };
        uint32_t z{ 0 };
        uint32_t width{ 0 };
        uint32_t height{ 1 };
        uint32_t depth{ 1 };
        TextureFormat format{ TextureFormat::RGBA8 };
        uint32_t rowAlignment{ 4 };
        std::vector<std::byte> pixels{};
    };

    [[nodiscard]] uint64_t textureByteSize(const TextureDesc& desc) noexcept;
    [[nodiscard]] uint32_t mipExtent(uint32_t base, uint32_t level) noexcept;
    [[nodiscard]] uint32_t fullMipChain(uint32_t width, uint32_t height, uint32_t depth) noexcept;
    [[nodiscard]] uint64_t alignedRowPitch(TextureFormat format, uint32_t width, uint32_t alignment) noexcept;

} // namespace drawcore
