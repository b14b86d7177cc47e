#pragma once

#include <cstdint>

namespace drawcore {

    enum class TextureTarget : uint8_t {
        Tex2D,
        Tex2DArray,
        Tex3D,
        Cube
    };

    enum class TextureFormat : uint8_t {
        R8,
        RG8,
        RGBA8,
        SRGBA8,
        R16F,
        RGBA16F,
        R32F,
        RGBA32F,
        R32I,
        R32UI,
        RGBA32UI,
        Depth16,
        Depth24,
        Depth32F,
        Depth24Stencil8,
        Stencil8,
        BC1,
        BC3,
        BC7,
        ETC2RGB8
    };

    // How a format is sampled; a sampler uniform only accepts textures of its own class.
    enum class SampleClass : uint8_t {
        Float,
        Int,
        UInt,
        Depth
    };

    [[nodiscard]] constexpr bool isCompressed(TextureFormat f) noexcept
    {
        return f == TextureFormat::BC1 || f == TextureFormat::BC3 || f == TextureFormat::BC7 || f == TextureFormat::ETC2RGB8;
    }

    [[nodiscard]] constexpr bool hasDepth(TextureFormat f) noexcept
    {
        return f == TextureFormat::Depth16 || f == TextureFormat::Depth24 || f == TextureFormat::Depth32F || f == TextureFormat::Depth24Stencil8;
    }

    [[nodiscard]] constexpr bool hasStencil(TextureFormat f) noexcept
    {
        return f == TextureFormat::Depth24Stencil8 || f == TextureFormat::Stencil8;
    }

    [[nodiscard]] constexpr bool isColor(TextureFormat f) noexcept
    {
        return !hasDepth(f) && !hasStencil(f);
    }

    [[nodiscard]] constexpr SampleClass sampleClass(TextureFormat f) noexcept
    {
        switch (f) {
        case TextureFormat::R32I: return SampleClass::Int;
        case TextureFormat::R32UI:
        case TextureFormat::RGBA32UI: return SampleClass::UInt;
        default: break;
        }
        return hasDepth(f) || hasStencil(f) ? SampleClass::Depth : SampleClass::Float;
    }

    // Bytes per texel, or bytes per 4x4 block for compressed formats.
    [[nodiscard]] constexpr uint32_t formatByteSize(TextureFormat f) noexcept
    {
        switch (f) {
        case TextureFormat::R8: return 1;
        case TextureFormat::RG8: return 2;
        case TextureFormat::RGBA8:
        case TextureFormat::SRGBA8: return 4;
        case TextureFormat::R16F: return 2;
        case TextureFormat::RGBA16F: return 8;
        case TextureFormat::R32F:
        case TextureFormat::R32I:
        case TextureFormat::R32UI: return 4;
        case TextureFormat::RGBA32F:
        case TextureFormat::RGBA32UI: return 16;
        case TextureFormat::Depth16: return 2;
        case TextureFormat::Depth24:
        case TextureFormat::Depth32F:
        case TextureFormat::Depth24Stencil8: return 4;
        case TextureFormat::Stencil8: return 1;
        case TextureFormat::BC1:
        case TextureFormat::ETC2RGB8: return 8;
        case TextureFormat::BC3:
        case TextureFormat::BC7: return 16;
        default: return 0;
        }
    }

    // Tightly packed size of a width x height x depth region, before row alignment.
    [[nodiscard]] constexpr uint64_t regionByteSize(TextureFormat f, uint32_t width, uint32_t height, uint32_t depth) noexcept
    {
        if (isCompressed(f)) {
            const uint64_t blocksX = (static_cast<uint64_t>(width) + 3) / 4;
            const uint64_t blocksY = (static_cast<uint64_t>(height) + 3) / 4;
            return blocksX * blocksY * depth * formatByteSize(f);
        }
        return static_cast<uint64_t>(width) * height * depth * formatByteSize(f);
    }

    [[nodiscard]] const char* textureFormatToString(TextureFormat f) noexcept;
    [[nodiscard]] const char* textureTargetToString(TextureTarget t) noexcept;

} // namespace drawcore
