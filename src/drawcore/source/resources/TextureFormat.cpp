#include <drawcore/resources/TextureFormat.h>

namespace drawcore {

    const char* textureFormatToString(TextureFormat f) noexcept
    {
        switch (f) {
        case TextureFormat::R8: return "R8";
        case TextureFormat::RG8: return "RG8";
        case TextureFormat::RGBA8: return "RGBA8";
        case TextureFormat::SRGBA8: return "SRGBA8";
        case TextureFormat::R16F: return "R16F";
        case TextureFormat::RGBA16F: return "RGBA16F";
        case TextureFormat::R32F: return "R32F";
        case TextureFormat::RGBA32F: return "RGBA32F";
        case TextureFormat::R32I: return "R32I";
        case TextureFormat::R32UI: return "R32UI";
        case TextureFormat::RGBA32UI: return "RGBA32UI";
        case TextureFormat::Depth16: return "Depth16";
        case TextureFormat::Depth24: return "Depth24";
        case TextureFormat::Depth32F: return "Depth32F";
        case TextureFormat::Depth24Stencil8: return "Depth24Stencil8";
        case TextureFormat::Stencil8: return "Stencil8";
        case TextureFormat::BC1: return "BC1";
        case TextureFormat::BC3: return "BC3";
        case TextureFormat::BC7: return "BC7";
        case TextureFormat::ETC2RGB8: return "ETC2RGB8";
        default: return "unknown";
        }
    }

    const char* textureTargetToString(TextureTarget t) noexcept
    {
        switch (t) {
        case TextureTarget::Tex2D: return "2D";
        case TextureTarget::Tex2DArray: return "2DArray";
        case TextureTarget::Tex3D: return "3D";
        case TextureTarget::Cube: return "Cube";
        default: return "unknown";
        }
    }

} // namespace drawcore
