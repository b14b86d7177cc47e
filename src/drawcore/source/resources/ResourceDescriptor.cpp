#include <algorithm>

#include <drawcore/resources/ResourceDescriptor.h>

namespace drawcore {

    uint32_t mipExtent(uint32_t base, uint32_t level) noexcept
    {
        const uint32_t extent = level >= 32 ? 0u : (base >> level);
        return std::max(extent, 1u);
    }

    uint32_t fullMipChain(uint32_t width, uint32_t height, uint32_t depth) noexcept
    {
        uint32_t largest = std::max({ width, height, depth });
        uint32_t levels = 1;
        while (largest > 1) {
            largest >>= 1;
            ++levels;
        }
        return levels;
    }

    uint64_t textureByteSize(const TextureDesc& desc) noexcept
    {
        const bool layered = desc.target == TextureTarget::Tex2DArray || desc.target == TextureTarget::Cube;
        uint64_t total = 0;
        for (uint32_t level = 0; level < desc.mipLevels; ++level) {
            const uint32_t w = mipExtent(desc.width, level);
            const uint32_t h = mipExtent(desc.height, level);
            const uint32_t d = layered ? desc.depth : mipExtent(desc.depth, level);
            total += regionByteSize(desc.format, w, h, d);
        }
        return total * std::max(desc.samples, 1u);
    }

    uint64_t alignedRowPitch(TextureFormat format, uint32_t width, uint32_t alignment) noexcept
    {
        const uint64_t packed = regionByteSize(format, width, isCompressed(format) ? 4u : 1u, 1);
        if (alignment <= 1) {
            return packed;
        }
        return (packed + alignment - 1) / alignment * alignment;
    }

} // namespace drawcore
