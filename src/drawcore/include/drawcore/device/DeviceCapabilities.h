#pragma once

#include <cstdint>

namespace drawcore {

    // Limits and optional features reported by the window/context layer.
    struct DeviceCapabilities {
        uint32_t maxTextureUnits{ 16 };
        uint32_t maxTextureSize{ 8192 };
        uint32_t max3DTextureSize{ 2048 };
        uint32_t maxCubeTextureSize{ 8192 };
        uint32_t maxArrayLayers{ 2048 };
        uint64_t maxBufferSize{ 1ull << 31 };
        uint32_t maxViewportWidth{ 16384 };
        uint32_t maxViewportHeight{ 16384 };
        uint32_t maxVertexAttributes{ 16 };
        uint32_t maxUniformBufferBindings{ 36 };
        uint32_t maxColorAttachments{ 8 };
        uint32_t maxClipDistances{ 8 };
        uint32_t maxPatchVertices{ 32 };
        // Bit N set means a sample count of (1 << N) is supported.
        uint32_t sampleCountMask{ 0x0F };
        float minLineWidth{ 1.0F };
        float maxLineWidth{ 1.0F };
        float maxPointSize{ 64.0F };

        bool depthClamp{ true };
        bool polygonModeNonFill{ true };
        bool minMaxBlend{ true };
        bool multisample{ true };
        bool compressedTextures{ false };
        bool persistentMapping{ true };
        bool primitiveRestart{ true };
        bool tessellation{ true };
        bool rasterizerDiscard{ true };

        [[nodiscard]] bool supportsSampleCount(uint32_t samples) const noexcept
        {
            if (samples == 0 || (samples & (samples - 1)) != 0) {
                return false;
            }
            uint32_t bit = 0;
            while ((1u << bit) != samples) {
                ++bit;
            }
            return bit < 32 && ((sampleCountMask >> bit) & 1u) != 0;
        }

        [[nodiscard]] uint32_t maxSamples() const noexcept
        {
            uint32_t best = 1;
            for (uint32_t bit = 0; bit < 31; ++bit) {
                if (((sampleCountMask >> bit) & 1u) != 0) {
                    best = 1u << bit;
                }
            }
            return best;
        }
    };

} // namespace drawcore
