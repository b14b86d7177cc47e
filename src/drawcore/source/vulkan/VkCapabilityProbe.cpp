#include <algorithm>
#include <string>

#include <drawcore/vulkan/VkCapabilityProbe.h>
#include <drawcore/vulkan/VkResultUtils.h>

namespace drawcore::vkutil {

    namespace {
        uint32_t sampleMaskFrom(VkSampleCountFlags flags)
        {
            // VkSampleCountFlagBits already sets bit N for a count of 1 << N.
            return static_cast<uint32_t>(flags) & 0x7Fu;
        }
    } // namespace

    DeviceCapabilities capabilitiesFromVulkan(const VkPhysicalDeviceProperties& properties,
        const VkPhysicalDeviceFeatures& features)
    {
        const VkPhysicalDeviceLimits& limits = properties.limits;

        DeviceCapabilities caps{};
        caps.maxTextureUnits = std::min(limits.maxPerStageDescriptorSampledImages, limits.maxPerStageDescriptorSamplers);
        caps.maxTextureSize = limits.maxImageDimension2D;
        caps.max3DTextureSize = limits.maxImageDimension3D;
        caps.maxCubeTextureSize = limits.maxImageDimensionCube;
        caps.maxArrayLayers = limits.maxImageArrayLayers;
        caps.maxBufferSize = std::max<uint64_t>(limits.maxStorageBufferRange, limits.maxUniformBufferRange);
        caps.maxViewportWidth = limits.maxViewportDimensions[0];
        caps.maxViewportHeight = limits.maxViewportDimensions[1];
        caps.maxVertexAttributes = limits.maxVertexInputAttributes;
        caps.maxUniformBufferBindings = limits.maxPerStageDescriptorUniformBuffers;
        caps.maxColorAttachments = limits.maxColorAttachments;
        caps.maxClipDistances = features.shaderClipDistance == VK_TRUE ? limits.maxClipDistances : 0;
        caps.maxPatchVertices = features.tessellationShader == VK_TRUE ? limits.maxTessellationPatchSize : 0;
        caps.sampleCountMask = sampleMaskFrom(limits.framebufferColorSampleCounts & limits.framebufferDepthSampleCounts);
        if (caps.sampleCountMask == 0) {
            caps.sampleCountMask = 1;
        }

        caps.minLineWidth = features.wideLines == VK_TRUE ? limits.lineWidthRange[0] : 1.0F;
        caps.maxLineWidth = features.wideLines == VK_TRUE ? limits.lineWidthRange[1] : 1.0F;
        caps.maxPointSize = features.largePoints == VK_TRUE ? limits.pointSizeRange[1] : 1.0F;

        caps.depthClamp = features.depthClamp == VK_TRUE;
        caps.polygonModeNonFill = features.fillModeNonSolid == VK_TRUE;
        caps.minMaxBlend = true;
        caps.multisample = (caps.sampleCountMask & ~1u) != 0;
        caps.compressedTextures = features.textureCompressionBC == VK_TRUE;
        caps.persistentMapping = true;
        caps.primitiveRestart = true;
        caps.tessellation = features.tessellationShader == VK_TRUE;
        caps.rasterizerDiscard = true;
        return caps;
    }

    Expected<DeviceCapabilities> probe(VkPhysicalDevice physicalDevice)
    {
        if (physicalDevice == VK_NULL_HANDLE) {
            return errorFromVkResult("vkutil::probe", VK_ERROR_INITIALIZATION_FAILED, "vk_probe");
        }

        VkPhysicalDeviceProperties properties{};
        vkGetPhysicalDeviceProperties(physicalDevice, &properties);
        VkPhysicalDeviceFeatures features{};
        vkGetPhysicalDeviceFeatures(physicalDevice, &features);

        DeviceCapabilities caps = capabilitiesFromVulkan(properties, features);
        reportInfo("vk_probe", "vkutil::probe",
            std::string(properties.deviceName) + ": " + std::to_string(caps.maxTextureUnits) + " texture units, max samples "
                + std::to_string(caps.maxSamples()));
        return caps;
    }

} // namespace drawcore::vkutil
