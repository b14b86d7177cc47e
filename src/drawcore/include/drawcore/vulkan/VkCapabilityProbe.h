#pragma once

#include <vulkan/vulkan.h>

#include <drawcore/core/Status.h>
#include <drawcore/device/DeviceCapabilities.h>

namespace drawcore::vkutil {

    // Pure mapping of Vulkan limits and features onto the capability set.
    [[nodiscard]] DeviceCapabilities capabilitiesFromVulkan(const VkPhysicalDeviceProperties& properties,
        const VkPhysicalDeviceFeatures& features);

    [[nodiscard]] Expected<DeviceCapabilities> probe(VkPhysicalDevice physicalDevice);

} // namespace drawcore::vkutil
