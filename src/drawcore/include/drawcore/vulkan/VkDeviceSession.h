#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <vulkan/vulkan.h>

#include <drawcore/core/Status.h>
#include <drawcore/device/DeviceCapabilities.h>

namespace drawcore::vkutil {

    // Instance plus a logical device with timeline semaphores enabled. Presentation is
    // not set up here; the window layer owns the surface.
    class VkDeviceSession
    {
    public:
        struct CreateInfo {
            const char* applicationName{ "drawcore" };
            std::vector<const char*> instanceExtensions{};
            bool enableValidation{ false };
        };

        VkDeviceSession() = default;
        ~VkDeviceSession();

        VkDeviceSession(const VkDeviceSession&) = delete;
        VkDeviceSession& operator=(const VkDeviceSession&) = delete;
        VkDeviceSession(VkDeviceSession&& other) noexcept;
        VkDeviceSession& operator=(VkDeviceSession&& other) noexcept;

        [[nodiscard]] static Expected<VkDeviceSession> create(const CreateInfo& info);

        [[nodiscard]] VkInstance instance() const noexcept { return instance_; }
        [[nodiscard]] VkPhysicalDevice physicalDevice() const noexcept { return physicalDevice_; }
        [[nodiscard]] VkDevice device() const noexcept { return device_; }
        [[nodiscard]] uint32_t graphicsQueueFamily() const noexcept { return graphicsFamily_; }
        [[nodiscard]] const DeviceCapabilities& capabilities() const noexcept { return capabilities_; }
        [[nodiscard]] const std::string& deviceName() const noexcept { return deviceName_; }

    private:
        void destroy() noexcept;

        VkInstance instance_{ VK_NULL_HANDLE };
        VkPhysicalDevice physicalDevice_{ VK_NULL_HANDLE };
        VkDevice device_{ VK_NULL_HANDLE };
        uint32_t graphicsFamily_{ UINT32_MAX };
        DeviceCapabilities capabilities_{};
        std::string deviceName_{};
    };

} // namespace drawcore::vkutil
