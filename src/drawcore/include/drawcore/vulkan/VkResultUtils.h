#pragma once

#include <source_location>

#include <vulkan/vulkan.h>

#include <drawcore/core/Status.h>

namespace drawcore::vkutil {

    [[nodiscard]] const char* vkResultToString(VkResult result) noexcept;

    // DEVICE_LOST -> ContextLost, TIMEOUT/NOT_READY -> SynchronizationTimeout,
    // out-of-memory and init failures -> ResourceCreation, anything else -> InvalidArgument.
    [[nodiscard]] ErrorCode errorCodeFromVkResult(VkResult result) noexcept;

    [[nodiscard]] ErrorContext errorFromVkResult(const char* operation,
        VkResult result,
        const char* subsystem = "vk",
        const std::source_location& location = std::source_location::current());

    [[nodiscard]] inline Expected<void> checkResult(VkResult result,
        const char* operation,
        const char* subsystem = "vk",
        const std::source_location& location = std::source_location::current())
    {
        if (result == VK_SUCCESS) {
            return {};
        }
        return errorFromVkResult(operation, result, subsystem, location);
    }

#define DRAWCORE_VK_RETURN_IF_FAILED(vk_expr, operation_name, subsystem_name) \
    do { \
        const VkResult _drawcore_vk_res = (vk_expr); \
        if (_drawcore_vk_res != VK_SUCCESS) { \
            return ::drawcore::vkutil::errorFromVkResult((operation_name), _drawcore_vk_res, (subsystem_name)); \
        } \
    } while (false)

} // namespace drawcore::vkutil
