#include <utility>
#include <variant>

#include <drawcore/vulkan/VkResultUtils.h>
#include <drawcore/vulkan/VkTimelineCompletionSource.h>

namespace drawcore::vkutil {

    VkTimelineCompletionSource::~VkTimelineCompletionSource()
    {
        destroy();
    }

    VkTimelineCompletionSource::VkTimelineCompletionSource(VkTimelineCompletionSource&& other) noexcept
        : device_(std::exchange(other.device_, VK_NULL_HANDLE))
        , semaphore_(std::exchange(other.semaphore_, VK_NULL_HANDLE))
    {
    }

    VkTimelineCompletionSource& VkTimelineCompletionSource::operator=(VkTimelineCompletionSource&& other) noexcept
    {
        if (this != &other) {
            destroy();
            device_ = std::exchange(other.device_, VK_NULL_HANDLE);
            semaphore_ = std::exchange(other.semaphore_, VK_NULL_HANDLE);
        }
        return *this;
    }

    void VkTimelineCompletionSource::destroy() noexcept
    {
        if (semaphore_ != VK_NULL_HANDLE) {
            vkDestroySemaphore(device_, semaphore_, nullptr);
            semaphore_ = VK_NULL_HANDLE;
        }
        device_ = VK_NULL_HANDLE;
    }

    Expected<VkTimelineCompletionSource> VkTimelineCompletionSource::create(VkDevice device, uint64_t initialValue)
    {
        if (device == VK_NULL_HANDLE) {
            return errorFromVkResult("VkTimelineCompletionSource::create", VK_ERROR_INITIALIZATION_FAILED, "vk_sync");
        }

        VkSemaphoreTypeCreateInfo typeInfo{ VK_STRUCTURE_TYPE_SEMAPHORE_TYPE_CREATE_INFO };
        typeInfo.semaphoreType = VK_SEMAPHORE_TYPE_TIMELINE;
        typeInfo.initialValue = initialValue;

        VkSemaphoreCreateInfo ci{ VK_STRUCTURE_TYPE_SEMAPHORE_CREATE_INFO };
        ci.pNext = &typeInfo;

        VkSemaphore semaphore = VK_NULL_HANDLE;
        DRAWCORE_VK_RETURN_IF_FAILED(vkCreateSemaphore(device, &ci, nullptr, &semaphore), "vkCreateSemaphore", "vk_sync");

        VkTimelineCompletionSource out{};
        out.device_ = device;
        out.semaphore_ = semaphore;
        return std::move(out);
    }

    Expected<uint64_t> VkTimelineCompletionSource::completedValue()
    {
        if (!valid()) {
            return errorFromVkResult("VkTimelineCompletionSource::completedValue", VK_ERROR_INITIALIZATION_FAILED, "vk_sync");
        }
        uint64_t value = 0;
        DRAWCORE_VK_RETURN_IF_FAILED(vkGetSemaphoreCounterValue(device_, semaphore_, &value), "vkGetSemaphoreCounterValue", "vk_sync");
        return value;
    }

    Expected<bool> VkTimelineCompletionSource::wait(uint64_t value, std::chrono::nanoseconds timeout)
    {
        if (!valid()) {
            return errorFromVkResult("VkTimelineCompletionSource::wait", VK_ERROR_INITIALIZATION_FAILED, "vk_sync");
        }

        VkSemaphoreWaitInfo wi{ VK_STRUCTURE_TYPE_SEMAPHORE_WAIT_INFO };
        wi.semaphoreCount = 1;
        wi.pSemaphores = &semaphore_;
        wi.pValues = &value;

        const uint64_t timeoutNs = timeout.count() < 0 ? 0 : static_cast<uint64_t>(timeout.count());
        const VkResult res = vkWaitSemaphores(device_, &wi, timeoutNs);
        if (res == VK_SUCCESS) {
            return true;
        }
        if (res == VK_TIMEOUT) {
            return false;
        }
        return errorFromVkResult("vkWaitSemaphores", res, "vk_sync");
    }

    Expected<void> VkTimelineCompletionSource::signal(uint64_t value)
    {
        if (!valid()) {
            return errorFromVkResult("VkTimelineCompletionSource::signal", VK_ERROR_INITIALIZATION_FAILED, "vk_sync");
        }

        VkSemaphoreSignalInfo info{ VK_STRUCTURE_TYPE_SEMAPHORE_SIGNAL_INFO };
        info.semaphore = semaphore_;
        info.value = value;
        return checkResult(vkSignalSemaphore(device_, &info), "vkSignalSemaphore", "vk_sync");
    }

    TimelineSignallingBackend::TimelineSignallingBackend(IDeviceBackend& inner, VkTimelineCompletionSource& timeline)
        : inner_(inner)
        , timeline_(timeline)
    {
    }

    Expected<void> TimelineSignallingBackend::execute(const Command& command)
    {
        DRAWCORE_RETURN_IF_FAILED(inner_.execute(command));
        if (const auto* signal = std::get_if<SignalFenceCmd>(&command.payload)) {
            return timeline_.signal(signal->value);
        }
        return {};
    }

} // namespace drawcore::vkutil
