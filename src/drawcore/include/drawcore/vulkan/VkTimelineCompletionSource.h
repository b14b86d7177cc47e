#pragma once

#include <chrono>
#include <cstdint>

#include <vulkan/vulkan.h>

#include <drawcore/command/DeviceThread.h>
#include <drawcore/core/Status.h>
#include <drawcore/sync/CompletionSource.h>

namespace drawcore::vkutil {

    // Completion source backed by a timeline semaphore. Fence value N is retired once the
    // semaphore counter reaches N. Requires a device created with timelineSemaphore enabled.
    class VkTimelineCompletionSource : public ICompletionSource
    {
    public:
        VkTimelineCompletionSource() = default;
        ~VkTimelineCompletionSource();

        VkTimelineCompletionSource(const VkTimelineCompletionSource&) = delete;
        VkTimelineCompletionSource& operator=(const VkTimelineCompletionSource&) = delete;
        VkTimelineCompletionSource(VkTimelineCompletionSource&& other) noexcept;
        VkTimelineCompletionSource& operator=(VkTimelineCompletionSource&& other) noexcept;

        [[nodiscard]] static Expected<VkTimelineCompletionSource> create(VkDevice device, uint64_t initialValue = 0);

        [[nodiscard]] Expected<uint64_t> completedValue() override;
        [[nodiscard]] Expected<bool> wait(uint64_t value, std::chrono::nanoseconds timeout) override;

        // Host-side signal, for backends that retire work on the CPU.
        [[nodiscard]] Expected<void> signal(uint64_t value);

        [[nodiscard]] VkSemaphore semaphore() const noexcept { return semaphore_; }
        [[nodiscard]] bool valid() const noexcept { return semaphore_ != VK_NULL_HANDLE; }

    private:
        void destroy() noexcept;

        VkDevice device_{ VK_NULL_HANDLE };
        VkSemaphore semaphore_{ VK_NULL_HANDLE };
    };

    // Runs commands on an inner backend and, for every SignalFence, signals the timeline
    // once the inner backend has executed it.
    class TimelineSignallingBackend : public IDeviceBackend
    {
    public:
        TimelineSignallingBackend(IDeviceBackend& inner, VkTimelineCompletionSource& timeline);

        [[nodiscard]] Expected<void> execute(const Command& command) override;

    private:
        IDeviceBackend& inner_;
        VkTimelineCompletionSource& timeline_;
    };

} // namespace drawcore::vkutil
