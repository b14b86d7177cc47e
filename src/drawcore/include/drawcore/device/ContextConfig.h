#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <drawcore/command/DeviceThread.h>
#include <drawcore/core/Status.h>
#include <drawcore/device/DeviceCapabilities.h>
#include <drawcore/resources/DeletionQueue.h>
#include <drawcore/resources/ResourceDescriptor.h>
#include <drawcore/sync/FenceTracker.h>

namespace drawcore {

    // How a busy buffer range is rewritten: wait for the GPU, or write into fresh storage.
    enum class RewritePolicy : uint8_t {
        UsageHint,          // Static waits, Dynamic reallocates, Persistent waits on the sub-range
        AlwaysWait,
        AlwaysReallocate    // except Persistent, whose mapping must stay put
    };

    struct ContextConfig {
        DeviceCapabilities capabilities{};
        // Shape of the window's framebuffer; updated by resize notifications.
        RenderTargetInfo defaultFramebuffer{ .width = 1280, .height = 720, .samples = 1, .colorAttachmentCount = 1, .hasDepth = true, .hasStencil = true };
        DeviceThread::Mode consumerMode{ DeviceThread::Mode::Dedicated };
        FenceTracker::RuntimeConfig fences{};
        RewritePolicy rewritePolicy{ RewritePolicy::UsageHint };
        DeletionQueue::RetryPolicy releaseRetry{};
        Severity minimumSeverity{ Severity::Warning };
    };

    // DRAWCORE_CONSUMER_MODE, DRAWCORE_WAIT_TIMEOUT_MS, DRAWCORE_REWRITE_POLICY,
    // DRAWCORE_TRACK_DRAW_READS and DRAWCORE_LOG_LEVEL. Unknown values are reported and ignored.
    void applyEnvironmentOverrides(ContextConfig& config);

    [[nodiscard]] std::optional<std::string> readEnvVar(const char* key);
    [[nodiscard]] const char* rewritePolicyToString(RewritePolicy policy) noexcept;

} // namespace drawcore
