#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include <drawcore/command/CommandQueue.h>
#include <drawcore/command/DeviceThread.h>
#include <drawcore/core/Status.h>
#include <drawcore/device/ContextConfig.h>
#include <drawcore/draw/CommandEmitter.h>
#include <drawcore/draw/DrawRequest.h>
#include <drawcore/draw/DrawValidator.h>
#include <drawcore/resources/ResourceRegistry.h>
#include <drawcore/state/StateCache.h>
#include <drawcore/sync/CompletionSource.h>
#include <drawcore/sync/FenceTracker.h>

namespace drawcore {

    // Result of a readback that was queued but not waited on.
    class PendingReadback
    {
    public:
        PendingReadback() = default;

        [[nodiscard]] bool isReady() const;
        [[nodiscard]] Expected<void> wait(std::optional<std::chrono::nanoseconds> timeout = std::nullopt) const;
        // Waits if needed, then hands the pixels over. Only the first call gets them.
        [[nodiscard]] Expected<std::vector<std::byte>> take(std::optional<std::chrono::nanoseconds> timeout = std::nullopt);

        [[nodiscard]] uint64_t fenceValue() const noexcept { return fence_; }

    private:
        friend class RenderContext;

        PendingReadback(std::shared_ptr<ReadbackSlot> slot, uint64_t fence, FenceTracker* fences);

        std::shared_ptr<ReadbackSlot> slot_{};
        uint64_t fence_{ 0 };
        FenceTracker* fences_{ nullptr };
    };

    // The stateless draw API. Owns the command stream, its consumer and everything in
    // between; any number of threads may call in concurrently.
    class RenderContext
    {
    public:
        struct Stats {
            CommandEmitter::Stats emitter{};
            TextureUnitAllocator::Stats textureUnits{};
            ResourceRegistry::Stats resources{};
            FenceTracker::Diagnostics fences{};
            DeviceThread::Diagnostics device{};
            uint64_t rejectedDraws{ 0 };
            uint64_t presents{ 0 };
        };

        RenderContext(const ContextConfig& config, IDeviceBackend& backend, ICompletionSource& completion);
        ~RenderContext();

        RenderContext(const RenderContext&) = delete;
        RenderContext& operator=(const RenderContext&) = delete;

        [[nodiscard]] ResourceRegistry& resources() noexcept { return registry_; }

        // Validates, then queues exactly the state changes the draw needs and the draw itself.
        // A rejected draw leaves the queue and the state cache untouched.
        [[nodiscard]] Expected<void> draw(const DrawRequest& request);
        [[nodiscard]] Expected<ValidatedDraw> validate(const DrawRequest& request) const;
        [[nodiscard]] Expected<void> clear(const ClearRequest& request);

        [[nodiscard]] Expected<std::vector<std::byte>> readPixels(const ReadRequest& request,
            std::optional<std::chrono::nanoseconds> timeout = std::nullopt);
        [[nodiscard]] Expected<PendingReadback> readPixelsAsync(const ReadRequest& request);

        // Hands every queued command to the device and collects retired releases.
        // The window layer swaps only after this returns.
        [[nodiscard]] Expected<void> present();
        void notifyViewportResized(uint32_t width, uint32_t height);

        [[nodiscard]] Expected<void> waitForBuffer(Handle buffer,
            ByteRange range,
            AccessMode mode,
            std::optional<std::chrono::nanoseconds> timeout = std::nullopt);
        [[nodiscard]] Expected<bool> isBufferAvailable(Handle buffer, ByteRange range, AccessMode mode);
        [[nodiscard]] Expected<uint64_t> insertFence();
        [[nodiscard]] Expected<void> waitForFence(uint64_t fenceValue, std::optional<std::chrono::nanoseconds> timeout = std::nullopt);
        [[nodiscard]] Expected<void> flush();

        [[nodiscard]] bool contextLost() const;
        [[nodiscard]] RenderTargetInfo defaultFramebuffer() const;
        [[nodiscard]] PipelineState cachedState() const { return cache_.current(); }
        [[nodiscard]] const ContextConfig& config() const noexcept { return config_; }
        [[nodiscard]] Stats stats() const;

    private:
        struct ReadSource {
            StorageId storage{ kNullStorage };
            ResourceKind kind{ ResourceKind::Framebuffer };
            uint32_t width{ 0 };
            uint32_t height{ 0 };
            std::vector<TrackedAccess> reads{};
        };

        [[nodiscard]] Expected<void> checkAlive(const char* operation) const;
        [[nodiscard]] Expected<ReadSource> resolveReadSource(const ReadRequest& request) const;
        void handleContextLost(const ErrorContext& error);

        ContextConfig config_{};
        CommandQueue queue_{};
        FenceTracker fences_;
        ResourceRegistry registry_;
        StateCache cache_;
        DrawValidator validator_;
        CommandEmitter emitter_;
        DeviceThread deviceThread_;

        mutable std::mutex targetMutex_{};
        RenderTargetInfo defaultTarget_{};

        std::atomic<uint64_t> rejectedDraws_{ 0 };
        std::atomic<uint64_t> frame_{ 0 };
        std::atomic<bool> lost_{ false };
    };

} // namespace drawcore
