#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <span>
#include <vector>

#include <drawcore/command/CommandQueue.h>
#include <drawcore/core/Handle.h>
#include <drawcore/core/Status.h>
#include <drawcore/device/ContextConfig.h>
#include <drawcore/device/DeviceCapabilities.h>
#include <drawcore/resources/DeletionQueue.h>
#include <drawcore/resources/ResourceDescriptor.h>
#include <drawcore/sync/FenceTracker.h>

namespace drawcore {

    // Owns every GPU-side object behind a generation-checked handle. Descriptors are checked
    // against the capability set before any device command is queued. Storage is released only
    // once the fence covering its last use has retired, and rewrites may swap in fresh storage
    // without the handle changing.
    class ResourceRegistry
    {
    public:
        struct Stats {
            uint64_t created{ 0 };
            uint64_t destroyed{ 0 };
            uint64_t storageReleased{ 0 };
            uint64_t reallocations{ 0 };
            uint64_t inPlaceWrites{ 0 };
            uint64_t mappedWrites{ 0 };
        };

        using ReleaseObserver = std::function<void(StorageId storage, ResourceKind kind)>;

        ResourceRegistry(const DeviceCapabilities& capabilities,
            CommandQueue& queue,
            FenceTracker& fences,
            RewritePolicy rewritePolicy = RewritePolicy::UsageHint,
            DeletionQueue::RetryPolicy releaseRetry = {});

        ResourceRegistry(const ResourceRegistry&) = delete;
        ResourceRegistry& operator=(const ResourceRegistry&) = delete;

        [[nodiscard]] Expected<Handle> createBuffer(const BufferDesc& desc, std::span<const std::byte> initialData = {});
        [[nodiscard]] Expected<Handle> createTexture(const TextureDesc& desc);
        [[nodiscard]] Expected<Handle> createProgram(const ProgramDesc& desc);
        [[nodiscard]] Expected<Handle> createFramebuffer(const FramebufferDesc& desc);

        // The handle dies now; its storage is released once every queued use has retired.
        [[nodiscard]] Expected<void> destroy(Handle handle);

        [[nodiscard]] Expected<void> writeBuffer(Handle handle,
            uint64_t offset,
            std::span<const std::byte> data,
            std::optional<std::chrono::nanoseconds> timeout = std::nullopt);
        [[nodiscard]] Expected<void> resizeBuffer(Handle handle, uint64_t newSize);
        // Drops the current contents without waiting for the GPU to finish with them.
        [[nodiscard]] Expected<void> invalidateBuffer(Handle handle);
        [[nodiscard]] Expected<std::vector<std::byte>> readBuffer(Handle handle,
            ByteRange range,
            std::optional<std::chrono::nanoseconds> timeout = std::nullopt);
        [[nodiscard]] Expected<void> uploadTexture(Handle handle,
            TextureUpload upload,
            std::optional<std::chrono::nanoseconds> timeout = std::nullopt);

        [[nodiscard]] Expected<ResourceDescriptor> describe(Handle handle) const;
        [[nodiscard]] Expected<StorageId> storageOf(Handle handle) const;
        [[nodiscard]] bool isLive(Handle handle) const;

        [[nodiscard]] std::size_t liveCount() const;
        [[nodiscard]] std::size_t pendingReleaseCount() const;

        // Releases everything whose fence is <= completedValue.
        [[nodiscard]] Expected<void> collect(uint64_t completedValue);

        // Held while a draw is validated and emitted. Deferred releases queue their
        // ReleaseStorage command only while no pin is held, so a storage id resolved
        // under the pin is still alive when the commands using it are queued.
        [[nodiscard]] std::shared_lock<std::shared_mutex> pinStorage() const;

        void setReleaseObserver(ReleaseObserver observer);
        void markContextLost();

        [[nodiscard]] const DeviceCapabilities& capabilities() const noexcept { return caps_; }
        [[nodiscard]] Stats stats() const;

    private:
        struct Slot {
            uint32_t generation{ 1 };
            bool live{ false };
            ResourceDescriptor record{};
            std::shared_ptr<std::vector<std::byte>> mapped{};
        };

        enum class RewritePath : uint8_t { Mapped, Wait, Reallocate };

        [[nodiscard]] Expected<void> checkAlive(const char* operation) const;
        [[nodiscard]] Expected<Slot*> resolveLocked(Handle handle, ResourceKind kind, const char* operation);
        [[nodiscard]] Expected<const Slot*> resolveLocked(Handle handle, ResourceKind kind, const char* operation) const;
        [[nodiscard]] Handle allocateSlotLocked(ResourceKind kind, ResourceDescriptor record);
        [[nodiscard]] Expected<Handle> finishCreateLocked(ResourceKind kind, ResourceDescriptor record, CreateStorageCmd create);
        [[nodiscard]] RewritePath rewritePathFor(BufferUsage usage) const noexcept;

        // Queues release of `storage` behind `fenceValue`. Caller holds mutex_.
        void retireStorageLocked(StorageId storage, ResourceKind kind, uint64_t fenceValue);

        [[nodiscard]] Expected<void> writeMapped(Handle handle, StorageId storage, uint64_t offset, std::span<const std::byte> data);
        [[nodiscard]] Expected<void> writeInPlace(Handle handle, StorageId storage, uint64_t offset, std::span<const std::byte> data);
        [[nodiscard]] Expected<void> writeReallocated(Handle handle, StorageId storage, uint64_t offset, std::span<const std::byte> data);

        DeviceCapabilities caps_{};
        CommandQueue& queue_;
        FenceTracker& fences_;
        RewritePolicy rewritePolicy_{ RewritePolicy::UsageHint };

        mutable std::mutex mutex_{};
        std::vector<Slot> slots_{};
        std::vector<uint32_t> freeList_{};
        std::size_t liveCount_{ 0 };
        StorageId nextStorage_{ 1 };
        Stats stats_{};
        ReleaseObserver releaseObserver_{};
        std::atomic<bool> lost_{ false };
        mutable std::shared_mutex releaseMutex_{};

        DeletionQueue releases_{};
    };

} // namespace drawcore
