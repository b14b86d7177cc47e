#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

#include <drawcore/core/Handle.h>
#include <drawcore/core/Status.h>
#include <drawcore/sync/CompletionSource.h>

namespace drawcore {

    struct ByteRange {
        uint64_t begin{ 0 };
        uint64_t end{ 0 };

        [[nodiscard]] bool empty() const noexcept { return end <= begin; }
        [[nodiscard]] bool overlaps(const ByteRange& other) const noexcept
        {
            return begin < other.end && other.begin < end;
        }

        friend bool operator==(const ByteRange&, const ByteRange&) = default;
    };

    enum class AccessMode : uint8_t {
        Read,
        Write
    };

    enum class FenceStatus : uint8_t {
        Pending,
        Satisfied,
        SatisfiedLost  // forced when the context was lost; the work never completed
    };

    enum class RangeState : uint8_t {
        Unused,
        PendingRead,
        PendingWrite,
        Satisfied
    };

    enum class DrawReadTracking : uint8_t {
        All,        // every draw fences the buffers and textures it reads
        MappedOnly  // only persistent-mapped buffers and readback targets
    };

    [[nodiscard]] const char* fenceStatusToString(FenceStatus status) noexcept;
    [[nodiscard]] const char* rangeStateToString(RangeState state) noexcept;

    // Per-storage record of which byte ranges the queued command stream still reads or
    // writes, and up to which fence. Ranges are split on record, so accesses to disjoint
    // sub-ranges of one persistent buffer never wait on each other.
    class FenceTracker
    {
    public:
        struct RuntimeConfig {
            DrawReadTracking drawReads{ DrawReadTracking::All };
            std::chrono::nanoseconds defaultTimeout{ std::chrono::seconds(5) };
        };

        struct Diagnostics {
            uint64_t fencesRecorded{ 0 };
            uint64_t hostWrites{ 0 };
            uint64_t waits{ 0 };
            uint64_t waitsSkipped{ 0 };
            uint64_t timeouts{ 0 };
            uint64_t waitedNs{ 0 };
            uint64_t forcedByContextLoss{ 0 };
        };

        // Makes sure the command carrying a fence has been handed to the device.
        using FlushHook = std::function<Expected<void>()>;
        // Productive work run before blocking, e.g. collecting deferred releases.
        using IdleWork = std::function<void(uint64_t completedValue)>;

        FenceTracker(ICompletionSource& source);
        FenceTracker(ICompletionSource& source, RuntimeConfig config);

        FenceTracker(const FenceTracker&) = delete;
        FenceTracker& operator=(const FenceTracker&) = delete;

        void setFlushHook(FlushHook hook);
        void setIdleWork(IdleWork work);

        // Called with the fence value of the command that performs the access, under the
        // command queue's push lock.
        void recordAccess(StorageId storage, ByteRange range, AccessMode mode, uint64_t fenceValue);
        // A CPU write through a persistent mapping. It is complete on return, so the range is
        // stamped with the newest retired fence: tracked as written, never pending.
        void recordHostWrite(StorageId storage, ByteRange range);

        [[nodiscard]] Expected<bool> isAvailable(StorageId storage, ByteRange range, AccessMode mode);
        [[nodiscard]] Expected<void> waitUntilAvailable(StorageId storage,
            ByteRange range,
            AccessMode mode,
            std::optional<std::chrono::nanoseconds> timeout = std::nullopt);
        [[nodiscard]] Expected<void> waitForFence(uint64_t fenceValue,
            std::optional<std::chrono::nanoseconds> timeout = std::nullopt);

        [[nodiscard]] RangeState rangeState(StorageId storage, ByteRange range);
        [[nodiscard]] FenceStatus fenceStatus(uint64_t fenceValue);
        // Fence covering every recorded access to the storage; 0 if none.
        [[nodiscard]] uint64_t latestFence(StorageId storage) const;
        [[nodiscard]] std::size_t trackedRangeCount(StorageId storage) const;

        // Polls the completion source. Never decreases.
        [[nodiscard]] uint64_t completedValue();
        void forget(StorageId storage);

        void markContextLost();
        [[nodiscard]] bool contextLost() const;

        [[nodiscard]] const RuntimeConfig& config() const noexcept { return config_; }
        [[nodiscard]] Diagnostics diagnostics() const;

    private:
        struct TrackedRange {
            ByteRange range{};
            uint64_t writeFence{ 0 };
            uint64_t accessFence{ 0 };
        };

        void recordLocked(StorageId storage, ByteRange range, AccessMode mode, uint64_t fenceValue);
        [[nodiscard]] uint64_t requiredFenceLocked(StorageId storage, ByteRange range, AccessMode mode) const;
        [[nodiscard]] bool satisfiedLocked(uint64_t fenceValue) const noexcept;
        void compactLocked(std::vector<TrackedRange>& ranges) const;
        void pollLocked();
        [[nodiscard]] ErrorContext lostError(const char* operation) const;

        ICompletionSource& source_;
        RuntimeConfig config_{};

        mutable std::mutex mutex_{};
        std::unordered_map<StorageId, std::vector<TrackedRange>> ranges_{};
        uint64_t completed_{ 0 };
        uint64_t highestRecorded_{ 0 };
        bool lost_{ false };
        Diagnostics diagnostics_{};

        std::mutex hookMutex_{};
        FlushHook flushHook_{};
        IdleWork idleWork_{};
    };

} // namespace drawcore
