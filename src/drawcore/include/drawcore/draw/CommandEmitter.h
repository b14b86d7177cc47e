#pragma once

#include <cstdint>
#include <mutex>
#include <vector>

#include <drawcore/command/CommandQueue.h>
#include <drawcore/core/Status.h>
#include <drawcore/draw/DrawRequest.h>
#include <drawcore/draw/TextureUnitAllocator.h>
#include <drawcore/state/StateCache.h>
#include <drawcore/state/StateDiff.h>
#include <drawcore/sync/FenceTracker.h>

namespace drawcore {

    // Turns a validated draw into the state changes it needs plus the draw itself, queues
    // them as one contiguous batch and only then commits the new state to the cache.
    // Emission is serialized so two producers never diff against the same stale snapshot.
    class CommandEmitter
    {
    public:
        struct Stats {
            uint64_t draws{ 0 };
            uint64_t clears{ 0 };
            uint64_t stateCommands{ 0 };
            uint64_t redundantSkipped{ 0 };
            uint64_t uniformCommands{ 0 };
            uint64_t fencedBatches{ 0 };
        };

        struct Emission {
            CommandQueue::Submission submission{};
            uint32_t stateCommands{ 0 };
            uint32_t skipped{ 0 };
        };

        CommandEmitter(CommandQueue& queue, FenceTracker& fences, StateCache& cache, uint32_t textureUnits);

        CommandEmitter(const CommandEmitter&) = delete;
        CommandEmitter& operator=(const CommandEmitter&) = delete;

        [[nodiscard]] Expected<Emission> emit(const ValidatedDraw& draw, uint32_t producerId = 0);

        // `writes` are the attachment storages of the cleared framebuffer.
        [[nodiscard]] Expected<Emission> emitClear(const ClearRequest& request,
            StorageId framebuffer,
            const std::vector<TrackedAccess>& writes,
            uint32_t producerId = 0);

        [[nodiscard]] Stats stats() const;
        [[nodiscard]] TextureUnitAllocator::Stats textureUnitStats() const;

    private:
        [[nodiscard]] Expected<Emission> submitLocked(std::vector<CommandPayload>&& batch,
            const StateDelta& delta,
            const StateCache::Snapshot& base,
            const std::vector<TrackedAccess>& accesses,
            uint32_t producerId,
            DiffCounts counts);

        CommandQueue& queue_;
        FenceTracker& fences_;
        StateCache& cache_;

        mutable std::mutex emitMutex_{};
        TextureUnitAllocator units_;
        Stats stats_{};
    };

} // namespace drawcore
