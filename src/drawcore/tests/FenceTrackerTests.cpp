#include <atomic>
#include <cassert>
#include <chrono>
#include <thread>

#include <drawcore/sync/FenceTracker.h>

#include "TestRig.h"

using namespace drawcore;
using namespace drawcore::test;

int main()
{
    constexpr StorageId kBuffer = 7;

    // Disjoint sub-ranges of one 1024-byte buffer are tracked behind different fences.
    {
        ManualCompletion completion{};
        FenceTracker tracker{ completion };

        tracker.recordAccess(kBuffer, ByteRange{ 0, 512 }, AccessMode::Write, 1);
        tracker.recordAccess(kBuffer, ByteRange{ 512, 1024 }, AccessMode::Read, 2);
        assert(tracker.trackedRangeCount(kBuffer) == 2);
        assert(tracker.latestFence(kBuffer) == 2);

        assert(tracker.rangeState(kBuffer, ByteRange{ 0, 512 }) == RangeState::PendingWrite);
        assert(tracker.rangeState(kBuffer, ByteRange{ 512, 1024 }) == RangeState::PendingRead);
        assert(tracker.rangeState(kBuffer, ByteRange{ 0, 1024 }) == RangeState::PendingWrite);

        // Reading a range that is only being read needs no wait; writing it does.
        assert(!tracker.isAvailable(kBuffer, ByteRange{ 0, 512 }, AccessMode::Read).value());
        assert(tracker.isAvailable(kBuffer, ByteRange{ 512, 1024 }, AccessMode::Read).value());
        assert(!tracker.isAvailable(kBuffer, ByteRange{ 512, 1024 }, AccessMode::Write).value());

        completion.retire(1);
        assert(tracker.rangeState(kBuffer, ByteRange{ 0, 512 }) == RangeState::Satisfied);
        assert(tracker.isAvailable(kBuffer, ByteRange{ 0, 512 }, AccessMode::Write).value());
        assert(!tracker.isAvailable(kBuffer, ByteRange{ 512, 1024 }, AccessMode::Write).value());
        assert(tracker.fenceStatus(1) == FenceStatus::Satisfied);
        assert(tracker.fenceStatus(2) == FenceStatus::Pending);

        completion.retire(2);
        assert(tracker.rangeState(kBuffer, ByteRange{ 0, 1024 }) == RangeState::Satisfied);
        assert(tracker.completedValue() == 2);

        tracker.forget(kBuffer);
        assert(tracker.trackedRangeCount(kBuffer) == 0);
        assert(tracker.rangeState(kBuffer, ByteRange{ 0, 1024 }) == RangeState::Unused);
    }

    // Overlapping records split the existing ranges.
    {
        ManualCompletion completion{};
        FenceTracker tracker{ completion };

        tracker.recordAccess(kBuffer, ByteRange{ 0, 1024 }, AccessMode::Read, 1);
        tracker.recordAccess(kBuffer, ByteRange{ 256, 512 }, AccessMode::Write, 2);
        assert(tracker.trackedRangeCount(kBuffer) == 3);

        completion.retire(1);
        assert(tracker.isAvailable(kBuffer, ByteRange{ 0, 256 }, AccessMode::Write).value());
        assert(tracker.isAvailable(kBuffer, ByteRange{ 512, 1024 }, AccessMode::Write).value());
        assert(!tracker.isAvailable(kBuffer, ByteRange{ 300, 301 }, AccessMode::Read).value());
    }

    // Waits flush first, then time out with a retryable error.
    {
        ManualCompletion completion{};
        FenceTracker tracker{ completion, FenceTracker::RuntimeConfig{ .drawReads = DrawReadTracking::All, .defaultTimeout = std::chrono::milliseconds(10) } };

        std::atomic<int> flushes{ 0 };
        tracker.setFlushHook([&]() -> Expected<void> {
            flushes.fetch_add(1);
            return {};
        });

        tracker.recordAccess(kBuffer, ByteRange{ 0, 64 }, AccessMode::Write, 3);
        auto waited = tracker.waitUntilAvailable(kBuffer, ByteRange{ 0, 64 }, AccessMode::Read);
        assert(!waited.hasValue());
        assert(waited.error() == ErrorCode::SynchronizationTimeout);
        assert(waited.context().retryable);
        assert(flushes.load() == 1);
        assert(tracker.diagnostics().timeouts == 1);

        // A wait that is already satisfied skips the flush.
        auto free = tracker.waitUntilAvailable(kBuffer, ByteRange{ 64, 128 }, AccessMode::Write);
        assert(free.hasValue());
        assert(flushes.load() == 1);
        assert(tracker.diagnostics().waitsSkipped == 1);
    }

    // A waiter wakes when another thread retires the fence.
    {
        ManualCompletion completion{};
        FenceTracker tracker{ completion };
        tracker.recordAccess(kBuffer, ByteRange{ 0, 16 }, AccessMode::Write, 5);

        std::thread retirer([&]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            completion.retire(5);
        });
        auto waited = tracker.waitForFence(5, std::chrono::seconds(2));
        retirer.join();
        assert(waited.hasValue());
        assert(tracker.fenceStatus(5) == FenceStatus::Satisfied);
    }

    // Context loss force-satisfies everything and turns waits into errors.
    {
        ManualCompletion completion{};
        FenceTracker tracker{ completion };
        tracker.recordAccess(kBuffer, ByteRange{ 0, 16 }, AccessMode::Write, 9);

        tracker.markContextLost();
        assert(tracker.contextLost());
        assert(tracker.fenceStatus(9) == FenceStatus::SatisfiedLost);
        assert(tracker.diagnostics().forcedByContextLoss == 9);

        auto waited = tracker.waitForFence(9);
        assert(!waited.hasValue());
        assert(waited.error() == ErrorCode::ContextLost);

        auto available = tracker.isAvailable(kBuffer, ByteRange{ 0, 16 }, AccessMode::Write);
        assert(!available.hasValue());
        assert(available.error() == ErrorCode::ContextLost);
    }

    return 0;
}
