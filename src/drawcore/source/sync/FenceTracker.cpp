#include <algorithm>
#include <string>
#include <utility>

#include <drawcore/sync/FenceTracker.h>

namespace drawcore {

    const char* fenceStatusToString(FenceStatus status) noexcept
    {
        switch (status) {
        case FenceStatus::Pending: return "pending";
        case FenceStatus::Satisfied: return "satisfied";
        case FenceStatus::SatisfiedLost: return "satisfied_lost";
        default: return "unknown";
        }
    }

    const char* rangeStateToString(RangeState state) noexcept
    {
        switch (state) {
        case RangeState::Unused: return "unused";
        case RangeState::PendingRead: return "pending_read";
        case RangeState::PendingWrite: return "pending_write";
        case RangeState::Satisfied: return "satisfied";
        default: return "unknown";
        }
    }

    FenceTracker::FenceTracker(ICompletionSource& source)
        : FenceTracker(source, RuntimeConfig{})
    {
    }

    FenceTracker::FenceTracker(ICompletionSource& source, RuntimeConfig config)
        : source_(source)
        , config_(config)
    {
    }

    void FenceTracker::setFlushHook(FlushHook hook)
    {
        std::lock_guard<std::mutex> lock(hookMutex_);
        flushHook_ = std::move(hook);
    }

    void FenceTracker::setIdleWork(IdleWork work)
    {
        std::lock_guard<std::mutex> lock(hookMutex_);
        idleWork_ = std::move(work);
    }

    void FenceTracker::recordAccess(StorageId storage, ByteRange range, AccessMode mode, uint64_t fenceValue)
    {
        if (storage == kNullStorage || range.empty() || fenceValue == 0) {
            return;
        }

        std::lock_guard<std::mutex> lock(mutex_);
        recordLocked(storage, range, mode, fenceValue);
        ++diagnostics_.fencesRecorded;
    }

    void FenceTracker::recordHostWrite(StorageId storage, ByteRange range)
    {
        if (storage == kNullStorage || range.empty()) {
            return;
        }

        std::lock_guard<std::mutex> lock(mutex_);
        pollLocked();
        ++diagnostics_.hostWrites;
        // With no fence retired yet, no device access was ever recorded against this range.
        if (completed_ == 0) {
            return;
        }
        recordLocked(storage, range, AccessMode::Write, completed_);
    }

    void FenceTracker::recordLocked(StorageId storage, ByteRange range, AccessMode mode, uint64_t fenceValue)
    {
        std::vector<TrackedRange>& list = ranges_[storage];

        const uint64_t freshWrite = mode == AccessMode::Write ? fenceValue : 0;
        std::vector<TrackedRange> out{};
        out.reserve(list.size() + 3);

        uint64_t cursor = range.begin;
        const auto flushGap = [&](uint64_t upTo) {
            if (cursor < upTo) {
                out.push_back(TrackedRange{ .range = { cursor, upTo }, .writeFence = freshWrite, .accessFence = fenceValue });
                cursor = upTo;
            }
        };

        for (const TrackedRange& entry : list) {
            if (!entry.range.overlaps(range)) {
                if (entry.range.begin >= range.end) {
                    flushGap(range.end);
                }
                out.push_back(entry);
                continue;
            }

            if (entry.range.begin < range.begin) {
                out.push_back(TrackedRange{ .range = { entry.range.begin, range.begin }, .writeFence = entry.writeFence, .accessFence = entry.accessFence });
            }

            const ByteRange mid{ std::max(entry.range.begin, range.begin), std::min(entry.range.end, range.end) };
            flushGap(mid.begin);
            out.push_back(TrackedRange{
                .range = mid,
                .writeFence = mode == AccessMode::Write ? fenceValue : entry.writeFence,
                .accessFence = std::max(entry.accessFence, fenceValue) });
            cursor = mid.end;

            if (entry.range.end > range.end) {
                out.push_back(TrackedRange{ .range = { range.end, entry.range.end }, .writeFence = entry.writeFence, .accessFence = entry.accessFence });
            }
        }
        flushGap(range.end);

        compactLocked(out);
        list = std::move(out);
        highestRecorded_ = std::max(highestRecorded_, fenceValue);
    }

    void FenceTracker::compactLocked(std::vector<TrackedRange>& ranges) const
    {
        if (ranges.size() < 2) {
            return;
        }
        std::vector<TrackedRange> merged{};
        merged.reserve(ranges.size());
        for (const TrackedRange& entry : ranges) {
            if (!merged.empty()) {
                TrackedRange& last = merged.back();
                const bool contiguous = last.range.end == entry.range.begin;
                const bool sameFences = last.writeFence == entry.writeFence && last.accessFence == entry.accessFence;
                const bool bothRetired = satisfiedLocked(last.accessFence) && satisfiedLocked(entry.accessFence);
                if (contiguous && (sameFences || bothRetired)) {
                    last.range.end = entry.range.end;
                    last.writeFence = std::max(last.writeFence, entry.writeFence);
                    last.accessFence = std::max(last.accessFence, entry.accessFence);
                    continue;
                }
            }
            merged.push_back(entry);
        }
        ranges = std::move(merged);
    }

    bool FenceTracker::satisfiedLocked(uint64_t fenceValue) const noexcept
    {
        return fenceValue == 0 || fenceValue <= completed_ || lost_;
    }

    void FenceTracker::pollLocked()
    {
        if (lost_) {
            return;
        }
        const Expected<uint64_t> completed = source_.completedValue();
        if (!completed.hasValue()) {
            if (completed.error() == ErrorCode::ContextLost) {
                lost_ = true;
            }
            return;
        }
        completed_ = std::max(completed_, completed.value());
    }

    uint64_t FenceTracker::requiredFenceLocked(StorageId storage, ByteRange range, AccessMode mode) const
    {
        const auto it = ranges_.find(storage);
        if (it == ranges_.end()) {
            return 0;
        }
        uint64_t required = 0;
        for (const TrackedRange& entry : it->second) {
            if (!entry.range.overlaps(range)) {
                continue;
            }
            // Reads only conflict with writes; writes conflict with any access.
            required = std::max(required, mode == AccessMode::Read ? entry.writeFence : entry.accessFence);
        }
        return required;
    }

    ErrorContext FenceTracker::lostError(const char* operation) const
    {
        return makeError(operation, ErrorCode::ContextLost, "fence_tracker", "context_lost");
    }

    Expected<bool> FenceTracker::isAvailable(StorageId storage, ByteRange range, AccessMode mode)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pollLocked();
        if (lost_) {
            return lostError("FenceTracker::isAvailable");
        }
        return satisfiedLocked(requiredFenceLocked(storage, range, mode));
    }

    Expected<void> FenceTracker::waitUntilAvailable(StorageId storage,
        ByteRange range,
        AccessMode mode,
        std::optional<std::chrono::nanoseconds> timeout)
    {
        uint64_t required = 0;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            pollLocked();
            if (lost_) {
                return lostError("FenceTracker::waitUntilAvailable");
            }
            required = requiredFenceLocked(storage, range, mode);
            if (satisfiedLocked(required)) {
                ++diagnostics_.waitsSkipped;
                return {};
            }
        }
        return waitForFence(required, timeout);
    }

    Expected<void> FenceTracker::waitForFence(uint64_t fenceValue, std::optional<std::chrono::nanoseconds> timeout)
    {
        const std::chrono::nanoseconds budget = timeout.value_or(config_.defaultTimeout);

        const auto poll = [&]() -> std::optional<Expected<void>> {
            std::lock_guard<std::mutex> lock(mutex_);
            pollLocked();
            if (lost_) {
                return Expected<void>{ lostError("FenceTracker::waitForFence") };
            }
            if (satisfiedLocked(fenceValue)) {
                return Expected<void>{};
            }
            return std::nullopt;
        };

        if (auto done = poll(); done.has_value()) {
            return *done;
        }

        FlushHook flush;
        IdleWork idle;
        {
            std::lock_guard<std::mutex> lock(hookMutex_);
            flush = flushHook_;
            idle = idleWork_;
        }

        // The signal may still sit in the queue; hand it to the device before waiting on it.
        if (flush) {
            DRAWCORE_RETURN_IF_FAILED(flush());
            if (auto done = poll(); done.has_value()) {
                return *done;
            }
        }

        if (idle) {
            idle(completedValue());
            if (auto done = poll(); done.has_value()) {
                return *done;
            }
        }

        const auto start = std::chrono::steady_clock::now();
        const Expected<bool> waited = source_.wait(fenceValue, budget);
        const auto elapsed = std::chrono::duration_cast<std::chrono::nanoseconds>(std::chrono::steady_clock::now() - start);

        std::lock_guard<std::mutex> lock(mutex_);
        ++diagnostics_.waits;
        diagnostics_.waitedNs += static_cast<uint64_t>(elapsed.count());

        if (!waited.hasValue()) {
            if (waited.error() == ErrorCode::ContextLost) {
                lost_ = true;
            }
            return waited.context();
        }
        if (lost_) {
            return lostError("FenceTracker::waitForFence");
        }
        if (!waited.value()) {
            ++diagnostics_.timeouts;
            return makeError("FenceTracker::waitForFence",
                ErrorCode::SynchronizationTimeout,
                "fence_tracker",
                "fence_wait_timeout",
                "fence " + std::to_string(fenceValue) + " not retired within " + std::to_string(budget.count()) + "ns",
                fenceValue);
        }
        completed_ = std::max(completed_, fenceValue);
        return {};
    }

    RangeState FenceTracker::rangeState(StorageId storage, ByteRange range)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pollLocked();
        const auto it = ranges_.find(storage);
        if (it == ranges_.end()) {
            return RangeState::Unused;
        }

        bool touched = false;
        bool pendingRead = false;
        for (const TrackedRange& entry : it->second) {
            if (!entry.range.overlaps(range)) {
                continue;
            }
            touched = true;
            if (!satisfiedLocked(entry.writeFence)) {
                return RangeState::PendingWrite;
            }
            if (!satisfiedLocked(entry.accessFence)) {
                pendingRead = true;
            }
        }
        if (pendingRead) {
            return RangeState::PendingRead;
        }
        return touched ? RangeState::Satisfied : RangeState::Unused;
    }

    FenceStatus FenceTracker::fenceStatus(uint64_t fenceValue)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pollLocked();
        if (fenceValue == 0 || fenceValue <= completed_) {
            return FenceStatus::Satisfied;
        }
        return lost_ ? FenceStatus::SatisfiedLost : FenceStatus::Pending;
    }

    uint64_t FenceTracker::latestFence(StorageId storage) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = ranges_.find(storage);
        if (it == ranges_.end()) {
            return 0;
        }
        uint64_t latest = 0;
        for (const TrackedRange& entry : it->second) {
            latest = std::max(latest, entry.accessFence);
        }
        return latest;
    }

    std::size_t FenceTracker::trackedRangeCount(StorageId storage) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = ranges_.find(storage);
        return it == ranges_.end() ? 0 : it->second.size();
    }

    uint64_t FenceTracker::completedValue()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pollLocked();
        return completed_;
    }

    void FenceTracker::forget(StorageId storage)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ranges_.erase(storage);
    }

    void FenceTracker::markContextLost()
    {
        uint64_t forced = 0;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (lost_) {
                return;
            }
            lost_ = true;
            forced = highestRecorded_ > completed_ ? highestRecorded_ - completed_ : 0;
            diagnostics_.forcedByContextLoss += forced;
        }
        reportInfo("fence_tracker", "FenceTracker::markContextLost",
            "context lost; " + std::to_string(forced) + " pending fence(s) force-satisfied");
    }

    bool FenceTracker::contextLost() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return lost_;
    }

    FenceTracker::Diagnostics FenceTracker::diagnostics() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return diagnostics_;
    }

} // namespace drawcore
