#include <cassert>
#include <vector>

#include <drawcore/resources/DeletionQueue.h>

using namespace drawcore;

namespace {

    ErrorContext busy()
    {
        return makeError("release", ErrorCode::InvalidArgument, "test", "storage_busy");
    }

} // namespace

int main()
{
    // Tasks run once their fence retires, oldest fence first.
    {
        DeletionQueue queue{};
        std::vector<int> order{};
        queue.enqueue(2, [&]() -> Expected<void> { order.push_back(2); return {}; });
        queue.enqueue(1, [&]() -> Expected<void> { order.push_back(1); return {}; });
        queue.enqueue(3, [&]() -> Expected<void> { order.push_back(3); return {}; });
        assert(queue.size() == 3);

        assert(queue.collect(0).hasValue());
        assert(order.empty());

        assert(queue.collect(2).hasValue());
        assert((order == std::vector<int>{ 1, 2 }));
        assert(queue.size() == 1);
        assert(queue.lastCollectStats().successCount == 2);

        assert(queue.flush().hasValue());
        assert(queue.empty());
    }

    // LIFO reverses the order within one fence.
    {
        DeletionQueue queue{ DeletionQueue::DrainOrder::LIFO };
        std::vector<int> order{};
        queue.enqueue(1, [&]() -> Expected<void> { order.push_back(1); return {}; });
        queue.enqueue(1, [&]() -> Expected<void> { order.push_back(2); return {}; });
        assert(queue.collect(1).hasValue());
        assert((order == std::vector<int>{ 2, 1 }));
    }

    // A failing task is kept and retried after a backoff.
    {
        DeletionQueue queue{};
        queue.setRetryPolicy(DeletionQueue::RetryPolicy{ .maxRetries = 4, .baseRetryBackoffPasses = 1 });
        int calls = 0;
        queue.enqueue(1, [&]() -> Expected<void> {
            ++calls;
            if (calls == 1) {
                return busy();
            }
            return {};
        });

        auto first = queue.collect(1);
        assert(!first.hasValue());
        assert(calls == 1);
        assert(queue.size() == 1);
        assert(queue.lastCollectStats().retainedFailedCount == 1);

        // Backing off: the next pass skips it.
        assert(queue.collect(1).hasValue());
        assert(calls == 1);

        assert(queue.collect(1).hasValue());
        assert(calls == 2);
        assert(queue.empty());
    }

    // Past the retry limit the task is dropped and escalated.
    {
        DeletionQueue queue{};
        queue.setRetryPolicy(DeletionQueue::RetryPolicy{ .maxRetries = 0, .baseRetryBackoffPasses = 1 });
        std::vector<DeletionQueue::FailureEscalationEvent> escalations{};
        queue.setFailureEscalationHook([&](const DeletionQueue::FailureEscalationEvent& event) { escalations.push_back(event); });
        queue.enqueue(4, []() -> Expected<void> { return busy(); });

        assert(!queue.collect(4).hasValue());
        assert(queue.empty());
        assert(escalations.size() == 1);
        assert(escalations[0].fenceValue == 4);
        assert(escalations[0].lastError == ErrorCode::InvalidArgument);
    }

    // Discarding drops failures without retrying.
    {
        DeletionQueue queue{};
        queue.setFailurePolicy(DeletionQueue::FailurePolicy::DiscardFailedTasks);
        queue.enqueue(1, []() -> Expected<void> { return busy(); });
        assert(!queue.collect(1).hasValue());
        assert(queue.empty());
        assert(queue.lastCollectStats().droppedFailedCount == 1);
    }

    // Work enqueued by a running task waits for the next collect.
    {
        DeletionQueue queue{};
        bool followUpRan = false;
        queue.enqueue(1, [&]() -> Expected<void> {
            queue.enqueue(1, [&]() -> Expected<void> { followUpRan = true; return {}; });
            return {};
        });
        assert(queue.collect(1).hasValue());
        assert(!followUpRan);
        assert(queue.size() == 1);
        assert(queue.collect(1).hasValue());
        assert(followUpRan);
    }

    return 0;
}
