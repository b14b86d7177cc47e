#include <limits>
#include <utility>

#include <drawcore/resources/DeletionQueue.h>

namespace drawcore {

    DeletionQueue::DeletionQueue(DrainOrder order)
        : drainOrder_(order)
    {
    }

    bool DeletionQueue::empty() const
    {
        return size() == 0;
    }

    std::size_t DeletionQueue::size() const
    {
        std::size_t pending = 0;
        {
            std::lock_guard<std::mutex> ingressLock(ingressMutex_);
            pending = ingressItems_.size();
        }
        std::lock_guard<std::mutex> lock(mutex_);
        return totalItems_ + pending;
    }

    void DeletionQueue::clear()
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            readyByFence_.clear();
            totalItems_ = 0;
        }
        std::lock_guard<std::mutex> ingressLock(ingressMutex_);
        ingressItems_.clear();
    }

    void DeletionQueue::setDrainOrder(DrainOrder order)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        drainOrder_ = order;
    }

    void DeletionQueue::setFailurePolicy(FailurePolicy policy)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        failurePolicy_ = policy;
    }

    void DeletionQueue::setRetryPolicy(const RetryPolicy& policy)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        retryPolicy_ = policy;
    }

    void DeletionQueue::setFailureEscalationHook(FailureEscalationHook hook)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        escalationHook_ = std::move(hook);
    }

    DeletionQueue::CollectStats DeletionQueue::lastCollectStats() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return lastCollectStats_;
    }

    void DeletionQueue::enqueue(uint64_t fenceValue, DeleteTask&& fn)
    {
        if (!fn) {
            return;
        }
        // Tasks may enqueue follow-up releases while collect() runs them, so new work
        // lands in a separate ingress list.
        std::lock_guard<std::mutex> ingressLock(ingressMutex_);
        ingressItems_.push_back(Item{ .fenceValue = fenceValue, .fn = std::move(fn) });
    }

    void DeletionQueue::drainIngressLocked()
    {
        std::vector<Item> incoming{};
        {
            std::lock_guard<std::mutex> ingressLock(ingressMutex_);
            incoming.swap(ingressItems_);
        }
        for (Item& item : incoming) {
            readyByFence_[item.fenceValue].push_back(std::move(item));
            ++totalItems_;
        }
    }

    bool DeletionQueue::retainFailedLocked(Item& item, ErrorCode code, FailureEscalationEvent& escalation) const
    {
        item.retryCount += 1;
        if (item.retryCount > retryPolicy_.maxRetries) {
            escalation = FailureEscalationEvent{
                .fenceValue = item.fenceValue,
                .retryCount = item.retryCount,
                .lastError = code
            };
            return false;
        }
        const uint32_t shift = item.retryCount > 16 ? 16u : item.retryCount;
        item.nextRetryPass = pass_ + (retryPolicy_.baseRetryBackoffPasses << shift);
        return true;
    }

    Expected<void> DeletionQueue::collect(uint64_t completedValue)
    {
        std::vector<Item> executeItems{};
        std::vector<Item> retryItems{};
        FailurePolicy policy = FailurePolicy::KeepFailedTasks;
        FailureEscalationHook hook;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            drainIngressLocked();
            ++pass_;
            policy = failurePolicy_;
            hook = escalationHook_;

            auto it = readyByFence_.begin();
            while (it != readyByFence_.end() && it->first <= completedValue) {
                std::deque<Item> queue = std::move(it->second);
                it = readyByFence_.erase(it);
                totalItems_ -= queue.size();

                const auto route = [&](Item& item) {
                    if (pass_ >= item.nextRetryPass) {
                        executeItems.push_back(std::move(item));
                    }
                    else {
                        retryItems.push_back(std::move(item));
                    }
                };
                if (drainOrder_ == DrainOrder::LIFO) {
                    for (auto rit = queue.rbegin(); rit != queue.rend(); ++rit) {
                        route(*rit);
                    }
                }
                else {
                    for (Item& item : queue) {
                        route(item);
                    }
                }
            }
        }

        CollectStats stats{};
        Expected<void> firstFailure{};
        std::vector<FailureEscalationEvent> escalations{};

        for (Item& item : executeItems) {
            ++stats.executedCount;
            const Expected<void> status = item.fn();
            if (status.hasValue()) {
                ++stats.successCount;
                continue;
            }

            ++stats.failureCount;
            if (firstFailure.hasValue()) {
                firstFailure = status;
            }

            if (policy == FailurePolicy::DiscardFailedTasks) {
                ++stats.droppedFailedCount;
                continue;
            }

            FailureEscalationEvent escalation{};
            bool retain = false;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                retain = retainFailedLocked(item, status.error(), escalation);
            }
            if (retain) {
                ++stats.retainedFailedCount;
                retryItems.push_back(std::move(item));
            }
            else {
                ++stats.droppedFailedCount;
                escalations.push_back(escalation);
            }
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (Item& item : retryItems) {
                readyByFence_[item.fenceValue].push_back(std::move(item));
                ++totalItems_;
            }
            lastCollectStats_ = stats;
        }

        for (const FailureEscalationEvent& escalation : escalations) {
            if (hook) {
                hook(escalation);
            }
        }

        return firstFailure;
    }

    Expected<void> DeletionQueue::flush()
    {
        return collect(std::numeric_limits<uint64_t>::max());
    }

} // namespace drawcore
