#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <vector>

#include <drawcore/core/Status.h>

namespace drawcore {

    // Release tasks keyed by the fence value that must retire before they may run.
    class DeletionQueue
    {
    public:
        using DeleteTask = std::function<Expected<void>()>;

        enum class DrainOrder : uint8_t { FIFO, LIFO };
        enum class FailurePolicy : uint8_t {
            KeepFailedTasks,
            DiscardFailedTasks
        };

        struct RetryPolicy {
            uint32_t maxRetries{ 8 };
            uint64_t baseRetryBackoffPasses{ 1 };
        };

        struct CollectStats {
            uint32_t executedCount{ 0 };
            uint32_t successCount{ 0 };
            uint32_t failureCount{ 0 };
            uint32_t retainedFailedCount{ 0 };
            uint32_t droppedFailedCount{ 0 };
        };

        struct FailureEscalationEvent {
            uint64_t fenceValue{ 0 };
            uint32_t retryCount{ 0 };
            ErrorCode lastError{ ErrorCode::Success };
        };

        using FailureEscalationHook = std::function<void(const FailureEscalationEvent&)>;

        DeletionQueue() = default;
        explicit DeletionQueue(DrainOrder order);

        [[nodiscard]] bool empty() const;
        [[nodiscard]] std::size_t size() const;
        void clear();

        void enqueue(uint64_t fenceValue, DeleteTask&& fn);

        // Runs every task whose fence is <= completedValue. Returns the first failure, if any.
        [[nodiscard]] Expected<void> collect(uint64_t completedValue);
        // Runs every task regardless of fences; for teardown once the device is idle or gone.
        [[nodiscard]] Expected<void> flush();

        void setDrainOrder(DrainOrder order);
        void setFailurePolicy(FailurePolicy policy);
        void setRetryPolicy(const RetryPolicy& policy);
        void setFailureEscalationHook(FailureEscalationHook hook);

        [[nodiscard]] CollectStats lastCollectStats() const;

    private:
        struct Item {
            uint64_t fenceValue{ 0 };
            DeleteTask fn{};
            uint32_t retryCount{ 0 };
            uint64_t nextRetryPass{ 0 };
        };

        void drainIngressLocked();
        [[nodiscard]] bool retainFailedLocked(Item& item, ErrorCode code, FailureEscalationEvent& escalation) const;

        mutable std::mutex mutex_{};
        std::map<uint64_t, std::deque<Item>> readyByFence_{};
        std::size_t totalItems_{ 0 };
        uint64_t pass_{ 0 };

        mutable std::mutex ingressMutex_{};
        std::vector<Item> ingressItems_{};

        DrainOrder drainOrder_{ DrainOrder::FIFO };
        FailurePolicy failurePolicy_{ FailurePolicy::KeepFailedTasks };
        RetryPolicy retryPolicy_{};
        FailureEscalationHook escalationHook_{};
        CollectStats lastCollectStats_{};
    };

} // namespace drawcore
