#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <vector>

#include <drawcore/command/Command.h>
#include <drawcore/core/Status.h>

namespace drawcore {

    // Single ordered stream from any number of producers to one device consumer.
    // Fence values are allocated here, under the push lock, so SignalFence commands
    // always appear in the stream in increasing value order.
    class CommandQueue
    {
    public:
        struct Submission {
            uint64_t firstSequence{ 0 };
            uint64_t lastSequence{ 0 };
            uint64_t fenceValue{ 0 };  // 0 when no fence was requested
        };

        // Runs under the push lock, after the batch and its fence are appended. Callbacks
        // therefore run in fence order and finish before a consumer can drain the batch.
        // A callback must not call back into this queue: the push lock is not recursive.
        using FenceCallback = std::function<void(uint64_t fenceValue)>;
        using Consumer = std::function<void(Command&)>;

        CommandQueue() = default;

        CommandQueue(const CommandQueue&) = delete;
        CommandQueue& operator=(const CommandQueue&) = delete;

        [[nodiscard]] Expected<uint64_t> push(CommandPayload&& payload, uint32_t producerId = 0);

        // The batch lands contiguously; commands of other producers never interleave with it.
        [[nodiscard]] Expected<Submission> submit(std::vector<CommandPayload>&& batch,
            uint32_t producerId = 0,
            bool signalFence = false,
            const FenceCallback& onFence = {});

        [[nodiscard]] Expected<uint64_t> insertFence(uint32_t producerId = 0, const FenceCallback& onFence = {});

        // Hands every queued command to `consumer` in FIFO order. Callers serialize draining.
        std::size_t drainTo(const Consumer& consumer);

        [[nodiscard]] bool waitForCommands(std::chrono::nanoseconds timeout);
        void close();

        [[nodiscard]] bool closed() const;
        [[nodiscard]] bool empty() const;
        [[nodiscard]] std::size_t size() const;
        [[nodiscard]] uint64_t pushedCount() const;
        [[nodiscard]] uint64_t lastFenceValue() const;

    private:
        [[nodiscard]] ErrorContext closedError(const char* operation) const;

        mutable std::mutex mutex_{};
        std::condition_variable available_{};
        std::deque<Command> commands_{};
        uint64_t nextSequence_{ 1 };
        uint64_t lastFence_{ 0 };
        bool closed_{ false };
    };

} // namespace drawcore
