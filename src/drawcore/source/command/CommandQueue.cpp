#include <utility>

#include <drawcore/command/CommandQueue.h>

namespace drawcore {

    ErrorContext CommandQueue::closedError(const char* operation) const
    {
        return makeError(operation, ErrorCode::ContextLost, "command_queue", "queue_closed");
    }

    Expected<uint64_t> CommandQueue::push(CommandPayload&& payload, uint32_t producerId)
    {
        uint64_t sequence = 0;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return closedError("CommandQueue::push");
            }
            sequence = nextSequence_++;
            commands_.push_back(Command{ .sequence = sequence, .producerId = producerId, .payload = std::move(payload) });
        }
        available_.notify_one();
        return sequence;
    }

    Expected<CommandQueue::Submission> CommandQueue::submit(std::vector<CommandPayload>&& batch,
        uint32_t producerId,
        bool signalFence,
        const FenceCallback& onFence)
    {
        Submission submission{};
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return closedError("CommandQueue::submit");
            }
            submission.firstSequence = nextSequence_;
            for (CommandPayload& payload : batch) {
                commands_.push_back(Command{ .sequence = nextSequence_++, .producerId = producerId, .payload = std::move(payload) });
            }
            if (signalFence) {
                submission.fenceValue = ++lastFence_;
                commands_.push_back(Command{
                    .sequence = nextSequence_++,
                    .producerId = producerId,
                    .payload = SignalFenceCmd{ .value = submission.fenceValue } });
                if (onFence) {
                    onFence(submission.fenceValue);
                }
            }
            submission.lastSequence = nextSequence_ - 1;
        }
        available_.notify_one();
        return submission;
    }

    Expected<uint64_t> CommandQueue::insertFence(uint32_t producerId, const FenceCallback& onFence)
    {
        auto submission = submit({}, producerId, true, onFence);
        if (!submission.hasValue()) {
            return submission.context();
        }
        return submission.value().fenceValue;
    }

    std::size_t CommandQueue::drainTo(const Consumer& consumer)
    {
        std::deque<Command> batch{};
        {
            std::lock_guard<std::mutex> lock(mutex_);
            batch.swap(commands_);
        }
        for (Command& cmd : batch) {
            consumer(cmd);
        }
        return batch.size();
    }

    bool CommandQueue::waitForCommands(std::chrono::nanoseconds timeout)
    {
        std::unique_lock<std::mutex> lock(mutex_);
        available_.wait_for(lock, timeout, [this] { return closed_ || !commands_.empty(); });
        return !commands_.empty();
    }

    void CommandQueue::close()
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        available_.notify_all();
    }

    bool CommandQueue::closed() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    bool CommandQueue::empty() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return commands_.empty();
    }

    std::size_t CommandQueue::size() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return commands_.size();
    }

    uint64_t CommandQueue::pushedCount() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return nextSequence_ - 1;
    }

    uint64_t CommandQueue::lastFenceValue() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return lastFence_;
    }

} // namespace drawcore
