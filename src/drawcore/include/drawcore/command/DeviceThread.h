#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>

#include <drawcore/command/Command.h>
#include <drawcore/command/CommandQueue.h>
#include <drawcore/core/Status.h>

namespace drawcore {

    // The driver side of the command stream. Executes one command at a time, in order.
    class IDeviceBackend
    {
    public:
        virtual ~IDeviceBackend() = default;

        [[nodiscard]] virtual Expected<void> execute(const Command& command) = 0;
    };

    // Sole consumer of a CommandQueue. Dedicated mode owns a thread; Inline mode drains
    // on whichever thread calls flush().
    class DeviceThread
    {
    public:
        enum class Mode : uint8_t {
            Dedicated,
            Inline
        };

        struct Diagnostics {
            uint64_t executed{ 0 };
            uint64_t failed{ 0 };
            uint64_t droppedAfterLoss{ 0 };
        };

        using ContextLostHandler = std::function<void(const ErrorContext&)>;

        DeviceThread(CommandQueue& queue, IDeviceBackend& backend, Mode mode);
        ~DeviceThread() noexcept;

        DeviceThread(const DeviceThread&) = delete;
        DeviceThread& operator=(const DeviceThread&) = delete;

        void start();
        void stop() noexcept;

        // Returns once everything queued before the call was handed to the backend. Inline
        // mode executes it on the calling thread; Dedicated mode waits for the worker.
        [[nodiscard]] Expected<void> flush();

        void setContextLostHandler(ContextLostHandler handler);

        [[nodiscard]] Mode mode() const noexcept { return mode_; }
        [[nodiscard]] bool contextLost() const noexcept { return lost_.load(std::memory_order_acquire); }
        [[nodiscard]] Diagnostics diagnostics() const;
        [[nodiscard]] uint64_t consumedSequence() const;

    private:
        void workerLoop();
        void drainLocked();
        void consume(Command& command);
        void markConsumed(uint64_t sequence);

        CommandQueue& queue_;
        IDeviceBackend& backend_;
        Mode mode_{ Mode::Dedicated };

        std::mutex consumeMutex_{};
        std::thread worker_{};
        std::atomic<bool> stop_{ false };
        std::atomic<bool> lost_{ false };

        mutable std::mutex progressMutex_{};
        std::condition_variable progress_{};
        uint64_t consumedSequence_{ 0 };

        mutable std::mutex stateMutex_{};
        ContextLostHandler lostHandler_{};
        Diagnostics diagnostics_{};
    };

} // namespace drawcore
