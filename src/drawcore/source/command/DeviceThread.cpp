#include <algorithm>
#include <utility>

#include <drawcore/command/DeviceThread.h>

namespace drawcore {

    namespace {
        constexpr std::chrono::milliseconds kIdleWait{ 5 };
    }

    DeviceThread::DeviceThread(CommandQueue& queue, IDeviceBackend& backend, Mode mode)
        : queue_(queue)
        , backend_(backend)
        , mode_(mode)
    {
    }

    DeviceThread::~DeviceThread() noexcept
    {
        stop();
    }

    void DeviceThread::start()
    {
        if (mode_ != Mode::Dedicated || worker_.joinable()) {
            return;
        }
        stop_.store(false, std::memory_order_release);
        worker_ = std::thread([this]() { workerLoop(); });
    }

    void DeviceThread::stop() noexcept
    {
        stop_.store(true, std::memory_order_release);
        queue_.close();
        if (worker_.joinable()) {
            worker_.join();
        }
        // Whatever was pushed before the close still executes.
        std::lock_guard<std::mutex> lock(consumeMutex_);
        drainLocked();
    }

    Expected<void> DeviceThread::flush()
    {
        if (mode_ == Mode::Inline || !worker_.joinable()) {
            std::lock_guard<std::mutex> lock(consumeMutex_);
            drainLocked();
        }
        else {
            const uint64_t target = queue_.pushedCount();
            std::unique_lock<std::mutex> lock(progressMutex_);
            while (consumedSequence_ < target && !contextLost() && !stop_.load(std::memory_order_acquire)) {
                progress_.wait_for(lock, kIdleWait);
            }
        }
        if (contextLost()) {
            return makeError("DeviceThread::flush", ErrorCode::ContextLost, "device_thread", "context_lost");
        }
        return {};
    }

    void DeviceThread::setContextLostHandler(ContextLostHandler handler)
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        lostHandler_ = std::move(handler);
    }

    DeviceThread::Diagnostics DeviceThread::diagnostics() const
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        return diagnostics_;
    }

    uint64_t DeviceThread::consumedSequence() const
    {
        std::lock_guard<std::mutex> lock(progressMutex_);
        return consumedSequence_;
    }

    void DeviceThread::markConsumed(uint64_t sequence)
    {
        {
            std::lock_guard<std::mutex> lock(progressMutex_);
            consumedSequence_ = std::max(consumedSequence_, sequence);
        }
        progress_.notify_all();
    }

    void DeviceThread::workerLoop()
    {
        while (true) {
            (void)queue_.waitForCommands(kIdleWait);
            {
                std::lock_guard<std::mutex> lock(consumeMutex_);
                drainLocked();
            }
            if (stop_.load(std::memory_order_acquire) && queue_.empty()) {
                return;
            }
        }
    }

    void DeviceThread::drainLocked()
    {
        queue_.drainTo([this](Command& command) {
            consume(command);
            markConsumed(command.sequence);
        });
    }

    void DeviceThread::consume(Command& command)
    {
        if (contextLost()) {
            std::lock_guard<std::mutex> lock(stateMutex_);
            ++diagnostics_.droppedAfterLoss;
            return;
        }

        const Expected<void> result = backend_.execute(command);

        ContextLostHandler handler;
        {
            std::lock_guard<std::mutex> lock(stateMutex_);
            ++diagnostics_.executed;
            if (result.hasValue()) {
                return;
            }
            ++diagnostics_.failed;
            if (result.error() == ErrorCode::ContextLost) {
                handler = lostHandler_;
            }
        }

        if (result.error() != ErrorCode::ContextLost) {
            DiagnosticMessage message{};
            message.severity = Severity::Warning;
            message.subsystem = "device_thread";
            message.operation = commandName(command.payload);
            message.code = result.error();
            message.text = errorMessage(result.context());
            reportDiagnostic(std::move(message));
            return;
        }

        lost_.store(true, std::memory_order_release);
        if (handler) {
            handler(result.context());
        }
    }

} // namespace drawcore
