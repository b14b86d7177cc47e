#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

#include <drawcore/command/Command.h>
#include <drawcore/command/DeviceThread.h>
#include <drawcore/core/Status.h>
#include <drawcore/state/PipelineState.h>
#include <drawcore/sync/CompletionSource.h>

namespace drawcore {

    // A device that lives in memory: storage is byte vectors, state changes land in a
    // PipelineState mirror and clears paint RGBA8 pixels. It executes commands and reports
    // their retirement, so it serves as both the backend and the completion source.
    class HeadlessDevice : public IDeviceBackend, public ICompletionSource
    {
    public:
        enum class RetireMode : uint8_t {
            Immediate,  // a fence retires as soon as its SignalFence command executes
            Manual      // signalled fences retire only through retire()/retireAll()
        };

        struct Counters {
            uint64_t stateChanges{ 0 };
            uint64_t draws{ 0 };
            uint64_t clears{ 0 };
            uint64_t storageCreated{ 0 };
            uint64_t storageReleased{ 0 };
            uint64_t presents{ 0 };
        };

        using CommandObserver = std::function<void(const Command&)>;

        HeadlessDevice(uint32_t textureUnits, uint32_t uniformBufferBindings, RetireMode mode = RetireMode::Immediate);

        [[nodiscard]] Expected<void> execute(const Command& command) override;

        [[nodiscard]] Expected<uint64_t> completedValue() override;
        [[nodiscard]] Expected<bool> wait(uint64_t value, std::chrono::nanoseconds timeout) override;

        // Manual mode: retire every signalled fence up to `value`.
        void retire(uint64_t value);
        void retireAll();
        [[nodiscard]] uint64_t signalledValue() const;

        // Every later command fails with ContextLost and every waiter wakes up.
        void loseContext();
        [[nodiscard]] bool contextLost() const;

        void resizeDefaultFramebuffer(uint32_t width, uint32_t height);
        void setCommandObserver(CommandObserver observer);

        [[nodiscard]] PipelineState state() const;
        [[nodiscard]] std::optional<UniformValue> uniform(StorageId program, int32_t location) const;
        [[nodiscard]] bool hasStorage(StorageId storage) const;
        [[nodiscard]] std::size_t storageCount() const;
        [[nodiscard]] std::optional<std::vector<std::byte>> storageBytes(StorageId storage) const;
        [[nodiscard]] Counters counters() const;

    private:
        struct Storage {
            ResourceKind kind{ ResourceKind::Buffer };
            std::vector<std::byte> bytes{};
            std::shared_ptr<std::vector<std::byte>> mapped{};
            std::optional<TextureDesc> texture{};
            std::vector<StorageId> attachments{};

            [[nodiscard]] std::vector<std::byte>& data() { return mapped ? *mapped : bytes; }
            [[nodiscard]] const std::vector<std::byte>& data() const { return mapped ? *mapped : bytes; }
        };

        [[nodiscard]] Expected<void> executeLocked(const CommandPayload& payload);
        [[nodiscard]] Expected<void> checkStorageLocked(StorageId storage, const char* operation) const;
        [[nodiscard]] Expected<void> clearLocked(const ClearCmd& clear);
        [[nodiscard]] Expected<void> uploadLocked(const TextureUploadCmd& upload);
        [[nodiscard]] Expected<void> readPixelsLocked(const ReadPixelsCmd& read);
        void signalLocked(uint64_t value);

        RetireMode retireMode_{ RetireMode::Immediate };

        mutable std::mutex mutex_{};
        std::condition_variable retired_{};
        std::unordered_map<StorageId, Storage> storage_{};
        PipelineState state_{};
        std::map<std::pair<StorageId, int32_t>, UniformValue> uniforms_{};
        uint32_t defaultWidth_{ 1280 };
        uint32_t defaultHeight_{ 720 };
        std::vector<std::byte> defaultColor_{};
        uint64_t signalled_{ 0 };
        uint64_t completed_{ 0 };
        bool lost_{ false };
        Counters counters_{};

        std::mutex observerMutex_{};
        CommandObserver observer_{};
    };

} // namespace drawcore
