#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

#include <drawcore/state/PipelineState.h>

namespace drawcore {

    struct UniformUpdate {
        StorageId program{ kNullStorage };
        int32_t location{ -1 };
        UniformValue value{};
    };

    struct StateDelta {
        PipelineState next{};
        std::vector<UniformUpdate> uniforms{};
    };

    // Mirror of the state the device will hold once every queued command has run.
    // Only the command emitter commits, and only after the matching commands were queued.
    class StateCache
    {
    public:
        // State read at the start of an emission, with the invalidation counts seen at that moment.
        struct Snapshot {
            PipelineState state{};
            uint64_t viewportEpoch{ 0 };
            uint64_t resetEpoch{ 0 };
        };

        StateCache(uint32_t textureUnits, uint32_t uniformBufferBindings);

        [[nodiscard]] PipelineState current() const;
        [[nodiscard]] Snapshot snapshot() const;
        [[nodiscard]] std::optional<UniformValue> uniform(StorageId program, int32_t location) const;

        // Invalidations that landed after `base` was taken win over the delta: a resize keeps
        // viewport and scissor unknown, a reset drops the delta entirely.
        void commit(const StateDelta& delta, const Snapshot& base);

        // The window layer resized the surface; the device viewport and scissor are no longer known.
        void invalidateViewport();
        // Programs are recreated with default uniform values, so a released program's cache must go.
        void forgetProgram(StorageId program);
        void reset();

        [[nodiscard]] uint64_t commitCount() const noexcept;

    private:
        mutable std::mutex mutex_{};
        uint32_t textureUnits_{ 0 };
        uint32_t uniformBufferBindings_{ 0 };
        PipelineState state_{};
        std::map<std::pair<StorageId, int32_t>, UniformValue> uniforms_{};
        uint64_t commits_{ 0 };
        uint64_t viewportEpoch_{ 0 };
        uint64_t resetEpoch_{ 0 };
    };

} // namespace drawcore
