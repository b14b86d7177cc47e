#include <drawcore/state/StateCache.h>

namespace drawcore {

    StateCache::StateCache(uint32_t textureUnits, uint32_t uniformBufferBindings)
        : textureUnits_(textureUnits)
        , uniformBufferBindings_(uniformBufferBindings)
        , state_(makeDefaultPipelineState(textureUnits, uniformBufferBindings))
    {
        // The initial viewport belongs to the window layer until the first draw sets one.
        state_.viewport.reset();
    }

    PipelineState StateCache::current() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return state_;
    }

    StateCache::Snapshot StateCache::snapshot() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return Snapshot{ .state = state_, .viewportEpoch = viewportEpoch_, .resetEpoch = resetEpoch_ };
    }

    std::optional<UniformValue> StateCache::uniform(StorageId program, int32_t location) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = uniforms_.find({ program, location });
        if (it == uniforms_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    void StateCache::commit(const StateDelta& delta, const Snapshot& base)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++commits_;
        if (base.resetEpoch != resetEpoch_) {
            return;
        }
        state_ = delta.next;
        if (base.viewportEpoch != viewportEpoch_) {
            state_.viewport.reset();
            state_.scissor.reset();
        }
        for (const UniformUpdate& u : delta.uniforms) {
            uniforms_.insert_or_assign({ u.program, u.location }, u.value);
        }
    }

    void StateCache::invalidateViewport()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_.viewport.reset();
        state_.scissor.reset();
        ++viewportEpoch_;
    }

    void StateCache::forgetProgram(StorageId program)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = uniforms_.begin(); it != uniforms_.end();) {
            if (it->first.first == program) {
                it = uniforms_.erase(it);
            }
            else {
                ++it;
            }
        }
    }

    void StateCache::reset()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = makeDefaultPipelineState(textureUnits_, uniformBufferBindings_);
        state_.viewport.reset();
        uniforms_.clear();
        ++resetEpoch_;
    }

    uint64_t StateCache::commitCount() const noexcept
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return commits_;
    }

} // namespace drawcore
