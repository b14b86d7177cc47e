#include <algorithm>
#include <limits>
#include <string>
#include <utility>

#include <drawcore/draw/CommandEmitter.h>

namespace drawcore {

    namespace {
        constexpr const char* kSubsystem = "command_emitter";
    }

    CommandEmitter::CommandEmitter(CommandQueue& queue, FenceTracker& fences, StateCache& cache, uint32_t textureUnits)
        : queue_(queue)
        , fences_(fences)
        , cache_(cache)
        , units_(textureUnits)
    {
    }

    Expected<CommandEmitter::Emission> CommandEmitter::emit(const ValidatedDraw& draw, uint32_t producerId)
    {
        std::lock_guard<std::mutex> lock(emitMutex_);

        const StateCache::Snapshot base = cache_.snapshot();
        const PipelineState& current = base.state;
        PipelineState next = current;
        const DrawParameters& params = draw.parameters;

        next.program = draw.program;
        next.framebuffer = draw.framebuffer;
        next.viewport = params.viewport;
        next.scissor = params.scissor.has_value() ? ScissorState{ .enabled = true, .rect = *params.scissor } : ScissorState{};
        next.depthTest = params.depthTest;
        next.depthWrite = params.depthWrite;
        next.depthRange = params.depthRange;
        next.depthClamp = params.depthClamp;
        next.stencil = params.stencil;
        next.blend = params.blend;
        next.colorMask = params.colorMask;
        next.cullMode = params.cullMode;
        next.frontFace = params.frontFace;
        next.polygonMode = params.polygonMode;
        next.lineWidth = params.lineWidth;
        next.pointSize = params.pointSize;
        next.multisample = params.multisample;
        next.dither = params.dither;
        next.clipDistanceMask = params.clipDistanceMask;
        next.rasterizerDiscard = params.rasterizerDiscard;
        next.primitiveRestart = params.primitiveRestart;
        next.vertexLayout = draw.vertexLayout;
        // Non-indexed draws ignore the index binding, so leave whatever is bound.
        if (draw.draw.indexed) {
            next.indexBuffer = draw.indexBuffer;
        }
        for (const ResolvedBlock& block : draw.blocks) {
            if (block.binding < next.uniformBuffers.size()) {
                next.uniformBuffers[block.binding] = block.buffer;
            }
        }

        const std::vector<uint32_t> assigned = units_.assign(draw.textures, next.textureUnits);
        for (size_t i = 0; i < assigned.size(); ++i) {
            if (assigned[i] == std::numeric_limits<uint32_t>::max()) {
                return makeError("CommandEmitter::emit", ErrorCode::TextureBinding, kSubsystem, "no_free_texture_unit");
            }
        }

        std::vector<CommandPayload> batch{};
        DiffCounts counts = appendStateChanges(current, next, batch);

        std::vector<std::pair<int32_t, UniformValue>> uniforms = draw.uniforms;
        for (size_t i = 0; i < draw.textures.size(); ++i) {
            uniforms.emplace_back(draw.textures[i].location, UniformValue{ static_cast<int32_t>(assigned[i]) });
        }

        StateDelta delta{ .next = std::move(next), .uniforms = {} };
        for (auto& [location, value] : uniforms) {
            if (location < 0) {
                continue;
            }
            const std::optional<UniformValue> cached = cache_.uniform(draw.program, location);
            if (cached.has_value() && *cached == value) {
                ++counts.skipped;
                continue;
            }
            batch.emplace_back(StateChangeCmd{ .field = StateField::Uniform, .slot = static_cast<uint32_t>(location), .value = StateValue{ value } });
            delta.uniforms.push_back(UniformUpdate{ .program = draw.program, .location = location, .value = value });
            ++counts.emitted;
            ++stats_.uniformCommands;
        }

        batch.emplace_back(draw.draw);

        auto emission = submitLocked(std::move(batch), delta, base, draw.accesses, producerId, counts);
        if (emission.hasValue()) {
            ++stats_.draws;
        }
        return emission;
    }

    Expected<CommandEmitter::Emission> CommandEmitter::emitClear(const ClearRequest& request,
        StorageId framebuffer,
        const std::vector<TrackedAccess>& writes,
        uint32_t producerId)
    {
        std::lock_guard<std::mutex> lock(emitMutex_);

        const StateCache::Snapshot base = cache_.snapshot();
        const PipelineState& current = base.state;
        PipelineState next = current;
        next.framebuffer = framebuffer;
        next.scissor = request.scissor.has_value() ? ScissorState{ .enabled = true, .rect = *request.scissor } : ScissorState{};
        // Clears honor the write masks, so open the ones this clear needs.
        if (request.color.has_value()) {
            next.colorMask = ColorMask{};
        }
        if (request.depth.has_value()) {
            next.depthWrite = true;
        }
        if (request.stencil.has_value()) {
            next.stencil.front.writeMask = 0xFFFFFFFFu;
            next.stencil.back.writeMask = 0xFFFFFFFFu;
        }

        std::vector<CommandPayload> batch{};
        const DiffCounts counts = appendStateChanges(current, next, batch);
        batch.emplace_back(ClearCmd{ .color = request.color, .depth = request.depth, .stencil = request.stencil });

        auto emission = submitLocked(std::move(batch), StateDelta{ .next = std::move(next), .uniforms = {} }, base, writes, producerId, counts);
        if (emission.hasValue()) {
            ++stats_.clears;
        }
        return emission;
    }

    Expected<CommandEmitter::Emission> CommandEmitter::submitLocked(std::vector<CommandPayload>&& batch,
        const StateDelta& delta,
        const StateCache::Snapshot& base,
        const std::vector<TrackedAccess>& accesses,
        uint32_t producerId,
        DiffCounts counts)
    {
        std::vector<TrackedAccess> tracked{};
        const bool trackAll = fences_.config().drawReads == DrawReadTracking::All;
        for (const TrackedAccess& access : accesses) {
            if ((trackAll || access.mapped) && !access.range.empty()) {
                tracked.push_back(access);
            }
        }

        auto submitted = queue_.submit(std::move(batch), producerId, !tracked.empty(), [&](uint64_t fence) {
            for (const TrackedAccess& access : tracked) {
                fences_.recordAccess(access.storage, access.range, access.mode, fence);
            }
        });
        if (!submitted.hasValue()) {
            return submitted.context();
        }

        // Only now is the new state queued, so only now may the cache claim it.
        cache_.commit(delta, base);

        stats_.stateCommands += counts.emitted;
        stats_.redundantSkipped += counts.skipped;
        if (!tracked.empty()) {
            ++stats_.fencedBatches;
        }
        return Emission{ .submission = submitted.value(), .stateCommands = counts.emitted, .skipped = counts.skipped };
    }

    CommandEmitter::Stats CommandEmitter::stats() const
    {
        std::lock_guard<std::mutex> lock(emitMutex_);
        return stats_;
    }

    TextureUnitAllocator::Stats CommandEmitter::textureUnitStats() const
    {
        std::lock_guard<std::mutex> lock(emitMutex_);
        return units_.stats();
    }

} // namespace drawcore
