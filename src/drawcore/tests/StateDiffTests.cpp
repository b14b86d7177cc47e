#include <cassert>
#include <variant>
#include <vector>

#include <glm/glm.hpp>

#include <drawcore/state/StateCache.h>
#include <drawcore/state/StateDiff.h>

using namespace drawcore;

namespace {

    const StateChangeCmd& change(const std::vector<CommandPayload>& out, size_t index)
    {
        return std::get<StateChangeCmd>(out.at(index));
    }

} // namespace

int main()
{
    // Identical states produce nothing.
    {
        const PipelineState state = makeDefaultPipelineState(4, 2);
        std::vector<CommandPayload> out{};
        const DiffCounts counts = appendStateChanges(state, state, out);
        assert(out.empty());
        assert(counts.emitted == 0);
        assert(counts.skipped > 0);
    }

    // One command per differing field, carrying the new value.
    {
        PipelineState from = makeDefaultPipelineState(4, 2);
        from.viewport = Rect{ .origin = { 0, 0 }, .size = { 64, 64 } };
        PipelineState to = from;
        to.program = 9;
        to.depthTest = DepthTest{ .enabled = true, .func = CompareFunc::Less };
        to.cullMode = CullMode::Back;

        std::vector<CommandPayload> out{};
        const DiffCounts counts = appendStateChanges(from, to, out);
        assert(out.size() == 3);
        assert(counts.emitted == 3);
        assert(change(out, 0).field == StateField::Program);
        assert(std::get<StorageId>(change(out, 0).value) == 9);
        assert(change(out, 1).field == StateField::DepthTest);
        assert(change(out, 2).field == StateField::CullMode);
    }

    // A disabled depth test ignores its compare function; a disabled scissor ignores its rect.
    {
        PipelineState from = makeDefaultPipelineState(1, 1);
        from.viewport = Rect{ .origin = { 0, 0 }, .size = { 8, 8 } };
        PipelineState to = from;
        to.depthTest.func = CompareFunc::Greater;
        to.scissor = ScissorState{ .enabled = false, .rect = Rect{ .origin = { 1, 1 }, .size = { 2, 2 } } };

        std::vector<CommandPayload> out{};
        static_cast<void>(appendStateChanges(from, to, out));
        assert(out.empty());
    }

    // An unknown viewport always differs from a known one.
    {
        PipelineState from = makeDefaultPipelineState(1, 1);
        PipelineState to = from;
        to.viewport = Rect{ .origin = { 0, 0 }, .size = { 8, 8 } };

        std::vector<CommandPayload> out{};
        static_cast<void>(appendStateChanges(from, to, out));
        assert(out.size() == 1);
        assert(change(out, 0).field == StateField::Viewport);
    }

    // Texture units diff per slot.
    {
        PipelineState from = makeDefaultPipelineState(4, 1);
        from.viewport = Rect{ .origin = { 0, 0 }, .size = { 8, 8 } };
        PipelineState to = from;
        to.textureUnits[1] = TextureUnitBinding{ .texture = 5 };
        to.textureUnits[3] = TextureUnitBinding{ .texture = 6 };

        std::vector<CommandPayload> out{};
        static_cast<void>(appendStateChanges(from, to, out));
        assert(out.size() == 2);
        assert(change(out, 0).field == StateField::TextureUnit && change(out, 0).slot == 1);
        assert(change(out, 1).field == StateField::TextureUnit && change(out, 1).slot == 3);
    }

    // Replaying the emitted changes on the old state yields the new one.
    {
        PipelineState from = makeDefaultPipelineState(2, 2);
        from.viewport = Rect{ .origin = { 0, 0 }, .size = { 8, 8 } };
        PipelineState to = from;
        to.program = 3;
        to.framebuffer = 4;
        to.blend = BlendState{ .enabled = true, .srcColor = BlendFactor::SrcAlpha, .dstColor = BlendFactor::OneMinusSrcAlpha };
        to.lineWidth = 2.0F;
        to.vertexLayout.push_back(VertexAttributeBinding{ .location = 0, .buffer = 11, .stride = 12, .type = ValueType::Vec3 });
        to.uniformBuffers[1] = UniformBufferBinding{ .buffer = 12, .offset = 0, .size = 64 };

        std::vector<CommandPayload> out{};
        static_cast<void>(appendStateChanges(from, to, out));

        PipelineState replayed = from;
        for (const CommandPayload& payload : out) {
            applyStateChange(replayed, std::get<StateChangeCmd>(payload));
        }
        assert(replayed == to);
    }

    // The cache only moves on commit, and forgets per-program uniforms when asked.
    {
        StateCache cache{ 2, 2 };
        assert(!cache.current().viewport.has_value());

        const StateCache::Snapshot base = cache.snapshot();
        PipelineState next = base.state;
        next.program = 5;
        next.viewport = Rect{ .origin = { 0, 0 }, .size = { 32, 32 } };
        cache.commit(StateDelta{ .next = next, .uniforms = { UniformUpdate{ .program = 5, .location = 0, .value = UniformValue{ 1.0F } } } }, base);
        assert(cache.current().program == 5);
        assert(cache.commitCount() == 1);
        assert(cache.uniform(5, 0).has_value());
        assert(std::get<float>(*cache.uniform(5, 0)) == 1.0F);

        cache.invalidateViewport();
        assert(!cache.current().viewport.has_value());
        assert(cache.current().program == 5);

        cache.forgetProgram(5);
        assert(!cache.uniform(5, 0).has_value());

        cache.reset();
        assert(cache.current().program == kNullStorage);
        assert(cache.current().textureUnits.size() == 2);
    }

    // A resize between reading the state and committing the delta keeps the viewport unknown.
    {
        StateCache cache{ 2, 2 };
        const StateCache::Snapshot base = cache.snapshot();
        PipelineState next = base.state;
        next.program = 7;
        next.viewport = Rect{ .origin = { 0, 0 }, .size = { 64, 64 } };
        next.scissor = ScissorState{ .enabled = true, .rect = Rect{ .origin = { 0, 0 }, .size = { 8, 8 } } };

        cache.invalidateViewport();
        cache.commit(StateDelta{ .next = next, .uniforms = {} }, base);
        assert(cache.current().program == 7);
        assert(!cache.current().viewport.has_value());
        assert(!cache.current().scissor.has_value());

        // With no invalidation in between the committed viewport sticks.
        const StateCache::Snapshot after = cache.snapshot();
        cache.commit(StateDelta{ .next = next, .uniforms = {} }, after);
        assert(cache.current().viewport.has_value());
        assert(cache.current().viewport->size == glm::ivec2(64, 64));
    }

    // A reset between reading the state and committing the delta drops the delta.
    {
        StateCache cache{ 2, 2 };
        const StateCache::Snapshot base = cache.snapshot();
        PipelineState next = base.state;
        next.program = 9;
        cache.reset();
        cache.commit(StateDelta{ .next = next, .uniforms = { UniformUpdate{ .program = 9, .location = 0, .value = UniformValue{ 2.0F } } } }, base);
        assert(cache.current().program == kNullStorage);
        assert(!cache.uniform(9, 0).has_value());
    }

    return 0;
}
