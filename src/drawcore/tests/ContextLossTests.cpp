#include <cassert>
#include <vector>

#include <glm/glm.hpp>

#include "TestRig.h"

using namespace drawcore;
using namespace drawcore::test;

int main()
{
    // Loss is noticed when the consumer hits it; from then on every call reports it.
    {
        ContextRig rig{ inlineConfig(), HeadlessDevice::RetireMode::Manual };
        ResourceRegistry& registry = rig.context.resources();
        const Handle program = valueOrThrow(registry.createProgram(ProgramDesc{ .reflection = colorProgram() }));
        const Handle vertices = makeVertexBuffer(registry, 3);

        DrawRequest request{};
        request.program = program;
        request.vertices.push_back(positions(vertices, 3));
        request.uniforms["color"] = UniformValue{ glm::vec4(1.0F) };
        assert(rig.context.draw(request).hasValue());

        auto pending = rig.context.readPixelsAsync(ReadRequest{ .region = Rect{ .origin = { 0, 0 }, .size = { 1, 1 } } });
        assert(pending.hasValue());

        rig.recorder.device.loseContext();
        auto flushed = rig.context.flush();
        assert(!flushed.hasValue());
        assert(flushed.error() == ErrorCode::ContextLost);
        assert(rig.context.contextLost());

        auto drawn = rig.context.draw(request);
        assert(!drawn.hasValue());
        assert(drawn.error() == ErrorCode::ContextLost);

        assert(rig.context.clear(ClearRequest{ .color = glm::vec4(0.0F) }).error() == ErrorCode::ContextLost);
        assert(rig.context.present().error() == ErrorCode::ContextLost);
        assert(rig.context.insertFence().error() == ErrorCode::ContextLost);

        auto created = registry.createBuffer(BufferDesc{ .size = 16 });
        assert(!created.hasValue());
        assert(created.error() == ErrorCode::ContextLost);

        // Waits do not hang on fences the device will never signal.
        auto taken = pending.value().take();
        assert(!taken.hasValue());
        assert(taken.error() == ErrorCode::ContextLost);

        auto waited = rig.context.waitForBuffer(vertices, ByteRange{ 0, 36 }, AccessMode::Write);
        assert(!waited.hasValue());
        assert(waited.error() == ErrorCode::ContextLost);

        // The cache no longer claims anything about device state.
        assert(rig.context.cachedState().program == kNullStorage);
        assert(!rig.context.cachedState().viewport.has_value());
    }

    // Commands queued behind the lost one are dropped, not executed.
    {
        ContextRig rig{};
        rig.recorder.device.loseContext();
        assert(rig.context.clear(ClearRequest{ .color = glm::vec4(1.0F) }).hasValue());
        assert(rig.context.clear(ClearRequest{ .depth = 0.5F }).hasValue());
        assert(!rig.context.flush().hasValue());

        const auto stats = rig.context.stats();
        assert(stats.device.failed == 1);
        assert(stats.device.droppedAfterLoss > 0);
        assert(rig.recorder.device.counters().clears == 0);
    }

    return 0;
}
