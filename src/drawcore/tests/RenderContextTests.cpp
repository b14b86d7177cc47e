#include <algorithm>
#include <atomic>
#include <cassert>
#include <cstddef>
#include <thread>
#include <variant>
#include <vector>

#include <glm/glm.hpp>

#include "TestRig.h"

using namespace drawcore;
using namespace drawcore::test;

namespace {

    DrawRequest colorDraw(Handle program, Handle vertices)
    {
        DrawRequest request{};
        request.program = program;
        request.vertices.push_back(positions(vertices, 3));
        request.uniforms["color"] = UniformValue{ glm::vec4(0.0F, 1.0F, 0.0F, 1.0F) };
        return request;
    }

    template<typename T>
    std::size_t countOf(const std::vector<Command>& commands)
    {
        std::size_t n = 0;
        for (const Command& command : commands) {
            if (std::holds_alternative<T>(command.payload)) {
                ++n;
            }
        }
        return n;
    }

    std::vector<StateField> changedFields(const std::vector<Command>& commands)
    {
        std::vector<StateField> fields{};
        for (const Command& command : commands) {
            if (const auto* change = std::get_if<StateChangeCmd>(&command.payload)) {
                fields.push_back(change->field);
            }
        }
        return fields;
    }

} // namespace

int main()
{
    // The first draw sets what it needs; the same draw again emits only the draw.
    {
        ContextRig rig{};
        ResourceRegistry& registry = rig.context.resources();
        const Handle program = valueOrThrow(registry.createProgram(ProgramDesc{ .reflection = colorProgram() }));
        const Handle vertices = makeVertexBuffer(registry, 3);
        static_cast<void>(rig.flushAndTake());

        DrawRequest request = colorDraw(program, vertices);
        request.parameters.depthTest = DepthTest{ .enabled = true, .func = CompareFunc::Less };

        assert(rig.context.draw(request).hasValue());
        const auto first = rig.flushAndTake();
        assert(countOf<DrawCmd>(first) == 1);
        const auto fields = changedFields(first);
        assert(std::count(fields.begin(), fields.end(), StateField::DepthTest) == 1);
        assert(std::count(fields.begin(), fields.end(), StateField::Program) == 1);
        assert(std::count(fields.begin(), fields.end(), StateField::Viewport) == 1);
        assert(std::count(fields.begin(), fields.end(), StateField::Uniform) == 1);

        assert(rig.context.draw(request).hasValue());
        const auto second = rig.flushAndTake();
        assert(countOf<DrawCmd>(second) == 1);
        assert(countOf<StateChangeCmd>(second) == 0);

        // A new uniform value is the only change.
        request.uniforms["color"] = UniformValue{ glm::vec4(1.0F) };
        assert(rig.context.draw(request).hasValue());
        const auto third = rig.flushAndTake();
        assert((changedFields(third) == std::vector<StateField>{ StateField::Uniform }));

        // The device ends up in exactly the state the cache believes it is in.
        assert(rig.recorder.device.state() == rig.context.cachedState());
        assert(rig.context.stats().emitter.draws == 3);
    }

    // A resize forgets the viewport, so the next draw sets it to the new size.
    {
        ContextRig rig{};
        ResourceRegistry& registry = rig.context.resources();
        const Handle program = valueOrThrow(registry.createProgram(ProgramDesc{ .reflection = colorProgram() }));
        const Handle vertices = makeVertexBuffer(registry, 3);
        assert(rig.context.draw(colorDraw(program, vertices)).hasValue());
        static_cast<void>(rig.flushAndTake());

        rig.recorder.device.resizeDefaultFramebuffer(640, 480);
        rig.context.notifyViewportResized(640, 480);
        assert(!rig.context.cachedState().viewport.has_value());
        assert(rig.context.defaultFramebuffer().width == 640);

        assert(rig.context.draw(colorDraw(program, vertices)).hasValue());
        const auto commands = rig.flushAndTake();
        assert((changedFields(commands) == std::vector<StateField>{ StateField::Viewport }));
        assert(rig.recorder.device.state().viewport->size == glm::ivec2(640, 480));
    }

    // Resizes racing with draws on other threads never leave a stale viewport in the cache.
    {
        ContextConfig config = inlineConfig();
        config.consumerMode = DeviceThread::Mode::Dedicated;
        ContextRig rig{ config };
        ResourceRegistry& registry = rig.context.resources();
        const Handle program = valueOrThrow(registry.createProgram(ProgramDesc{ .reflection = colorProgram() }));
        const Handle vertices = makeVertexBuffer(registry, 3);

        std::atomic<bool> resizing{ true };
        std::thread drawer([&]() {
            const DrawRequest request = colorDraw(program, vertices);
            while (resizing.load()) {
                const Expected<void> drawn = rig.context.draw(request);
                assert(drawn.hasValue());
            }
        });
        std::thread resizer([&]() {
            for (int i = 0; i < 200; ++i) {
                const bool large = (i % 2) == 0;
                rig.context.notifyViewportResized(large ? 800 : 640, large ? 600 : 480);
                std::this_thread::yield();
            }
            resizing.store(false);
        });
        resizer.join();
        drawer.join();

        // The last resize was to 640x480: the cache either forgot the viewport or holds the new one.
        const PipelineState cached = rig.context.cachedState();
        assert(!cached.viewport.has_value() || cached.viewport->size == glm::ivec2(640, 480));

        assert(rig.context.draw(colorDraw(program, vertices)).hasValue());
        assert(rig.context.flush().hasValue());
        assert(rig.recorder.device.state().viewport->size == glm::ivec2(640, 480));
        assert(rig.recorder.device.state() == rig.context.cachedState());
    }

    // Clears set only the state they need, and an empty clear does nothing.
    {
        ContextRig rig{};
        static_cast<void>(rig.flushAndTake());

        assert(rig.context.clear(ClearRequest{}).hasValue());
        assert(rig.flushAndTake().empty());

        assert(rig.context.clear(ClearRequest{ .color = glm::vec4(0.0F), .depth = 1.0F }).hasValue());
        const auto first = rig.flushAndTake();
        assert(countOf<ClearCmd>(first) == 1);

        assert(rig.context.clear(ClearRequest{ .color = glm::vec4(0.0F), .depth = 1.0F }).hasValue());
        const auto second = rig.flushAndTake();
        assert(countOf<ClearCmd>(second) == 1);
        assert(countOf<StateChangeCmd>(second) == 0);
        assert(rig.recorder.device.counters().clears == 2);
    }

    // Clearing an aspect the target has no attachment for is rejected before anything is queued.
    {
        ContextRig rig{};
        ResourceRegistry& registry = rig.context.resources();
        FramebufferDesc colorOnly{};
        colorOnly.colorAttachments.push_back(FramebufferAttachment{ .texture = makeTexture(registry, 16, 16) });
        const Handle framebuffer = valueOrThrow(registry.createFramebuffer(colorOnly));
        static_cast<void>(rig.flushAndTake());

        auto depth = rig.context.clear(ClearRequest{ .framebuffer = framebuffer, .color = glm::vec4(0.0F), .depth = 1.0F });
        assert(!depth.hasValue());
        assert(depth.error() == ErrorCode::FramebufferMismatch);
        assert(hasTag(depth.context(), "clear_depth_without_attachment"));

        auto stencil = rig.context.clear(ClearRequest{ .framebuffer = framebuffer, .stencil = 0 });
        assert(!stencil.hasValue());
        assert(hasTag(stencil.context(), "clear_stencil_without_attachment"));
        assert(rig.flushAndTake().empty());

        assert(rig.context.clear(ClearRequest{ .framebuffer = framebuffer, .color = glm::vec4(1.0F) }).hasValue());
        assert(countOf<ClearCmd>(rig.flushAndTake()) == 1);

        // The default framebuffer follows what the window layer reported.
        ContextConfig config = inlineConfig();
        config.defaultFramebuffer.hasStencil = false;
        ContextRig noStencil{ config };
        auto defaultStencil = noStencil.context.clear(ClearRequest{ .depth = 1.0F, .stencil = 0 });
        assert(!defaultStencil.hasValue());
        assert(hasTag(defaultStencil.context(), "clear_stencil_without_attachment"));
        assert(noStencil.context.clear(ClearRequest{ .depth = 1.0F }).hasValue());
    }

    // Present hands everything over and counts frames; fences inserted by the caller retire.
    {
        ContextRig rig{};
        const uint64_t fence = valueOrThrow(rig.context.insertFence());
        assert(rig.context.present().hasValue());
        assert(rig.context.present().hasValue());
        assert(rig.context.stats().presents == 2);
        assert(rig.recorder.device.counters().presents == 2);
        assert(rig.context.waitForFence(fence).hasValue());
    }

    // Many threads drawing through a dedicated device thread.
    {
        ContextConfig config = inlineConfig();
        config.consumerMode = DeviceThread::Mode::Dedicated;
        ContextRig rig{ config };
        ResourceRegistry& registry = rig.context.resources();
        const Handle program = valueOrThrow(registry.createProgram(ProgramDesc{ .reflection = colorProgram() }));
        const Handle vertices = makeVertexBuffer(registry, 3);

        constexpr int kThreads = 4;
        constexpr int kDraws = 50;
        std::vector<std::thread> threads{};
        for (int t = 0; t < kThreads; ++t) {
            threads.emplace_back([&, t]() {
                DrawRequest request = colorDraw(program, vertices);
                request.parameters.cullMode = (t % 2 == 0) ? CullMode::Back : CullMode::Front;
                for (int i = 0; i < kDraws; ++i) {
                    const Expected<void> drawn = rig.context.draw(request);
                    assert(drawn.hasValue());
                }
            });
        }
        for (std::thread& thread : threads) {
            thread.join();
        }

        assert(rig.context.flush().hasValue());
        assert(rig.recorder.device.counters().draws == kThreads * kDraws);
        assert(rig.context.stats().device.failed == 0);
        assert(rig.recorder.device.state() == rig.context.cachedState());
    }

    return 0;
}
