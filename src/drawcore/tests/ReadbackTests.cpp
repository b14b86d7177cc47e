#include <cassert>
#include <cstddef>
#include <vector>

#include <glm/glm.hpp>

#include "TestRig.h"

using namespace drawcore;
using namespace drawcore::test;

namespace {

    bool pixelIs(const std::vector<std::byte>& pixels, std::size_t index, uint8_t r, uint8_t g, uint8_t b, uint8_t a)
    {
        const std::size_t base = index * 4;
        return pixels.size() >= base + 4
            && pixels[base] == std::byte{ r } && pixels[base + 1] == std::byte{ g }
            && pixels[base + 2] == std::byte{ b } && pixels[base + 3] == std::byte{ a };
    }

    Rect region(int32_t x, int32_t y, int32_t w, int32_t h)
    {
        return Rect{ .origin = { x, y }, .size = { w, h } };
    }

} // namespace

int main()
{
    // Clearing the default framebuffer and reading it back returns the clear color.
    {
        ContextRig rig{};
        assert(rig.context.clear(ClearRequest{ .color = glm::vec4(1.0F, 0.0F, 0.0F, 1.0F) }).hasValue());

        auto pixels = rig.context.readPixels(ReadRequest{ .region = region(0, 0, 2, 2) });
        assert(pixels.hasValue());
        assert(pixels.value().size() == 16);
        for (std::size_t i = 0; i < 4; ++i) {
            assert(pixelIs(pixels.value(), i, 255, 0, 0, 255));
        }

        // A scissored clear touches only its rectangle.
        assert(rig.context.clear(ClearRequest{ .color = glm::vec4(0.0F, 0.0F, 1.0F, 1.0F), .scissor = region(0, 0, 1, 1) }).hasValue());
        auto after = rig.context.readPixels(ReadRequest{ .region = region(0, 0, 2, 1) });
        assert(after.hasValue());
        assert(pixelIs(after.value(), 0, 0, 0, 255, 255));
        assert(pixelIs(after.value(), 1, 255, 0, 0, 255));
    }

    // Offscreen framebuffers read through their first color attachment; textures read directly.
    {
        ContextRig rig{};
        ResourceRegistry& registry = rig.context.resources();
        const Handle color = makeTexture(registry, 8, 8);
        FramebufferDesc fbDesc{};
        fbDesc.colorAttachments.push_back(FramebufferAttachment{ .texture = color });
        const Handle framebuffer = valueOrThrow(registry.createFramebuffer(fbDesc));

        assert(rig.context.clear(ClearRequest{ .framebuffer = framebuffer, .color = glm::vec4(0.0F, 1.0F, 0.0F, 1.0F) }).hasValue());

        auto viaFramebuffer = rig.context.readPixels(ReadRequest{ .source = framebuffer, .region = region(7, 7, 1, 1) });
        assert(viaFramebuffer.hasValue());
        assert(pixelIs(viaFramebuffer.value(), 0, 0, 255, 0, 255));

        auto viaTexture = rig.context.readPixels(ReadRequest{ .source = color, .region = region(0, 0, 8, 8) });
        assert(viaTexture.hasValue());
        assert(viaTexture.value().size() == 8 * 8 * 4);
        assert(pixelIs(viaTexture.value(), 63, 0, 255, 0, 255));
    }

    // An async readback is not ready until its fence retires, and hands its data over once.
    {
        ContextRig rig{ inlineConfig(), HeadlessDevice::RetireMode::Manual };
        assert(rig.context.clear(ClearRequest{ .color = glm::vec4(1.0F) }).hasValue());

        auto pending = rig.context.readPixelsAsync(ReadRequest{ .region = region(0, 0, 1, 1) });
        assert(pending.hasValue());
        PendingReadback readback = std::move(pending.value());
        assert(!readback.isReady());

        assert(rig.context.flush().hasValue());
        assert(!readback.isReady());
        auto early = readback.wait(std::chrono::milliseconds(10));
        assert(!early.hasValue());
        assert(early.error() == ErrorCode::SynchronizationTimeout);

        rig.recorder.device.retireAll();
        assert(readback.isReady());
        auto taken = readback.take();
        assert(taken.hasValue());
        assert(pixelIs(taken.value(), 0, 255, 255, 255, 255));

        auto again = readback.take();
        assert(!again.hasValue());
    }

    // Bad requests fail before anything is queued.
    {
        ContextRig rig{};
        ResourceRegistry& registry = rig.context.resources();
        const Handle buffer = makeVertexBuffer(registry, 3);
        static_cast<void>(rig.flushAndTake());

        auto outside = rig.context.readPixels(ReadRequest{ .region = region(1270, 0, 20, 1) });
        assert(!outside.hasValue());
        assert(hasTag(outside.context(), "readback_region_out_of_bounds"));

        auto compressed = rig.context.readPixels(ReadRequest{ .region = region(0, 0, 4, 4), .format = TextureFormat::BC1 });
        assert(!compressed.hasValue());
        assert(hasTag(compressed.context(), "readback_format_unsupported"));

        auto fromBuffer = rig.context.readPixels(ReadRequest{ .source = buffer, .region = region(0, 0, 1, 1) });
        assert(!fromBuffer.hasValue());
        assert(fromBuffer.error() == ErrorCode::InvalidHandle);

        assert(rig.flushAndTake().empty());
    }

    return 0;
}
