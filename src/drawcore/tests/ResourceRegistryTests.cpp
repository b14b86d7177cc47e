#include <cassert>
#include <chrono>
#include <cstddef>
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
        request.uniforms["color"] = UniformValue{ glm::vec4(1.0F, 0.0F, 0.0F, 1.0F) };
        return request;
    }

} // namespace

int main()
{
    // Creation checks the descriptor against the capability set before queueing anything.
    {
        ContextRig rig{};
        ResourceRegistry& registry = rig.context.resources();

        auto zero = registry.createBuffer(BufferDesc{ .size = 0 });
        assert(!zero.hasValue());
        assert(zero.error() == ErrorCode::ResourceCreation);
        assert(hasTag(zero.context(), "zero_sized_buffer"));

        auto huge = registry.createTexture(TextureDesc{ .width = 1u << 20, .height = 4 });
        assert(!huge.hasValue());
        assert(hasTag(huge.context(), "texture_too_large"));

        auto cube = registry.createTexture(TextureDesc{ .target = TextureTarget::Cube, .width = 64, .height = 32, .depth = 6 });
        assert(!cube.hasValue());
        assert(hasTag(cube.context(), "cube_not_square"));

        auto noReflection = registry.createProgram(ProgramDesc{});
        assert(!noReflection.hasValue());
        assert(hasTag(noReflection.context(), "missing_reflection"));

        assert(registry.liveCount() == 0);
        const auto commands = rig.flushAndTake();
        assert(commands.empty());
    }

    // Handles carry their kind and generation; a destroyed handle stays dead.
    {
        ContextRig rig{ inlineConfig(), HeadlessDevice::RetireMode::Manual };
        ResourceRegistry& registry = rig.context.resources();

        const Handle buffer = makeVertexBuffer(registry, 3);
        assert(registry.isLive(buffer));
        assert(buffer.kind == ResourceKind::Buffer);

        auto described = registry.describe(buffer);
        assert(described.hasValue());
        assert(described.value().byteSize == 36);
        const StorageId storage = described.value().storage;

        static_cast<void>(rig.flushAndTake());
        assert(rig.recorder.device.hasStorage(storage));

        Handle asTexture = buffer;
        asTexture.kind = ResourceKind::Texture;
        auto wrongKind = registry.describe(asTexture);
        assert(!wrongKind.hasValue());
        assert(wrongKind.error() == ErrorCode::InvalidHandle);

        assert(registry.destroy(buffer).hasValue());
        assert(!registry.isLive(buffer));
        assert(registry.liveCount() == 0);

        auto stale = registry.describe(buffer);
        assert(!stale.hasValue());
        assert(hasTag(stale.context(), "stale_handle"));

        auto twice = registry.destroy(buffer);
        assert(!twice.hasValue());
        assert(twice.error() == ErrorCode::InvalidHandle);

        // Storage outlives the handle until the covering fence retires.
        assert(registry.pendingReleaseCount() > 0);
        assert(rig.context.present().hasValue());
        static_cast<void>(rig.flushAndTake());
        assert(rig.recorder.device.hasStorage(storage));
        assert(registry.pendingReleaseCount() > 0);

        rig.recorder.device.retireAll();
        assert(rig.context.present().hasValue());
        static_cast<void>(rig.flushAndTake());
        assert(!rig.recorder.device.hasStorage(storage));
        assert(registry.pendingReleaseCount() == 0);
        assert(registry.stats().storageReleased == 1);

        // The slot comes back with a new generation; the old handle still resolves as stale.
        const Handle reused = makeVertexBuffer(registry, 3);
        assert(reused.index == buffer.index);
        assert(reused.generation != buffer.generation);
        assert(!registry.isLive(buffer));
        assert(registry.isLive(reused));
    }

    // A busy dynamic buffer is rewritten into fresh storage; the handle does not change.
    {
        ContextRig rig{ inlineConfig(), HeadlessDevice::RetireMode::Manual };
        ResourceRegistry& registry = rig.context.resources();

        const Handle program = valueOrThrow(registry.createProgram(ProgramDesc{ .reflection = colorProgram() }));
        std::vector<std::byte> initial(36, std::byte{ 1 });
        const Handle dynamic = valueOrThrow(registry.createBuffer(BufferDesc{ .size = 36, .usage = BufferUsage::Dynamic }, initial));
        const StorageId before = valueOrThrow(registry.storageOf(dynamic));

        assert(rig.context.draw(colorDraw(program, dynamic)).hasValue());
        assert(!valueOrThrow(rig.context.isBufferAvailable(dynamic, ByteRange{ 0, 36 }, AccessMode::Write)));

        std::vector<std::byte> next(12, std::byte{ 7 });
        assert(registry.writeBuffer(dynamic, 12, next).hasValue());
        const StorageId after = valueOrThrow(registry.storageOf(dynamic));
        assert(after != before);
        assert(registry.isLive(dynamic));
        assert(registry.stats().reallocations == 1);

        static_cast<void>(rig.flushAndTake());
        const auto bytes = rig.recorder.device.storageBytes(after);
        assert(bytes.has_value());
        assert((*bytes)[0] == std::byte{ 1 });
        assert((*bytes)[12] == std::byte{ 7 });
        assert((*bytes)[24] == std::byte{ 1 });
    }

    // A busy static buffer waits; with nothing retiring, the wait times out and can be retried.
    {
        ContextRig rig{ inlineConfig(), HeadlessDevice::RetireMode::Manual };
        ResourceRegistry& registry = rig.context.resources();

        const Handle program = valueOrThrow(registry.createProgram(ProgramDesc{ .reflection = colorProgram() }));
        const Handle vertices = makeVertexBuffer(registry, 3);
        assert(rig.context.draw(colorDraw(program, vertices)).hasValue());

        std::vector<std::byte> data(12, std::byte{ 3 });
        auto timedOut = registry.writeBuffer(vertices, 0, data, std::chrono::milliseconds(20));
        assert(!timedOut.hasValue());
        assert(timedOut.error() == ErrorCode::SynchronizationTimeout);
        assert(timedOut.context().retryable);

        rig.recorder.device.retireAll();
        assert(registry.writeBuffer(vertices, 0, data).hasValue());
        assert(registry.stats().reallocations == 0);

        auto outOfBounds = registry.writeBuffer(vertices, 30, data);
        assert(!outOfBounds.hasValue());
        assert(hasTag(outOfBounds.context(), "write_out_of_bounds"));
    }

    // Buffer readback returns what was written.
    {
        ContextRig rig{};
        ResourceRegistry& registry = rig.context.resources();

        std::vector<std::byte> initial(16);
        for (std::size_t i = 0; i < initial.size(); ++i) {
            initial[i] = static_cast<std::byte>(i);
        }
        const Handle buffer = valueOrThrow(registry.createBuffer(BufferDesc{ .size = 16, .usage = BufferUsage::Static }, initial));
        auto read = registry.readBuffer(buffer, ByteRange{ 4, 8 });
        assert(read.hasValue());
        assert(read.value().size() == 4);
        assert(read.value()[0] == std::byte{ 4 });
        assert(read.value()[3] == std::byte{ 7 });

        auto past = registry.readBuffer(buffer, ByteRange{ 8, 32 });
        assert(!past.hasValue());
        assert(hasTag(past.context(), "read_out_of_bounds"));
    }

    // Writes to disjoint halves of one buffer are fenced separately: once the first write
    // retires, its half is free even though the second write is still in flight.
    {
        ContextRig rig{ inlineConfig(), HeadlessDevice::RetireMode::Manual };
        ResourceRegistry& registry = rig.context.resources();
        const Handle buffer = valueOrThrow(registry.createBuffer(BufferDesc{ .size = 1024, .usage = BufferUsage::Dynamic }));
        const StorageId storage = valueOrThrow(registry.storageOf(buffer));
        static_cast<void>(rig.flushAndTake());

        const std::vector<std::byte> low(512, std::byte{ 1 });
        const std::vector<std::byte> high(512, std::byte{ 2 });
        assert(registry.writeBuffer(buffer, 0, low).hasValue());
        const uint64_t afterLow = valueOrThrow(rig.context.insertFence());
        assert(registry.writeBuffer(buffer, 512, high).hasValue());
        assert(rig.context.flush().hasValue());

        // Both writes went into the same storage; neither forced a reallocation.
        assert(valueOrThrow(registry.storageOf(buffer)) == storage);
        assert(registry.stats().inPlaceWrites == 2);
        assert(registry.stats().reallocations == 0);

        rig.recorder.device.retire(afterLow);
        assert(valueOrThrow(rig.context.isBufferAvailable(buffer, ByteRange{ 0, 512 }, AccessMode::Read)));
        assert(!valueOrThrow(rig.context.isBufferAvailable(buffer, ByteRange{ 512, 1024 }, AccessMode::Read)));
        assert(!valueOrThrow(rig.context.isBufferAvailable(buffer, ByteRange{ 0, 1024 }, AccessMode::Read)));

        const uint64_t timeoutsBefore = rig.context.stats().fences.timeouts;
        assert(rig.context.waitForBuffer(buffer, ByteRange{ 0, 512 }, AccessMode::Read, std::chrono::milliseconds(20)).hasValue());
        assert(rig.context.stats().fences.timeouts == timeoutsBefore);

        auto busy = rig.context.waitForBuffer(buffer, ByteRange{ 512, 1024 }, AccessMode::Read, std::chrono::milliseconds(20));
        assert(!busy.hasValue());
        assert(busy.error() == ErrorCode::SynchronizationTimeout);

        rig.recorder.device.retireAll();
        assert(valueOrThrow(rig.context.isBufferAvailable(buffer, ByteRange{ 512, 1024 }, AccessMode::Read)));
        const auto bytes = rig.recorder.device.storageBytes(storage);
        assert(bytes.has_value());
        assert((*bytes)[511] == std::byte{ 1 });
        assert((*bytes)[512] == std::byte{ 2 });
    }

    // A mapped write waits only on its own sub-range and is tracked once it lands.
    {
        ContextRig rig{ inlineConfig(), HeadlessDevice::RetireMode::Manual };
        ResourceRegistry& registry = rig.context.resources();
        const Handle program = valueOrThrow(registry.createProgram(ProgramDesc{ .reflection = colorProgram() }));
        const Handle mapped = valueOrThrow(registry.createBuffer(BufferDesc{ .size = 72, .usage = BufferUsage::Persistent, .bindFlags = BufferBindVertex }));
        const StorageId storage = valueOrThrow(registry.storageOf(mapped));

        // The draw reads the first 36 bytes only.
        assert(rig.context.draw(colorDraw(program, mapped)).hasValue());
        assert(rig.context.flush().hasValue());
        assert(!valueOrThrow(rig.context.isBufferAvailable(mapped, ByteRange{ 0, 36 }, AccessMode::Write)));

        const std::vector<std::byte> tail(36, std::byte{ 9 });
        assert(registry.writeBuffer(mapped, 36, tail, std::chrono::milliseconds(20)).hasValue());

        const std::vector<std::byte> head(12, std::byte{ 4 });
        auto blocked = registry.writeBuffer(mapped, 0, head, std::chrono::milliseconds(20));
        assert(!blocked.hasValue());
        assert(blocked.error() == ErrorCode::SynchronizationTimeout);

        rig.recorder.device.retireAll();
        assert(registry.writeBuffer(mapped, 0, head).hasValue());
        assert(registry.stats().mappedWrites == 2);
        assert(rig.context.stats().fences.hostWrites == 2);
        assert(valueOrThrow(rig.context.isBufferAvailable(mapped, ByteRange{ 0, 72 }, AccessMode::Write)));
        assert(valueOrThrow(rig.context.isBufferAvailable(mapped, ByteRange{ 0, 72 }, AccessMode::Read)));

        // The device sees the mapping directly, with no queued write.
        const auto bytes = rig.recorder.device.storageBytes(storage);
        assert(bytes.has_value());
        assert((*bytes)[0] == std::byte{ 4 });
        assert((*bytes)[36] == std::byte{ 9 });
        assert(rig.recorder.count<BufferWriteCmd>() == 0);
    }

    // Resizing keeps the common prefix in new storage; invalidating drops the contents.
    {
        ContextRig rig{};
        ResourceRegistry& registry = rig.context.resources();

        std::vector<std::byte> initial(8, std::byte{ 5 });
        const Handle buffer = valueOrThrow(registry.createBuffer(BufferDesc{ .size = 8, .usage = BufferUsage::Dynamic }, initial));
        const StorageId first = valueOrThrow(registry.storageOf(buffer));

        assert(registry.resizeBuffer(buffer, 16).hasValue());
        const StorageId resized = valueOrThrow(registry.storageOf(buffer));
        assert(resized != first);
        assert(valueOrThrow(registry.describe(buffer)).byteSize == 16);

        auto grown = registry.readBuffer(buffer, ByteRange{ 0, 16 });
        assert(grown.hasValue());
        assert(grown.value()[7] == std::byte{ 5 });
        assert(grown.value()[8] == std::byte{ 0 });

        assert(registry.invalidateBuffer(buffer).hasValue());
        assert(valueOrThrow(registry.storageOf(buffer)) != resized);
        auto cleared = registry.readBuffer(buffer, ByteRange{ 0, 8 });
        assert(cleared.hasValue());
        assert(cleared.value()[0] == std::byte{ 0 });

        assert(!registry.resizeBuffer(buffer, 0).hasValue());
    }

    // Uploaded pixels land where the region says, honoring the source row alignment.
    {
        ContextRig rig{};
        ResourceRegistry& registry = rig.context.resources();
        const Handle texture = makeTexture(registry, 4, 4);

        TextureUpload upload{ .x = 1, .y = 2, .width = 2, .height = 1, .format = TextureFormat::RGBA8, .rowAlignment = 4 };
        upload.pixels = { std::byte{ 10 }, std::byte{ 20 }, std::byte{ 30 }, std::byte{ 40 },
            std::byte{ 50 }, std::byte{ 60 }, std::byte{ 70 }, std::byte{ 80 } };
        assert(registry.uploadTexture(texture, upload).hasValue());

        auto pixels = rig.context.readPixels(ReadRequest{ .source = texture, .region = Rect{ .origin = { 1, 2 }, .size = { 2, 1 } } });
        assert(pixels.hasValue());
        assert(pixels.value().size() == 8);
        assert(pixels.value()[0] == std::byte{ 10 });
        assert(pixels.value()[7] == std::byte{ 80 });

        TextureUpload outside = upload;
        outside.x = 3;
        auto rejected = registry.uploadTexture(texture, outside);
        assert(!rejected.hasValue());
        assert(hasTag(rejected.context(), "upload_region_out_of_bounds"));

        TextureUpload shortData = upload;
        shortData.pixels.resize(4);
        assert(hasTag(registry.uploadTexture(texture, shortData).context(), "upload_data_too_small"));
    }

    return 0;
}
