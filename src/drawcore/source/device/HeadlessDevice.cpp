#include <algorithm>
#include <cmath>
#include <cstring>
#include <string>
#include <utility>

#include <drawcore/device/HeadlessDevice.h>
#include <drawcore/state/StateDiff.h>

namespace drawcore {

    namespace {
        constexpr const char* kSubsystem = "headless_device";
        constexpr const char* kOp = "HeadlessDevice::execute";
        constexpr uint32_t kDefaultPixelBytes = 4;

        ErrorContext deviceError(const char* reason, std::string detail = {})
        {
            return makeError(kOp, ErrorCode::InvalidArgument, kSubsystem, reason, std::move(detail));
        }

        std::byte toUnorm8(float value)
        {
            const float clamped = std::clamp(value, 0.0F, 1.0F);
            return static_cast<std::byte>(static_cast<uint8_t>(std::lround(clamped * 255.0F)));
        }

        uint64_t levelOffset(const TextureDesc& desc, uint32_t level)
        {
            const bool layered = desc.target == TextureTarget::Tex2DArray || desc.target == TextureTarget::Cube;
            uint64_t offset = 0;
            for (uint32_t l = 0; l < level; ++l) {
                const uint32_t d = layered ? desc.depth : mipExtent(desc.depth, l);
                offset += regionByteSize(desc.format, mipExtent(desc.width, l), mipExtent(desc.height, l), d);
            }
            return offset;
        }

        // Paints level 0, layer 0 of an RGBA8 image, honoring the scissor and color mask.
        void paint(std::vector<std::byte>& pixels, uint32_t width, uint32_t height, const PipelineState& state, const glm::vec4& color)
        {
            int32_t x0 = 0;
            int32_t y0 = 0;
            int32_t x1 = static_cast<int32_t>(width);
            int32_t y1 = static_cast<int32_t>(height);
            if (state.scissor.has_value() && state.scissor->enabled) {
                const Rect& r = state.scissor->rect;
                x0 = std::max(x0, r.origin.x);
                y0 = std::max(y0, r.origin.y);
                x1 = std::min(x1, r.origin.x + r.size.x);
                y1 = std::min(y1, r.origin.y + r.size.y);
            }
            const std::byte rgba[4] = { toUnorm8(color.r), toUnorm8(color.g), toUnorm8(color.b), toUnorm8(color.a) };
            const bool mask[4] = { state.colorMask.r, state.colorMask.g, state.colorMask.b, state.colorMask.a };
            for (int32_t y = y0; y < y1; ++y) {
                for (int32_t x = x0; x < x1; ++x) {
                    const size_t base = (static_cast<size_t>(y) * width + static_cast<size_t>(x)) * kDefaultPixelBytes;
                    if (base + kDefaultPixelBytes > pixels.size()) {
                        return;
                    }
                    for (size_t c = 0; c < 4; ++c) {
                        if (mask[c]) {
                            pixels[base + c] = rgba[c];
                        }
                    }
                }
            }
        }
    }

    HeadlessDevice::HeadlessDevice(uint32_t textureUnits, uint32_t uniformBufferBindings, RetireMode mode)
        : retireMode_(mode)
        , state_(makeDefaultPipelineState(textureUnits, uniformBufferBindings))
    {
        defaultColor_.resize(static_cast<size_t>(defaultWidth_) * defaultHeight_ * kDefaultPixelBytes);
    }

    Expected<void> HeadlessDevice::execute(const Command& command)
    {
        CommandObserver observer;
        {
            std::lock_guard<std::mutex> lock(observerMutex_);
            observer = observer_;
        }
        if (observer) {
            observer(command);
        }

        std::lock_guard<std::mutex> lock(mutex_);
        if (lost_) {
            return makeError(kOp, ErrorCode::ContextLost, kSubsystem, "device_lost");
        }
        return executeLocked(command.payload);
    }

    Expected<void> HeadlessDevice::checkStorageLocked(StorageId storage, const char* what) const
    {
        if (storage_.find(storage) == storage_.end()) {
            return deviceError("unknown_storage", std::string(what) + " references storage " + std::to_string(storage));
        }
        return {};
    }

    Expected<void> HeadlessDevice::executeLocked(const CommandPayload& payload)
    {
        if (const auto* change = std::get_if<StateChangeCmd>(&payload)) {
            ++counters_.stateChanges;
            if (change->field == StateField::Uniform) {
                uniforms_.insert_or_assign({ state_.program, static_cast<int32_t>(change->slot) }, std::get<UniformValue>(change->value));
                return {};
            }
            if (change->field == StateField::Program || change->field == StateField::Framebuffer) {
                const StorageId target = std::get<StorageId>(change->value);
                if (target != kNullStorage) {
                    DRAWCORE_RETURN_IF_FAILED(checkStorageLocked(target, stateFieldToString(change->field)));
                }
            }
            applyStateChange(state_, *change);
            return {};
        }

        if (const auto* draw = std::get_if<DrawCmd>(&payload)) {
            if (state_.program == kNullStorage) {
                return deviceError("draw_without_program");
            }
            DRAWCORE_RETURN_IF_FAILED(checkStorageLocked(state_.program, "draw program"));
            for (const VertexAttributeBinding& attribute : state_.vertexLayout) {
                DRAWCORE_RETURN_IF_FAILED(checkStorageLocked(attribute.buffer, "vertex attribute"));
            }
            if (draw->indexed) {
                DRAWCORE_RETURN_IF_FAILED(checkStorageLocked(state_.indexBuffer.buffer, "index buffer"));
            }
            ++counters_.draws;
            return {};
        }

        if (const auto* clear = std::get_if<ClearCmd>(&payload)) {
            return clearLocked(*clear);
        }

        if (const auto* create = std::get_if<CreateStorageCmd>(&payload)) {
            if (storage_.find(create->storage) != storage_.end()) {
                return deviceError("storage_exists", std::to_string(create->storage));
            }
            Storage storage{};
            storage.kind = create->kind;
            storage.texture = create->texture;
            storage.attachments = create->attachments;
            storage.mapped = create->mapped;
            if (!storage.mapped) {
                storage.bytes.resize(static_cast<size_t>(create->byteSize));
                std::copy_n(create->initialData.begin(), std::min(create->initialData.size(), storage.bytes.size()), storage.bytes.begin());
            }
            storage_.emplace(create->storage, std::move(storage));
            ++counters_.storageCreated;
            return {};
        }

        if (const auto* release = std::get_if<ReleaseStorageCmd>(&payload)) {
            if (storage_.erase(release->storage) == 0) {
                return deviceError("release_of_unknown_storage", std::to_string(release->storage));
            }
            ++counters_.storageReleased;
            return {};
        }

        if (const auto* copy = std::get_if<CopyStorageCmd>(&payload)) {
            DRAWCORE_RETURN_IF_FAILED(checkStorageLocked(copy->source, "copy source"));
            DRAWCORE_RETURN_IF_FAILED(checkStorageLocked(copy->destination, "copy destination"));
            const std::vector<std::byte>& src = storage_.at(copy->source).data();
            std::vector<std::byte>& dst = storage_.at(copy->destination).data();
            if (copy->sourceOffset + copy->size > src.size() || copy->destinationOffset + copy->size > dst.size()) {
                return deviceError("copy_out_of_bounds");
            }
            std::memmove(dst.data() + copy->destinationOffset, src.data() + copy->sourceOffset, static_cast<size_t>(copy->size));
            return {};
        }

        if (const auto* write = std::get_if<BufferWriteCmd>(&payload)) {
            DRAWCORE_RETURN_IF_FAILED(checkStorageLocked(write->storage, "buffer write"));
            std::vector<std::byte>& dst = storage_.at(write->storage).data();
            if (write->offset + write->data.size() > dst.size()) {
                return deviceError("write_out_of_bounds");
            }
            std::copy(write->data.begin(), write->data.end(), dst.begin() + static_cast<std::ptrdiff_t>(write->offset));
            return {};
        }

        if (const auto* upload = std::get_if<TextureUploadCmd>(&payload)) {
            return uploadLocked(*upload);
        }

        if (const auto* read = std::get_if<ReadBufferCmd>(&payload)) {
            DRAWCORE_RETURN_IF_FAILED(checkStorageLocked(read->storage, "buffer read"));
            const std::vector<std::byte>& src = storage_.at(read->storage).data();
            if (read->offset + read->size > src.size()) {
                return deviceError("read_out_of_bounds");
            }
            const auto first = src.begin() + static_cast<std::ptrdiff_t>(read->offset);
            read->slot->data.assign(first, first + static_cast<std::ptrdiff_t>(read->size));
            read->slot->filled.store(true, std::memory_order_release);
            return {};
        }

        if (const auto* read = std::get_if<ReadPixelsCmd>(&payload)) {
            return readPixelsLocked(*read);
        }

        if (const auto* signal = std::get_if<SignalFenceCmd>(&payload)) {
            signalLocked(signal->value);
            return {};
        }

        if (std::holds_alternative<PresentCmd>(payload)) {
            ++counters_.presents;
            return {};
        }
        return deviceError("unknown_command");
    }

    Expected<void> HeadlessDevice::clearLocked(const ClearCmd& clear)
    {
        ++counters_.clears;
        if (!clear.color.has_value()) {
            return {};
        }
        if (state_.framebuffer == kNullStorage) {
            paint(defaultColor_, defaultWidth_, defaultHeight_, state_, *clear.color);
            return {};
        }

        DRAWCORE_RETURN_IF_FAILED(checkStorageLocked(state_.framebuffer, "clear target"));
        for (StorageId attachment : storage_.at(state_.framebuffer).attachments) {
            DRAWCORE_RETURN_IF_FAILED(checkStorageLocked(attachment, "clear attachment"));
            Storage& texture = storage_.at(attachment);
            if (!texture.texture.has_value() || formatByteSize(texture.texture->format) != kDefaultPixelBytes
                || !isColor(texture.texture->format) || sampleClass(texture.texture->format) != SampleClass::Float) {
                continue;
            }
            paint(texture.bytes, texture.texture->width, texture.texture->height, state_, *clear.color);
        }
        return {};
    }

    Expected<void> HeadlessDevice::uploadLocked(const TextureUploadCmd& upload)
    {
        DRAWCORE_RETURN_IF_FAILED(checkStorageLocked(upload.storage, "texture upload"));
        Storage& storage = storage_.at(upload.storage);
        if (!storage.texture.has_value()) {
            return deviceError("upload_to_non_texture");
        }
        const TextureDesc& desc = *storage.texture;
        const TextureUpload& region = upload.upload;
        if (isCompressed(desc.format)) {
            // Block data is opaque here; only the size was checked on the way in.
            return {};
        }

        const uint32_t bpp = formatByteSize(desc.format);
        const uint32_t levelWidth = mipExtent(desc.width, region.mipLevel);
        const uint32_t levelHeight = mipExtent(desc.height, region.mipLevel);
        const uint64_t base = levelOffset(desc, region.mipLevel);
        const uint64_t srcPitch = alignedRowPitch(region.format, region.width, region.rowAlignment);
        const uint64_t rowBytes = uint64_t{ region.width } * bpp;

        for (uint32_t z = 0; z < region.depth; ++z) {
            for (uint32_t y = 0; y < region.height; ++y) {
                const uint64_t src = (uint64_t{ z } * region.height + y) * srcPitch;
                const uint64_t dst = base
                    + ((uint64_t{ region.z + z } * levelHeight + region.y + y) * levelWidth + region.x) * bpp;
                if (src + rowBytes > region.pixels.size() || dst + rowBytes > storage.bytes.size()) {
                    return deviceError("upload_out_of_bounds");
                }
                std::memcpy(storage.bytes.data() + dst, region.pixels.data() + src, static_cast<size_t>(rowBytes));
            }
        }
        return {};
    }

    Expected<void> HeadlessDevice::readPixelsLocked(const ReadPixelsCmd& read)
    {
        const std::vector<std::byte>* pixels = &defaultColor_;
        uint32_t width = defaultWidth_;
        uint32_t height = defaultHeight_;
        uint32_t bpp = kDefaultPixelBytes;

        if (read.source != kNullStorage) {
            DRAWCORE_RETURN_IF_FAILED(checkStorageLocked(read.source, "readback source"));
            StorageId textureStorage = read.source;
            if (read.sourceKind == ResourceKind::Framebuffer) {
                const Storage& framebuffer = storage_.at(read.source);
                if (framebuffer.attachments.empty()) {
                    return deviceError("readback_without_attachment");
                }
                textureStorage = framebuffer.attachments.front();
                DRAWCORE_RETURN_IF_FAILED(checkStorageLocked(textureStorage, "readback attachment"));
            }
            const Storage& texture = storage_.at(textureStorage);
            if (!texture.texture.has_value()) {
                return deviceError("readback_from_non_texture");
            }
            pixels = &texture.bytes;
            width = texture.texture->width;
            height = texture.texture->height;
            bpp = formatByteSize(texture.texture->format);
        }

        if (formatByteSize(read.format) != bpp) {
            return deviceError("readback_format_mismatch", textureFormatToString(read.format));
        }
        const Rect& r = read.region;
        if (r.origin.x < 0 || r.origin.y < 0 || r.size.x <= 0 || r.size.y <= 0
            || static_cast<uint32_t>(r.origin.x + r.size.x) > width || static_cast<uint32_t>(r.origin.y + r.size.y) > height) {
            return deviceError("readback_region_out_of_bounds");
        }

        std::vector<std::byte> out{};
        out.reserve(static_cast<size_t>(r.size.x) * static_cast<size_t>(r.size.y) * bpp);
        for (int32_t y = r.origin.y; y < r.origin.y + r.size.y; ++y) {
            const size_t row = (static_cast<size_t>(y) * width + static_cast<size_t>(r.origin.x)) * bpp;
            const size_t bytes = static_cast<size_t>(r.size.x) * bpp;
            if (row + bytes > pixels->size()) {
                return deviceError("readback_region_out_of_bounds");
            }
            out.insert(out.end(), pixels->begin() + static_cast<std::ptrdiff_t>(row), pixels->begin() + static_cast<std::ptrdiff_t>(row + bytes));
        }
        read.slot->data = std::move(out);
        read.slot->filled.store(true, std::memory_order_release);
        return {};
    }

    void HeadlessDevice::signalLocked(uint64_t value)
    {
        signalled_ = std::max(signalled_, value);
        if (retireMode_ == RetireMode::Immediate) {
            completed_ = signalled_;
            retired_.notify_all();
        }
    }

    Expected<uint64_t> HeadlessDevice::completedValue()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (lost_) {
            return makeError("HeadlessDevice::completedValue", ErrorCode::ContextLost, kSubsystem, "device_lost");
        }
        return completed_;
    }

    Expected<bool> HeadlessDevice::wait(uint64_t value, std::chrono::nanoseconds timeout)
    {
        std::unique_lock<std::mutex> lock(mutex_);
        retired_.wait_for(lock, timeout, [&]() { return lost_ || completed_ >= value; });
        if (lost_) {
            return makeError("HeadlessDevice::wait", ErrorCode::ContextLost, kSubsystem, "device_lost");
        }
        return completed_ >= value;
    }

    void HeadlessDevice::retire(uint64_t value)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        completed_ = std::max(completed_, std::min(value, signalled_));
        retired_.notify_all();
    }

    void HeadlessDevice::retireAll()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        completed_ = signalled_;
        retired_.notify_all();
    }

    uint64_t HeadlessDevice::signalledValue() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return signalled_;
    }

    void HeadlessDevice::loseContext()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        lost_ = true;
        retired_.notify_all();
    }

    bool HeadlessDevice::contextLost() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return lost_;
    }

    void HeadlessDevice::resizeDefaultFramebuffer(uint32_t width, uint32_t height)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        defaultWidth_ = width;
        defaultHeight_ = height;
        defaultColor_.assign(static_cast<size_t>(width) * height * kDefaultPixelBytes, std::byte{ 0 });
    }

    void HeadlessDevice::setCommandObserver(CommandObserver observer)
    {
        std::lock_guard<std::mutex> lock(observerMutex_);
        observer_ = std::move(observer);
    }

    PipelineState HeadlessDevice::state() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return state_;
    }

    std::optional<UniformValue> HeadlessDevice::uniform(StorageId program, int32_t location) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = uniforms_.find({ program, location });
        if (it == uniforms_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    bool HeadlessDevice::hasStorage(StorageId storage) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return storage_.find(storage) != storage_.end();
    }

    std::size_t HeadlessDevice::storageCount() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return storage_.size();
    }

    std::optional<std::vector<std::byte>> HeadlessDevice::storageBytes(StorageId storage) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = storage_.find(storage);
        if (it == storage_.end()) {
            return std::nullopt;
        }
        return it->second.data();
    }

    HeadlessDevice::Counters HeadlessDevice::counters() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return counters_;
    }

} // namespace drawcore
