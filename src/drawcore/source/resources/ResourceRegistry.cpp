#include <algorithm>
#include <cstring>
#include <string>
#include <utility>

#include <drawcore/resources/ResourceRegistry.h>

namespace drawcore {

    namespace {
        constexpr const char* kSubsystem = "resource_registry";

        ErrorContext creationError(const char* operation, const char* reason, std::string detail = {})
        {
            return makeError(operation, ErrorCode::ResourceCreation, kSubsystem, reason, std::move(detail));
        }

        ErrorContext argumentError(const char* operation, const char* reason, std::string detail = {}, uint64_t handle = 0)
        {
            return makeError(operation, ErrorCode::InvalidArgument, kSubsystem, reason, std::move(detail), handle);
        }

        ByteRange wholeRange(uint64_t size)
        {
            return ByteRange{ 0, size };
        }
    }

    ResourceRegistry::ResourceRegistry(const DeviceCapabilities& capabilities,
        CommandQueue& queue,
        FenceTracker& fences,
        RewritePolicy rewritePolicy,
        DeletionQueue::RetryPolicy releaseRetry)
        : caps_(capabilities)
        , queue_(queue)
        , fences_(fences)
        , rewritePolicy_(rewritePolicy)
    {
        releases_.setRetryPolicy(releaseRetry);
        releases_.setFailureEscalationHook([](const DeletionQueue::FailureEscalationEvent& event) {
            DiagnosticMessage msg{};
            msg.severity = Severity::Error;
            msg.subsystem = kSubsystem;
            msg.operation = "ResourceRegistry::collect";
            msg.code = event.lastError;
            msg.text = "dropping storage release behind fence " + std::to_string(event.fenceValue)
                + " after " + std::to_string(event.retryCount) + " attempts";
            reportDiagnostic(std::move(msg));
        });
    }

    Expected<void> ResourceRegistry::checkAlive(const char* operation) const
    {
        if (lost_.load(std::memory_order_acquire) || fences_.contextLost()) {
            return makeError(operation, ErrorCode::ContextLost, kSubsystem, "context_lost");
        }
        return {};
    }

    Expected<ResourceRegistry::Slot*> ResourceRegistry::resolveLocked(Handle handle, ResourceKind kind, const char* operation)
    {
        const auto* constThis = this;
        auto resolved = constThis->resolveLocked(handle, kind, operation);
        if (!resolved.hasValue()) {
            return resolved.context();
        }
        return const_cast<Slot*>(resolved.value());
    }

    Expected<const ResourceRegistry::Slot*> ResourceRegistry::resolveLocked(Handle handle, ResourceKind kind, const char* operation) const
    {
        if (handle.isNull() || handle.index >= slots_.size()) {
            return makeError(operation, ErrorCode::InvalidHandle, kSubsystem, "unknown_handle", {}, handle.packed());
        }
        const Slot& slot = slots_[handle.index];
        if (!slot.live || slot.generation != handle.generation) {
            return makeError(operation, ErrorCode::InvalidHandle, kSubsystem, "stale_handle", {}, handle.packed());
        }
        if (slot.record.handle.kind != kind || handle.kind != kind) {
            return makeError(operation, ErrorCode::InvalidHandle, kSubsystem, "wrong_resource_kind",
                std::string("expected ") + resourceKindToString(kind) + ", got " + resourceKindToString(slot.record.handle.kind),
                handle.packed());
        }
        return &slot;
    }

    Handle ResourceRegistry::allocateSlotLocked(ResourceKind kind, ResourceDescriptor record)
    {
        uint32_t index = 0;
        if (!freeList_.empty()) {
            index = freeList_.back();
            freeList_.pop_back();
        }
        else {
            index = static_cast<uint32_t>(slots_.size());
            slots_.emplace_back();
        }

        Slot& slot = slots_[index];
        const Handle handle{ .index = index, .generation = slot.generation, .kind = kind };
        record.handle = handle;
        slot.record = std::move(record);
        slot.live = true;
        ++liveCount_;
        ++stats_.created;
        return handle;
    }

    Expected<Handle> ResourceRegistry::finishCreateLocked(ResourceKind kind, ResourceDescriptor record, CreateStorageCmd create)
    {
        const StorageId storage = nextStorage_++;
        record.storage = storage;
        create.storage = storage;
        create.kind = kind;
        std::shared_ptr<std::vector<std::byte>> mapped = create.mapped;

        auto pushed = queue_.push(std::move(create));
        if (!pushed.hasValue()) {
            return pushed.context();
        }

        const Handle handle = allocateSlotLocked(kind, std::move(record));
        slots_[handle.index].mapped = std::move(mapped);
        return handle;
    }

    Expected<Handle> ResourceRegistry::createBuffer(const BufferDesc& desc, std::span<const std::byte> initialData)
    {
        constexpr const char* kOp = "ResourceRegistry::createBuffer";
        DRAWCORE_RETURN_IF_FAILED(checkAlive(kOp));

        if (desc.size == 0) {
            return creationError(kOp, "zero_sized_buffer");
        }
        if (desc.size > caps_.maxBufferSize) {
            return creationError(kOp, "buffer_too_large",
                std::to_string(desc.size) + " bytes exceeds limit " + std::to_string(caps_.maxBufferSize));
        }
        if (desc.usage == BufferUsage::Persistent && !caps_.persistentMapping) {
            return creationError(kOp, "persistent_mapping_unsupported");
        }
        if (initialData.size() > desc.size) {
            return creationError(kOp, "initial_data_too_large");
        }

        ResourceDescriptor record{};
        record.desc = desc;
        record.byteSize = desc.size;

        CreateStorageCmd create{};
        create.byteSize = desc.size;
        if (desc.usage == BufferUsage::Persistent) {
            create.mapped = std::make_shared<std::vector<std::byte>>(static_cast<size_t>(desc.size));
            std::copy(initialData.begin(), initialData.end(), create.mapped->begin());
        }
        else {
            create.initialData.assign(initialData.begin(), initialData.end());
        }

        std::lock_guard<std::mutex> lock(mutex_);
        return finishCreateLocked(ResourceKind::Buffer, std::move(record), std::move(create));
    }

    Expected<Handle> ResourceRegistry::createTexture(const TextureDesc& desc)
    {
        constexpr const char* kOp = "ResourceRegistry::createTexture";
        DRAWCORE_RETURN_IF_FAILED(checkAlive(kOp));

        if (desc.width == 0 || desc.height == 0 || desc.depth == 0) {
            return creationError(kOp, "zero_sized_texture");
        }
        if (desc.mipLevels == 0) {
            return creationError(kOp, "zero_mip_levels");
        }
        if (isCompressed(desc.format) && !caps_.compressedTextures) {
            return creationError(kOp, "compressed_format_unsupported", textureFormatToString(desc.format));
        }

        switch (desc.target) {
        case TextureTarget::Tex2D:
            if (desc.depth != 1) {
                return creationError(kOp, "invalid_depth_for_2d");
            }
            if (desc.width > caps_.maxTextureSize || desc.height > caps_.maxTextureSize) {
                return creationError(kOp, "texture_too_large");
            }
            break;
        case TextureTarget::Tex2DArray:
            if (desc.width > caps_.maxTextureSize || desc.height > caps_.maxTextureSize || desc.depth > caps_.maxArrayLayers) {
                return creationError(kOp, "texture_too_large");
            }
            break;
        case TextureTarget::Tex3D:
            if (desc.width > caps_.max3DTextureSize || desc.height > caps_.max3DTextureSize || desc.depth > caps_.max3DTextureSize) {
                return creationError(kOp, "texture_too_large");
            }
            if (!isColor(desc.format) || isCompressed(desc.format)) {
                return creationError(kOp, "format_unsupported_for_3d", textureFormatToString(desc.format));
            }
            break;
        case TextureTarget::Cube:
            if (desc.width != desc.height) {
                return creationError(kOp, "cube_not_square");
            }
            if (desc.depth != 6) {
                return creationError(kOp, "cube_requires_six_faces");
            }
            if (desc.width > caps_.maxCubeTextureSize) {
                return creationError(kOp, "texture_too_large");
            }
            break;
        default:
            return creationError(kOp, "unknown_texture_target");
        }

        const bool layered = desc.target == TextureTarget::Tex2DArray || desc.target == TextureTarget::Cube;
        const uint32_t fullChain = fullMipChain(desc.width, desc.height, layered ? 1u : desc.depth);
        if (desc.mipLevels > fullChain) {
            return creationError(kOp, "too_many_mip_levels",
                std::to_string(desc.mipLevels) + " requested, full chain is " + std::to_string(fullChain));
        }

        if (desc.samples != 1) {
            if (!caps_.multisample || !caps_.supportsSampleCount(desc.samples)) {
                return creationError(kOp, "sample_count_unsupported", std::to_string(desc.samples));
            }
            if (desc.mipLevels != 1) {
                return creationError(kOp, "multisample_with_mips");
            }
            if (desc.target != TextureTarget::Tex2D || isCompressed(desc.format)) {
                return creationError(kOp, "multisample_target_unsupported");
            }
        }

        ResourceDescriptor record{};
        record.desc = desc;
        record.byteSize = textureByteSize(desc);

        CreateStorageCmd create{};
        create.byteSize = record.byteSize;
        create.texture = desc;

        std::lock_guard<std::mutex> lock(mutex_);
        return finishCreateLocked(ResourceKind::Texture, std::move(record), std::move(create));
    }

    Expected<Handle> ResourceRegistry::createProgram(const ProgramDesc& desc)
    {
        constexpr const char* kOp = "ResourceRegistry::createProgram";
        DRAWCORE_RETURN_IF_FAILED(checkAlive(kOp));

        if (!desc.reflection) {
            return creationError(kOp, "missing_reflection");
        }
        const ProgramReflection& reflection = *desc.reflection;
        if (reflection.attributes.size() > caps_.maxVertexAttributes) {
            return creationError(kOp, "too_many_attributes");
        }
        for (const AttributeInfo& attribute : reflection.attributes) {
            if (attribute.location >= caps_.maxVertexAttributes) {
                return creationError(kOp, "attribute_location_out_of_range", attribute.name);
            }
        }
        for (const UniformBlockInfo& block : reflection.uniformBlocks) {
            if (block.binding >= caps_.maxUniformBufferBindings) {
                return creationError(kOp, "uniform_block_binding_out_of_range", block.name);
            }
        }
        if (reflection.hasTessellation && !caps_.tessellation) {
            return creationError(kOp, "tessellation_unsupported");
        }

        ResourceDescriptor record{};
        record.desc = desc;

        std::lock_guard<std::mutex> lock(mutex_);
        return finishCreateLocked(ResourceKind::Program, std::move(record), CreateStorageCmd{});
    }

    Expected<Handle> ResourceRegistry::createFramebuffer(const FramebufferDesc& desc)
    {
        constexpr const char* kOp = "ResourceRegistry::createFramebuffer";
        DRAWCORE_RETURN_IF_FAILED(checkAlive(kOp));

        if (desc.colorAttachments.empty() && !desc.depthAttachment.has_value() && !desc.stencilAttachment.has_value()) {
            return creationError(kOp, "empty_framebuffer");
        }
        if (desc.colorAttachments.size() > caps_.maxColorAttachments) {
            return creationError(kOp, "too_many_color_attachments");
        }

        std::lock_guard<std::mutex> lock(mutex_);

        ResourceDescriptor record{};
        record.desc = desc;
        record.target = RenderTargetInfo{
            .width = UINT32_MAX,
            .height = UINT32_MAX,
            .samples = 0,
            .colorAttachmentCount = static_cast<uint32_t>(desc.colorAttachments.size()),
            .hasDepth = false,
            .hasStencil = false
        };

        enum class Role : uint8_t { Color, Depth, Stencil };
        const auto attach = [&](const FramebufferAttachment& attachment, Role role) -> Expected<void> {
            auto resolved = resolveLocked(attachment.texture, ResourceKind::Texture, kOp);
            if (!resolved.hasValue()) {
                return creationError(kOp, "dead_attachment");
            }
            const Slot* slot = resolved.value();
            const TextureDesc& tex = *slot->record.texture();
            if (attachment.mipLevel >= tex.mipLevels) {
                return creationError(kOp, "attachment_mip_out_of_range");
            }
            if (attachment.layer >= tex.depth) {
                return creationError(kOp, "attachment_layer_out_of_range");
            }
            const bool formatOk = (role == Role::Color && isColor(tex.format) && !isCompressed(tex.format))
                || (role == Role::Depth && hasDepth(tex.format))
                || (role == Role::Stencil && hasStencil(tex.format));
            if (!formatOk) {
                return creationError(kOp, "attachment_format_mismatch", textureFormatToString(tex.format));
            }
            record.target.width = std::min(record.target.width, mipExtent(tex.width, attachment.mipLevel));
            record.target.height = std::min(record.target.height, mipExtent(tex.height, attachment.mipLevel));
            if (record.target.samples == 0) {
                record.target.samples = tex.samples;
            }
            record.target.hasDepth = record.target.hasDepth || hasDepth(tex.format);
            record.target.hasStencil = record.target.hasStencil || hasStencil(tex.format);
            record.attachmentStorage.push_back(slot->record.storage);
            return {};
        };

        for (const FramebufferAttachment& color : desc.colorAttachments) {
            DRAWCORE_RETURN_IF_FAILED(attach(color, Role::Color));
        }
        if (desc.depthAttachment.has_value()) {
            DRAWCORE_RETURN_IF_FAILED(attach(*desc.depthAttachment, Role::Depth));
        }
        if (desc.stencilAttachment.has_value()) {
            DRAWCORE_RETURN_IF_FAILED(attach(*desc.stencilAttachment, Role::Stencil));
        }

        CreateStorageCmd create{};
        create.attachments = record.attachmentStorage;
        return finishCreateLocked(ResourceKind::Framebuffer, std::move(record), std::move(create));
    }

    void ResourceRegistry::retireStorageLocked(StorageId storage, ResourceKind kind, uint64_t fenceValue)
    {
        releases_.enqueue(fenceValue, [this, storage, kind]() -> Expected<void> {
            {
                std::unique_lock<std::shared_mutex> exclusive(releaseMutex_);
                auto pushed = queue_.push(ReleaseStorageCmd{ .storage = storage, .kind = kind });
                if (!pushed.hasValue()) {
                    return pushed.context();
                }
            }
            fences_.forget(storage);

            ReleaseObserver observer;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                ++stats_.storageReleased;
                observer = releaseObserver_;
            }
            if (observer) {
                observer(storage, kind);
            }
            return {};
        });
    }

    Expected<void> ResourceRegistry::destroy(Handle handle)
    {
        constexpr const char* kOp = "ResourceRegistry::destroy";
        DRAWCORE_RETURN_IF_FAILED(checkAlive(kOp));

        std::lock_guard<std::mutex> lock(mutex_);
        auto resolved = resolveLocked(handle, handle.kind, kOp);
        if (!resolved.hasValue()) {
            return resolved.context();
        }
        Slot& slot = *resolved.value();

        // Everything queued so far may still use the storage; release behind a fresh fence.
        auto fence = queue_.insertFence();
        if (!fence.hasValue()) {
            return fence.context();
        }

        slot.live = false;
        --liveCount_;
        ++stats_.destroyed;

        const StorageId storage = slot.record.storage;
        const uint32_t index = handle.index;
        retireStorageLocked(storage, handle.kind, fence.value());
        releases_.enqueue(fence.value(), [this, index]() -> Expected<void> {
            std::lock_guard<std::mutex> slotLock(mutex_);
            Slot& retired = slots_[index];
            retired.generation = retired.generation == UINT32_MAX ? 1u : retired.generation + 1;
            retired.record = ResourceDescriptor{};
            retired.mapped.reset();
            freeList_.push_back(index);
            return {};
        });
        return {};
    }

    ResourceRegistry::RewritePath ResourceRegistry::rewritePathFor(BufferUsage usage) const noexcept
    {
        if (usage == BufferUsage::Persistent) {
            return RewritePath::Mapped;
        }
        switch (rewritePolicy_) {
        case RewritePolicy::AlwaysWait: return RewritePath::Wait;
        case RewritePolicy::AlwaysReallocate: return RewritePath::Reallocate;
        default: break;
        }
        return usage == BufferUsage::Dynamic ? RewritePath::Reallocate : RewritePath::Wait;
    }

    Expected<void> ResourceRegistry::writeBuffer(Handle handle,
        uint64_t offset,
        std::span<const std::byte> data,
        std::optional<std::chrono::nanoseconds> timeout)
    {
        constexpr const char* kOp = "ResourceRegistry::writeBuffer";
        DRAWCORE_RETURN_IF_FAILED(checkAlive(kOp));
        if (data.empty()) {
            return {};
        }

        StorageId storage = kNullStorage;
        BufferUsage usage = BufferUsage::Static;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto resolved = resolveLocked(handle, ResourceKind::Buffer, kOp);
            if (!resolved.hasValue()) {
                return resolved.context();
            }
            const Slot& slot = *resolved.value();
            if (offset + data.size() > slot.record.byteSize || offset + data.size() < offset) {
                return argumentError(kOp, "write_out_of_bounds",
                    "[" + std::to_string(offset) + ", " + std::to_string(offset + data.size()) + ") in buffer of "
                    + std::to_string(slot.record.byteSize) + " bytes", handle.packed());
            }
            storage = slot.record.storage;
            usage = slot.record.buffer()->usage;
        }

        const ByteRange range{ offset, offset + data.size() };
        switch (rewritePathFor(usage)) {
        case RewritePath::Mapped:
            DRAWCORE_RETURN_IF_FAILED(fences_.waitUntilAvailable(storage, range, AccessMode::Write, timeout));
            return writeMapped(handle, storage, offset, data);
        case RewritePath::Wait:
            DRAWCORE_RETURN_IF_FAILED(fences_.waitUntilAvailable(storage, range, AccessMode::Write, timeout));
            return writeInPlace(handle, storage, offset, data);
        case RewritePath::Reallocate:
        default:
            break;
        }

        auto available = fences_.isAvailable(storage, range, AccessMode::Write);
        if (!available.hasValue()) {
            return available.context();
        }
        if (available.value()) {
            return writeInPlace(handle, storage, offset, data);
        }
        return writeReallocated(handle, storage, offset, data);
    }

    Expected<void> ResourceRegistry::writeMapped(Handle handle, StorageId storage, uint64_t offset, std::span<const std::byte> data)
    {
        constexpr const char* kOp = "ResourceRegistry::writeBuffer";
        std::lock_guard<std::mutex> lock(mutex_);
        auto resolved = resolveLocked(handle, ResourceKind::Buffer, kOp);
        if (!resolved.hasValue()) {
            return resolved.context();
        }
        Slot& slot = *resolved.value();
        if (slot.record.storage != storage || !slot.mapped || offset + data.size() > slot.mapped->size()) {
            // Resized while we waited; the caller's range no longer describes this storage.
            return argumentError(kOp, "storage_changed_during_wait", {}, handle.packed());
        }
        std::memcpy(slot.mapped->data() + offset, data.data(), data.size());
        fences_.recordHostWrite(storage, ByteRange{ offset, offset + data.size() });
        ++stats_.mappedWrites;
        return {};
    }

    Expected<void> ResourceRegistry::writeInPlace(Handle handle, StorageId storage, uint64_t offset, std::span<const std::byte> data)
    {
        constexpr const char* kOp = "ResourceRegistry::writeBuffer";
        std::lock_guard<std::mutex> lock(mutex_);
        auto resolved = resolveLocked(handle, ResourceKind::Buffer, kOp);
        if (!resolved.hasValue()) {
            return resolved.context();
        }
        const Slot& slot = *resolved.value();
        if (slot.record.storage != storage) {
            return argumentError(kOp, "storage_changed_during_wait", {}, handle.packed());
        }

        std::vector<CommandPayload> batch{};
        batch.emplace_back(BufferWriteCmd{ .storage = storage, .offset = offset, .data = { data.begin(), data.end() } });
        const ByteRange range{ offset, offset + data.size() };
        auto submitted = queue_.submit(std::move(batch), 0, true, [&](uint64_t fence) {
            fences_.recordAccess(storage, range, AccessMode::Write, fence);
        });
        if (!submitted.hasValue()) {
            return submitted.context();
        }
        ++stats_.inPlaceWrites;
        return {};
    }

    Expected<void> ResourceRegistry::writeReallocated(Handle handle, StorageId storage, uint64_t offset, std::span<const std::byte> data)
    {
        constexpr const char* kOp = "ResourceRegistry::writeBuffer";
        std::lock_guard<std::mutex> lock(mutex_);
        auto resolved = resolveLocked(handle, ResourceKind::Buffer, kOp);
        if (!resolved.hasValue()) {
            return resolved.context();
        }
        Slot& slot = *resolved.value();
        if (slot.record.storage != storage) {
            return argumentError(kOp, "storage_changed_during_wait", {}, handle.packed());
        }

        const uint64_t size = slot.record.byteSize;
        const StorageId fresh = nextStorage_++;
        const bool coversAll = offset == 0 && data.size() == size;

        std::vector<CommandPayload> batch{};
        batch.emplace_back(CreateStorageCmd{ .storage = fresh, .kind = ResourceKind::Buffer, .byteSize = size });
        if (!coversAll) {
            batch.emplace_back(CopyStorageCmd{ .source = storage, .destination = fresh, .sourceOffset = 0, .destinationOffset = 0, .size = size });
        }
        batch.emplace_back(BufferWriteCmd{ .storage = fresh, .offset = offset, .data = { data.begin(), data.end() } });

        const ByteRange written = coversAll ? wholeRange(size) : ByteRange{ offset, offset + data.size() };
        auto submitted = queue_.submit(std::move(batch), 0, true, [&](uint64_t fence) {
            if (coversAll) {
                fences_.recordAccess(fresh, written, AccessMode::Write, fence);
                return;
            }
            // The copy writes all of the fresh storage and reads all of the old one.
            fences_.recordAccess(fresh, wholeRange(size), AccessMode::Write, fence);
            fences_.recordAccess(storage, wholeRange(size), AccessMode::Read, fence);
        });
        if (!submitted.hasValue()) {
            return submitted.context();
        }

        retireStorageLocked(storage, ResourceKind::Buffer, submitted.value().fenceValue);
        slot.record.storage = fresh;
        ++slot.record.swapCount;
        ++stats_.reallocations;
        reportInfo(kSubsystem, kOp, "buffer range busy; swapped to storage " + std::to_string(fresh));
        return {};
    }

    Expected<void> ResourceRegistry::resizeBuffer(Handle handle, uint64_t newSize)
    {
        constexpr const char* kOp = "ResourceRegistry::resizeBuffer";
        DRAWCORE_RETURN_IF_FAILED(checkAlive(kOp));
        if (newSize == 0) {
            return creationError(kOp, "zero_sized_buffer");
        }
        if (newSize > caps_.maxBufferSize) {
            return creationError(kOp, "buffer_too_large");
        }

        std::lock_guard<std::mutex> lock(mutex_);
        auto resolved = resolveLocked(handle, ResourceKind::Buffer, kOp);
        if (!resolved.hasValue()) {
            return resolved.context();
        }
        Slot& slot = *resolved.value();
        const StorageId old = slot.record.storage;
        const uint64_t oldSize = slot.record.byteSize;
        const uint64_t kept = std::min(oldSize, newSize);
        const StorageId fresh = nextStorage_++;

        CreateStorageCmd create{ .storage = fresh, .kind = ResourceKind::Buffer, .byteSize = newSize };
        if (slot.mapped) {
            create.mapped = std::make_shared<std::vector<std::byte>>(static_cast<size_t>(newSize));
        }
        std::shared_ptr<std::vector<std::byte>> mapped = create.mapped;

        std::vector<CommandPayload> batch{};
        batch.emplace_back(std::move(create));
        batch.emplace_back(CopyStorageCmd{ .source = old, .destination = fresh, .sourceOffset = 0, .destinationOffset = 0, .size = kept });

        auto submitted = queue_.submit(std::move(batch), 0, true, [&](uint64_t fence) {
            fences_.recordAccess(old, wholeRange(kept), AccessMode::Read, fence);
            fences_.recordAccess(fresh, wholeRange(newSize), AccessMode::Write, fence);
        });
        if (!submitted.hasValue()) {
            return submitted.context();
        }

        retireStorageLocked(old, ResourceKind::Buffer, submitted.value().fenceValue);
        BufferDesc desc = *slot.record.buffer();
        desc.size = newSize;
        slot.record.desc = desc;
        slot.record.byteSize = newSize;
        slot.record.storage = fresh;
        ++slot.record.swapCount;
        slot.mapped = std::move(mapped);
        ++stats_.reallocations;
        return {};
    }

    Expected<void> ResourceRegistry::invalidateBuffer(Handle handle)
    {
        constexpr const char* kOp = "ResourceRegistry::invalidateBuffer";
        DRAWCORE_RETURN_IF_FAILED(checkAlive(kOp));

        std::lock_guard<std::mutex> lock(mutex_);
        auto resolved = resolveLocked(handle, ResourceKind::Buffer, kOp);
        if (!resolved.hasValue()) {
            return resolved.context();
        }
        Slot& slot = *resolved.value();
        const StorageId old = slot.record.storage;
        const StorageId fresh = nextStorage_++;

        CreateStorageCmd create{ .storage = fresh, .kind = ResourceKind::Buffer, .byteSize = slot.record.byteSize };
        if (slot.mapped) {
            create.mapped = std::make_shared<std::vector<std::byte>>(static_cast<size_t>(slot.record.byteSize));
        }
        std::shared_ptr<std::vector<std::byte>> mapped = create.mapped;

        std::vector<CommandPayload> batch{};
        batch.emplace_back(std::move(create));
        auto submitted = queue_.submit(std::move(batch), 0, true);
        if (!submitted.hasValue()) {
            return submitted.context();
        }

        retireStorageLocked(old, ResourceKind::Buffer, submitted.value().fenceValue);
        slot.record.storage = fresh;
        ++slot.record.swapCount;
        slot.mapped = std::move(mapped);
        return {};
    }

    Expected<std::vector<std::byte>> ResourceRegistry::readBuffer(Handle handle,
        ByteRange range,
        std::optional<std::chrono::nanoseconds> timeout)
    {
        constexpr const char* kOp = "ResourceRegistry::readBuffer";
        DRAWCORE_RETURN_IF_FAILED(checkAlive(kOp));

        StorageId storage = kNullStorage;
        bool mapped = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto resolved = resolveLocked(handle, ResourceKind::Buffer, kOp);
            if (!resolved.hasValue()) {
                return resolved.context();
            }
            const Slot& slot = *resolved.value();
            if (range.empty() || range.end > slot.record.byteSize) {
                return argumentError(kOp, "read_out_of_bounds", {}, handle.packed());
            }
            storage = slot.record.storage;
            mapped = slot.mapped != nullptr;
        }

        if (mapped) {
            DRAWCORE_RETURN_IF_FAILED(fences_.waitUntilAvailable(storage, range, AccessMode::Read, timeout));
            std::lock_guard<std::mutex> lock(mutex_);
            auto resolved = resolveLocked(handle, ResourceKind::Buffer, kOp);
            if (!resolved.hasValue()) {
                return resolved.context();
            }
            const Slot& slot = *resolved.value();
            if (slot.record.storage != storage) {
                return argumentError(kOp, "storage_changed_during_wait", {}, handle.packed());
            }
            const auto first = slot.mapped->begin() + static_cast<std::ptrdiff_t>(range.begin);
            return std::vector<std::byte>(first, first + static_cast<std::ptrdiff_t>(range.end - range.begin));
        }

        auto readback = std::make_shared<ReadbackSlot>();
        uint64_t fence = 0;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            std::vector<CommandPayload> batch{};
            batch.emplace_back(ReadBufferCmd{ .storage = storage, .offset = range.begin, .size = range.end - range.begin, .slot = readback });
            auto submitted = queue_.submit(std::move(batch), 0, true, [&](uint64_t value) {
                fences_.recordAccess(storage, range, AccessMode::Read, value);
            });
            if (!submitted.hasValue()) {
                return submitted.context();
            }
            fence = submitted.value().fenceValue;
        }

        DRAWCORE_RETURN_IF_FAILED(fences_.waitForFence(fence, timeout));
        if (!readback->filled.load(std::memory_order_acquire)) {
            return argumentError(kOp, "readback_not_filled", {}, handle.packed());
        }
        return std::move(readback->data);
    }

    Expected<void> ResourceRegistry::uploadTexture(Handle handle,
        TextureUpload upload,
        std::optional<std::chrono::nanoseconds> timeout)
    {
        constexpr const char* kOp = "ResourceRegistry::uploadTexture";
        DRAWCORE_RETURN_IF_FAILED(checkAlive(kOp));

        StorageId storage = kNullStorage;
        uint64_t byteSize = 0;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto resolved = resolveLocked(handle, ResourceKind::Texture, kOp);
            if (!resolved.hasValue()) {
                return resolved.context();
            }
            const Slot& slot = *resolved.value();
            const TextureDesc& tex = *slot.record.texture();

            if (tex.samples != 1) {
                return argumentError(kOp, "upload_to_multisample", {}, handle.packed());
            }
            if (upload.mipLevel >= tex.mipLevels) {
                return argumentError(kOp, "upload_mip_out_of_range", {}, handle.packed());
            }
            const bool layered = tex.target == TextureTarget::Tex2DArray || tex.target == TextureTarget::Cube;
            const uint32_t mipW = mipExtent(tex.width, upload.mipLevel);
            const uint32_t mipH = mipExtent(tex.height, upload.mipLevel);
            const uint32_t mipD = layered ? tex.depth : mipExtent(tex.depth, upload.mipLevel);
            if (upload.width == 0 || upload.height == 0 || upload.depth == 0
                || uint64_t{ upload.x } + upload.width > mipW
                || uint64_t{ upload.y } + upload.height > mipH
                || uint64_t{ upload.z } + upload.depth > mipD) {
                return argumentError(kOp, "upload_region_out_of_bounds", {}, handle.packed());
            }

            const bool formatOk = upload.format == tex.format
                || (!isCompressed(upload.format) && !isCompressed(tex.format)
                    && sampleClass(upload.format) == sampleClass(tex.format)
                    && formatByteSize(upload.format) == formatByteSize(tex.format));
            if (!formatOk) {
                return argumentError(kOp, "upload_format_mismatch",
                    std::string(textureFormatToString(upload.format)) + " into " + textureFormatToString(tex.format), handle.packed());
            }

            const uint32_t rows = isCompressed(upload.format) ? (upload.height + 3) / 4 : upload.height;
            const uint64_t pitch = alignedRowPitch(upload.format, upload.width, upload.rowAlignment);
            const uint64_t required = pitch * rows * upload.depth;
            if (upload.pixels.size() < required) {
                return argumentError(kOp, "upload_data_too_small",
                    std::to_string(upload.pixels.size()) + " bytes, need " + std::to_string(required), handle.packed());
            }
            storage = slot.record.storage;
            byteSize = slot.record.byteSize;
        }

        const ByteRange whole = wholeRange(byteSize);
        DRAWCORE_RETURN_IF_FAILED(fences_.waitUntilAvailable(storage, whole, AccessMode::Write, timeout));

        std::lock_guard<std::mutex> lock(mutex_);
        auto resolved = resolveLocked(handle, ResourceKind::Texture, kOp);
        if (!resolved.hasValue()) {
            return resolved.context();
        }
        std::vector<CommandPayload> batch{};
        batch.emplace_back(TextureUploadCmd{ .storage = storage, .upload = std::move(upload) });
        auto submitted = queue_.submit(std::move(batch), 0, true, [&](uint64_t fence) {
            fences_.recordAccess(storage, whole, AccessMode::Write, fence);
        });
        if (!submitted.hasValue()) {
            return submitted.context();
        }
        return {};
    }

    Expected<ResourceDescriptor> ResourceRegistry::describe(Handle handle) const
    {
        constexpr const char* kOp = "ResourceRegistry::describe";
        DRAWCORE_RETURN_IF_FAILED(checkAlive(kOp));
        std::lock_guard<std::mutex> lock(mutex_);
        auto resolved = resolveLocked(handle, handle.kind, kOp);
        if (!resolved.hasValue()) {
            return resolved.context();
        }
        return resolved.value()->record;
    }

    Expected<StorageId> ResourceRegistry::storageOf(Handle handle) const
    {
        constexpr const char* kOp = "ResourceRegistry::storageOf";
        DRAWCORE_RETURN_IF_FAILED(checkAlive(kOp));
        std::lock_guard<std::mutex> lock(mutex_);
        auto resolved = resolveLocked(handle, handle.kind, kOp);
        if (!resolved.hasValue()) {
            return resolved.context();
        }
        return resolved.value()->record.storage;
    }

    bool ResourceRegistry::isLive(Handle handle) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (handle.isNull() || handle.index >= slots_.size()) {
            return false;
        }
        const Slot& slot = slots_[handle.index];
        return slot.live && slot.generation == handle.generation && slot.record.handle.kind == handle.kind;
    }

    std::size_t ResourceRegistry::liveCount() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return liveCount_;
    }

    std::size_t ResourceRegistry::pendingReleaseCount() const
    {
        return releases_.size();
    }

    Expected<void> ResourceRegistry::collect(uint64_t completedValue)
    {
        if (lost_.load(std::memory_order_acquire)) {
            return {};
        }
        return releases_.collect(completedValue);
    }

    std::shared_lock<std::shared_mutex> ResourceRegistry::pinStorage() const
    {
        return std::shared_lock<std::shared_mutex>(releaseMutex_);
    }

    void ResourceRegistry::setReleaseObserver(ReleaseObserver observer)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        releaseObserver_ = std::move(observer);
    }

    void ResourceRegistry::markContextLost()
    {
        if (lost_.exchange(true, std::memory_order_acq_rel)) {
            return;
        }
        // The device storage died with the context; nothing is left to release.
        releases_.clear();
        std::lock_guard<std::mutex> lock(mutex_);
        for (Slot& slot : slots_) {
            slot.live = false;
            slot.mapped.reset();
        }
        liveCount_ = 0;
    }

    ResourceRegistry::Stats ResourceRegistry::stats() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return stats_;
    }

} // namespace drawcore
