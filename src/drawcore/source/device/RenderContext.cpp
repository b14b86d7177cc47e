#include <atomic>
#include <limits>
#include <string>
#include <utility>

#include <drawcore/device/RenderContext.h>
#include <drawcore/resources/TextureFormat.h>

namespace drawcore {

    namespace {
        constexpr const char* kSubsystem = "render_context";

        std::atomic<uint32_t> g_nextProducer{ 1 };

        uint32_t currentProducerId()
        {
            thread_local const uint32_t id = g_nextProducer.fetch_add(1, std::memory_order_relaxed);
            return id;
        }

        DeviceCapabilities clampedCapabilities(const ContextConfig& config)
        {
            DeviceCapabilities caps = config.capabilities;
            if (caps.maxTextureUnits == 0) {
                caps.maxTextureUnits = 1;
            }
            return caps;
        }
    } // namespace

    PendingReadback::PendingReadback(std::shared_ptr<ReadbackSlot> slot, uint64_t fence, FenceTracker* fences)
        : slot_(std::move(slot))
        , fence_(fence)
        , fences_(fences)
    {
    }

    bool PendingReadback::isReady() const
    {
        if (!slot_ || fences_ == nullptr) {
            return false;
        }
        return slot_->filled.load(std::memory_order_acquire) && fences_->fenceStatus(fence_) == FenceStatus::Satisfied;
    }

    Expected<void> PendingReadback::wait(std::optional<std::chrono::nanoseconds> timeout) const
    {
        if (!slot_ || fences_ == nullptr) {
            return makeError("PendingReadback::wait", ErrorCode::InvalidArgument, kSubsystem, "empty_readback");
        }
        return fences_->waitForFence(fence_, timeout);
    }

    Expected<std::vector<std::byte>> PendingReadback::take(std::optional<std::chrono::nanoseconds> timeout)
    {
        DRAWCORE_RETURN_IF_FAILED(wait(timeout));
        if (!slot_->filled.load(std::memory_order_acquire)) {
            return makeError("PendingReadback::take", ErrorCode::InvalidArgument, kSubsystem, "readback_failed",
                "the readback command did not produce data", fence_);
        }
        std::vector<std::byte> pixels = std::move(slot_->data);
        slot_.reset();
        return pixels;
    }

    RenderContext::RenderContext(const ContextConfig& config, IDeviceBackend& backend, ICompletionSource& completion)
        : config_(config)
        , fences_(completion, config.fences)
        , registry_(clampedCapabilities(config), queue_, fences_, config.rewritePolicy, config.releaseRetry)
        , cache_(clampedCapabilities(config).maxTextureUnits, config.capabilities.maxUniformBufferBindings)
        , validator_(registry_, clampedCapabilities(config))
        , emitter_(queue_, fences_, cache_, clampedCapabilities(config).maxTextureUnits)
        , deviceThread_(queue_, backend, config.consumerMode)
        , defaultTarget_(config.defaultFramebuffer)
    {
        setMinimumSeverity(config.minimumSeverity);

        fences_.setFlushHook([this]() { return deviceThread_.flush(); });
        fences_.setIdleWork([this](uint64_t completed) {
            auto collected = registry_.collect(completed);
            if (!collected.hasValue()) {
                reportInfo(kSubsystem, "idle collect", errorMessage(collected.context()));
            }
        });
        registry_.setReleaseObserver([this](StorageId storage, ResourceKind kind) {
            if (kind == ResourceKind::Program) {
                cache_.forgetProgram(storage);
            }
        });
        deviceThread_.setContextLostHandler([this](const ErrorContext& error) { handleContextLost(error); });

        deviceThread_.start();
    }

    RenderContext::~RenderContext()
    {
        deviceThread_.stop();
    }

    void RenderContext::handleContextLost(const ErrorContext& error)
    {
        if (lost_.exchange(true, std::memory_order_acq_rel)) {
            return;
        }
        fences_.markContextLost();
        registry_.markContextLost();
        cache_.reset();

        DiagnosticMessage message{};
        message.severity = Severity::Error;
        message.subsystem = kSubsystem;
        message.operation = error.operation;
        message.code = ErrorCode::ContextLost;
        message.text = "context lost: " + errorMessage(error);
        reportDiagnostic(std::move(message));
    }

    Expected<void> RenderContext::checkAlive(const char* operation) const
    {
        if (lost_.load(std::memory_order_acquire) || deviceThread_.contextLost()) {
            return makeError(operation, ErrorCode::ContextLost, kSubsystem, "context_lost");
        }
        return {};
    }

    Expected<void> RenderContext::draw(const DrawRequest& request)
    {
        DRAWCORE_RETURN_IF_FAILED(checkAlive("RenderContext::draw"));

        // Storage resolved by the validator must outlive the emitted commands' queueing.
        auto pin = registry_.pinStorage();
        auto validated = validator_.validate(request, defaultFramebuffer());
        if (!validated.hasValue()) {
            rejectedDraws_.fetch_add(1, std::memory_order_relaxed);
            return validated.context();
        }

        auto emission = emitter_.emit(validated.value(), currentProducerId());
        if (!emission.hasValue()) {
            return emission.context();
        }
        return {};
    }

    Expected<ValidatedDraw> RenderContext::validate(const DrawRequest& request) const
    {
        auto pin = registry_.pinStorage();
        return validator_.validate(request, defaultFramebuffer());
    }

    Expected<void> RenderContext::clear(const ClearRequest& request)
    {
        DRAWCORE_RETURN_IF_FAILED(checkAlive("RenderContext::clear"));
        if (!request.color.has_value() && !request.depth.has_value() && !request.stencil.has_value()) {
            return {};
        }

        auto pin = registry_.pinStorage();
        auto target = validator_.resolveFramebuffer(request.framebuffer, "RenderContext::clear");
        if (!target.hasValue()) {
            return target.context();
        }

        const ResourceDescriptor& framebuffer = target.value();
        const RenderTargetInfo shape = request.framebuffer.isNull() ? defaultFramebuffer() : framebuffer.target;
        const char* missing = nullptr;
        if (request.color.has_value() && shape.colorAttachmentCount == 0) {
            missing = "clear_color_without_attachment";
        }
        else if (request.depth.has_value() && !shape.hasDepth) {
            missing = "clear_depth_without_attachment";
        }
        else if (request.stencil.has_value() && !shape.hasStencil) {
            missing = "clear_stencil_without_attachment";
        }
        if (missing != nullptr) {
            return makeError("RenderContext::clear", ErrorCode::FramebufferMismatch, kSubsystem, missing, {}, request.framebuffer.packed());
        }

        std::vector<TrackedAccess> writes{};
        for (StorageId attachment : framebuffer.attachmentStorage) {
            writes.push_back(TrackedAccess{
                .storage = attachment,
                .range = ByteRange{ 0, std::numeric_limits<uint64_t>::max() },
                .mode = AccessMode::Write,
                .mapped = false });
        }

        auto emission = emitter_.emitClear(request, framebuffer.storage, writes, currentProducerId());
        if (!emission.hasValue()) {
            return emission.context();
        }
        return {};
    }

    Expected<RenderContext::ReadSource> RenderContext::resolveReadSource(const ReadRequest& request) const
    {
        ReadSource source{};
        if (request.source.isNull()) {
            const RenderTargetInfo target = defaultFramebuffer();
            source.width = target.width;
            source.height = target.height;
            return source;
        }

        auto described = registry_.describe(request.source);
        if (!described.hasValue()) {
            return described.context();
        }
        const ResourceDescriptor& record = described.value();
        source.storage = record.storage;
        source.kind = record.kind();

        if (record.kind() == ResourceKind::Framebuffer) {
            if (record.attachmentStorage.empty()) {
                return makeError("RenderContext::readPixels", ErrorCode::InvalidArgument, kSubsystem,
                    "readback_without_attachment", {}, request.source.packed());
            }
            source.width = record.target.width;
            source.height = record.target.height;
            source.reads.push_back(TrackedAccess{
                .storage = record.attachmentStorage.front(),
                .range = ByteRange{ 0, std::numeric_limits<uint64_t>::max() },
                .mode = AccessMode::Read,
                .mapped = true });
            return source;
        }

        if (const TextureDesc* texture = record.texture()) {
            if (texture->samples > 1) {
                return makeError("RenderContext::readPixels", ErrorCode::InvalidArgument, kSubsystem,
                    "readback_of_multisample_texture", {}, request.source.packed());
            }
            source.width = texture->width;
            source.height = texture->height;
            source.reads.push_back(TrackedAccess{
                .storage = record.storage,
                .range = ByteRange{ 0, record.byteSize },
                .mode = AccessMode::Read,
                .mapped = true });
            return source;
        }

        return makeError("RenderContext::readPixels", ErrorCode::InvalidHandle, kSubsystem,
            "wrong_resource_kind", "readback source must be a framebuffer or texture", request.source.packed());
    }

    Expected<std::vector<std::byte>> RenderContext::readPixels(const ReadRequest& request,
        std::optional<std::chrono::nanoseconds> timeout)
    {
        auto pending = readPixelsAsync(request);
        if (!pending.hasValue()) {
            return pending.context();
        }
        return pending.value().take(timeout);
    }

    Expected<PendingReadback> RenderContext::readPixelsAsync(const ReadRequest& request)
    {
        DRAWCORE_RETURN_IF_FAILED(checkAlive("RenderContext::readPixelsAsync"));

        auto pin = registry_.pinStorage();
        auto source = resolveReadSource(request);
        if (!source.hasValue()) {
            return source.context();
        }

        const Rect& region = request.region;
        if (region.origin.x < 0 || region.origin.y < 0 || region.size.x <= 0 || region.size.y <= 0
            || static_cast<uint64_t>(region.origin.x) + static_cast<uint64_t>(region.size.x) > source.value().width
            || static_cast<uint64_t>(region.origin.y) + static_cast<uint64_t>(region.size.y) > source.value().height) {
            return makeError("RenderContext::readPixelsAsync", ErrorCode::InvalidArgument, kSubsystem,
                "readback_region_out_of_bounds",
                std::to_string(region.size.x) + "x" + std::to_string(region.size.y) + " at (" + std::to_string(region.origin.x) + ", "
                    + std::to_string(region.origin.y) + ") in " + std::to_string(source.value().width) + "x" + std::to_string(source.value().height),
                request.source.packed());
        }
        if (isCompressed(request.format)) {
            return makeError("RenderContext::readPixelsAsync", ErrorCode::InvalidArgument, kSubsystem,
                "readback_format_unsupported", textureFormatToString(request.format));
        }

        auto slot = std::make_shared<ReadbackSlot>();
        std::vector<CommandPayload> batch{};
        batch.emplace_back(ReadPixelsCmd{
            .source = source.value().storage,
            .sourceKind = source.value().kind,
            .region = region,
            .format = request.format,
            .slot = slot });

        const std::vector<TrackedAccess>& reads = source.value().reads;
        auto submitted = queue_.submit(std::move(batch), currentProducerId(), true, [&](uint64_t fence) {
            for (const TrackedAccess& access : reads) {
                fences_.recordAccess(access.storage, access.range, access.mode, fence);
            }
        });
        if (!submitted.hasValue()) {
            return submitted.context();
        }
        return PendingReadback(std::move(slot), submitted.value().fenceValue, &fences_);
    }

    Expected<void> RenderContext::present()
    {
        DRAWCORE_RETURN_IF_FAILED(checkAlive("RenderContext::present"));

        const uint64_t frame = frame_.fetch_add(1, std::memory_order_relaxed) + 1;
        auto pushed = queue_.push(PresentCmd{ .frame = frame }, currentProducerId());
        if (!pushed.hasValue()) {
            return pushed.context();
        }
        DRAWCORE_RETURN_IF_FAILED(deviceThread_.flush());
        return registry_.collect(fences_.completedValue());
    }

    void RenderContext::notifyViewportResized(uint32_t width, uint32_t height)
    {
        {
            std::lock_guard<std::mutex> lock(targetMutex_);
            defaultTarget_.width = width;
            defaultTarget_.height = height;
        }
        cache_.invalidateViewport();
    }

    Expected<void> RenderContext::waitForBuffer(Handle buffer,
        ByteRange range,
        AccessMode mode,
        std::optional<std::chrono::nanoseconds> timeout)
    {
        auto storage = registry_.storageOf(buffer);
        if (!storage.hasValue()) {
            return storage.context();
        }
        return fences_.waitUntilAvailable(storage.value(), range, mode, timeout);
    }

    Expected<bool> RenderContext::isBufferAvailable(Handle buffer, ByteRange range, AccessMode mode)
    {
        auto storage = registry_.storageOf(buffer);
        if (!storage.hasValue()) {
            return storage.context();
        }
        return fences_.isAvailable(storage.value(), range, mode);
    }

    Expected<uint64_t> RenderContext::insertFence()
    {
        DRAWCORE_RETURN_IF_FAILED(checkAlive("RenderContext::insertFence"));
        return queue_.insertFence(currentProducerId());
    }

    Expected<void> RenderContext::waitForFence(uint64_t fenceValue, std::optional<std::chrono::nanoseconds> timeout)
    {
        return fences_.waitForFence(fenceValue, timeout);
    }

    Expected<void> RenderContext::flush()
    {
        return deviceThread_.flush();
    }

    bool RenderContext::contextLost() const
    {
        return lost_.load(std::memory_order_acquire) || deviceThread_.contextLost();
    }

    RenderTargetInfo RenderContext::defaultFramebuffer() const
    {
        std::lock_guard<std::mutex> lock(targetMutex_);
        return defaultTarget_;
    }

    RenderContext::Stats RenderContext::stats() const
    {
        Stats stats{};
        stats.emitter = emitter_.stats();
        stats.textureUnits = emitter_.textureUnitStats();
        stats.resources = registry_.stats();
        stats.fences = fences_.diagnostics();
        stats.device = deviceThread_.diagnostics();
        stats.rejectedDraws = rejectedDraws_.load(std::memory_order_relaxed);
        stats.presents = frame_.load(std::memory_order_relaxed);
        return stats;
    }

} // namespace drawcore
