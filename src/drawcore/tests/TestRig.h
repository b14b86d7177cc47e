#pragma once

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <variant>
#include <vector>

#include <drawcore/command/Command.h>
#include <drawcore/device/ContextConfig.h>
#include <drawcore/device/HeadlessDevice.h>
#include <drawcore/device/RenderContext.h>
#include <drawcore/draw/ProgramReflection.h>
#include <drawcore/sync/CompletionSource.h>

namespace drawcore::test {

    // Completion source the test retires by hand.
    class ManualCompletion : public ICompletionSource
    {
    public:
        Expected<uint64_t> completedValue() override
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return completed_;
        }

        Expected<bool> wait(uint64_t value, std::chrono::nanoseconds timeout) override
        {
            std::unique_lock<std::mutex> lock(mutex_);
            return retired_.wait_for(lock, timeout, [&] { return completed_ >= value; });
        }

        void retire(uint64_t value)
        {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                completed_ = std::max(completed_, value);
            }
            retired_.notify_all();
        }

    private:
        std::mutex mutex_{};
        std::condition_variable retired_{};
        uint64_t completed_{ 0 };
    };

    // Headless device that keeps a copy of every command it was handed.
    class RecordingDevice
    {
    public:
        explicit RecordingDevice(HeadlessDevice::RetireMode mode = HeadlessDevice::RetireMode::Immediate,
            uint32_t textureUnits = 16,
            uint32_t uniformBufferBindings = 36)
            : device(textureUnits, uniformBufferBindings, mode)
        {
            device.setCommandObserver([this](const Command& command) {
                std::lock_guard<std::mutex> lock(mutex_);
                commands_.push_back(command);
            });
        }

        [[nodiscard]] std::vector<Command> commands() const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return commands_;
        }

        void clear()
        {
            std::lock_guard<std::mutex> lock(mutex_);
            commands_.clear();
        }

        template<typename T>
        [[nodiscard]] std::size_t count() const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return static_cast<std::size_t>(std::count_if(commands_.begin(), commands_.end(),
                [](const Command& c) { return std::holds_alternative<T>(c.payload); }));
        }

        [[nodiscard]] std::size_t stateChanges(StateField field) const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return static_cast<std::size_t>(std::count_if(commands_.begin(), commands_.end(), [field](const Command& c) {
                const auto* change = std::get_if<StateChangeCmd>(&c.payload);
                return change != nullptr && change->field == field;
            }));
        }

        HeadlessDevice device;

    private:
        mutable std::mutex mutex_{};
        std::vector<Command> commands_{};
    };

    inline ContextConfig inlineConfig()
    {
        ContextConfig config{};
        config.consumerMode = DeviceThread::Mode::Inline;
        config.fences.defaultTimeout = std::chrono::milliseconds(200);
        config.minimumSeverity = Severity::Error;
        return config;
    }

    // A context over a recording device, consumed inline on the calling thread.
    struct ContextRig {
        explicit ContextRig(ContextConfig config = inlineConfig(),
            HeadlessDevice::RetireMode mode = HeadlessDevice::RetireMode::Immediate)
            : recorder(mode, config.capabilities.maxTextureUnits, config.capabilities.maxUniformBufferBindings)
            , context(config, recorder.device, recorder.device)
        {
        }

        [[nodiscard]] std::vector<Command> flushAndTake()
        {
            const Expected<void> flushed = context.flush();
            (void)flushed;
            std::vector<Command> out = recorder.commands();
            recorder.clear();
            return out;
        }

        RecordingDevice recorder;
        RenderContext context;
    };

    // One vec3 position attribute, one vec4 color uniform.
    inline std::shared_ptr<ProgramReflection> colorProgram()
    {
        auto reflection = std::make_shared<ProgramReflection>();
        reflection->attributes.push_back(AttributeInfo{ .name = "position", .location = 0, .type = ValueType::Vec3 });
        reflection->uniforms.push_back(UniformInfo{ .name = "color", .location = 0, .type = ValueType::Vec4 });
        return reflection;
    }

    // Position attribute plus `samplers` 2D samplers named tex0, tex1, ...
    inline std::shared_ptr<ProgramReflection> texturedProgram(uint32_t samplers)
    {
        auto reflection = std::make_shared<ProgramReflection>();
        reflection->attributes.push_back(AttributeInfo{ .name = "position", .location = 0, .type = ValueType::Vec3 });
        for (uint32_t i = 0; i < samplers; ++i) {
            reflection->uniforms.push_back(UniformInfo{ .name = "tex" + std::to_string(i), .location = static_cast<int32_t>(i), .type = ValueType::Sampler2D });
        }
        return reflection;
    }

    inline VertexSource positions(Handle buffer, uint32_t count)
    {
        VertexSource source{};
        source.buffer = buffer;
        source.stride = 12;
        source.elementCount = count;
        source.attributes.push_back(VertexAttributeSource{ .name = "position", .type = ValueType::Vec3, .offset = 0 });
        return source;
    }

    inline Handle makeVertexBuffer(ResourceRegistry& registry, uint32_t vertices)
    {
        std::vector<std::byte> data(static_cast<std::size_t>(vertices) * 12, std::byte{ 0 });
        return valueOrThrow(registry.createBuffer(BufferDesc{ .size = data.size(), .usage = BufferUsage::Static, .bindFlags = BufferBindVertex }, data));
    }

    inline Handle makeTexture(ResourceRegistry& registry, uint32_t width = 4, uint32_t height = 4)
    {
        return valueOrThrow(registry.createTexture(TextureDesc{ .target = TextureTarget::Tex2D, .format = TextureFormat::RGBA8, .width = width, .height = height }));
    }

    inline bool hasTag(const ErrorContext& context, const char* tag)
    {
        return context.objectName != nullptr && std::string(context.objectName) == tag;
    }

} // namespace drawcore::test
