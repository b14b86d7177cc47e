#include <drawcore/device/ContextConfig.h>
#include <drawcore/device/HeadlessDevice.h>
#include <drawcore/device/RenderContext.h>
#include <drawcore/platform/GlfwSurfaceBridge.h>
#include <drawcore/vulkan/VkDeviceSession.h>
#include <drawcore/vulkan/VkTimelineCompletionSource.h>

#include <glm/glm.hpp>

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <memory>
#include <vector>

namespace {

constexpr uint32_t kHeadlessFrames = 3;

enum class DemoMode : uint8_t {
    Headless,
    Vulkan,
    Window
};

struct Scene {
    drawcore::Handle program{};
    drawcore::Handle vertices{};
};

std::shared_ptr<drawcore::ProgramReflection> triangleReflection()
{
    auto reflection = std::make_shared<drawcore::ProgramReflection>();
    reflection->attributes.push_back(drawcore::AttributeInfo{ .name = "position", .location = 0, .type = drawcore::ValueType::Vec3 });
    reflection->uniforms.push_back(drawcore::UniformInfo{ .name = "tint", .location = 0, .type = drawcore::ValueType::Vec4 });
    return reflection;
}

drawcore::Expected<Scene> createScene(drawcore::ResourceRegistry& registry)
{
    const float positions[] = {
        -0.5F, -0.5F, 0.0F,
        0.5F, -0.5F, 0.0F,
        0.0F, 0.5F, 0.0F,
    };
    std::vector<std::byte> bytes(sizeof(positions));
    std::memcpy(bytes.data(), positions, sizeof(positions));

    auto program = registry.createProgram(drawcore::ProgramDesc{ .reflection = triangleReflection() });
    if (!program.hasValue()) {
        return program.context();
    }
    auto vertices = registry.createBuffer(
        drawcore::BufferDesc{ .size = bytes.size(), .usage = drawcore::BufferUsage::Static, .bindFlags = drawcore::BufferBindVertex },
        bytes);
    if (!vertices.hasValue()) {
        return vertices.context();
    }
    return Scene{ .program = program.value(), .vertices = vertices.value() };
}

drawcore::Expected<void> renderFrame(drawcore::RenderContext& context, const Scene& scene, uint32_t frame)
{
    DRAWCORE_RETURN_IF_FAILED(context.clear(drawcore::ClearRequest{ .color = glm::vec4(0.05F, 0.05F, 0.08F, 1.0F), .depth = 1.0F }));

    drawcore::DrawRequest request{};
    request.program = scene.program;
    request.vertices.push_back(drawcore::VertexSource{
        .buffer = scene.vertices,
        .stride = 12,
        .elementCount = 3,
        .attributes = { drawcore::VertexAttributeSource{ .name = "position", .type = drawcore::ValueType::Vec3 } } });
    const float phase = static_cast<float>(frame) * 0.1F;
    request.uniforms["tint"] = drawcore::UniformValue{ glm::vec4(0.5F + 0.5F * std::sin(phase), 0.6F, 0.9F, 1.0F) };
    request.parameters.depthTest = drawcore::DepthTest{ .enabled = true, .func = drawcore::CompareFunc::Less };
    return context.draw(request);
}

void printStats(const drawcore::RenderContext& context)
{
    const drawcore::RenderContext::Stats stats = context.stats();
    std::cout << "draws=" << stats.emitter.draws
              << " state_commands=" << stats.emitter.stateCommands
              << " redundant_skipped=" << stats.emitter.redundantSkipped
              << " executed=" << stats.device.executed
              << " presents=" << stats.presents
              << std::endl;
}

int runHeadless(drawcore::ContextConfig config, bool traceCommands)
{
    drawcore::HeadlessDevice device(config.capabilities.maxTextureUnits, config.capabilities.maxUniformBufferBindings);
    if (traceCommands) {
        device.setCommandObserver([](const drawcore::Command& command) {
            std::cout << "  #" << command.sequence << " " << drawcore::commandName(command.payload) << std::endl;
        });
    }

    drawcore::RenderContext context(config, device, device);
    auto scene = createScene(context.resources());
    if (!scene.hasValue()) {
        std::cerr << drawcore::errorMessage(scene.context()) << std::endl;
        return 1;
    }

    for (uint32_t frame = 0; frame < kHeadlessFrames; ++frame) {
        std::cout << "frame " << frame << std::endl;
        auto rendered = renderFrame(context, scene.value(), frame);
        if (!rendered.hasValue()) {
            std::cerr << drawcore::errorMessage(rendered.context()) << std::endl;
            return 1;
        }
        auto presented = context.present();
        if (!presented.hasValue()) {
            std::cerr << drawcore::errorMessage(presented.context()) << std::endl;
            return 1;
        }
    }
    printStats(context);
    return 0;
}

int runVulkan(drawcore::ContextConfig config)
{
    auto session = drawcore::vkutil::VkDeviceSession::create(drawcore::vkutil::VkDeviceSession::CreateInfo{ .applicationName = "drawcore_demo" });
    if (!session.hasValue()) {
        std::cerr << drawcore::errorMessage(session.context()) << std::endl;
        return 1;
    }
    auto timeline = drawcore::vkutil::VkTimelineCompletionSource::create(session.value().device());
    if (!timeline.hasValue()) {
        std::cerr << drawcore::errorMessage(timeline.context()) << std::endl;
        return 1;
    }

    config.capabilities = session.value().capabilities();
    drawcore::HeadlessDevice device(config.capabilities.maxTextureUnits, config.capabilities.maxUniformBufferBindings);
    drawcore::vkutil::TimelineSignallingBackend backend(device, timeline.value());

    drawcore::RenderContext context(config, backend, timeline.value());
    auto scene = createScene(context.resources());
    if (!scene.hasValue()) {
        std::cerr << drawcore::errorMessage(scene.context()) << std::endl;
        return 1;
    }
    for (uint32_t frame = 0; frame < kHeadlessFrames; ++frame) {
        auto rendered = renderFrame(context, scene.value(), frame);
        if (!rendered.hasValue()) {
            std::cerr << drawcore::errorMessage(rendered.context()) << std::endl;
            return 1;
        }
        auto presented = context.present();
        if (!presented.hasValue()) {
            std::cerr << drawcore::errorMessage(presented.context()) << std::endl;
            return 1;
        }
    }
    std::cout << "device: " << session.value().deviceName() << std::endl;
    printStats(context);
    return 0;
}

int runWindow(drawcore::ContextConfig config)
{
    drawcore::GlfwSurfaceBridge surface{};
    auto opened = surface.open(drawcore::GlfwSurfaceBridge::WindowConfig{ .title = "drawcore demo" });
    if (!opened.hasValue()) {
        std::cerr << drawcore::errorMessage(opened.context()) << std::endl;
        return 1;
    }

    drawcore::HeadlessDevice device(config.capabilities.maxTextureUnits, config.capabilities.maxUniformBufferBindings);
    drawcore::RenderContext context(config, device, device);
    surface.attach(context);

    auto scene = createScene(context.resources());
    if (!scene.hasValue()) {
        std::cerr << drawcore::errorMessage(scene.context()) << std::endl;
        return 1;
    }

    uint32_t frame = 0;
    while (!surface.shouldClose()) {
        surface.pollEvents();
        auto rendered = renderFrame(context, scene.value(), frame++);
        if (!rendered.hasValue()) {
            std::cerr << drawcore::errorMessage(rendered.context()) << std::endl;
            break;
        }
        auto presented = surface.presentFrame();
        if (!presented.hasValue()) {
            std::cerr << drawcore::errorMessage(presented.context()) << std::endl;
            break;
        }
    }
    surface.detach();
    printStats(context);
    return 0;
}

} // namespace

int main(int argc, char** argv)
{
    DemoMode mode = DemoMode::Headless;
    bool traceCommands = false;
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--vulkan") == 0) {
            mode = DemoMode::Vulkan;
        }
        else if (std::strcmp(argv[i], "--window") == 0) {
            mode = DemoMode::Window;
        }
        else if (std::strcmp(argv[i], "--trace") == 0) {
            traceCommands = true;
        }
        else {
            std::cerr << "usage: drawcore_demo [--vulkan | --window] [--trace]" << std::endl;
            return 2;
        }
    }

    drawcore::ContextConfig config{};
    drawcore::applyEnvironmentOverrides(config);

    switch (mode) {
    case DemoMode::Vulkan: return runVulkan(config);
    case DemoMode::Window: return runWindow(config);
    default: return runHeadless(config, traceCommands);
    }
}
