#include <drawcore/device/HeadlessDevice.h>
#include <drawcore/device/RenderContext.h>

#include <glm/glm.hpp>

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <thread>
#include <vector>

namespace {

uint32_t parseArg(const char* value, uint32_t fallback)
{
    if (value == nullptr) {
        return fallback;
    }
    const long parsed = std::strtol(value, nullptr, 10);
    if (parsed <= 0) {
        return fallback;
    }
    return static_cast<uint32_t>(parsed);
}

float parseFloat(const char* value, float fallback)
{
    if (value == nullptr) {
        return fallback;
    }
    const float parsed = std::strtof(value, nullptr);
    if (parsed <= 0.0F) {
        return fallback;
    }
    return parsed;
}

} // namespace

int main(int argc, char** argv)
{
    const uint32_t drawsPerThread = argc > 1 ? parseArg(argv[1], 20000) : 20000;
    const uint32_t threads = argc > 2 ? parseArg(argv[2], 4) : 4;
    const float maxAllowedUs = argc > 3 ? parseFloat(argv[3], 50.0F) : 50.0F;

    drawcore::ContextConfig config{};
    config.consumerMode = drawcore::DeviceThread::Mode::Dedicated;
    config.minimumSeverity = drawcore::Severity::Error;
    drawcore::HeadlessDevice device(config.capabilities.maxTextureUnits, config.capabilities.maxUniformBufferBindings);
    drawcore::RenderContext context(config, device, device);
    drawcore::ResourceRegistry& registry = context.resources();

    auto reflection = std::make_shared<drawcore::ProgramReflection>();
    reflection->attributes.push_back(drawcore::AttributeInfo{ .name = "position", .location = 0, .type = drawcore::ValueType::Vec3 });
    reflection->uniforms.push_back(drawcore::UniformInfo{ .name = "tint", .location = 0, .type = drawcore::ValueType::Vec4 });
    const drawcore::Handle program = drawcore::valueOrThrow(registry.createProgram(drawcore::ProgramDesc{ .reflection = reflection }));

    std::vector<std::byte> vertexBytes(3 * 12, std::byte{ 0 });
    const drawcore::Handle vertices = drawcore::valueOrThrow(registry.createBuffer(drawcore::BufferDesc{ .size = vertexBytes.size() }, vertexBytes));

    const auto begin = std::chrono::steady_clock::now();
    std::vector<std::thread> workers{};
    std::vector<uint32_t> failures(threads, 0);
    for (uint32_t t = 0; t < threads; ++t) {
        workers.emplace_back([&, t]() {
            drawcore::DrawRequest request{};
            request.program = program;
            request.vertices.push_back(drawcore::VertexSource{
                .buffer = vertices,
                .stride = 12,
                .elementCount = 3,
                .attributes = { drawcore::VertexAttributeSource{ .name = "position", .type = drawcore::ValueType::Vec3 } } });
            for (uint32_t i = 0; i < drawsPerThread; ++i) {
                // Every eighth draw changes state; the rest should diff to nothing.
                const bool varied = (i % 8) == 0;
                request.parameters.cullMode = varied ? drawcore::CullMode::Back : drawcore::CullMode::None;
                request.uniforms["tint"] = drawcore::UniformValue{ glm::vec4(varied ? 1.0F : 0.5F) };
                if (!context.draw(request).hasValue()) {
                    ++failures[t];
                }
            }
        });
    }
    for (std::thread& worker : workers) {
        worker.join();
    }
    const auto flushed = context.flush();
    const auto end = std::chrono::steady_clock::now();

    const uint64_t totalDraws = static_cast<uint64_t>(drawsPerThread) * threads;
    const double totalUs = std::chrono::duration<double, std::micro>(end - begin).count();
    const double avgUs = totalUs / static_cast<double>(totalDraws);
    const drawcore::RenderContext::Stats stats = context.stats();

    std::cout << "draw_benchmark draws=" << totalDraws
              << " threads=" << threads
              << " avg_us=" << avgUs
              << " state_commands=" << stats.emitter.stateCommands
              << " redundant_skipped=" << stats.emitter.redundantSkipped
              << " threshold_us=" << maxAllowedUs
              << std::endl;

    uint32_t failed = 0;
    for (uint32_t count : failures) {
        failed += count;
    }
    if (!flushed.hasValue() || failed != 0) {
        std::cerr << "draw_benchmark failed: " << failed << " draws rejected" << std::endl;
        return 1;
    }
    if (avgUs > static_cast<double>(maxAllowedUs)) {
        std::cerr << "draw_benchmark failed: average draw cost above threshold" << std::endl;
        return 2;
    }
    return 0;
}
