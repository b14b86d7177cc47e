#include <cassert>
#include <string>

#include <glm/glm.hpp>

#include <drawcore/draw/DrawValidator.h>

#include "TestRig.h"

using namespace drawcore;
using namespace drawcore::test;

namespace {

    DrawRequest colorDraw(Handle program, Handle vertices)
    {
        DrawRequest request{};
        request.program = program;
        request.vertices.push_back(positions(vertices, 3));
        request.uniforms["color"] = UniformValue{ glm::vec4(0.2F, 0.4F, 0.6F, 1.0F) };
        return request;
    }

    DrawRequest texturedDraw(Handle program, Handle vertices, const std::vector<Handle>& textures)
    {
        DrawRequest request{};
        request.program = program;
        request.vertices.push_back(positions(vertices, 3));
        for (size_t i = 0; i < textures.size(); ++i) {
            request.uniforms["tex" + std::to_string(i)] = TextureBinding{ .texture = textures[i] };
        }
        return request;
    }

} // namespace

int main()
{
    // A well-formed draw resolves to storage ids with the viewport defaulted to the target.
    {
        ContextRig rig{};
        ResourceRegistry& registry = rig.context.resources();
        const Handle program = valueOrThrow(registry.createProgram(ProgramDesc{ .reflection = colorProgram() }));
        const Handle vertices = makeVertexBuffer(registry, 3);

        auto validated = rig.context.validate(colorDraw(program, vertices));
        assert(validated.hasValue());
        const ValidatedDraw& draw = validated.value();
        assert(draw.program == valueOrThrow(registry.storageOf(program)));
        assert(draw.framebuffer == kNullStorage);
        assert(draw.draw.vertexCount == 3);
        assert(draw.draw.instanceCount == 1);
        assert(!draw.draw.indexed);
        assert(draw.vertexLayout.size() == 1);
        assert(draw.vertexLayout[0].buffer == valueOrThrow(registry.storageOf(vertices)));
        assert(draw.uniforms.size() == 1);
        assert(draw.parameters.viewport.has_value());
        assert(draw.parameters.viewport->size == glm::ivec2(1280, 720));
    }

    // A missing uniform is a layout mismatch, and nothing reaches the device.
    {
        ContextRig rig{};
        ResourceRegistry& registry = rig.context.resources();
        const Handle program = valueOrThrow(registry.createProgram(ProgramDesc{ .reflection = colorProgram() }));
        const Handle vertices = makeVertexBuffer(registry, 3);
        static_cast<void>(rig.flushAndTake());
        const PipelineState before = rig.context.cachedState();

        DrawRequest request = colorDraw(program, vertices);
        request.uniforms.clear();
        auto drawn = rig.context.draw(request);
        assert(!drawn.hasValue());
        assert(drawn.error() == ErrorCode::UniformLayoutMismatch);
        assert(hasTag(drawn.context(), "uniform_missing"));
        assert(drawn.context().layoutDiff.size() == 1);
        assert(drawn.context().layoutDiff[0].member == "color");

        assert(rig.flushAndTake().empty());
        assert(rig.context.cachedState() == before);
        assert(rig.context.stats().rejectedDraws == 1);
    }

    // Wrong uniform type names both sides.
    {
        ContextRig rig{};
        ResourceRegistry& registry = rig.context.resources();
        const Handle program = valueOrThrow(registry.createProgram(ProgramDesc{ .reflection = colorProgram() }));
        const Handle vertices = makeVertexBuffer(registry, 3);

        DrawRequest request = colorDraw(program, vertices);
        request.uniforms["color"] = UniformValue{ glm::vec3(1.0F) };
        auto validated = rig.context.validate(request);
        assert(!validated.hasValue());
        assert(hasTag(validated.context(), "uniform_type_mismatch"));
        assert(validated.context().layoutDiff[0].expected == "vec4");
    }

    // Checks run in order: a draw missing both an attribute and a uniform reports the attribute.
    {
        ContextRig rig{};
        ResourceRegistry& registry = rig.context.resources();
        const Handle program = valueOrThrow(registry.createProgram(ProgramDesc{ .reflection = colorProgram() }));
        const Handle vertices = makeVertexBuffer(registry, 3);

        DrawRequest request = colorDraw(program, vertices);
        request.uniforms.clear();
        request.vertices[0].attributes[0].name = "normal";
        auto validated = rig.context.validate(request);
        assert(!validated.hasValue());
        assert(validated.error() == ErrorCode::MissingAttribute);
        assert(hasTag(validated.context(), "missing_attribute"));
    }

    // A source that is both too short and missing the program's attribute reports the attribute.
    {
        ContextRig rig{};
        ResourceRegistry& registry = rig.context.resources();
        const Handle program = valueOrThrow(registry.createProgram(ProgramDesc{ .reflection = colorProgram() }));
        const Handle vertices = makeVertexBuffer(registry, 3);

        DrawRequest request = colorDraw(program, vertices);
        request.vertices[0].elementCount = 10;
        request.vertices[0].attributes[0].name = "normal";
        auto validated = rig.context.validate(request);
        assert(!validated.hasValue());
        assert(validated.error() == ErrorCode::MissingAttribute);
        assert(hasTag(validated.context(), "missing_attribute"));

        // Mismatched instanced sources do not hide it either.
        VertexSource instanced = positions(vertices, 2);
        instanced.divisor = 1;
        instanced.attributes[0].name = "offset";
        VertexSource other = positions(vertices, 3);
        other.divisor = 1;
        other.attributes[0].name = "scale";
        request.vertices[0].elementCount = 3;
        request.vertices.push_back(instanced);
        request.vertices.push_back(other);
        auto mixed = rig.context.validate(request);
        assert(!mixed.hasValue());
        assert(mixed.error() == ErrorCode::MissingAttribute);

        // With the attribute restored, the extent problem is what remains.
        request.vertices.resize(1);
        request.vertices[0].attributes[0].name = "position";
        request.vertices[0].elementCount = 10;
        auto extent = rig.context.validate(request);
        assert(!extent.hasValue());
        assert(extent.error() == ErrorCode::InvalidDrawParameters);
        assert(hasTag(extent.context(), "vertex_range_out_of_bounds"));
    }

    // Handles are checked before anything else.
    {
        ContextRig rig{};
        ResourceRegistry& registry = rig.context.resources();
        const Handle program = valueOrThrow(registry.createProgram(ProgramDesc{ .reflection = colorProgram() }));
        const Handle vertices = makeVertexBuffer(registry, 3);

        auto noProgram = rig.context.validate(colorDraw(Handle{}, vertices));
        assert(!noProgram.hasValue());
        assert(noProgram.error() == ErrorCode::InvalidHandle);

        assert(registry.destroy(vertices).hasValue());
        auto deadBuffer = rig.context.validate(colorDraw(program, vertices));
        assert(!deadBuffer.hasValue());
        assert(deadBuffer.error() == ErrorCode::InvalidHandle);
    }

    // Draw parameters outside the sources are rejected.
    {
        ContextRig rig{};
        ResourceRegistry& registry = rig.context.resources();
        const Handle program = valueOrThrow(registry.createProgram(ProgramDesc{ .reflection = colorProgram() }));
        const Handle vertices = makeVertexBuffer(registry, 3);

        DrawRequest request = colorDraw(program, vertices);
        request.vertexCount = 10;
        auto validated = rig.context.validate(request);
        assert(!validated.hasValue());
        assert(validated.error() == ErrorCode::InvalidDrawParameters);
        assert(hasTag(validated.context(), "vertex_range_out_of_bounds"));
    }

    // Features the device lacks are rejected by name.
    {
        ContextConfig config = inlineConfig();
        config.capabilities.depthClamp = false;
        ContextRig rig{ config };
        ResourceRegistry& registry = rig.context.resources();
        const Handle program = valueOrThrow(registry.createProgram(ProgramDesc{ .reflection = colorProgram() }));
        const Handle vertices = makeVertexBuffer(registry, 3);

        DrawRequest request = colorDraw(program, vertices);
        request.parameters.depthClamp = true;
        auto validated = rig.context.validate(request);
        assert(!validated.hasValue());
        assert(validated.error() == ErrorCode::UnsupportedFeature);
        assert(hasTag(validated.context(), "depth_clamp"));
    }

    // Depth testing into a framebuffer without depth is unsupported.
    {
        ContextRig rig{};
        ResourceRegistry& registry = rig.context.resources();
        const Handle program = valueOrThrow(registry.createProgram(ProgramDesc{ .reflection = colorProgram() }));
        const Handle vertices = makeVertexBuffer(registry, 3);
        const Handle color = makeTexture(registry, 32, 32);
        FramebufferDesc fbDesc{};
        fbDesc.colorAttachments.push_back(FramebufferAttachment{ .texture = color });
        const Handle framebuffer = valueOrThrow(registry.createFramebuffer(fbDesc));

        DrawRequest request = colorDraw(program, vertices);
        request.framebuffer = framebuffer;
        request.parameters.depthTest = DepthTest{ .enabled = true, .func = CompareFunc::Less };
        auto validated = rig.context.validate(request);
        assert(!validated.hasValue());
        assert(hasTag(validated.context(), "depth_buffer_missing"));

        request.parameters.depthTest.enabled = false;
        auto accepted = rig.context.validate(request);
        assert(accepted.hasValue());
        assert(accepted.value().parameters.viewport->size == glm::ivec2(32, 32));
    }

    // Attachments of different sizes cannot be drawn into together.
    {
        ContextRig rig{};
        ResourceRegistry& registry = rig.context.resources();
        const Handle program = valueOrThrow(registry.createProgram(ProgramDesc{ .reflection = colorProgram() }));
        const Handle vertices = makeVertexBuffer(registry, 3);
        FramebufferDesc fbDesc{};
        fbDesc.colorAttachments.push_back(FramebufferAttachment{ .texture = makeTexture(registry, 32, 32) });
        fbDesc.colorAttachments.push_back(FramebufferAttachment{ .texture = makeTexture(registry, 16, 16) });
        const Handle framebuffer = valueOrThrow(registry.createFramebuffer(fbDesc));

        DrawRequest request = colorDraw(program, vertices);
        request.framebuffer = framebuffer;
        auto validated = rig.context.validate(request);
        assert(!validated.hasValue());
        assert(validated.error() == ErrorCode::FramebufferMismatch);
        assert(hasTag(validated.context(), "attachment_dimension_mismatch"));
    }

    // Three distinct textures on a two-unit device do not fit; sharing one binding does.
    {
        ContextConfig config = inlineConfig();
        config.capabilities.maxTextureUnits = 2;
        ContextRig rig{ config };
        ResourceRegistry& registry = rig.context.resources();
        const Handle program = valueOrThrow(registry.createProgram(ProgramDesc{ .reflection = texturedProgram(3) }));
        const Handle vertices = makeVertexBuffer(registry, 3);
        const Handle a = makeTexture(registry);
        const Handle b = makeTexture(registry);
        const Handle c = makeTexture(registry);
        static_cast<void>(rig.flushAndTake());

        auto drawn = rig.context.draw(texturedDraw(program, vertices, { a, b, c }));
        assert(!drawn.hasValue());
        assert(drawn.error() == ErrorCode::TextureBinding);
        assert(hasTag(drawn.context(), "too_many_texture_units"));
        assert(rig.flushAndTake().empty());

        assert(rig.context.draw(texturedDraw(program, vertices, { a, b, a })).hasValue());
    }

    // The same request against the same registry always gets the same verdict.
    {
        ContextRig rig{};
        ResourceRegistry& registry = rig.context.resources();
        const Handle program = valueOrThrow(registry.createProgram(ProgramDesc{ .reflection = colorProgram() }));
        const Handle vertices = makeVertexBuffer(registry, 3);
        DrawValidator validator{ registry, registry.capabilities() };
        const RenderTargetInfo target = rig.context.defaultFramebuffer();

        DrawRequest bad = colorDraw(program, vertices);
        bad.parameters.depthRange = glm::vec2(-1.0F, 1.0F);
        for (int i = 0; i < 4; ++i) {
            auto verdict = validator.validate(bad, target);
            assert(!verdict.hasValue());
            assert(verdict.error() == ErrorCode::InvalidDrawParameters);
            assert(hasTag(verdict.context(), "depth_range_out_of_bounds"));
        }

        const DrawRequest good = colorDraw(program, vertices);
        auto first = validator.validate(good, target);
        auto second = validator.validate(good, target);
        assert(first.hasValue() && second.hasValue());
        assert(first.value().vertexLayout == second.value().vertexLayout);
        assert(first.value().draw.vertexCount == second.value().draw.vertexCount);
        assert(first.value().accesses.size() == second.value().accesses.size());
    }

    return 0;
}
