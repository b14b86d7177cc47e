#include <algorithm>

#include <drawcore/state/StateDiff.h>

namespace drawcore {

    namespace {
        template<typename T>
        void diffField(StateField field, const T& from, const T& to, std::vector<CommandPayload>& out, DiffCounts& counts)
        {
            if (from == to) {
                ++counts.skipped;
                return;
            }
            out.emplace_back(StateChangeCmd{ .field = field, .slot = 0, .value = StateValue{ to } });
            ++counts.emitted;
        }

        template<typename T>
        void diffOptional(StateField field, const std::optional<T>& from, const std::optional<T>& to, std::vector<CommandPayload>& out, DiffCounts& counts)
        {
            // Nothing can be emitted for an unknown target.
            if (!to.has_value()) {
                ++counts.skipped;
                return;
            }
            if (from.has_value() && *from == *to) {
                ++counts.skipped;
                return;
            }
            out.emplace_back(StateChangeCmd{ .field = field, .slot = 0, .value = StateValue{ *to } });
            ++counts.emitted;
        }

        template<typename T>
        void diffSlots(StateField field, const std::vector<T>& from, const std::vector<T>& to, std::vector<CommandPayload>& out, DiffCounts& counts)
        {
            for (size_t i = 0; i < to.size(); ++i) {
                const bool same = i < from.size() && from[i] == to[i];
                if (same) {
                    ++counts.skipped;
                    continue;
                }
                out.emplace_back(StateChangeCmd{ .field = field, .slot = static_cast<uint32_t>(i), .value = StateValue{ to[i] } });
                ++counts.emitted;
            }
        }

        template<typename T>
        void assignSlot(std::vector<T>& slots, uint32_t slot, const T& value)
        {
            if (slots.size() <= slot) {
                slots.resize(static_cast<size_t>(slot) + 1);
            }
            slots[slot] = value;
        }
    }

    DiffCounts appendStateChanges(const PipelineState& from, const PipelineState& to, std::vector<CommandPayload>& out)
    {
        DiffCounts counts{};
        diffField(StateField::Program, from.program, to.program, out, counts);
        diffField(StateField::Framebuffer, from.framebuffer, to.framebuffer, out, counts);
        diffOptional(StateField::Viewport, from.viewport, to.viewport, out, counts);
        diffOptional(StateField::Scissor, from.scissor, to.scissor, out, counts);
        diffField(StateField::DepthTest, from.depthTest, to.depthTest, out, counts);
        diffField(StateField::DepthWrite, from.depthWrite, to.depthWrite, out, counts);
        diffField(StateField::DepthRange, from.depthRange, to.depthRange, out, counts);
        diffField(StateField::DepthClamp, from.depthClamp, to.depthClamp, out, counts);
        diffField(StateField::Stencil, from.stencil, to.stencil, out, counts);
        diffField(StateField::Blend, from.blend, to.blend, out, counts);
        diffField(StateField::ColorMask, from.colorMask, to.colorMask, out, counts);
        diffField(StateField::CullMode, from.cullMode, to.cullMode, out, counts);
        diffField(StateField::FrontFace, from.frontFace, to.frontFace, out, counts);
        diffField(StateField::PolygonMode, from.polygonMode, to.polygonMode, out, counts);
        diffField(StateField::LineWidth, from.lineWidth, to.lineWidth, out, counts);
        diffField(StateField::PointSize, from.pointSize, to.pointSize, out, counts);
        diffField(StateField::Multisample, from.multisample, to.multisample, out, counts);
        diffField(StateField::Dither, from.dither, to.dither, out, counts);
        diffField(StateField::ClipDistances, from.clipDistanceMask, to.clipDistanceMask, out, counts);
        diffField(StateField::RasterizerDiscard, from.rasterizerDiscard, to.rasterizerDiscard, out, counts);
        diffField(StateField::PrimitiveRestart, from.primitiveRestart, to.primitiveRestart, out, counts);
        diffField(StateField::VertexLayout, from.vertexLayout, to.vertexLayout, out, counts);
        diffField(StateField::IndexBuffer, from.indexBuffer, to.indexBuffer, out, counts);
        diffSlots(StateField::TextureUnit, from.textureUnits, to.textureUnits, out, counts);
        diffSlots(StateField::UniformBuffer, from.uniformBuffers, to.uniformBuffers, out, counts);
        return counts;
    }

    void applyStateChange(PipelineState& state, const StateChangeCmd& cmd)
    {
        const StateValue& v = cmd.value;
        switch (cmd.field) {
        case StateField::Program: state.program = std::get<StorageId>(v); break;
        case StateField::Framebuffer: state.framebuffer = std::get<StorageId>(v); break;
        case StateField::Viewport: state.viewport = std::get<Rect>(v); break;
        case StateField::Scissor: state.scissor = std::get<ScissorState>(v); break;
        case StateField::DepthTest: state.depthTest = std::get<DepthTest>(v); break;
        case StateField::DepthWrite: state.depthWrite = std::get<bool>(v); break;
        case StateField::DepthRange: state.depthRange = std::get<glm::vec2>(v); break;
        case StateField::DepthClamp: state.depthClamp = std::get<bool>(v); break;
        case StateField::Stencil: state.stencil = std::get<StencilState>(v); break;
        case StateField::Blend: state.blend = std::get<BlendState>(v); break;
        case StateField::ColorMask: state.colorMask = std::get<ColorMask>(v); break;
        case StateField::CullMode: state.cullMode = std::get<CullMode>(v); break;
        case StateField::FrontFace: state.frontFace = std::get<FrontFace>(v); break;
        case StateField::PolygonMode: state.polygonMode = std::get<PolygonMode>(v); break;
        case StateField::LineWidth: state.lineWidth = std::get<float>(v); break;
        case StateField::PointSize: state.pointSize = std::get<float>(v); break;
        case StateField::Multisample: state.multisample = std::get<bool>(v); break;
        case StateField::Dither: state.dither = std::get<bool>(v); break;
        case StateField::ClipDistances: state.clipDistanceMask = std::get<uint32_t>(v); break;
        case StateField::RasterizerDiscard: state.rasterizerDiscard = std::get<bool>(v); break;
        case StateField::PrimitiveRestart: state.primitiveRestart = std::get<bool>(v); break;
        case StateField::VertexLayout: state.vertexLayout = std::get<std::vector<VertexAttributeBinding>>(v); break;
        case StateField::IndexBuffer: state.indexBuffer = std::get<IndexBinding>(v); break;
        case StateField::TextureUnit: assignSlot(state.textureUnits, cmd.slot, std::get<TextureUnitBinding>(v)); break;
        case StateField::UniformBuffer: assignSlot(state.uniformBuffers, cmd.slot, std::get<UniformBufferBinding>(v)); break;
        case StateField::Uniform: break;
        default: break;
        }
    }

} // namespace drawcore
