#include <drawcore/command/Command.h>

namespace drawcore {

    namespace {
        template<typename... Ts>
        struct Overloaded : Ts... {
            using Ts::operator()...;
        };
        template<typename... Ts>
        Overloaded(Ts...) -> Overloaded<Ts...>;
    }

    const char* stateFieldToString(StateField field) noexcept
    {
        switch (field) {
        case StateField::Program: return "program";
        case StateField::Framebuffer: return "framebuffer";
        case StateField::Viewport: return "viewport";
        case StateField::Scissor: return "scissor";
        case StateField::DepthTest: return "depth_test";
        case StateField::DepthWrite: return "depth_write";
        case StateField::DepthRange: return "depth_range";
        case StateField::DepthClamp: return "depth_clamp";
        case StateField::Stencil: return "stencil";
        case StateField::Blend: return "blend";
        case StateField::ColorMask: return "color_mask";
        case StateField::CullMode: return "cull_mode";
        case StateField::FrontFace: return "front_face";
        case StateField::PolygonMode: return "polygon_mode";
        case StateField::LineWidth: return "line_width";
        case StateField::PointSize: return "point_size";
        case StateField::Multisample: return "multisample";
        case StateField::Dither: return "dither";
        case StateField::ClipDistances: return "clip_distances";
        case StateField::RasterizerDiscard: return "rasterizer_discard";
        case StateField::PrimitiveRestart: return "primitive_restart";
        case StateField::VertexLayout: return "vertex_layout";
        case StateField::IndexBuffer: return "index_buffer";
        case StateField::TextureUnit: return "texture_unit";
        case StateField::UniformBuffer: return "uniform_buffer";
        case StateField::Uniform: return "uniform";
        default: return "unknown";
        }
    }

    CommandCategory commandCategory(const CommandPayload& payload) noexcept
    {
        return std::visit(Overloaded{
            [](const StateChangeCmd&) { return CommandCategory::StateChange; },
            [](const DrawCmd&) { return CommandCategory::Draw; },
            [](const ClearCmd&) { return CommandCategory::Draw; },
            [](const SignalFenceCmd&) { return CommandCategory::Sync; },
            [](const ReadBufferCmd&) { return CommandCategory::Readback; },
            [](const ReadPixelsCmd&) { return CommandCategory::Readback; },
            [](const PresentCmd&) { return CommandCategory::Present; },
            [](const auto&) { return CommandCategory::Resource; }
        }, payload);
    }

    const char* commandName(const CommandPayload& payload) noexcept
    {
        return std::visit(Overloaded{
            [](const StateChangeCmd&) { return "StateChange"; },
            [](const DrawCmd&) { return "Draw"; },
            [](const ClearCmd&) { return "Clear"; },
            [](const CreateStorageCmd&) { return "CreateStorage"; },
            [](const ReleaseStorageCmd&) { return "ReleaseStorage"; },
            [](const CopyStorageCmd&) { return "CopyStorage"; },
            [](const BufferWriteCmd&) { return "BufferWrite"; },
            [](const TextureUploadCmd&) { return "TextureUpload"; },
            [](const ReadBufferCmd&) { return "ReadBuffer"; },
            [](const ReadPixelsCmd&) { return "ReadPixels"; },
            [](const SignalFenceCmd&) { return "SignalFence"; },
            [](const PresentCmd&) { return "Present"; }
        }, payload);
    }

} // namespace drawcore
