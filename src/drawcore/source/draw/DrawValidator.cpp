#include <algorithm>
#include <limits>
#include <set>
#include <string>
#include <utility>

#include <drawcore/draw/DrawValidator.h>

namespace drawcore {

    namespace {
        constexpr const char* kSubsystem = "draw_validator";
        constexpr const char* kOp = "DrawValidator::validate";

        ErrorContext reject(ErrorCode code, const char* reason, std::string detail = {}, uint64_t handle = 0)
        {
            return makeError(kOp, code, kSubsystem, reason, std::move(detail), handle);
        }

        ErrorContext layoutMismatch(const char* reason, std::string detail, std::vector<LayoutDiffEntry> diff)
        {
            ErrorContext ctx = reject(ErrorCode::UniformLayoutMismatch, reason, std::move(detail));
            ctx.layoutDiff = std::move(diff);
            return ctx;
        }

        uint32_t indexByteSize(IndexType type) noexcept
        {
            return type == IndexType::U16 ? 2u : 4u;
        }

        bool attributeTypesCompatible(ValueType provided, ValueType required) noexcept
        {
            return scalarKind(provided) == scalarKind(required) && componentCount(provided) == componentCount(required);
        }

        std::string describeMember(const BlockMember& member)
        {
            std::string text = std::string(valueTypeToString(member.type)) + " @" + std::to_string(member.offset);
            if (member.arraySize > 1) {
                text += " [" + std::to_string(member.arraySize) + " x " + std::to_string(member.arrayStride) + "]";
            }
            return text;
        }

        std::vector<LayoutDiffEntry> diffBlockLayout(const std::vector<BlockMember>& expected, const std::vector<BlockMember>& provided)
        {
            std::vector<LayoutDiffEntry> diff{};
            for (const BlockMember& member : expected) {
                const auto it = std::find_if(provided.begin(), provided.end(),
                    [&](const BlockMember& p) { return p.name == member.name; });
                if (it == provided.end()) {
                    diff.push_back(LayoutDiffEntry{ .member = member.name, .expected = describeMember(member), .provided = "missing" });
                }
                else if (!(*it == member)) {
                    diff.push_back(LayoutDiffEntry{ .member = member.name, .expected = describeMember(member), .provided = describeMember(*it) });
                }
            }
            for (const BlockMember& member : provided) {
                const auto it = std::find_if(expected.begin(), expected.end(),
                    [&](const BlockMember& e) { return e.name == member.name; });
                if (it == expected.end()) {
                    diff.push_back(LayoutDiffEntry{ .member = member.name, .expected = "absent", .provided = describeMember(member) });
                }
            }
            return diff;
        }

        bool samplerAccepts(SampleClass expected, SampleClass actual) noexcept
        {
            // Depth textures sample as float when no comparison is requested.
            return expected == actual || (expected == SampleClass::Float && actual == SampleClass::Depth);
        }

        bool isMapped(const ResourceDescriptor& desc) noexcept
        {
            const BufferDesc* buffer = desc.buffer();
            return buffer != nullptr && buffer->usage == BufferUsage::Persistent;
        }
    }

    DrawValidator::DrawValidator(const ResourceRegistry& registry, const DeviceCapabilities& capabilities)
        : registry_(registry)
        , caps_(capabilities)
    {
    }

    Expected<ResourceDescriptor> DrawValidator::fetch(Handle handle, ResourceKind kind, const char* role) const
    {
        if (handle.isNull()) {
            return reject(ErrorCode::InvalidHandle, "null_handle", role);
        }
        if (handle.kind != kind) {
            return reject(ErrorCode::InvalidHandle, "wrong_resource_kind",
                std::string(role) + ": expected " + resourceKindToString(kind) + ", got " + resourceKindToString(handle.kind),
                handle.packed());
        }
        if (!registry_.isLive(handle)) {
            return reject(ErrorCode::InvalidHandle, "dead_handle", role, handle.packed());
        }
        return registry_.describe(handle);
    }

    Expected<ResourceDescriptor> DrawValidator::resolveFramebuffer(Handle framebuffer, const char* operation) const
    {
        if (framebuffer.isNull()) {
            return ResourceDescriptor{};
        }
        if (framebuffer.kind != ResourceKind::Framebuffer || !registry_.isLive(framebuffer)) {
            return makeError(operation, ErrorCode::InvalidHandle, kSubsystem, "dead_handle", "framebuffer", framebuffer.packed());
        }
        return registry_.describe(framebuffer);
    }

    Expected<DrawValidator::ResolvedHandles> DrawValidator::checkHandles(const DrawRequest& request) const
    {
        ResolvedHandles handles{};

        auto program = fetch(request.program, ResourceKind::Program, "program");
        if (!program.hasValue()) {
            return program.context();
        }
        handles.program = std::move(program.value());

        if (!request.framebuffer.isNull()) {
            auto framebuffer = fetch(request.framebuffer, ResourceKind::Framebuffer, "framebuffer");
            if (!framebuffer.hasValue()) {
                return framebuffer.context();
            }
            handles.framebuffer = std::move(framebuffer.value());
        }

        for (const VertexSource& source : request.vertices) {
            auto buffer = fetch(source.buffer, ResourceKind::Buffer, "vertex source");
            if (!buffer.hasValue()) {
                return buffer.context();
            }
            handles.vertexBuffers.push_back(std::move(buffer.value()));
        }

        if (request.indices.has_value()) {
            auto buffer = fetch(request.indices->buffer, ResourceKind::Buffer, "index source");
            if (!buffer.hasValue()) {
                return buffer.context();
            }
            handles.indexBuffer = std::move(buffer.value());
        }

        for (const auto& [name, binding] : request.uniforms) {
            Handle handle{};
            ResourceKind kind = ResourceKind::Buffer;
            if (const auto* texture = std::get_if<TextureBinding>(&binding)) {
                handle = texture->texture;
                kind = ResourceKind::Texture;
            }
            else if (const auto* block = std::get_if<BlockBinding>(&binding)) {
                handle = block->buffer;
            }
            else {
                continue;
            }
            auto resource = fetch(handle, kind, name.c_str());
            if (!resource.hasValue()) {
                return resource.context();
            }
            handles.uniformResources.emplace(name, std::move(resource.value()));
        }
        return handles;
    }

    Expected<void> DrawValidator::checkAttributes(const DrawRequest& request, const ResolvedHandles& handles, ValidatedDraw& out) const
    {
        const ProgramReflection& reflection = *handles.program.program()->reflection;

        // Every attribute the program reads must be sourced before the sources' extents matter.
        for (const AttributeInfo& required : reflection.attributes) {
            const VertexSource* found = nullptr;
            const VertexAttributeSource* foundAttribute = nullptr;
            size_t sourceIndex = 0;
            for (size_t i = 0; i < request.vertices.size() && found == nullptr; ++i) {
                for (const VertexAttributeSource& attribute : request.vertices[i].attributes) {
                    if (attribute.name == required.name) {
                        found = &request.vertices[i];
                        foundAttribute = &attribute;
                        sourceIndex = i;
                        break;
                    }
                }
            }
            if (found == nullptr) {
                return reject(ErrorCode::MissingAttribute, "missing_attribute", required.name);
            }
            if (!attributeTypesCompatible(foundAttribute->type, required.type)) {
                return reject(ErrorCode::MissingAttribute, "attribute_type_mismatch",
                    required.name + ": program expects " + valueTypeToString(required.type)
                    + ", source provides " + valueTypeToString(foundAttribute->type));
            }
            out.vertexLayout.push_back(VertexAttributeBinding{
                .location = required.location,
                .buffer = handles.vertexBuffers[sourceIndex].storage,
                .offset = found->offset + foundAttribute->offset,
                .stride = found->stride,
                .type = foundAttribute->type,
                .divisor = found->divisor });
        }
        std::sort(out.vertexLayout.begin(), out.vertexLayout.end(),
            [](const VertexAttributeBinding& a, const VertexAttributeBinding& b) { return a.location < b.location; });

        std::optional<uint32_t> verticesAvailable{};
        std::optional<uint32_t> instancesAvailable{};
        for (size_t i = 0; i < request.vertices.size(); ++i) {
            const VertexSource& source = request.vertices[i];
            const ResourceDescriptor& buffer = handles.vertexBuffers[i];

            uint64_t elementSize = source.stride;
            for (const VertexAttributeSource& attribute : source.attributes) {
                const uint64_t end = attribute.offset + valueByteSize(attribute.type);
                if (source.stride != 0 && end > source.stride) {
                    return reject(ErrorCode::InvalidDrawParameters, "attribute_outside_element", attribute.name, source.buffer.packed());
                }
                elementSize = std::max(elementSize, end);
            }
            const uint64_t bytes = elementSize * source.elementCount;
            if (source.offset + bytes > buffer.byteSize) {
                return reject(ErrorCode::InvalidDrawParameters, "vertex_range_out_of_bounds",
                    std::to_string(source.offset + bytes) + " bytes needed, buffer holds " + std::to_string(buffer.byteSize),
                    source.buffer.packed());
            }
            out.accesses.push_back(TrackedAccess{
                .storage = buffer.storage,
                .range = ByteRange{ source.offset, source.offset + bytes },
                .mode = AccessMode::Read,
                .mapped = isMapped(buffer) });

            if (source.divisor == 0) {
                verticesAvailable = std::min(verticesAvailable.value_or(std::numeric_limits<uint32_t>::max()), source.elementCount);
                continue;
            }
            const uint64_t capacity = uint64_t{ source.elementCount } * source.divisor;
            const uint32_t instances = static_cast<uint32_t>(std::min<uint64_t>(capacity, std::numeric_limits<uint32_t>::max()));
            if (instancesAvailable.has_value() && *instancesAvailable != instances) {
                return reject(ErrorCode::InvalidDrawParameters, "instances_count_mismatch",
                    std::to_string(*instancesAvailable) + " vs " + std::to_string(instances));
            }
            instancesAvailable = instances;
        }

        uint32_t instanceCount = request.instanceCount != 0 ? request.instanceCount : instancesAvailable.value_or(1);
        if (instancesAvailable.has_value() && instanceCount > *instancesAvailable) {
            return reject(ErrorCode::InvalidDrawParameters, "instances_count_mismatch",
                std::to_string(instanceCount) + " instances requested, sources hold " + std::to_string(*instancesAvailable));
        }

        DrawCmd draw{};
        draw.primitive = request.primitive;
        draw.firstVertex = request.firstVertex;
        draw.instanceCount = instanceCount;
        draw.patchVertices = request.patchVertices;

        if (request.indices.has_value()) {
            const IndexSource& indices = *request.indices;
            const ResourceDescriptor& buffer = *handles.indexBuffer;
            const uint32_t stride = indexByteSize(indices.type);
            if (indices.offset % stride != 0) {
                return reject(ErrorCode::InvalidDrawParameters, "index_offset_misaligned", {}, indices.buffer.packed());
            }
            const uint64_t bytes = uint64_t{ indices.count } * stride;
            if (indices.offset + bytes > buffer.byteSize) {
                return reject(ErrorCode::InvalidDrawParameters, "index_range_out_of_bounds",
                    std::to_string(indices.offset + bytes) + " bytes needed, buffer holds " + std::to_string(buffer.byteSize),
                    indices.buffer.packed());
            }
            const uint32_t count = request.vertexCount != 0 ? request.vertexCount : indices.count - std::min(indices.count, request.firstVertex);
            if (uint64_t{ request.firstVertex } + count > indices.count) {
                return reject(ErrorCode::InvalidDrawParameters, "index_range_out_of_bounds",
                    "draws indices up to " + std::to_string(uint64_t{ request.firstVertex } + count) + " of " + std::to_string(indices.count));
            }
            draw.indexed = true;
            draw.indexOffset = indices.offset;
            draw.vertexCount = count;
            out.indexBuffer = IndexBinding{ .buffer = buffer.storage, .type = indices.type };
            out.accesses.push_back(TrackedAccess{
                .storage = buffer.storage,
                .range = ByteRange{ indices.offset, indices.offset + bytes },
                .mode = AccessMode::Read,
                .mapped = isMapped(buffer) });
        }
        else {
            uint32_t count = request.vertexCount;
            if (count == 0) {
                if (!verticesAvailable.has_value()) {
                    return reject(ErrorCode::InvalidDrawParameters, "vertex_count_unknown");
                }
                count = *verticesAvailable - std::min(*verticesAvailable, request.firstVertex);
            }
            if (verticesAvailable.has_value() && uint64_t{ request.firstVertex } + count > *verticesAvailable) {
                return reject(ErrorCode::InvalidDrawParameters, "vertex_range_out_of_bounds",
                    "draws vertices up to " + std::to_string(uint64_t{ request.firstVertex } + count)
                    + " of " + std::to_string(*verticesAvailable));
            }
            draw.vertexCount = count;
        }

        if (reflection.hasTessellation && request.primitive != PrimitiveType::Patches) {
            return reject(ErrorCode::InvalidDrawParameters, "tessellation_without_patches");
        }
        if (!reflection.hasTessellation && request.primitive == PrimitiveType::Patches) {
            return reject(ErrorCode::InvalidDrawParameters, "patches_without_tessellation");
        }

        out.draw = draw;
        return {};
    }

    Expected<void> DrawValidator::checkUniforms(const DrawRequest& request,
        const ResolvedHandles& handles,
        std::vector<TextureUse>& textures,
        ValidatedDraw& out) const
    {
        const ProgramReflection& reflection = *handles.program.program()->reflection;

        for (const UniformInfo& uniform : reflection.uniforms) {
            const auto it = request.uniforms.find(uniform.name);
            if (it == request.uniforms.end()) {
                return layoutMismatch("uniform_missing", uniform.name,
                    { LayoutDiffEntry{ .member = uniform.name, .expected = valueTypeToString(uniform.type), .provided = "nothing" } });
            }
            const UniformBinding& binding = it->second;

            if (std::holds_alternative<BlockBinding>(binding)) {
                return layoutMismatch("uniform_buffer_to_value", uniform.name,
                    { LayoutDiffEntry{ .member = uniform.name, .expected = valueTypeToString(uniform.type), .provided = "uniform buffer" } });
            }

            if (isSamplerType(uniform.type)) {
                const auto* texture = std::get_if<TextureBinding>(&binding);
                if (texture == nullptr) {
                    return layoutMismatch("uniform_type_mismatch", uniform.name,
                        { LayoutDiffEntry{ .member = uniform.name,
                            .expected = valueTypeToString(uniform.type),
                            .provided = valueTypeToString(uniformValueType(std::get<UniformValue>(binding))) } });
                }
                textures.push_back(TextureUse{
                    .uniform = &uniform,
                    .binding = texture,
                    .texture = &handles.uniformResources.at(uniform.name) });
                continue;
            }

            const auto* value = std::get_if<UniformValue>(&binding);
            if (value == nullptr) {
                return layoutMismatch("uniform_type_mismatch", uniform.name,
                    { LayoutDiffEntry{ .member = uniform.name, .expected = valueTypeToString(uniform.type), .provided = "texture" } });
            }
            if (uniformValueType(*value) != uniform.type) {
                return layoutMismatch("uniform_type_mismatch", uniform.name,
                    { LayoutDiffEntry{ .member = uniform.name,
                        .expected = valueTypeToString(uniform.type),
                        .provided = valueTypeToString(uniformValueType(*value)) } });
            }
            out.uniforms.emplace_back(uniform.location, *value);
        }

        for (const UniformBlockInfo& block : reflection.uniformBlocks) {
            const auto it = request.uniforms.find(block.name);
            if (it == request.uniforms.end()) {
                return layoutMismatch("uniform_missing", block.name,
                    { LayoutDiffEntry{ .member = block.name, .expected = "uniform block", .provided = "nothing" } });
            }
            const auto* bound = std::get_if<BlockBinding>(&it->second);
            if (bound == nullptr) {
                return layoutMismatch("uniform_value_to_block", block.name,
                    { LayoutDiffEntry{ .member = block.name, .expected = "uniform block", .provided = "single value" } });
            }

            if (!bound->layout.empty()) {
                std::vector<LayoutDiffEntry> diff = diffBlockLayout(block.members, bound->layout);
                if (!diff.empty()) {
                    return layoutMismatch("block_layout_mismatch", block.name, std::move(diff));
                }
            }

            const ResourceDescriptor& buffer = handles.uniformResources.at(block.name);
            if (bound->offset > buffer.byteSize) {
                return layoutMismatch("block_buffer_too_small", block.name, {});
            }
            const uint64_t size = bound->size != 0 ? bound->size : buffer.byteSize - bound->offset;
            if (bound->offset + size > buffer.byteSize || size < block.size) {
                return layoutMismatch("block_buffer_too_small",
                    block.name + ": " + std::to_string(size) + " bytes bound, block needs " + std::to_string(block.size),
                    {});
            }

            out.blocks.push_back(ResolvedBlock{
                .binding = block.binding,
                .buffer = UniformBufferBinding{ .buffer = buffer.storage, .offset = bound->offset, .size = size } });
            out.accesses.push_back(TrackedAccess{
                .storage = buffer.storage,
                .range = ByteRange{ bound->offset, bound->offset + size },
                .mode = AccessMode::Read,
                .mapped = isMapped(buffer) });
        }
        return {};
    }

    Expected<void> DrawValidator::checkFeatures(const DrawRequest& request, const ValidatedDraw& out) const
    {
        const DrawParameters& params = request.parameters;

        if (params.depthRange.x < 0.0F || params.depthRange.x > 1.0F || params.depthRange.y < 0.0F || params.depthRange.y > 1.0F) {
            return reject(ErrorCode::InvalidDrawParameters, "depth_range_out_of_bounds");
        }
        if (params.viewport.has_value()) {
            const Rect& viewport = *params.viewport;
            if (viewport.size.x <= 0 || viewport.size.y <= 0) {
                return reject(ErrorCode::InvalidDrawParameters, "empty_viewport");
            }
            if (static_cast<uint32_t>(viewport.size.x) > caps_.maxViewportWidth
                || static_cast<uint32_t>(viewport.size.y) > caps_.maxViewportHeight) {
                return reject(ErrorCode::InvalidDrawParameters, "viewport_too_large");
            }
        }
        if (params.scissor.has_value() && (params.scissor->size.x < 0 || params.scissor->size.y < 0)) {
            return reject(ErrorCode::InvalidDrawParameters, "negative_scissor");
        }

        if (params.depthClamp && !caps_.depthClamp) {
            return reject(ErrorCode::UnsupportedFeature, "depth_clamp");
        }
        if (params.polygonMode != PolygonMode::Fill && !caps_.polygonModeNonFill) {
            return reject(ErrorCode::UnsupportedFeature, "polygon_mode");
        }
        if (params.blend.usesMinMax() && !caps_.minMaxBlend) {
            return reject(ErrorCode::UnsupportedFeature, "min_max_blending");
        }
        if (params.lineWidth < caps_.minLineWidth || params.lineWidth > caps_.maxLineWidth) {
            return reject(ErrorCode::UnsupportedFeature, "line_width", std::to_string(params.lineWidth));
        }
        if (params.pointSize <= 0.0F || params.pointSize > caps_.maxPointSize) {
            return reject(ErrorCode::UnsupportedFeature, "point_size", std::to_string(params.pointSize));
        }
        if (caps_.maxClipDistances < 32 && (params.clipDistanceMask >> caps_.maxClipDistances) != 0) {
            return reject(ErrorCode::UnsupportedFeature, "clip_distances");
        }
        if (params.multisample && out.target.samples > 1 && !caps_.multisample) {
            return reject(ErrorCode::UnsupportedFeature, "multisampling");
        }
        if (params.primitiveRestart && !caps_.primitiveRestart) {
            return reject(ErrorCode::UnsupportedFeature, "primitive_restart");
        }
        if (params.rasterizerDiscard && !caps_.rasterizerDiscard) {
            return reject(ErrorCode::UnsupportedFeature, "rasterizer_discard");
        }
        if (request.primitive == PrimitiveType::Patches) {
            if (!caps_.tessellation) {
                return reject(ErrorCode::UnsupportedFeature, "tessellation");
            }
            if (request.patchVertices == 0 || request.patchVertices > caps_.maxPatchVertices) {
                return reject(ErrorCode::UnsupportedFeature, "patch_size", std::to_string(request.patchVertices));
            }
        }
        if (params.depthTest.enabled && !out.target.hasDepth) {
            return reject(ErrorCode::UnsupportedFeature, "depth_buffer_missing");
        }
        if (params.stencil.enabled && !out.target.hasStencil) {
            return reject(ErrorCode::UnsupportedFeature, "stencil_buffer_missing");
        }
        return {};
    }

    Expected<void> DrawValidator::checkTextures(const std::vector<TextureUse>& textures, ValidatedDraw& out) const
    {
        std::set<std::pair<StorageId, size_t>> units{};
        std::vector<SamplerState> samplers{};
        for (const TextureUse& use : textures) {
            auto sampler = std::find(samplers.begin(), samplers.end(), use.binding->sampler);
            if (sampler == samplers.end()) {
                samplers.push_back(use.binding->sampler);
                sampler = samplers.end() - 1;
            }
            units.emplace(use.texture->storage, static_cast<size_t>(sampler - samplers.begin()));
        }
        if (units.size() > caps_.maxTextureUnits) {
            return reject(ErrorCode::TextureBinding, "too_many_texture_units",
                std::to_string(units.size()) + " units needed, device has " + std::to_string(caps_.maxTextureUnits));
        }

        for (size_t i = 0; i < textures.size(); ++i) {
            const TextureUse& use = textures[i];
            for (size_t j = 0; j < i; ++j) {
                const TextureUse& other = textures[j];
                if (other.texture->storage == use.texture->storage
                    && (samplerClass(other.uniform->type) != samplerClass(use.uniform->type)
                        || samplerTarget(other.uniform->type) != samplerTarget(use.uniform->type))) {
                    return reject(ErrorCode::TextureBinding, "incompatible_sampler_types",
                        other.uniform->name + " and " + use.uniform->name, use.binding->texture.packed());
                }
            }

            const TextureDesc& texture = *use.texture->texture();
            if (samplerTarget(use.uniform->type) != texture.target) {
                return reject(ErrorCode::TextureBinding, "texture_target_mismatch",
                    use.uniform->name + ": " + valueTypeToString(use.uniform->type) + " given a "
                    + textureTargetToString(texture.target) + " texture", use.binding->texture.packed());
            }
            if (texture.samples != 1) {
                return reject(ErrorCode::TextureBinding, "multisample_texture_sampled", use.uniform->name, use.binding->texture.packed());
            }
            const std::optional<SampleClass> expected = samplerClass(use.uniform->type);
            if (!expected.has_value() || !samplerAccepts(*expected, sampleClass(texture.format))) {
                return reject(ErrorCode::TextureBinding, "texture_format_mismatch",
                    use.uniform->name + ": " + textureFormatToString(texture.format), use.binding->texture.packed());
            }

            out.textures.push_back(ResolvedTexture{
                .location = use.uniform->location,
                .storage = use.texture->storage,
                .target = texture.target,
                .sampler = use.binding->sampler });
            out.accesses.push_back(TrackedAccess{
                .storage = use.texture->storage,
                .range = ByteRange{ 0, use.texture->byteSize },
                .mode = AccessMode::Read,
                .mapped = false });
        }
        return {};
    }

    Expected<void> DrawValidator::checkFramebuffer(const ResolvedHandles& handles, ValidatedDraw& out) const
    {
        if (!handles.framebuffer.has_value()) {
            return {};
        }
        const FramebufferDesc& desc = *handles.framebuffer->framebuffer();

        std::vector<FramebufferAttachment> attachments = desc.colorAttachments;
        if (desc.depthAttachment.has_value()) {
            attachments.push_back(*desc.depthAttachment);
        }
        if (desc.stencilAttachment.has_value()) {
            attachments.push_back(*desc.stencilAttachment);
        }

        std::optional<std::pair<uint32_t, uint32_t>> extent{};
        std::optional<uint32_t> samples{};
        for (const FramebufferAttachment& attachment : attachments) {
            if (!registry_.isLive(attachment.texture)) {
                return reject(ErrorCode::FramebufferMismatch, "dead_attachment", {}, attachment.texture.packed());
            }
            auto texture = registry_.describe(attachment.texture);
            if (!texture.hasValue()) {
                return reject(ErrorCode::FramebufferMismatch, "dead_attachment", {}, attachment.texture.packed());
            }
            const TextureDesc& tex = *texture.value().texture();
            const std::pair<uint32_t, uint32_t> size{ mipExtent(tex.width, attachment.mipLevel), mipExtent(tex.height, attachment.mipLevel) };
            if (extent.has_value() && *extent != size) {
                return reject(ErrorCode::FramebufferMismatch, "attachment_dimension_mismatch",
                    std::to_string(extent->first) + "x" + std::to_string(extent->second) + " vs "
                    + std::to_string(size.first) + "x" + std::to_string(size.second));
            }
            if (samples.has_value() && *samples != tex.samples) {
                return reject(ErrorCode::FramebufferMismatch, "attachment_sample_mismatch",
                    std::to_string(*samples) + " vs " + std::to_string(tex.samples));
            }
            extent = size;
            samples = tex.samples;

            out.accesses.push_back(TrackedAccess{
                .storage = texture.value().storage,
                .range = ByteRange{ 0, texture.value().byteSize },
                .mode = AccessMode::Write,
                .mapped = false });
        }
        return {};
    }

    Expected<ValidatedDraw> DrawValidator::validate(const DrawRequest& request, const RenderTargetInfo& defaultTarget) const
    {
        auto handles = checkHandles(request);
        if (!handles.hasValue()) {
            return handles.context();
        }
        const ResolvedHandles& resolved = handles.value();

        ValidatedDraw out{};
        out.program = resolved.program.storage;
        out.framebuffer = resolved.framebuffer.has_value() ? resolved.framebuffer->storage : kNullStorage;
        out.target = resolved.framebuffer.has_value() ? resolved.framebuffer->target : defaultTarget;
        out.parameters = request.parameters;
        if (!out.parameters.viewport.has_value()) {
            out.parameters.viewport = Rect{
                .origin = { 0, 0 },
                .size = { static_cast<int32_t>(out.target.width), static_cast<int32_t>(out.target.height) } };
        }

        std::vector<TextureUse> textures{};
        DRAWCORE_RETURN_IF_FAILED(checkAttributes(request, resolved, out));
        DRAWCORE_RETURN_IF_FAILED(checkUniforms(request, resolved, textures, out));
        DRAWCORE_RETURN_IF_FAILED(checkFeatures(request, out));
        DRAWCORE_RETURN_IF_FAILED(checkTextures(textures, out));
        DRAWCORE_RETURN_IF_FAILED(checkFramebuffer(resolved, out));
        return out;
    }

} // namespace drawcore
