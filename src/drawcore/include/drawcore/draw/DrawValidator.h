#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include <drawcore/core/Status.h>
#include <drawcore/device/DeviceCapabilities.h>
#include <drawcore/draw/DrawRequest.h>
#include <drawcore/resources/ResourceRegistry.h>

namespace drawcore {

    // Rejects draws that would be undefined behaviour on the device. Never touches the
    // device or the command queue; the same request against the same registry state
    // always produces the same verdict.
    //
    // Checks run in a fixed order and the first failure wins:
    //   handles -> attributes -> uniforms -> features -> textures -> framebuffer
    class DrawValidator
    {
    public:
        DrawValidator(const ResourceRegistry& registry, const DeviceCapabilities& capabilities);

        [[nodiscard]] Expected<ValidatedDraw> validate(const DrawRequest& request, const RenderTargetInfo& defaultTarget) const;

        // Resolves the target of a clear or readback. Null handle = the default framebuffer.
        [[nodiscard]] Expected<ResourceDescriptor> resolveFramebuffer(Handle framebuffer, const char* operation) const;

    private:
        struct ResolvedHandles {
            ResourceDescriptor program{};
            std::optional<ResourceDescriptor> framebuffer{};
            std::vector<ResourceDescriptor> vertexBuffers{};
            std::optional<ResourceDescriptor> indexBuffer{};
            std::map<std::string, ResourceDescriptor> uniformResources{};
        };

        struct TextureUse {
            const UniformInfo* uniform{ nullptr };
            const TextureBinding* binding{ nullptr };
            const ResourceDescriptor* texture{ nullptr };
        };

        [[nodiscard]] Expected<ResourceDescriptor> fetch(Handle handle, ResourceKind kind, const char* role) const;
        [[nodiscard]] Expected<ResolvedHandles> checkHandles(const DrawRequest& request) const;
        [[nodiscard]] Expected<void> checkAttributes(const DrawRequest& request, const ResolvedHandles& handles, ValidatedDraw& out) const;
        [[nodiscard]] Expected<void> checkUniforms(const DrawRequest& request,
            const ResolvedHandles& handles,
            std::vector<TextureUse>& textures,
            ValidatedDraw& out) const;
        [[nodiscard]] Expected<void> checkFeatures(const DrawRequest& request, const ValidatedDraw& out) const;
        [[nodiscard]] Expected<void> checkTextures(const std::vector<TextureUse>& textures, ValidatedDraw& out) const;
        [[nodiscard]] Expected<void> checkFramebuffer(const ResolvedHandles& handles, ValidatedDraw& out) const;

        const ResourceRegistry& registry_;
        DeviceCapabilities caps_{};
    };

} // namespace drawcore
