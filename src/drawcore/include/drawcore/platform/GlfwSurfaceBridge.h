#pragma once

#include <cstdint>
#include <vector>

#include <drawcore/core/Status.h>

struct GLFWwindow;

namespace drawcore {

    class RenderContext;

    // Owns the GLFW window and forwards its events to a RenderContext: framebuffer resizes
    // become viewport invalidations, and a frame is swapped only after present() has handed
    // every queued command to the device.
    class GlfwSurfaceBridge
    {
    public:
        struct WindowConfig {
            uint32_t width{ 1280 };
            uint32_t height{ 720 };
            const char* title{ "drawcore" };
            // false = GLFW_NO_API, for a Vulkan surface; true = a GL context that swaps.
            bool clientApi{ false };
        };

        GlfwSurfaceBridge() = default;
        ~GlfwSurfaceBridge();

        GlfwSurfaceBridge(const GlfwSurfaceBridge&) = delete;
        GlfwSurfaceBridge& operator=(const GlfwSurfaceBridge&) = delete;

        [[nodiscard]] Expected<void> open(const WindowConfig& config);
        void close() noexcept;

        // The context must outlive the bridge or be detached first.
        void attach(RenderContext& context);
        void detach() noexcept;

        [[nodiscard]] Expected<void> presentFrame();
        void pollEvents();
        [[nodiscard]] bool shouldClose() const;
        void framebufferSize(uint32_t& width, uint32_t& height) const;

        // Instance extensions GLFW needs for a Vulkan surface. Valid after open().
        [[nodiscard]] static std::vector<const char*> requiredInstanceExtensions();

        [[nodiscard]] GLFWwindow* window() const noexcept { return window_; }

    private:
        static void onFramebufferResized(GLFWwindow* window, int width, int height);

        GLFWwindow* window_{ nullptr };
        RenderContext* context_{ nullptr };
        bool clientApi_{ false };
        bool initialised_{ false };
    };

} // namespace drawcore
