#include <GLFW/glfw3.h>

#include <drawcore/device/RenderContext.h>
#include <drawcore/platform/GlfwSurfaceBridge.h>

namespace drawcore {

    namespace {
        constexpr const char* kSubsystem = "glfw_bridge";
    }

    GlfwSurfaceBridge::~GlfwSurfaceBridge()
    {
        close();
    }

    Expected<void> GlfwSurfaceBridge::open(const WindowConfig& config)
    {
        if (window_ != nullptr) {
            return makeError("GlfwSurfaceBridge::open", ErrorCode::InvalidArgument, kSubsystem, "window_already_open");
        }
        if (!glfwInit()) {
            return makeError("GlfwSurfaceBridge::open", ErrorCode::ResourceCreation, kSubsystem, "glfw_init_failed");
        }
        initialised_ = true;

        glfwWindowHint(GLFW_CLIENT_API, config.clientApi ? GLFW_OPENGL_API : GLFW_NO_API);
        window_ = glfwCreateWindow(
            static_cast<int>(config.width),
            static_cast<int>(config.height),
            config.title != nullptr ? config.title : "drawcore",
            nullptr,
            nullptr);
        if (!window_) {
            close();
            return makeError("GlfwSurfaceBridge::open", ErrorCode::ResourceCreation, kSubsystem, "window_creation_failed");
        }

        clientApi_ = config.clientApi;
        if (clientApi_) {
            glfwMakeContextCurrent(window_);
        }
        glfwSetWindowUserPointer(window_, this);
        glfwSetFramebufferSizeCallback(window_, &GlfwSurfaceBridge::onFramebufferResized);
        return {};
    }

    void GlfwSurfaceBridge::close() noexcept
    {
        if (window_ != nullptr) {
            glfwDestroyWindow(window_);
            window_ = nullptr;
        }
        if (initialised_) {
            glfwTerminate();
            initialised_ = false;
        }
        context_ = nullptr;
    }

    void GlfwSurfaceBridge::attach(RenderContext& context)
    {
        context_ = &context;
        uint32_t width = 0;
        uint32_t height = 0;
        framebufferSize(width, height);
        if (width > 0 && height > 0) {
            context_->notifyViewportResized(width, height);
        }
    }

    void GlfwSurfaceBridge::detach() noexcept
    {
        context_ = nullptr;
    }

    Expected<void> GlfwSurfaceBridge::presentFrame()
    {
        if (context_ == nullptr) {
            return makeError("GlfwSurfaceBridge::presentFrame", ErrorCode::InvalidArgument, kSubsystem, "no_context_attached");
        }
        DRAWCORE_RETURN_IF_FAILED(context_->present());
        if (clientApi_ && window_ != nullptr) {
            glfwSwapBuffers(window_);
        }
        return {};
    }

    void GlfwSurfaceBridge::pollEvents()
    {
        glfwPollEvents();
    }

    bool GlfwSurfaceBridge::shouldClose() const
    {
        return window_ == nullptr || glfwWindowShouldClose(window_);
    }

    void GlfwSurfaceBridge::framebufferSize(uint32_t& width, uint32_t& height) const
    {
        width = 0;
        height = 0;
        if (window_ == nullptr) {
            return;
        }
        int fbWidth = 0;
        int fbHeight = 0;
        glfwGetFramebufferSize(window_, &fbWidth, &fbHeight);
        width = fbWidth > 0 ? static_cast<uint32_t>(fbWidth) : 0;
        height = fbHeight > 0 ? static_cast<uint32_t>(fbHeight) : 0;
    }

    std::vector<const char*> GlfwSurfaceBridge::requiredInstanceExtensions()
    {
        uint32_t count = 0;
        const char* const* const exts = glfwGetRequiredInstanceExtensions(&count);
        if (!exts || count == 0) {
            return {};
        }
        return std::vector<const char*>(exts, exts + count);
    }

    void GlfwSurfaceBridge::onFramebufferResized(GLFWwindow* window, int width, int height)
    {
        auto* bridge = static_cast<GlfwSurfaceBridge*>(glfwGetWindowUserPointer(window));
        // Minimised windows report 0x0; keep the last real size.
        if (bridge == nullptr || bridge->context_ == nullptr || width <= 0 || height <= 0) {
            return;
        }
        bridge->context_->notifyViewportResized(static_cast<uint32_t>(width), static_cast<uint32_t>(height));
    }

} // namespace drawcore
