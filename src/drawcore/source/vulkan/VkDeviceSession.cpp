#include <utility>
#include <vector>

#include <drawcore/vulkan/VkCapabilityProbe.h>
#include <drawcore/vulkan/VkDeviceSession.h>
#include <drawcore/vulkan/VkResultUtils.h>

namespace drawcore::vkutil {

    namespace {
        constexpr const char* kSubsystem = "vk_session";

        bool supportsTimeline(VkPhysicalDevice candidate)
        {
            VkPhysicalDeviceProperties props{};
            vkGetPhysicalDeviceProperties(candidate, &props);
            if (props.apiVersion < VK_API_VERSION_1_2) {
                return false;
            }
            VkPhysicalDeviceTimelineSemaphoreFeatures timeline{ VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_TIMELINE_SEMAPHORE_FEATURES };
            VkPhysicalDeviceFeatures2 f2{ VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_FEATURES_2 };
            f2.pNext = &timeline;
            vkGetPhysicalDeviceFeatures2(candidate, &f2);
            return timeline.timelineSemaphore == VK_TRUE;
        }

        uint32_t findGraphicsFamily(VkPhysicalDevice candidate)
        {
            uint32_t count = 0;
            vkGetPhysicalDeviceQueueFamilyProperties(candidate, &count, nullptr);
            std::vector<VkQueueFamilyProperties> props(count);
            if (count) vkGetPhysicalDeviceQueueFamilyProperties(candidate, &count, props.data());

            for (uint32_t i = 0; i < count; ++i) {
                if ((props[i].queueFlags & VK_QUEUE_GRAPHICS_BIT) != 0) {
                    return i;
                }
            }
            return UINT32_MAX;
        }
    } // namespace

    VkDeviceSession::~VkDeviceSession()
    {
        destroy();
    }

    VkDeviceSession::VkDeviceSession(VkDeviceSession&& other) noexcept
        : instance_(std::exchange(other.instance_, VK_NULL_HANDLE))
        , physicalDevice_(std::exchange(other.physicalDevice_, VK_NULL_HANDLE))
        , device_(std::exchange(other.device_, VK_NULL_HANDLE))
        , graphicsFamily_(std::exchange(other.graphicsFamily_, UINT32_MAX))
        , capabilities_(other.capabilities_)
        , deviceName_(std::move(other.deviceName_))
    {
    }

    VkDeviceSession& VkDeviceSession::operator=(VkDeviceSession&& other) noexcept
    {
        if (this != &other) {
            destroy();
            instance_ = std::exchange(other.instance_, VK_NULL_HANDLE);
            physicalDevice_ = std::exchange(other.physicalDevice_, VK_NULL_HANDLE);
            device_ = std::exchange(other.device_, VK_NULL_HANDLE);
            graphicsFamily_ = std::exchange(other.graphicsFamily_, UINT32_MAX);
            capabilities_ = other.capabilities_;
            deviceName_ = std::move(other.deviceName_);
        }
        return *this;
    }

    void VkDeviceSession::destroy() noexcept
    {
        if (device_ != VK_NULL_HANDLE) {
            vkDeviceWaitIdle(device_);
            vkDestroyDevice(device_, nullptr);
            device_ = VK_NULL_HANDLE;
        }
        if (instance_ != VK_NULL_HANDLE) {
            vkDestroyInstance(instance_, nullptr);
            instance_ = VK_NULL_HANDLE;
        }
        physicalDevice_ = VK_NULL_HANDLE;
    }

    Expected<VkDeviceSession> VkDeviceSession::create(const CreateInfo& info)
    {
        VkDeviceSession session{};

        VkApplicationInfo appInfo{ VK_STRUCTURE_TYPE_APPLICATION_INFO };
        appInfo.pApplicationName = info.applicationName;
        appInfo.applicationVersion = VK_MAKE_API_VERSION(0, 1, 0, 0);
        appInfo.pEngineName = "drawcore";
        appInfo.engineVersion = VK_MAKE_API_VERSION(0, 1, 0, 0);
        appInfo.apiVersion = VK_API_VERSION_1_2;

        std::vector<const char*> layers{};
        if (info.enableValidation) {
            layers.push_back("VK_LAYER_KHRONOS_validation");
        }

        VkInstanceCreateInfo ci{ VK_STRUCTURE_TYPE_INSTANCE_CREATE_INFO };
        ci.pApplicationInfo = &appInfo;
        ci.enabledLayerCount = static_cast<uint32_t>(layers.size());
        ci.ppEnabledLayerNames = layers.empty() ? nullptr : layers.data();
        ci.enabledExtensionCount = static_cast<uint32_t>(info.instanceExtensions.size());
        ci.ppEnabledExtensionNames = info.instanceExtensions.empty() ? nullptr : info.instanceExtensions.data();
        DRAWCORE_VK_RETURN_IF_FAILED(vkCreateInstance(&ci, nullptr, &session.instance_), "vkCreateInstance", kSubsystem);

        uint32_t deviceCount = 0;
        DRAWCORE_VK_RETURN_IF_FAILED(vkEnumeratePhysicalDevices(session.instance_, &deviceCount, nullptr), "vkEnumeratePhysicalDevices", kSubsystem);
        std::vector<VkPhysicalDevice> devices(deviceCount);
        if (deviceCount) {
            DRAWCORE_VK_RETURN_IF_FAILED(vkEnumeratePhysicalDevices(session.instance_, &deviceCount, devices.data()), "vkEnumeratePhysicalDevices", kSubsystem);
        }

        for (VkPhysicalDevice candidate : devices) {
            const uint32_t family = findGraphicsFamily(candidate);
            if (family != UINT32_MAX && supportsTimeline(candidate)) {
                session.physicalDevice_ = candidate;
                session.graphicsFamily_ = family;
                break;
            }
        }
        if (session.physicalDevice_ == VK_NULL_HANDLE) {
            return makeError("VkDeviceSession::create", ErrorCode::ResourceCreation, kSubsystem, "no_suitable_device",
                "no device with a graphics queue and timeline semaphores");
        }

        VkPhysicalDeviceProperties props{};
        vkGetPhysicalDeviceProperties(session.physicalDevice_, &props);
        session.deviceName_ = props.deviceName;

        auto caps = probe(session.physicalDevice_);
        if (!caps.hasValue()) {
            return caps.context();
        }
        session.capabilities_ = caps.value();

        const float priority = 1.0F;
        VkDeviceQueueCreateInfo qci{ VK_STRUCTURE_TYPE_DEVICE_QUEUE_CREATE_INFO };
        qci.queueFamilyIndex = session.graphicsFamily_;
        qci.queueCount = 1;
        qci.pQueuePriorities = &priority;

        VkPhysicalDeviceTimelineSemaphoreFeatures timeline{ VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_TIMELINE_SEMAPHORE_FEATURES };
        timeline.timelineSemaphore = VK_TRUE;

        VkDeviceCreateInfo dci{ VK_STRUCTURE_TYPE_DEVICE_CREATE_INFO };
        dci.pNext = &timeline;
        dci.queueCreateInfoCount = 1;
        dci.pQueueCreateInfos = &qci;
        DRAWCORE_VK_RETURN_IF_FAILED(vkCreateDevice(session.physicalDevice_, &dci, nullptr, &session.device_), "vkCreateDevice", kSubsystem);

        return std::move(session);
    }

} // namespace drawcore::vkutil
