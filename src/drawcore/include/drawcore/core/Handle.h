#pragma once

#include <cstddef>
#include <cstdint>

namespace drawcore {

    enum class ResourceKind : uint8_t {
        Buffer,
        Texture,
        Program,
        Framebuffer
    };

    // Slab index plus generation. Generation 0 never names a live object.
    struct Handle {
        uint32_t index{ 0 };
        uint32_t generation{ 0 };
        ResourceKind kind{ ResourceKind::Buffer };

        [[nodiscard]] constexpr bool isNull() const noexcept { return generation == 0; }
        [[nodiscard]] constexpr uint64_t packed() const noexcept
        {
            return (static_cast<uint64_t>(index) << 32U) | static_cast<uint64_t>(generation);
        }

        friend bool operator==(Handle lhs, Handle rhs) = default;
    };

    struct HandleHash {
        [[nodiscard]] size_t operator()(const Handle& h) const noexcept
        {
            return static_cast<size_t>(h.packed()) ^ (static_cast<size_t>(h.kind) << 1U);
        }
    };

    // Device-side backing storage. Monotonic and never reused; 0 is "none"
    // (for framebuffers, the default framebuffer).
    using StorageId = uint64_t;
    inline constexpr StorageId kNullStorage = 0;

    [[nodiscard]] constexpr const char* resourceKindToString(ResourceKind kind) noexcept
    {
        switch (kind) {
        case ResourceKind::Buffer: return "buffer";
        case ResourceKind::Texture: return "texture";
        case ResourceKind::Program: return "program";
        case ResourceKind::Framebuffer: return "framebuffer";
        default: return "unknown";
        }
    }

} // namespace drawcore
