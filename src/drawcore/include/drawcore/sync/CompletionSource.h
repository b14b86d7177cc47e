#pragma once

#include <chrono>
#include <cstdint>

#include <drawcore/core/Status.h>

namespace drawcore {

    // Reports how far the device has retired the command stream, in fence values.
    class ICompletionSource
    {
    public:
        virtual ~ICompletionSource() = default;

        [[nodiscard]] virtual Expected<uint64_t> completedValue() = 0;

        // true once `value` has retired, false if the timeout expired first.
        [[nodiscard]] virtual Expected<bool> wait(uint64_t value, std::chrono::nanoseconds timeout) = 0;
    };

} // namespace drawcore
