#pragma once

#include <cstdint>
#include <vector>

#include <drawcore/draw/DrawRequest.h>
#include <drawcore/state/PipelineState.h>

namespace drawcore {

    // Picks a texture unit for every texture a draw samples, trying to keep bindings
    // that later draws are likely to need. Not thread-safe; the emitter serializes calls.
    class TextureUnitAllocator
    {
    public:
        struct Stats {
            uint64_t reused{ 0 };
            uint64_t filledEmpty{ 0 };
            uint64_t evicted{ 0 };
        };

        explicit TextureUnitAllocator(uint32_t unitCount);

        // Writes the chosen bindings into `units` (the table the draw will run with) and
        // returns the unit per entry of `textures`. Entries with the same texture and
        // sampler share a unit. The caller guarantees enough units exist.
        [[nodiscard]] std::vector<uint32_t> assign(const std::vector<ResolvedTexture>& textures, std::vector<TextureUnitBinding>& units);

        [[nodiscard]] uint32_t cursor() const noexcept { return cursor_; }
        [[nodiscard]] Stats stats() const noexcept { return stats_; }

    private:
        uint32_t unitCount_{ 0 };
        uint32_t cursor_{ 0 };
        Stats stats_{};
    };

} // namespace drawcore
