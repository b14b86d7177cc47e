#pragma once

#include <cstdint>
#include <vector>

#include <drawcore/command/Command.h>
#include <drawcore/state/PipelineState.h>

namespace drawcore {

    struct DiffCounts {
        uint32_t emitted{ 0 };
        uint32_t skipped{ 0 };
    };

    // Appends exactly one StateChangeCmd per field (or per slot for texture units and
    // uniform-buffer bindings) where `from` and `to` differ. Unknown fields in `from` always differ.
    DiffCounts appendStateChanges(const PipelineState& from, const PipelineState& to, std::vector<CommandPayload>& out);

    // Device-side mirror of a state change. Used by executing backends and by tests that
    // replay the stream to check the cache against what the device was told.
    void applyStateChange(PipelineState& state, const StateChangeCmd& cmd);

} // namespace drawcore
