#include <algorithm>
#include <limits>
#include <unordered_set>

#include <drawcore/draw/TextureUnitAllocator.h>

namespace drawcore {

    TextureUnitAllocator::TextureUnitAllocator(uint32_t unitCount)
        : unitCount_(unitCount)
    {
    }

    std::vector<uint32_t> TextureUnitAllocator::assign(const std::vector<ResolvedTexture>& textures, std::vector<TextureUnitBinding>& units)
    {
        constexpr uint32_t kUnassigned = std::numeric_limits<uint32_t>::max();
        const uint32_t count = std::min<uint32_t>(unitCount_, static_cast<uint32_t>(units.size()));

        std::vector<uint32_t> result(textures.size(), kUnassigned);
        std::vector<bool> claimed(count, false);
        std::unordered_set<StorageId> needed{};
        for (const ResolvedTexture& texture : textures) {
            needed.insert(texture.storage);
        }

        const auto wanted = [](const ResolvedTexture& texture) {
            return TextureUnitBinding{ .texture = texture.storage, .target = texture.target, .sampler = texture.sampler };
        };
        const auto findExact = [&](const TextureUnitBinding& binding) -> uint32_t {
            for (uint32_t unit = 0; unit < count; ++unit) {
                if (units[unit] == binding) {
                    return unit;
                }
            }
            return kUnassigned;
        };

        // Units that already hold exactly what this draw wants stay put.
        for (size_t i = 0; i < textures.size(); ++i) {
            const uint32_t unit = findExact(wanted(textures[i]));
            if (unit != kUnassigned) {
                result[i] = unit;
                claimed[unit] = true;
                ++stats_.reused;
            }
        }

        for (size_t i = 0; i < textures.size(); ++i) {
            if (result[i] != kUnassigned) {
                continue;
            }
            const TextureUnitBinding binding = wanted(textures[i]);

            // An earlier entry of this draw may have just bound the same pair.
            uint32_t unit = findExact(binding);
            if (unit != kUnassigned && claimed[unit]) {
                result[i] = unit;
                continue;
            }

            unit = kUnassigned;
            for (uint32_t candidate = 0; candidate < count; ++candidate) {
                if (!claimed[candidate] && units[candidate].empty()) {
                    unit = candidate;
                    ++stats_.filledEmpty;
                    break;
                }
            }

            // Evict round-robin, preferring units whose texture this draw does not sample.
            if (unit == kUnassigned && count != 0) {
                for (int pass = 0; pass < 2 && unit == kUnassigned; ++pass) {
                    for (uint32_t step = 0; step < count; ++step) {
                        const uint32_t candidate = (cursor_ + step) % count;
                        if (claimed[candidate]) {
                            continue;
                        }
                        if (pass == 0 && needed.contains(units[candidate].texture)) {
                            continue;
                        }
                        unit = candidate;
                        cursor_ = (candidate + 1) % count;
                        ++stats_.evicted;
                        break;
                    }
                }
            }

            if (unit == kUnassigned) {
                continue;
            }
            units[unit] = binding;
            claimed[unit] = true;
            result[i] = unit;
        }
        return result;
    }

} // namespace drawcore
