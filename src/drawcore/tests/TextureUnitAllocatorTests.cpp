#include <cassert>
#include <cstdint>
#include <vector>

#include <drawcore/draw/TextureUnitAllocator.h>

using namespace drawcore;

namespace {

    ResolvedTexture texture(StorageId storage, SamplerFilter filter = SamplerFilter::Linear)
    {
        ResolvedTexture resolved{};
        resolved.storage = storage;
        resolved.sampler.minify = filter;
        resolved.sampler.magnify = filter;
        return resolved;
    }

} // namespace

int main()
{
    // Empty units fill in order; the same draw again reuses them untouched.
    {
        TextureUnitAllocator allocator{ 4 };
        std::vector<TextureUnitBinding> units(4);

        const auto first = allocator.assign({ texture(5), texture(6) }, units);
        assert((first == std::vector<uint32_t>{ 0, 1 }));
        assert(units[0].texture == 5 && units[1].texture == 6);
        assert(units[2].empty());
        assert(allocator.stats().filledEmpty == 2);

        const std::vector<TextureUnitBinding> before = units;
        const auto second = allocator.assign({ texture(6), texture(5) }, units);
        assert((second == std::vector<uint32_t>{ 1, 0 }));
        assert(units == before);
        assert(allocator.stats().reused == 2);
    }

    // One texture sampled twice with one sampler shares a unit; a second sampler needs another.
    {
        TextureUnitAllocator allocator{ 4 };
        std::vector<TextureUnitBinding> units(4);

        const auto shared = allocator.assign({ texture(9), texture(9) }, units);
        assert(shared[0] == shared[1]);
        assert(units[1].empty());

        const auto split = allocator.assign({ texture(9), texture(9, SamplerFilter::Nearest) }, units);
        assert(split[0] != split[1]);
        assert(units[split[1]].sampler.minify == SamplerFilter::Nearest);
    }

    // When full, a unit holding a texture the draw does not need is evicted first.
    {
        TextureUnitAllocator allocator{ 2 };
        std::vector<TextureUnitBinding> units(2);
        static_cast<void>(allocator.assign({ texture(5), texture(6) }, units));

        const auto result = allocator.assign({ texture(7), texture(6) }, units);
        assert(result[1] == 1);
        assert(result[0] == 0);
        assert(units[0].texture == 7);
        assert(units[1].texture == 6);
        assert(allocator.stats().evicted == 1);
        assert(allocator.cursor() == 1);

        // The cursor moves on, so the next eviction lands on the other unit.
        const auto next = allocator.assign({ texture(8) }, units);
        assert(next[0] == 1);
        assert(units[0].texture == 7);
    }

    return 0;
}
