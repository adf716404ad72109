#pragma once
#include "core/Common.hpp"

// Sub-stream discriminators. Every consumer of a seed derives its own stream so
// that carving, augmentation, target picking and board filling never alias.
constexpr uint32_t kAugmentStreamMask = 0x1234abcdu;
constexpr const char* kTargetsSuffix = "|targets";
constexpr const char* kActiveSuffix = "|active";

// FNV-1a (h0 = 2166136261, prime = 16777619) over the bytes of the seed.
uint32_t SeedToState(const std::string& seed);

// mulberry32
class Rng
{
public:
    explicit Rng(uint32_t state) : state_(state) {}

    // uniform in [0, 1)
    double Next();

    // floor(Next() * bound); bound must be positive
    uint32_t NextIndex(uint32_t bound);

private:
    uint32_t state_;
};

// Fisher-Yates from the back: position i swaps with floor(Next() * (i + 1)).
template <class T>
std::vector<T> Shuffle(const std::vector<T>& items, Rng& rng)
{
    std::vector<T> out(items);
    for (size_t i = out.size(); i-- > 1;)
    {
        const size_t j = rng.NextIndex((uint32_t)(i + 1));
        std::swap(out[i], out[j]);
    }
    return out;
}

template <class T>
std::vector<T> Shuffle(const std::vector<T>& items, const std::string& seed)
{
    Rng rng(SeedToState(seed));
    return Shuffle(items, rng);
}
