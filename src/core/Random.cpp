#include "core/Random.hpp"

uint32_t SeedToState(const std::string& seed)
{
    uint32_t h = 2166136261u;
    for (unsigned char ch : seed)
    {
        h ^= ch;
        h *= 16777619u;
    }
    return h;
}

double Rng::Next()
{
    state_ += 0x6d2b79f5u;
    uint32_t t = state_;
    t = (t ^ (t >> 15)) * (t | 1u);
    t ^= t + (t ^ (t >> 7)) * (t | 61u);
    t ^= t >> 14;
    return (double)t / 4294967296.0;
}

uint32_t Rng::NextIndex(uint32_t bound)
{
    if (bound == 0) {
        throw std::invalid_argument("Rng::NextIndex bound must be positive");
    }
    return (uint32_t)(Next() * (double)bound);
}
