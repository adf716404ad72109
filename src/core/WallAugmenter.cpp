#include "core/WallAugmenter.hpp"
#include "core/Connectivity.hpp"
#include "core/Random.hpp"

std::pair<EdgeSet, uint32_t> WallAugmenter::AddExtraWalls(
    const EdgeSet& walls,
    uint32_t extra,
    const std::string& seed,
    const GridSize& grid)
{
    EdgeSet result(walls);
    uint32_t added = 0;

    if (extra == 0) return { result, added };

    const EdgeSet passages = Connectivity::PassagesFromWalls(walls, grid);
    std::vector<Edge> candidates(passages.begin(), passages.end());

    Rng rng(SeedToState(seed) ^ kAugmentStreamMask);
    candidates = Shuffle(candidates, rng);

    for (const Edge& e : candidates)
    {
        if (added >= extra) break;

        result.insert(e);
        if (Connectivity::IsConnected(result, grid))
        {
            ++added;
        }
        else
        {
            result.erase(e);
        }
    }

    return { result, added };
}
