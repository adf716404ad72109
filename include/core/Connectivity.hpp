#pragma once
#include "core/Common.hpp"
#include "core/DataStruct.hpp"

// Reachability over the passage graph (all internal edges that are not walls).
class Connectivity
{
public:
    static EdgeSet PassagesFromWalls(const EdgeSet& walls, const GridSize& grid);

    // number of cells reachable from `from` through passages, `from` included
    static size_t ReachableCount(
        const EdgeSet& walls,
        const GridSize& grid,
        const Cell& from = { 0, 0 }
    );

    static bool IsConnected(const EdgeSet& walls, const GridSize& grid);

    // connected and exactly R*C - 1 passages, i.e. a spanning tree
    static bool IsPerfect(const EdgeSet& walls, const GridSize& grid);
};
