#pragma once
#include "core/Common.hpp"
#include "core/DataStruct.hpp"

class WallAugmenter
{
public:
    // Closes up to `extra` passages, one at a time, skipping any whose closure
    // would disconnect the board. Returns the new wall set and how many walls
    // were actually added; `walls` itself is left untouched.
    //
    // Each candidate costs a full traversal of the board. Fine for a 6x6 board;
    // larger grids would want incremental bridge detection instead.
    static std::pair<EdgeSet, uint32_t> AddExtraWalls(
        const EdgeSet& walls,
        uint32_t extra,
        const std::string& seed,
        const GridSize& grid = GridSize::Board()
    );
};
