#pragma once
#include "core/Common.hpp"
#include "core/DataStruct.hpp"

class MazeBuilder
{
public:
    // Perfect maze (spanning tree of passages) carved by randomized DFS from (0,0).
    // onCarve, if set, sees every carved passage in carving order.
    static Maze Build(
        const std::string& seed,
        const GridSize& grid = GridSize::Board(),
        const std::function<void(const Edge&)>& onCarve = nullptr
    );
};
