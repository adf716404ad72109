#pragma once
#include "core/Common.hpp"
#include "core/DataStruct.hpp"

class GridTopology
{
public:
    static bool Contains(const GridSize& grid, const Cell& cell);

    static size_t CellCount(const GridSize& grid);

    // up, down, left, right; throws std::out_of_range for a cell off the grid
    static std::vector<Cell> Neighbors(const GridSize& grid, const Cell& cell);

    // 2*R*C - R - C edges
    static EdgeSet AllInternalEdges(const GridSize& grid);
};
