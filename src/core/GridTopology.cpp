#include "core/GridTopology.hpp"

bool GridTopology::Contains(const GridSize& grid, const Cell& cell)
{
    return cell.row >= 0 && cell.col >= 0 && cell.row < grid.rows && cell.col < grid.cols;
}

size_t GridTopology::CellCount(const GridSize& grid)
{
    grid.Validate();
    return (size_t)grid.rows * (size_t)grid.cols;
}

std::vector<Cell> GridTopology::Neighbors(const GridSize& grid, const Cell& cell)
{
    if (!Contains(grid, cell)) {
        throw std::out_of_range("Cell (" + cell.ToString() + ") is outside the " +
                                std::to_string(grid.rows) + "x" +
                                std::to_string(grid.cols) + " grid");
    }

    std::vector<Cell> out;
    out.reserve(4);
    if (cell.row > 0)             out.push_back({ cell.row - 1, cell.col });
    if (cell.row < grid.rows - 1) out.push_back({ cell.row + 1, cell.col });
    if (cell.col > 0)             out.push_back({ cell.row, cell.col - 1 });
    if (cell.col < grid.cols - 1) out.push_back({ cell.row, cell.col + 1 });
    return out;
}

EdgeSet GridTopology::AllInternalEdges(const GridSize& grid)
{
    grid.Validate();

    EdgeSet all;
    for (int32_t r = 0; r < grid.rows; ++r)
        for (int32_t c = 0; c + 1 < grid.cols; ++c)
            all.insert(Edge::Between({ r, c }, { r, c + 1 }));

    for (int32_t r = 0; r + 1 < grid.rows; ++r)
        for (int32_t c = 0; c < grid.cols; ++c)
            all.insert(Edge::Between({ r, c }, { r + 1, c }));

    return all;
}
