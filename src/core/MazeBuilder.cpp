#include "core/MazeBuilder.hpp"
#include "core/GridTopology.hpp"
#include "core/Random.hpp"

Maze MazeBuilder::Build(
    const std::string& seed,
    const GridSize& grid,
    const std::function<void(const Edge&)>& onCarve)
{
    grid.Validate();

    Maze maze;
    maze.grid = grid;
    maze.seed = seed;

    Rng rng(SeedToState(seed));

    std::vector<std::vector<bool>> visited(
        (size_t)grid.rows, std::vector<bool>((size_t)grid.cols, false));

    EdgeSet carved;

    visited[0][0] = true;
    std::vector<Cell> st;
    st.push_back({ 0, 0 });

    while (!st.empty())
    {
        const Cell cur = st.back();

        std::vector<Cell> unvisited;
        for (const Cell& n : GridTopology::Neighbors(grid, cur))
        {
            if (!visited[n.row][n.col]) unvisited.push_back(n);
        }

        if (unvisited.empty())
        {
            st.pop_back();
            continue;
        }

        const Cell next = unvisited[rng.NextIndex((uint32_t)unvisited.size())];
        const Edge passage = Edge::Between(cur, next);
        carved.insert(passage);
        visited[next.row][next.col] = true;
        st.push_back(next);

        if (onCarve) onCarve(passage);
    }

    maze.walls = GridTopology::AllInternalEdges(grid);
    for (const Edge& e : carved) maze.walls.erase(e);

    return maze;
}
