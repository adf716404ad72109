#include "core/Connectivity.hpp"
#include "core/GridTopology.hpp"

#include <queue>

EdgeSet Connectivity::PassagesFromWalls(const EdgeSet& walls, const GridSize& grid)
{
    EdgeSet all = GridTopology::AllInternalEdges(grid);
    for (const Edge& w : walls) all.erase(w);
    return all;
}

size_t Connectivity::ReachableCount(const EdgeSet& walls, const GridSize& grid, const Cell& from)
{
    if (!GridTopology::Contains(grid, from)) {
        throw std::out_of_range("Start cell (" + from.ToString() + ") is outside the grid");
    }

    const size_t N = GridTopology::CellCount(grid);
    auto key = [&](const Cell& c) {
        return (size_t)c.row * (size_t)grid.cols + (size_t)c.col;
    };

    std::vector<std::vector<Cell>> adj(N);
    for (const Edge& e : PassagesFromWalls(walls, grid))
    {
        adj[key(e.A())].push_back(e.B());
        adj[key(e.B())].push_back(e.A());
    }

    std::vector<bool> visited(N, false);
    std::queue<Cell> q;
    q.push(from);
    visited[key(from)] = true;
    size_t reached = 1;

    while (!q.empty())
    {
        Cell cur = q.front(); q.pop();

        for (const Cell& next : adj[key(cur)])
        {
            const size_t k = key(next);
            if (visited[k]) continue;

            visited[k] = true;
            ++reached;
            q.push(next);
        }
    }

    return reached;
}

bool Connectivity::IsConnected(const EdgeSet& walls, const GridSize& grid)
{
    return ReachableCount(walls, grid) == GridTopology::CellCount(grid);
}

bool Connectivity::IsPerfect(const EdgeSet& walls, const GridSize& grid)
{
    const size_t passages = PassagesFromWalls(walls, grid).size();
    return passages + 1 == GridTopology::CellCount(grid) && IsConnected(walls, grid);
}
