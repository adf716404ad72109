#include "board/WallInstructions.hpp"

#include <sstream>

static std::string Coord(const Cell& c)
{
    return "(" + c.ToString() + ")";
}

std::vector<std::string> WallInstructions::Describe(const EdgeSet& walls)
{
    std::vector<std::string> lines;
    lines.reserve(walls.size());

    for (const Edge& w : walls)
    {
        const char* orientation = w.IsHorizontalPair() ? "VERTICAL" : "HORIZONTAL";
        lines.push_back(std::string("Muro ") + orientation + " entre " +
                        Coord(w.A()) + " y " + Coord(w.B()));
    }

    std::sort(lines.begin(), lines.end());
    return lines;
}

std::string WallInstructions::Serialize(const EdgeSet& walls)
{
    std::string out;
    for (const Edge& w : walls)
    {
        if (!out.empty()) out.push_back(';');
        out += w.Key();
    }
    return out;
}

std::string WallInstructions::RenderAscii(const Maze& maze, const std::vector<Cell>& targets)
{
    const GridSize& g = maze.grid;
    g.Validate();

    auto isTarget = [&](int32_t r, int32_t c) {
        return std::find(targets.begin(), targets.end(), Cell{ r, c }) != targets.end();
    };
    auto wallRight = [&](int32_t r, int32_t c) {
        return maze.walls.count(Edge::Between({ r, c }, { r, c + 1 })) > 0;
    };
    auto wallBelow = [&](int32_t r, int32_t c) {
        return maze.walls.count(Edge::Between({ r, c }, { r + 1, c })) > 0;
    };

    std::ostringstream os;

    // outer border
    for (int32_t c = 0; c < g.cols; ++c) os << "+---";
    os << "+\n";

    for (int32_t r = 0; r < g.rows; ++r)
    {
        os << '|';
        for (int32_t c = 0; c < g.cols; ++c)
        {
            os << (isTarget(r, c) ? " * " : "   ");
            const bool closed = (c == g.cols - 1) || wallRight(r, c);
            os << (closed ? '|' : ' ');
        }
        os << '\n';

        for (int32_t c = 0; c < g.cols; ++c)
        {
            const bool closed = (r == g.rows - 1) || wallBelow(r, c);
            os << '+' << (closed ? "---" : "   ");
        }
        os << "+\n";
    }

    return os.str();
}
