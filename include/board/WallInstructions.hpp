#pragma once
#include "core/Common.hpp"
#include "core/DataStruct.hpp"

class WallInstructions
{
public:
    // one placement line per wall, sorted:
    //   "Muro VERTICAL entre (r,c) y (r,c+1)"    wall between two cells of a row
    //   "Muro HORIZONTAL entre (r,c) y (r+1,c)"  wall between two cells of a column
    static std::vector<std::string> Describe(const EdgeSet& walls);

    // canonical "r1,c1|r2,c2" keys joined by ';'
    static std::string Serialize(const EdgeSet& walls);

    // text drawing of the board: '+' posts, "---" and '|' walls, targets as '*'
    static std::string RenderAscii(const Maze& maze, const std::vector<Cell>& targets = {});
};
