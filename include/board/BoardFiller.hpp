#pragma once
#include "core/Common.hpp"
#include "core/DataStruct.hpp"

class BoardFiller
{
public:
    // category given to words that arrive without one
    static const char* const kUncategorized;

    // Shuffles the word pool on the seed's "|active" stream and lays it out
    // row-major. Extra words are dropped; a short pool leaves trailing cells empty.
    static LabeledBoard Fill(
        const std::vector<LabeledCell>& pool,
        const std::string& seed,
        const GridSize& grid = GridSize::Board()
    );
};
