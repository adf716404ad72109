#pragma once
#include "core/Common.hpp"
#include "core/DataStruct.hpp"

class TargetSelector
{
public:
    // Cells whose category matches after ToLower on both sides, in board order.
    static std::vector<Cell> Candidates(const LabeledBoard& board, const std::string& category);

    // At most `count` candidates. The whole pool, unshuffled, when it is small
    // enough; otherwise the first `count` of a shuffle driven by `seed`.
    static std::vector<Cell> Select(
        const LabeledBoard& board,
        const std::string& category,
        uint32_t count,
        const std::string& seed
    );
};
