#include "core/TargetSelector.hpp"
#include "core/Random.hpp"

std::vector<Cell> TargetSelector::Candidates(const LabeledBoard& board, const std::string& category)
{
    const std::string wanted = ToLower(category);

    std::vector<Cell> out;
    for (const auto& entry : board)
    {
        if (ToLower(entry.second.category) == wanted) out.push_back(entry.first);
    }
    return out;
}

std::vector<Cell> TargetSelector::Select(
    const LabeledBoard& board,
    const std::string& category,
    uint32_t count,
    const std::string& seed)
{
    std::vector<Cell> pool = Candidates(board, category);
    if (pool.size() <= count) return pool;

    std::vector<Cell> shuffled = Shuffle(pool, seed);
    shuffled.resize(count);
    return shuffled;
}
