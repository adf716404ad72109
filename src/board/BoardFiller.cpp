#include "board/BoardFiller.hpp"
#include "core/GridTopology.hpp"
#include "core/Random.hpp"

const char* const BoardFiller::kUncategorized = "sin categoría";

LabeledBoard BoardFiller::Fill(
    const std::vector<LabeledCell>& pool,
    const std::string& seed,
    const GridSize& grid)
{
    const size_t capacity = GridTopology::CellCount(grid);
    const std::vector<LabeledCell> shuffled = Shuffle(pool, seed + kActiveSuffix);

    LabeledBoard board;
    const size_t n = std::min(capacity, shuffled.size());
    for (size_t i = 0; i < n; ++i)
    {
        const Cell cell{ (int32_t)(i / (size_t)grid.cols), (int32_t)(i % (size_t)grid.cols) };

        LabeledCell labeled = shuffled[i];
        labeled.category = labeled.category.empty() ? kUncategorized : ToLower(labeled.category);
        board.emplace(cell, std::move(labeled));
    }
    return board;
}
