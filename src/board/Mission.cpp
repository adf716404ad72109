#include "board/Mission.hpp"
#include "core/MazeBuilder.hpp"
#include "core/Random.hpp"
#include "core/TargetSelector.hpp"
#include "core/WallAugmenter.hpp"

void MissionConfig::Validate() const
{
    grid.Validate();

    if (extraWalls > kMaxExtraWalls) {
        throw std::invalid_argument("extraWalls must be at most " + std::to_string(kMaxExtraWalls) +
                                    ", got " + std::to_string(extraWalls));
    }
    if (targetCount < kMinTargets || targetCount > kMaxTargets) {
        throw std::invalid_argument("targetCount must be in " + std::to_string(kMinTargets) + ".." +
                                    std::to_string(kMaxTargets) + ", got " +
                                    std::to_string(targetCount));
    }
}

Mission MissionBuilder::Build(const MissionConfig& config, const LabeledBoard& board)
{
    config.Validate();

    Mission mission;
    mission.config = config;
    mission.maze = MazeBuilder::Build(config.seed, config.grid);

    if (config.extraWalls > 0)
    {
        auto [walls, added] = WallAugmenter::AddExtraWalls(
            mission.maze.walls, config.extraWalls, config.seed, config.grid);
        mission.maze.walls = std::move(walls);
        mission.wallsAdded = added;
    }

    mission.targets = TargetSelector::Select(
        board, config.targetCategory, config.targetCount, config.seed + kTargetsSuffix);

    return mission;
}

std::vector<std::string> MissionBuilder::MissionCard(const Mission& mission, const LabeledBoard& board)
{
    std::vector<std::string> lines;
    lines.reserve(mission.targets.size() + 1);

    lines.push_back("Categoría: " + mission.config.targetCategory +
                    " · Objetivos: " + std::to_string(mission.targets.size()) +
                    " · Semilla: " + mission.config.seed);

    for (const Cell& t : mission.targets)
    {
        auto it = board.find(t);
        const std::string text =
            (it != board.end() && !it->second.text.empty()) ? it->second.text : "(sin texto)";
        lines.push_back("Casilla (" + t.ToString() + "): " + text);
    }
    return lines;
}
