#pragma once
#include "core/Common.hpp"
#include "core/DataStruct.hpp"

constexpr uint32_t kMaxExtraWalls = 60;
constexpr uint32_t kMinTargets = 1;
constexpr uint32_t kMaxTargets = 10;

struct MissionConfig
{
    std::string seed{"aula1"};
    uint32_t extraWalls{0};
    std::string targetCategory{"sustantivo"};
    uint32_t targetCount{3};
    GridSize grid{GridSize::Board()};

    // throws std::invalid_argument when a value is outside what the board supports
    void Validate() const;
};

struct Mission
{
    MissionConfig config;
    Maze maze;
    uint32_t wallsAdded{0};
    std::vector<Cell> targets;
};

class MissionBuilder
{
public:
    // maze -> extra walls -> targets, each on its own stream of config.seed
    static Mission Build(const MissionConfig& config, const LabeledBoard& board);

    // "Categoría: ... · Objetivos: ... · Semilla: ..." then one line per target
    static std::vector<std::string> MissionCard(const Mission& mission, const LabeledBoard& board);
};
