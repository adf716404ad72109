#include "app.hpp"
#include "board/BoardFiller.hpp"
#include "board/Mission.hpp"
#include "board/WallInstructions.hpp"

#include <cctype>
#include <string>

std::vector<LabeledCell> DemoWordPool()
{
    return {
        { "casa", "sustantivo" },   { "perro", "sustantivo" },  { "mesa", "sustantivo" },
        { "libro", "sustantivo" },  { "árbol", "sustantivo" },  { "ventana", "sustantivo" },
        { "escuela", "sustantivo" },{ "río", "sustantivo" },    { "luna", "sustantivo" },
        { "flor", "sustantivo" },   { "zapato", "sustantivo" }, { "nube", "sustantivo" },
        { "correr", "verbo" },      { "saltar", "verbo" },      { "leer", "verbo" },
        { "cantar", "verbo" },      { "comer", "verbo" },       { "dormir", "verbo" },
        { "escribir", "verbo" },    { "nadar", "verbo" },       { "jugar", "verbo" },
        { "pintar", "verbo" },      { "bailar", "verbo" },      { "abrir", "verbo" },
        { "rojo", "adjetivo" },     { "grande", "adjetivo" },   { "feliz", "adjetivo" },
        { "rápido", "adjetivo" },   { "suave", "adjetivo" },    { "alto", "adjetivo" },
        { "frío", "adjetivo" },     { "bonito", "adjetivo" },   { "viejo", "adjetivo" },
        { "dulce", "adjetivo" },    { "oscuro", "adjetivo" },   { "limpio", "adjetivo" },
    };
}

// getline without the trailing '\r' of CRLF input
static bool readLine(std::istream& in, std::string& out)
{
    if (!std::getline(in, out)) return false;
    if (!out.empty() && out.back() == '\r') out.pop_back();
    return true;
}

static std::string trim(const std::string& s)
{
    const size_t b = s.find_first_not_of(" \t");
    if (b == std::string::npos) return {};
    const size_t e = s.find_last_not_of(" \t");
    return s.substr(b, e - b + 1);
}

static bool parseCount(const std::string& s, uint32_t& out)
{
    if (s.empty() || s.size() > 9) return false;
    for (unsigned char ch : s)
        if (!std::isdigit(ch)) return false;
    out = (uint32_t)std::stoul(s);
    return true;
}

static void printMission(std::ostream& out, const Mission& mission, const LabeledBoard& board)
{
    out << WallInstructions::RenderAscii(mission.maze, mission.targets);
    out << "Walls: " << mission.maze.walls.size()
        << " (extra requested " << mission.config.extraWalls
        << ", added " << mission.wallsAdded << ")" << std::endl;

    for (const auto& line : WallInstructions::Describe(mission.maze.walls))
        out << "  " << line << "\n";

    for (const auto& line : MissionBuilder::MissionCard(mission, board))
        out << line << "\n";
    out << std::flush;
}

void runApp(std::istream& in, std::ostream& out)
{
    while (true)
    {
        std::string input;
        out << "press b to build a maze" << std::endl;
        out << "press q to quit" << std::endl;
        if (!readLine(in, input)) break;

        input = trim(input);
        if (input == "q") break;

        if (input != "b") {
            out << "Invalid input. Please try again." << std::endl;
            continue;
        }

        // one field per line: seeds and categories may contain spaces
        MissionConfig config;
        std::string extra, count;

        out << "Enter seed value: ";
        if (!readLine(in, config.seed)) break;
        out << "Extra walls (0-" << kMaxExtraWalls << "): ";
        if (!readLine(in, extra)) break;
        out << "Target category: ";
        if (!readLine(in, config.targetCategory)) break;
        out << "Target count (" << kMinTargets << "-" << kMaxTargets << "): ";
        if (!readLine(in, count)) break;

        if (!parseCount(trim(extra), config.extraWalls) || !parseCount(trim(count), config.targetCount)) {
            out << "Invalid number." << std::endl;
            continue;
        }
        config.targetCategory = ToLower(trim(config.targetCategory));

        try
        {
            const LabeledBoard board = BoardFiller::Fill(DemoWordPool(), config.seed, config.grid);
            const Mission mission = MissionBuilder::Build(config, board);
            printMission(out, mission, board);
        }
        catch (const std::exception& e)
        {
            out << "Error: " << e.what() << std::endl;
        }
    }
}
