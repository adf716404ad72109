#pragma once
#include "core/Common.hpp"

struct GridSize
{
    int32_t rows{6};
    int32_t cols{6};

    // the physical board the game is played on
    static GridSize Board() { return {6, 6}; }

    // throws std::invalid_argument for an empty grid
    void Validate() const;

    bool operator==(const GridSize& other) const
    {
        return rows == other.rows && cols == other.cols;
    }
};

struct Cell
{
    int32_t row;
    int32_t col;

    bool operator==(const Cell& other) const
    {
        return row == other.row && col == other.col;
    }
    bool operator!=(const Cell& other) const { return !(*this == other); }

    // row-major
    bool operator<(const Cell& other) const
    {
        return row < other.row || (row == other.row && col < other.col);
    }

    std::string ToString() const;
};

// Unordered pair of grid-adjacent cells, always stored with the smaller cell first.
class Edge
{
public:
    // throws std::invalid_argument if p and q are not adjacent
    static Edge Between(const Cell& p, const Cell& q);

    const Cell& A() const { return a_; }
    const Cell& B() const { return b_; }

    bool IsHorizontalPair() const { return a_.row == b_.row; }

    // "r1,c1|r2,c2"
    std::string Key() const;

    bool operator==(const Edge& other) const { return a_ == other.a_ && b_ == other.b_; }
    bool operator!=(const Edge& other) const { return !(*this == other); }
    bool operator<(const Edge& other) const
    {
        return a_ < other.a_ || (a_ == other.a_ && b_ < other.b_);
    }

private:
    Edge(const Cell& a, const Cell& b) : a_(a), b_(b) {}

    Cell a_;
    Cell b_;
};

using EdgeSet = std::set<Edge>;

struct LabeledCell
{
    std::string text;
    std::string category;
};

using LabeledBoard = std::map<Cell, LabeledCell>;

struct Maze
{
    GridSize grid{};
    std::string seed;
    EdgeSet walls{};
};

// ASCII letters plus the accented Latin-1 capitals (Á, Í, Ñ, Ü...) in UTF-8
std::string ToLower(const std::string& s);

namespace std
{
template <>
struct hash<Cell>
{
    size_t operator()(const Cell& c) const noexcept
    {
        return (static_cast<size_t>(static_cast<uint32_t>(c.row)) << 16) ^
               static_cast<size_t>(static_cast<uint32_t>(c.col));
    }
};

template <>
struct hash<Edge>
{
    size_t operator()(const Edge& e) const noexcept
    {
        const size_t ha = hash<Cell>()(e.A());
        const size_t hb = hash<Cell>()(e.B());
        return ha * 31u + hb;
    }
};
} // namespace std
