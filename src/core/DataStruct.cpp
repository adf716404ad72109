#include "core/DataStruct.hpp"

#include <cctype>
#include <cstdlib>

void GridSize::Validate() const
{
    if (rows <= 0 || cols <= 0) {
        throw std::invalid_argument(
            "Grid must have at least one row and one column, got " +
            std::to_string(rows) + "x" + std::to_string(cols));
    }
}

std::string Cell::ToString() const
{
    return std::to_string(row) + "," + std::to_string(col);
}

Edge Edge::Between(const Cell& p, const Cell& q)
{
    const int32_t dr = std::abs(p.row - q.row);
    const int32_t dc = std::abs(p.col - q.col);
    if (dr + dc != 1) {
        throw std::invalid_argument(
            "Cells (" + p.ToString() + ") and (" + q.ToString() + ") are not adjacent");
    }
    return (q < p) ? Edge(q, p) : Edge(p, q);
}

std::string Edge::Key() const
{
    return a_.ToString() + "|" + b_.ToString();
}

std::string ToLower(const std::string& s)
{
    std::string t;
    t.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i)
    {
        const unsigned char ch = (unsigned char)s[i];
        t.push_back((char)std::tolower(ch));

        // UTF-8 Latin-1 capitals U+00C0..U+00DE (minus U+00D7) are 0xC3 0x80..0x9E
        if (ch == 0xC3 && i + 1 < s.size())
        {
            const unsigned char next = (unsigned char)s[++i];
            const bool upper = next >= 0x80 && next <= 0x9E && next != 0x97;
            t.push_back((char)(upper ? next + 0x20 : next));
        }
    }
    return t;
}
