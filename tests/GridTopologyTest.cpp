#include "core/GridTopology.hpp"

#include <gtest/gtest.h>

TEST(Edge, CanonicalizesOrder)
{
    const Edge e1 = Edge::Between({ 1, 2 }, { 1, 1 });
    const Edge e2 = Edge::Between({ 1, 1 }, { 1, 2 });

    EXPECT_EQ(e1, e2);
    EXPECT_EQ(e1.A(), (Cell{ 1, 1 }));
    EXPECT_EQ(e1.B(), (Cell{ 1, 2 }));
    EXPECT_EQ(e1.Key(), "1,1|1,2");
    EXPECT_EQ(std::hash<Edge>()(e1), std::hash<Edge>()(e2));
}

TEST(Edge, RejectsNonAdjacentCells)
{
    EXPECT_THROW(Edge::Between({ 0, 0 }, { 1, 1 }), std::invalid_argument);
    EXPECT_THROW(Edge::Between({ 0, 0 }, { 0, 2 }), std::invalid_argument);
    EXPECT_THROW(Edge::Between({ 2, 2 }, { 2, 2 }), std::invalid_argument);
}

TEST(GridTopology, NeighborOrderIsUpDownLeftRight)
{
    const GridSize g = GridSize::Board();

    EXPECT_EQ(GridTopology::Neighbors(g, { 2, 3 }),
              (std::vector<Cell>{ { 1, 3 }, { 3, 3 }, { 2, 2 }, { 2, 4 } }));
    EXPECT_EQ(GridTopology::Neighbors(g, { 0, 0 }),
              (std::vector<Cell>{ { 1, 0 }, { 0, 1 } }));
    EXPECT_EQ(GridTopology::Neighbors(g, { 5, 5 }),
              (std::vector<Cell>{ { 4, 5 }, { 5, 4 } }));
}

TEST(GridTopology, NeighborsOfOffGridCellThrows)
{
    EXPECT_THROW(GridTopology::Neighbors(GridSize::Board(), { 6, 0 }), std::out_of_range);
    EXPECT_THROW(GridTopology::Neighbors(GridSize::Board(), { 0, -1 }), std::out_of_range);
}

TEST(GridTopology, InternalEdgeCount)
{
    EXPECT_EQ(GridTopology::AllInternalEdges(GridSize::Board()).size(), 60u);
    EXPECT_EQ(GridTopology::AllInternalEdges({ 3, 4 }).size(), 2u * 3 * 4 - 3 - 4);
    EXPECT_EQ(GridTopology::AllInternalEdges({ 1, 1 }).size(), 0u);
    EXPECT_EQ(GridTopology::AllInternalEdges({ 1, 5 }).size(), 4u);
}

TEST(GridTopology, EmptyGridIsRejected)
{
    EXPECT_THROW(GridTopology::AllInternalEdges({ 0, 6 }), std::invalid_argument);
    EXPECT_THROW(GridTopology::CellCount({ 6, -1 }), std::invalid_argument);
}

TEST(ToLower, FoldsAsciiAndAccentedCapitals)
{
    EXPECT_EQ(ToLower("SUSTANTIVO"), "sustantivo");
    EXPECT_EQ(ToLower("SIN CATEGORÍA"), "sin categoría");
    EXPECT_EQ(ToLower("ÑANDÚ ÜBER ÀÉÎÕ"), "ñandú über àéîõ");
    EXPECT_EQ(ToLower("ya minúscula"), "ya minúscula");
    EXPECT_EQ(ToLower("2×3"), "2×3");
}
