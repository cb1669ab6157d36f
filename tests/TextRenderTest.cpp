#include <gtest/gtest.h>

#include "core/Grid.hpp"
#include "core/Solver.hpp"
#include "core/TextRender.hpp"

TEST(TextRenderTest, SingleCell)
{
    Grid g(1, 1, {}, 0u);
    g.generate();

    EXPECT_EQ(RenderText(g),
        "+   +\n"
        "|   |\n"
        "+   +\n");

    const SolveResult r = Solver::Solve(g);
    EXPECT_EQ(RenderText(g, r.path),
        "+   +\n"
        "| * |\n"
        "+   +\n");
}

TEST(TextRenderTest, CorridorWithPath)
{
    Grid g(1, 4, {}, 3u);
    g.generate();
    const SolveResult r = Solver::Solve(g);

    EXPECT_EQ(RenderText(g, r.path),
        "+   +---+---+---+\n"
        "| *   *   *   * |\n"
        "+---+---+---+   +\n");
}

TEST(TextRenderTest, FreshGridIsClosed)
{
    Grid g(2, 2, {}, 0u);
    EXPECT_EQ(RenderText(g),
        "+---+---+\n"
        "|   |   |\n"
        "+---+---+\n"
        "|   |   |\n"
        "+---+---+\n");
}

TEST(TextRenderTest, IgnoresOutOfRangePathCells)
{
    Grid g(1, 1, {}, 0u);
    EXPECT_NO_THROW(RenderText(g, { { 5, 5 }, { -1, 0 } }));
}
