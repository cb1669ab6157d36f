#pragma once
#include "core/Common.hpp"
#include "core/Grid.hpp"

#include <array>
#include <atomic>
#include <chrono>

struct SolveResult
{
    bool solved{false};
    bool cancelled{false};
    std::vector<CellPos> path;   // entrance -> exit when solved
    uint32_t visited{0};         // cells marked visitedSolve by this run
    uint32_t backtracks{0};
};

class Solver
{
public:
    // Fixed probe order. Observable in tests and in the animation.
    static constexpr std::array<Wall, 4> kDirectionOrder = {
        Wall::Top, Wall::Bottom, Wall::Left, Wall::Right
    };

    // Depth-first search from grid.entrance() to grid.exit().
    // Does not clear visitedSolve first; call grid.resetSolveState() between runs.
    // A raised cancel flag stops the walk and reports cancelled; walls are
    // never written and visitedSolve flags are left as they were.
    static SolveResult Solve(
        Grid& grid,
        Renderer& renderer,
        const std::atomic<bool>* cancel = nullptr
    );

    static SolveResult Solve(Grid& grid);

    // true if a move across `side` of `from` is open on both cells
    static bool IsOpen(const Grid& grid, const CellPos& from, Wall side);
};
