#include "core/Solver.hpp"

static bool cancelled_(const std::atomic<bool>* cancel)
{
    return cancel && cancel->load(std::memory_order_relaxed);
}

bool Solver::IsOpen(const Grid& grid, const CellPos& from, Wall side)
{
    const CellPos to = Step(from, side);
    if (!grid.InBounds(from) || !grid.InBounds(to))
        return false;

    // a one-sided wall counts as closed
    return !grid.cell(from).hasWall(side) && !grid.cell(to).hasWall(Opposite(side));
}

SolveResult Solver::Solve(Grid& grid)
{
    NullRenderer none;
    return Solve(grid, none);
}

SolveResult Solver::Solve(Grid& grid, Renderer& renderer, const std::atomic<bool>* cancel)
{
    struct Frame
    {
        CellPos pos;
        size_t nextDir;
    };

    SolveResult result;

    const CellPos start = grid.entrance();
    const CellPos goal = grid.exit();

    std::vector<Frame> st;
    st.reserve((size_t)grid.rows() * (size_t)grid.cols());

    grid.cell(start).visitedSolve = true;
    ++result.visited;
    st.push_back({ start, 0 });

    while (!st.empty())
    {
        if (cancelled_(cancel))
        {
            result.cancelled = true;
            return result;
        }

        Frame& top = st.back();

        if (top.pos == goal)
        {
            result.solved = true;
            result.path.reserve(st.size());
            for (const Frame& f : st)
                result.path.push_back(f.pos);
            return result;
        }

        if (top.nextDir >= kDirectionOrder.size())
        {
            const CellPos dead = top.pos;
            st.pop_back();
            if (!st.empty())
            {
                ++result.backtracks;
                renderer.onMove(grid.cell(st.back().pos), grid.cell(dead), true);
            }
            continue;
        }

        const Wall side = kDirectionOrder[top.nextDir++];
        const CellPos cur = top.pos;
        if (!IsOpen(grid, cur, side))
            continue;

        const CellPos next = Step(cur, side);
        Cell& nextCell = grid.cell(next);
        if (nextCell.visitedSolve)
            continue;

        // `top` may dangle after push_back
        nextCell.visitedSolve = true;
        ++result.visited;
        renderer.onMove(grid.cell(cur), nextCell, false);
        st.push_back({ next, 0 });
    }

    return result;
}
