#pragma once
#include "core/Grid.hpp"
#include "core/Solver.hpp"

#include <queue>

namespace testutil {

struct MoveEvent
{
    CellPos from;
    CellPos to;
    bool backtrack;
};

class RecordingRenderer : public Renderer
{
public:
    std::vector<std::pair<CellPos, CellPos>> broken;
    std::vector<std::pair<CellPos, Wall>> opened;
    std::vector<MoveEvent> moves;

    void onWallBroken(const Cell& a, const Cell& b) override
    {
        broken.emplace_back(a.pos(), b.pos());
    }

    void onMove(const Cell& from, const Cell& to, bool isBacktrack) override
    {
        moves.push_back({ from.pos(), to.pos(), isBacktrack });
    }

    void onBoundaryOpened(const Cell& cell, Wall wall) override
    {
        opened.emplace_back(cell.pos(), wall);
    }
};

// Internal boundaries open on both sides.
inline int CountOpenInternalWalls(const Grid& g)
{
    int open = 0;
    for (int32_t r = 0; r < g.rows(); ++r)
    {
        for (int32_t c = 0; c < g.cols(); ++c)
        {
            if (c + 1 < g.cols() && Solver::IsOpen(g, { r, c }, Wall::Right)) ++open;
            if (r + 1 < g.rows() && Solver::IsOpen(g, { r, c }, Wall::Bottom)) ++open;
        }
    }
    return open;
}

// Every shared wall has the same state on both of its cells.
inline bool WallsAreMutual(const Grid& g)
{
    for (int32_t r = 0; r < g.rows(); ++r)
    {
        for (int32_t c = 0; c < g.cols(); ++c)
        {
            const Cell& cell = g.cell(r, c);
            if (c + 1 < g.cols() && cell.wallRight() != g.cell(r, c + 1).wallLeft()) return false;
            if (r + 1 < g.rows() && cell.wallBottom() != g.cell(r + 1, c).wallTop()) return false;
        }
    }
    return true;
}

inline int CountReachable(const Grid& g, CellPos from)
{
    std::vector<uint8_t> seen((size_t)g.rows() * (size_t)g.cols(), 0);
    std::queue<CellPos> q;
    q.push(from);
    seen[(size_t)from.row * (size_t)g.cols() + (size_t)from.col] = 1;

    int count = 0;
    while (!q.empty())
    {
        const CellPos cur = q.front();
        q.pop();
        ++count;
        for (Wall w : Solver::kDirectionOrder)
        {
            if (!Solver::IsOpen(g, cur, w)) continue;
            const CellPos n = Step(cur, w);
            uint8_t& s = seen[(size_t)n.row * (size_t)g.cols() + (size_t)n.col];
            if (s) continue;
            s = 1;
            q.push(n);
        }
    }
    return count;
}

inline std::vector<uint8_t> WallSnapshot(const Grid& g)
{
    std::vector<uint8_t> out;
    out.reserve((size_t)g.rows() * (size_t)g.cols() * 4);
    for (const auto& line : g.cells())
    {
        for (const Cell& c : line)
        {
            out.push_back(c.wallTop());
            out.push_back(c.wallBottom());
            out.push_back(c.wallLeft());
            out.push_back(c.wallRight());
        }
    }
    return out;
}

// Opens the shared wall of two adjacent cells by hand.
inline void Carve(Grid& g, CellPos a, Wall side)
{
    const CellPos b = Step(a, side);
    g.cell(a).setWall(side, false);
    g.cell(b).setWall(Opposite(side), false);
}

} // namespace testutil
