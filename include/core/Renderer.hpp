#pragma once
#include "core/DataStruct.hpp"

// Passive observer of generation and solving. Called synchronously from the
// thread running the traversal; the cells are only valid during the call.
class Renderer
{
public:
    virtual ~Renderer() = default;

    // both cells already have their shared wall cleared
    virtual void onWallBroken(const Cell& a, const Cell& b) = 0;

    virtual void onMove(const Cell& from, const Cell& to, bool isBacktrack) = 0;

    // entrance/exit marker opened on the outer boundary
    virtual void onBoundaryOpened(const Cell& cell, Wall wall)
    {
        (void)cell;
        (void)wall;
    }
};

class NullRenderer final : public Renderer
{
public:
    void onWallBroken(const Cell&, const Cell&) override {}
    void onMove(const Cell&, const Cell&, bool) override {}
};
