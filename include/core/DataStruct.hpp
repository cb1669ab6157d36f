#pragma once
#include "core/Common.hpp"

#include <array>

struct CellPos
{
    int32_t row;
    int32_t col;

    bool operator==(const CellPos& other) const
    {
        return row == other.row && col == other.col;
    }

    bool operator!=(const CellPos& other) const
    {
        return !(*this == other);
    }
};

inline std::ostream& operator<<(std::ostream& os, const CellPos& p)
{
    return os << "(" << p.row << "," << p.col << ")";
}

enum class Wall : uint8_t
{
    Top = 0,
    Bottom = 1,
    Left = 2,
    Right = 3
};

inline Wall Opposite(Wall w)
{
    switch (w)
    {
    case Wall::Top:    return Wall::Bottom;
    case Wall::Bottom: return Wall::Top;
    case Wall::Left:   return Wall::Right;
    case Wall::Right:  return Wall::Left;
    }
    return w;
}

// row/col offset of the neighbour across a wall
inline CellPos Step(const CellPos& p, Wall w)
{
    switch (w)
    {
    case Wall::Top:    return { p.row - 1, p.col };
    case Wall::Bottom: return { p.row + 1, p.col };
    case Wall::Left:   return { p.row, p.col - 1 };
    case Wall::Right:  return { p.row, p.col + 1 };
    }
    return p;
}

class Cell
{
public:
    Cell(int32_t row, int32_t col) : row_(row), col_(col) {}

    int32_t row() const noexcept { return row_; }
    int32_t col() const noexcept { return col_; }
    CellPos pos() const noexcept { return { row_, col_ }; }

    bool hasWall(Wall w) const { return walls_[static_cast<size_t>(w)]; }
    void setWall(Wall w, bool present) { walls_[static_cast<size_t>(w)] = present; }

    bool wallTop() const { return hasWall(Wall::Top); }
    bool wallBottom() const { return hasWall(Wall::Bottom); }
    bool wallLeft() const { return hasWall(Wall::Left); }
    bool wallRight() const { return hasWall(Wall::Right); }

    // generation bookkeeping; only meaningful inside Grid::generate()
    bool visitedGeneration{false};
    // solve bookkeeping; cleared by Grid::resetSolveState()
    bool visitedSolve{false};

private:
    int32_t row_;
    int32_t col_;
    std::array<bool, 4> walls_{ { true, true, true, true } };
};
