#pragma once
#include "core/Common.hpp"
#include "core/DataStruct.hpp"
#include "core/Renderer.hpp"

#include <random>

// Pixel placement of the grid. Only renderers read it.
struct GridLayout
{
    int32_t cellWidth{50};
    int32_t cellHeight{50};
    int32_t originX{50};
    int32_t originY{50};
};

class Grid
{
public:
    using Engine = std::mt19937;

    // Throws ValidationError when rows <= 0 or cols <= 0.
    // Without a seed one is drawn from std::random_device; seed() reports it.
    Grid(int32_t rows,
         int32_t cols,
         GridLayout layout = {},
         std::optional<uint32_t> seed = std::nullopt);

    // Carve a perfect maze by randomized depth-first backtracking.
    // Throws InvalidStateError if the grid was already generated.
    void generate(Renderer& renderer);
    void generate();

    // Back to the freshly constructed state, engine re-seeded with seed().
    void reset();

    // Clears visitedSolve on every cell. Walls and generation state untouched.
    void resetSolveState();

    int32_t rows() const noexcept { return rows_; }
    int32_t cols() const noexcept { return cols_; }
    uint32_t seed() const noexcept { return seed_; }
    const GridLayout& layout() const noexcept { return layout_; }
    bool isGenerated() const noexcept { return generated_; }

    CellPos entrance() const noexcept { return { 0, 0 }; }
    CellPos exit() const noexcept { return { rows_ - 1, cols_ - 1 }; }

    bool InBounds(int32_t row, int32_t col) const noexcept
    {
        return row >= 0 && col >= 0 && row < rows_ && col < cols_;
    }
    bool InBounds(const CellPos& p) const noexcept { return InBounds(p.row, p.col); }

    // Throws std::out_of_range outside the grid.
    Cell& cell(int32_t row, int32_t col);
    const Cell& cell(int32_t row, int32_t col) const;
    Cell& cell(const CellPos& p) { return cell(p.row, p.col); }
    const Cell& cell(const CellPos& p) const { return cell(p.row, p.col); }

    const std::vector<std::vector<Cell>>& cells() const noexcept { return cells_; }

private:
    void createCells_();
    void breakWall_(Cell& current, Cell& next, Wall side);
    void openBoundary_(Renderer& renderer);

    int32_t rows_;
    int32_t cols_;
    GridLayout layout_;
    uint32_t seed_;
    Engine rng_;
    bool generated_{false};

    std::vector<std::vector<Cell>> cells_;
};
