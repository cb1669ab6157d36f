#include "core/Grid.hpp"
#include "core/Errors.hpp"

#include <algorithm>
#include <array>

static uint32_t DrawSeed_(const std::optional<uint32_t>& seed)
{
    if (seed)
        return *seed;

    std::random_device rd;
    return rd();
}

Grid::Grid(int32_t rows, int32_t cols, GridLayout layout, std::optional<uint32_t> seed)
    : rows_(rows)
    , cols_(cols)
    , layout_(layout)
    , seed_(0)
{
    if (rows <= 0 || cols <= 0)
    {
        throw ValidationError("grid dimensions must be positive, got "
            + std::to_string(rows) + "x" + std::to_string(cols));
    }

    seed_ = DrawSeed_(seed);
    rng_.seed(seed_);
    createCells_();
}

void Grid::createCells_()
{
    cells_.clear();
    cells_.reserve((size_t)rows_);
    for (int32_t r = 0; r < rows_; ++r)
    {
        std::vector<Cell> line;
        line.reserve((size_t)cols_);
        for (int32_t c = 0; c < cols_; ++c)
            line.emplace_back(r, c);
        cells_.push_back(std::move(line));
    }
}

void Grid::reset()
{
    createCells_();
    rng_.seed(seed_);
    generated_ = false;
}

void Grid::resetSolveState()
{
    for (auto& line : cells_)
        for (auto& c : line)
            c.visitedSolve = false;
}

Cell& Grid::cell(int32_t row, int32_t col)
{
    if (!InBounds(row, col))
        throw std::out_of_range("cell (" + std::to_string(row) + "," + std::to_string(col) + ") outside grid");
    return cells_[(size_t)row][(size_t)col];
}

const Cell& Grid::cell(int32_t row, int32_t col) const
{
    if (!InBounds(row, col))
        throw std::out_of_range("cell (" + std::to_string(row) + "," + std::to_string(col) + ") outside grid");
    return cells_[(size_t)row][(size_t)col];
}

void Grid::breakWall_(Cell& current, Cell& next, Wall side)
{
    current.setWall(side, false);
    next.setWall(Opposite(side), false);
}

void Grid::generate()
{
    NullRenderer none;
    generate(none);
}

void Grid::generate(Renderer& renderer)
{
    if (generated_)
        throw InvalidStateError("grid already generated; call reset() first");

    // set before carving so a renderer exception cannot allow a second pass
    // over half-carved walls
    generated_ = true;

    static constexpr std::array<Wall, 4> kSides = {
        Wall::Top, Wall::Bottom, Wall::Left, Wall::Right
    };

    const CellPos start = entrance();
    cell(start).visitedGeneration = true;

    std::vector<CellPos> st;
    st.reserve((size_t)rows_ * (size_t)cols_);
    st.push_back(start);

    std::vector<std::pair<CellPos, Wall>> options;
    options.reserve(kSides.size());

    while (!st.empty())
    {
        const CellPos cur = st.back();

        options.clear();
        for (Wall side : kSides)
        {
            const CellPos n = Step(cur, side);
            if (!InBounds(n)) continue;
            if (cells_[(size_t)n.row][(size_t)n.col].visitedGeneration) continue;
            options.emplace_back(n, side);
        }

        if (options.empty())
        {
            st.pop_back();
            continue;
        }

        std::shuffle(options.begin(), options.end(), rng_);
        const CellPos next = options.front().first;
        const Wall side = options.front().second;

        Cell& a = cells_[(size_t)cur.row][(size_t)cur.col];
        Cell& b = cells_[(size_t)next.row][(size_t)next.col];
        breakWall_(a, b, side);
        b.visitedGeneration = true;
        st.push_back(next);

        renderer.onWallBroken(a, b);
    }

    openBoundary_(renderer);

    for (auto& line : cells_)
        for (auto& c : line)
            c.visitedGeneration = false;
}

// The outer frame stays closed apart from the two markers.
void Grid::openBoundary_(Renderer& renderer)
{
    Cell& in = cell(entrance());
    in.setWall(Wall::Top, false);
    renderer.onBoundaryOpened(in, Wall::Top);

    Cell& out = cell(exit());
    out.setWall(Wall::Bottom, false);
    renderer.onBoundaryOpened(out, Wall::Bottom);
}
