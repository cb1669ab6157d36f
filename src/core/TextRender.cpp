#include "core/TextRender.hpp"

std::string RenderText(const Grid& grid, const std::vector<CellPos>& path)
{
    const int32_t rows = grid.rows();
    const int32_t cols = grid.cols();

    std::vector<uint8_t> onPath((size_t)rows * (size_t)cols, 0);
    for (const auto& p : path)
    {
        if (grid.InBounds(p))
            onPath[(size_t)p.row * (size_t)cols + (size_t)p.col] = 1;
    }

    std::string out;
    out.reserve((size_t)(rows * 2 + 1) * (size_t)(cols * 4 + 2));

    for (int32_t r = 0; r < rows; ++r)
    {
        for (int32_t c = 0; c < cols; ++c)
        {
            out += '+';
            out += grid.cell(r, c).wallTop() ? "---" : "   ";
        }
        out += "+\n";

        for (int32_t c = 0; c < cols; ++c)
        {
            const Cell& cell = grid.cell(r, c);
            out += cell.wallLeft() ? '|' : ' ';
            out += onPath[(size_t)r * (size_t)cols + (size_t)c] ? " * " : "   ";
        }
        out += grid.cell(r, cols - 1).wallRight() ? "|\n" : " \n";
    }

    for (int32_t c = 0; c < cols; ++c)
    {
        out += '+';
        out += grid.cell(rows - 1, c).wallBottom() ? "---" : "   ";
    }
    out += "+\n";

    return out;
}
