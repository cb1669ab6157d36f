#pragma once
#include "core/Common.hpp"
#include "core/Grid.hpp"

// Draws the maze with '+' corners, '-' and '|' walls and '*' on path cells.
// Each cell is three characters wide; lines end with '\n'.
std::string RenderText(const Grid& grid, const std::vector<CellPos>& path = {});
