#include "Viewer/core.hpp"
#include "Viewer/ViewerInternal.hpp"

#include <algorithm>

namespace
{
const Color kWall      = { 1.00f, 1.00f, 1.00f };
const Color kMove      = { 0.90f, 0.10f, 0.10f };
const Color kBacktrack = { 0.50f, 0.50f, 0.50f };

constexpr float kWallPx = 2.0f;
constexpr float kMovePx = 2.0f;
}

void Viewer::rebuildMeshIfDirty()
{
    std::vector<Walls> localWalls;
    std::vector<Move> localMoves;
    {
        std::lock_guard<std::mutex> lock(mtx);
        if (!meshDirty) return;
        localWalls = walls;
        localMoves = moves;
        meshDirty = false;
    }

    rebuildMesh(localWalls, localMoves);
}

// Layout is in window pixels with y down, like the cell rectangles.
void Viewer::rebuildMesh(const std::vector<Walls>& ws, const std::vector<Move>& ms)
{
    std::vector<Vertex> verts;
    verts.reserve(ws.size() * 4 * 6 + ms.size() * 6);

    const float sx = 2.0f / (float)winW;
    const float sy = 2.0f / (float)winH;

    // axis-aligned segment of `thick` pixels, converted to NDC
    auto pushSegment = [&](float px0, float py0, float px1, float py1, float thick, const Color& c)
    {
        const float h = thick * 0.5f;
        const float l = std::min(px0, px1) - h;
        const float r = std::max(px0, px1) + h;
        const float t = std::min(py0, py1) - h;
        const float b = std::max(py0, py1) + h;
        PushRect(verts, l * sx - 1.0f, 1.0f - b * sy, r * sx - 1.0f, 1.0f - t * sy, c);
    };

    auto left   = [&](int32_t c) { return (float)(layout.originX + layout.cellWidth * c); };
    auto top    = [&](int32_t r) { return (float)(layout.originY + layout.cellHeight * r); };
    auto center = [&](const CellPos& p, float& outX, float& outY)
    {
        outX = left(p.col) + (float)layout.cellWidth * 0.5f;
        outY = top(p.row) + (float)layout.cellHeight * 0.5f;
    };

    for (int32_t r = 0; r < rows; ++r)
    {
        for (int32_t c = 0; c < cols; ++c)
        {
            const Walls& w = ws[(size_t)r * (size_t)cols + (size_t)c];
            const float x1 = left(c);
            const float y1 = top(r);
            const float x2 = left(c + 1);
            const float y2 = top(r + 1);

            if (w[(size_t)Wall::Top])    pushSegment(x1, y1, x2, y1, kWallPx, kWall);
            if (w[(size_t)Wall::Bottom]) pushSegment(x1, y2, x2, y2, kWallPx, kWall);
            if (w[(size_t)Wall::Left])   pushSegment(x1, y1, x1, y2, kWallPx, kWall);
            if (w[(size_t)Wall::Right])  pushSegment(x2, y1, x2, y2, kWallPx, kWall);
        }
    }

    // later entries paint over earlier ones: a backtrack grays its red move
    for (const Move& m : ms)
    {
        float ax = 0, ay = 0, bx = 0, by = 0;
        center(m.from, ax, ay);
        center(m.to, bx, by);
        pushSegment(ax, ay, bx, by, kMovePx, m.backtrack ? kBacktrack : kMove);
    }

    glBindBuffer(GL_ARRAY_BUFFER, vbo);
    glBufferData(GL_ARRAY_BUFFER, (GLsizeiptr)(verts.size() * sizeof(Vertex)), verts.data(), GL_DYNAMIC_DRAW);
    glBindBuffer(GL_ARRAY_BUFFER, 0);

    vertexCount = (int)verts.size();
}

void Viewer::drawMaze()
{
    rebuildMeshIfDirty();

    if (vertexCount <= 0) return;

    glViewport(0, 0, fbW, fbH);

    glUseProgram(program);
    glBindVertexArray(vao);
    glDrawArrays(GL_TRIANGLES, 0, vertexCount);
    glBindVertexArray(0);
    glUseProgram(0);
}
