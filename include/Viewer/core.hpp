#pragma once

#include "core/Common.hpp"
#include "core/DataStruct.hpp"
#include "core/Grid.hpp"
#include "core/Renderer.hpp"

#include <array>
#include <atomic>
#include <chrono>
#include <mutex>

// Window that animates a Grid while another thread generates and solves it.
// The Renderer callbacks may run on any thread; everything else belongs to
// the thread that called open().
class Viewer final : public Renderer
{
public:
    Viewer(int32_t rows,
           int32_t cols,
           const GridLayout& layout,
           int32_t windowWidth,
           int32_t windowHeight,
           std::chrono::milliseconds stepDelay);
    ~Viewer() override;

    Viewer(const Viewer&) = delete;
    Viewer& operator=(const Viewer&) = delete;

    // Creates the window and GL objects. Throws std::runtime_error on failure.
    void open();

    // Event loop until the window is closed. `onFrame` runs once per frame
    // on this thread before drawing.
    void run(const std::function<void()>& onFrame = {});

    // any thread
    void requestClose();
    bool isClosing() const noexcept;
    void setStatus(const std::string& status);

    void onFramebufferResized(int width, int height);

    // Renderer
    void onWallBroken(const Cell& a, const Cell& b) override;
    void onMove(const Cell& from, const Cell& to, bool isBacktrack) override;
    void onBoundaryOpened(const Cell& cell, Wall wall) override;

private:
    struct Move
    {
        CellPos from;
        CellPos to;
        bool backtrack;
    };

    using Walls = std::array<bool, 4>;

    // window/gl
    void initWindowAndGL();
    void shutdownGL();
    void applyTitle();

    // render
    void drawMaze();
    void rebuildMeshIfDirty();
    void rebuildMesh(const std::vector<Walls>& ws, const std::vector<Move>& ms);

    void copyWalls_(const Cell& c);
    void pace_() const;

private:
    const int32_t rows;
    const int32_t cols;
    const GridLayout layout;
    const int32_t winW;
    const int32_t winH;
    const std::chrono::milliseconds stepDelay;

    // -------- window / gl state --------
    void* window = nullptr;
    int fbW = 800;
    int fbH = 600;

    uint32_t program = 0;
    uint32_t vao = 0;
    uint32_t vbo = 0;
    int vertexCount = 0;

    // -------- state shared with the maze thread --------
    mutable std::mutex mtx;
    std::vector<Walls> walls;      // row-major copy of every cell's walls
    std::vector<Move> moves;       // solver trail in call order
    bool meshDirty = true;
    std::string status;
    bool titleDirty = true;

    std::atomic<bool> closing{false};
};
