#include "Viewer/core.hpp"
#include "Viewer/ViewerInternal.hpp"

#include <algorithm>
#include <thread>

Viewer::Viewer(int32_t rows_,
               int32_t cols_,
               const GridLayout& layout_,
               int32_t windowWidth,
               int32_t windowHeight,
               std::chrono::milliseconds stepDelay_)
    : rows(rows_)
    , cols(cols_)
    , layout(layout_)
    , winW(std::max(1, windowWidth))
    , winH(std::max(1, windowHeight))
    , stepDelay(stepDelay_)
    , fbW(winW)
    , fbH(winH)
{
    // a fresh grid is fully walled
    walls.assign((size_t)rows * (size_t)cols, Walls{ { true, true, true, true } });
}

Viewer::~Viewer()
{
    shutdownGL();
}

void Viewer::open()
{
    initWindowAndGL();
}

void Viewer::run(const std::function<void()>& onFrame)
{
    auto* win = static_cast<GLFWwindow*>(window);
    if (!win)
        throw std::runtime_error("Viewer::run called before open()");

    while (!glfwWindowShouldClose(win) && !closing.load())
    {
        if (onFrame) onFrame();
        applyTitle();

        // #2c2c2e
        glClearColor(0.173f, 0.173f, 0.180f, 1.0f);
        glClear(GL_COLOR_BUFFER_BIT);

        drawMaze();

        glfwSwapBuffers(win);
        glfwPollEvents();
    }

    closing.store(true);
}

void Viewer::requestClose()
{
    closing.store(true);
}

bool Viewer::isClosing() const noexcept
{
    return closing.load();
}

void Viewer::setStatus(const std::string& s)
{
    std::lock_guard<std::mutex> lock(mtx);
    status = s;
    titleDirty = true;
}

void Viewer::applyTitle()
{
    std::string title;
    {
        std::lock_guard<std::mutex> lock(mtx);
        if (!titleDirty) return;
        titleDirty = false;
        title = "Maze  |  " + std::to_string(rows) + "x" + std::to_string(cols);
        if (!status.empty()) title += "  |  " + status;
    }
    glfwSetWindowTitle(static_cast<GLFWwindow*>(window), title.c_str());
}

void Viewer::onFramebufferResized(int width, int height)
{
    fbW = std::max(1, width);
    fbH = std::max(1, height);
}

void Viewer::copyWalls_(const Cell& c)
{
    Walls& w = walls[(size_t)c.row() * (size_t)cols + (size_t)c.col()];
    w[(size_t)Wall::Top]    = c.wallTop();
    w[(size_t)Wall::Bottom] = c.wallBottom();
    w[(size_t)Wall::Left]   = c.wallLeft();
    w[(size_t)Wall::Right]  = c.wallRight();
}

// Cooperative pause so the window thread can show the step.
void Viewer::pace_() const
{
    if (stepDelay.count() <= 0 || closing.load()) return;
    std::this_thread::sleep_for(stepDelay);
}

void Viewer::onWallBroken(const Cell& a, const Cell& b)
{
    {
        std::lock_guard<std::mutex> lock(mtx);
        copyWalls_(a);
        copyWalls_(b);
        meshDirty = true;
    }
    pace_();
}

void Viewer::onBoundaryOpened(const Cell& cell, Wall /*wall*/)
{
    {
        std::lock_guard<std::mutex> lock(mtx);
        copyWalls_(cell);
        meshDirty = true;
    }
    pace_();
}

void Viewer::onMove(const Cell& from, const Cell& to, bool isBacktrack)
{
    {
        std::lock_guard<std::mutex> lock(mtx);
        moves.push_back({ from.pos(), to.pos(), isBacktrack });
        meshDirty = true;
    }
    pace_();
}
