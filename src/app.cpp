#include "app.hpp"
#include "core/Grid.hpp"
#include "core/Solver.hpp"
#include "core/TextRender.hpp"
#include "Viewer/core.hpp"
#include "Thread/ThreadPool.hpp"

#include <atomic>
#include <chrono>
#include <exception>
#include <future>

static void report_(std::ostream& os, const Grid& grid, const SolveResult& r)
{
    os << "maze " << grid.rows() << "x" << grid.cols() << " seed=" << grid.seed() << ": ";
    if (r.solved)
        os << "solved, path " << r.path.size() << " cells";
    else if (r.cancelled)
        os << "cancelled";
    else
        os << "no path";
    os << ", visited " << r.visited << ", backtracks " << r.backtracks << std::endl;
}

int runHeadless(const AppConfig& cfg)
{
    Grid grid(cfg.rows, cfg.cols, cfg.layout, cfg.seed);
    grid.generate();
    grid.resetSolveState();

    const SolveResult r = Solver::Solve(grid);

    std::cout << RenderText(grid, r.path);
    report_(std::cout, grid, r);
    return r.solved ? 0 : 3;
}

int runWindowed(const AppConfig& cfg)
{
    // validate before any window shows up
    Grid grid(cfg.rows, cfg.cols, cfg.layout, cfg.seed);
    std::cout << "maze " << grid.rows() << "x" << grid.cols() << " seed=" << grid.seed() << std::endl;

    Viewer viewer(grid.rows(), grid.cols(), grid.layout(),
                  cfg.windowWidth, cfg.windowHeight,
                  std::chrono::milliseconds(cfg.stepDelayMs()));
    viewer.open();
    viewer.setStatus("seed=" + std::to_string(grid.seed()) + "  generating");

    std::atomic<bool> cancel{false};
    ThreadPool pool(1);

    auto job = pool.submit([&]() -> SolveResult
    {
        grid.generate(viewer);
        grid.resetSolveState();
        viewer.setStatus("seed=" + std::to_string(grid.seed()) + "  solving");
        return Solver::Solve(grid, viewer, &cancel);
    });

    bool done = false;
    SolveResult result;
    std::exception_ptr failure;

    auto collect = [&]()
    {
        done = true;
        try {
            result = job.get();
        }
        catch (const std::exception& e) {
            std::cerr << "maze job failed: " << e.what() << std::endl;
            failure = std::current_exception();
        }
    };

    try {
        viewer.run([&]()
        {
            if (done) return;
            if (job.wait_for(std::chrono::seconds(0)) != std::future_status::ready) return;

            collect();
            if (failure)
            {
                viewer.requestClose();
                return;
            }
            viewer.setStatus("seed=" + std::to_string(grid.seed())
                + (result.solved ? "  solved, path " + std::to_string(result.path.size()) : "  no path"));
        });
    }
    catch (const std::exception&) {
        cancel.store(true);
        viewer.requestClose();
        throw;
    }

    // window closed: stop an unfinished solve and wait for the worker
    cancel.store(true);
    if (!done) collect();
    pool.shutdown();

    if (failure) std::rethrow_exception(failure);

    report_(std::cout, grid, result);
    return (result.solved || result.cancelled) ? 0 : 3;
}
