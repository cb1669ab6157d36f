#include "core/Config.hpp"

#include <limits>

static bool parseInt_(const std::string& s, int64_t lo, int64_t hi, int64_t& out)
{
    if (s.empty()) return false;

    size_t used = 0;
    long long v = 0;
    try {
        v = std::stoll(s, &used, 10);
    }
    catch (const std::invalid_argument&) {
        return false;
    }
    catch (const std::out_of_range&) {
        return false;
    }

    if (used != s.size()) return false;
    if (v < lo || v > hi) return false;
    out = (int64_t)v;
    return true;
}

bool ParseArgs(int argc, const char* const* argv, AppConfig& out, std::string& outError)
{
    constexpr int64_t kIntMin = std::numeric_limits<int32_t>::min();
    constexpr int64_t kIntMax = std::numeric_limits<int32_t>::max();

    for (int i = 1; i < argc; ++i)
    {
        const std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") { out.showHelp = true; continue; }
        if (arg == "--headless")            { out.headless = true; continue; }

        if (i + 1 >= argc)
        {
            outError = "missing value for " + arg;
            return false;
        }
        const std::string value = argv[++i];

        auto readInt = [&](int64_t lo, int64_t hi, int64_t& dst) -> bool
        {
            if (parseInt_(value, lo, hi, dst)) return true;
            outError = "invalid value for " + arg + ": '" + value + "'";
            return false;
        };

        int64_t v = 0;
        if (arg == "--rows")
        {
            if (!readInt(kIntMin, kIntMax, v)) return false;
            out.rows = (int32_t)v;
        }
        else if (arg == "--cols")
        {
            if (!readInt(kIntMin, kIntMax, v)) return false;
            out.cols = (int32_t)v;
        }
        else if (arg == "--seed")
        {
            if (!readInt(0, std::numeric_limits<uint32_t>::max(), v)) return false;
            out.seed = (uint32_t)v;
        }
        else if (arg == "--cell-size")
        {
            if (!readInt(1, kIntMax, v)) return false;
            out.layout.cellWidth = (int32_t)v;
            out.layout.cellHeight = (int32_t)v;
        }
        else if (arg == "--cell-width")
        {
            if (!readInt(1, kIntMax, v)) return false;
            out.layout.cellWidth = (int32_t)v;
        }
        else if (arg == "--cell-height")
        {
            if (!readInt(1, kIntMax, v)) return false;
            out.layout.cellHeight = (int32_t)v;
        }
        else if (arg == "--offset-x")
        {
            if (!readInt(kIntMin, kIntMax, v)) return false;
            out.layout.originX = (int32_t)v;
        }
        else if (arg == "--offset-y")
        {
            if (!readInt(kIntMin, kIntMax, v)) return false;
            out.layout.originY = (int32_t)v;
        }
        else if (arg == "--width")
        {
            if (!readInt(1, kIntMax, v)) return false;
            out.windowWidth = (int32_t)v;
        }
        else if (arg == "--height")
        {
            if (!readInt(1, kIntMax, v)) return false;
            out.windowHeight = (int32_t)v;
        }
        else if (arg == "--delay-ms")
        {
            if (!readInt(0, 60000, v)) return false;
            out.delayMs = (int32_t)v;
        }
        else
        {
            outError = "unknown option " + arg;
            return false;
        }
    }
    return true;
}

std::string UsageText(const std::string& program)
{
    return "usage: " + program + " [options]\n"
        "  --rows N          grid rows (default 10)\n"
        "  --cols N          grid columns (default 14)\n"
        "  --seed N          reproducible maze\n"
        "  --cell-size N     cell width and height in pixels (default 50)\n"
        "  --cell-width N\n"
        "  --cell-height N\n"
        "  --offset-x N      left edge of the maze (default 50)\n"
        "  --offset-y N      top edge of the maze (default 50)\n"
        "  --width N         window width (default 800)\n"
        "  --height N        window height (default 600)\n"
        "  --delay-ms N      pause after each step (default 20, 0 headless)\n"
        "  --headless        no window; print the solved maze as text\n"
        "  --help\n";
}
