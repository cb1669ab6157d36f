#pragma once
#include "core/Common.hpp"
#include "core/Grid.hpp"

struct AppConfig
{
    int32_t rows{10};
    int32_t cols{14};
    GridLayout layout{};
    std::optional<uint32_t> seed{};

    int32_t windowWidth{800};
    int32_t windowHeight{600};

    // unset: 20 ms per step with a window, none headless
    std::optional<int32_t> delayMs{};
    bool headless{false};
    bool showHelp{false};

    int32_t stepDelayMs() const
    {
        if (delayMs) return *delayMs;
        return headless ? 0 : 20;
    }
};

// Fills `out` from argv[1..]. Unknown flags, missing values and malformed
// numbers fail with a message in outError. Grid dimensions are not checked
// here; Grid's constructor rejects them.
bool ParseArgs(int argc, const char* const* argv, AppConfig& out, std::string& outError);

std::string UsageText(const std::string& program);
