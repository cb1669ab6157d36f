#pragma once
#include "core/Config.hpp"

// Both return the process exit code. Grid construction errors propagate.
int runHeadless(const AppConfig& cfg);
int runWindowed(const AppConfig& cfg);
