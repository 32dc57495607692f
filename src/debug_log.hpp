#pragma once
// CPU Benchmark - Debug logging
//
// Diagnostics go to stderr only when CPUBENCH_DEBUG is set to a non-zero value.
// --debug exports the variable so that spawned benchmark passes inherit it.

#include <cstdlib>
#include <iostream>
#include <string>

constexpr const char* DEBUG_ENV_VAR = "CPUBENCH_DEBUG";

inline bool debug_enabled() {
    const char* env = std::getenv(DEBUG_ENV_VAR);
    return env && env[0] != '\0' && env[0] != '0';
}

inline void debug_log(const std::string& msg) {
    if (debug_enabled()) {
        std::cerr << msg << "\n";
    }
}

// Turn debug output on for this process and its children
bool enable_debug_env();
