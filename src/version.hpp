#pragma once
// CPU Benchmark - Version information

#include <string>
#include <sstream>

#include "platform.hpp"

namespace version {

constexpr const char* VERSION_STRING = "1.2.0";

// Build date and time
constexpr const char* BUILD_DATE = __DATE__;
constexpr const char* BUILD_TIME = __TIME__;

// Format: "CPUBench1A X.Y.Z (built DATE TIME with COMPILER on OS)"
inline std::string get_full_version_string() {
    std::ostringstream oss;
    oss << "CPUBench1A " << VERSION_STRING
        << " (built " << BUILD_DATE << " " << BUILD_TIME
        << " with " << get_compiler_info() << " on " << get_os_name() << ")";
    return oss.str();
}

} // namespace version
