#pragma once
// CPU Benchmark - Process CPU affinity

#include <vector>

// Affinity result codes
enum class AffinityResult {
    Success,            // Affinity was set successfully
    NotSupported,       // Platform doesn't support process affinity
    InvalidCore,        // Requested CPU count is zero or no CPU is usable
    PermissionDenied,   // Insufficient permissions
    Failed              // Other failure
};

class ThreadAffinityManager {
public:
    // Restrict the calling process to the first `cpu_count` CPUs it is
    // currently allowed to run on. Threads created afterwards inherit the
    // restriction, so call this before any worker is spawned.
    // A count at or above the number of allowed CPUs leaves the mask unchanged.
    static AffinityResult limit_process_to_cpus(unsigned cpu_count);

    // CPUs the process may currently run on (empty if not supported)
    static std::vector<unsigned> get_allowed_cpus();
};

// Convert AffinityResult to string for logging/debugging
inline const char* affinity_result_to_string(AffinityResult result) {
    switch (result) {
        case AffinityResult::Success: return "Success";
        case AffinityResult::NotSupported: return "Not Supported";
        case AffinityResult::InvalidCore: return "Invalid Core ID";
        case AffinityResult::PermissionDenied: return "Permission Denied";
        case AffinityResult::Failed: return "Failed";
        default: return "Unknown";
    }
}
