// CPU Benchmark - Process CPU affinity implementation

#include "thread_affinity.hpp"

// Platform-specific includes
#ifdef _WIN32
    #define WIN32_LEAN_AND_MEAN
    #include <windows.h>
#elif defined(__linux__)
    #ifndef _GNU_SOURCE
        #define _GNU_SOURCE
    #endif
    #include <sched.h>
    #include <errno.h>
#endif

// ============================================================================
// Windows Implementation
// ============================================================================
#ifdef _WIN32

// Only processor group 0 is addressed by the process affinity mask
std::vector<unsigned> ThreadAffinityManager::get_allowed_cpus() {
    std::vector<unsigned> cpus;
    DWORD_PTR process_mask = 0;
    DWORD_PTR system_mask = 0;
    if (!GetProcessAffinityMask(GetCurrentProcess(), &process_mask, &system_mask)) {
        return cpus;
    }
    for (unsigned bit = 0; bit < sizeof(DWORD_PTR) * 8; ++bit) {
        if (process_mask & (static_cast<DWORD_PTR>(1) << bit)) {
            cpus.push_back(bit);
        }
    }
    return cpus;
}

AffinityResult ThreadAffinityManager::limit_process_to_cpus(unsigned cpu_count) {
    if (cpu_count == 0) {
        return AffinityResult::InvalidCore;
    }
    std::vector<unsigned> allowed = get_allowed_cpus();
    if (allowed.empty()) {
        return AffinityResult::Failed;
    }
    if (cpu_count >= allowed.size()) {
        return AffinityResult::Success;
    }

    DWORD_PTR mask = 0;
    for (unsigned i = 0; i < cpu_count; ++i) {
        mask |= (static_cast<DWORD_PTR>(1) << allowed[i]);
    }

    if (!SetProcessAffinityMask(GetCurrentProcess(), mask)) {
        DWORD error = GetLastError();
        if (error == ERROR_ACCESS_DENIED) {
            return AffinityResult::PermissionDenied;
        }
        return AffinityResult::Failed;
    }
    return AffinityResult::Success;
}

// ============================================================================
// Linux Implementation
// ============================================================================
#elif defined(__linux__)

std::vector<unsigned> ThreadAffinityManager::get_allowed_cpus() {
    std::vector<unsigned> cpus;
    cpu_set_t cpuset;
    CPU_ZERO(&cpuset);
    if (sched_getaffinity(0, sizeof(cpu_set_t), &cpuset) != 0) {
        return cpus;
    }
    for (unsigned cpu = 0; cpu < CPU_SETSIZE; ++cpu) {
        if (CPU_ISSET(cpu, &cpuset)) {
            cpus.push_back(cpu);
        }
    }
    return cpus;
}

AffinityResult ThreadAffinityManager::limit_process_to_cpus(unsigned cpu_count) {
    if (cpu_count == 0) {
        return AffinityResult::InvalidCore;
    }
    std::vector<unsigned> allowed = get_allowed_cpus();
    if (allowed.empty()) {
        return AffinityResult::Failed;
    }
    if (cpu_count >= allowed.size()) {
        return AffinityResult::Success;
    }

    cpu_set_t cpuset;
    CPU_ZERO(&cpuset);
    for (unsigned i = 0; i < cpu_count; ++i) {
        CPU_SET(allowed[i], &cpuset);
    }

    // pid 0 = calling thread; threads spawned later inherit its mask
    int result = sched_setaffinity(0, sizeof(cpu_set_t), &cpuset);

    if (result != 0) {
        if (errno == EPERM) {
            return AffinityResult::PermissionDenied;
        }
        if (errno == EINVAL) {
            return AffinityResult::InvalidCore;
        }
        return AffinityResult::Failed;
    }

    return AffinityResult::Success;
}

// ============================================================================
// macOS and other platforms
// ============================================================================
#else

// macOS only offers affinity tags as scheduler hints
std::vector<unsigned> ThreadAffinityManager::get_allowed_cpus() {
    return std::vector<unsigned>();
}

AffinityResult ThreadAffinityManager::limit_process_to_cpus(unsigned cpu_count) {
    if (cpu_count == 0) {
        return AffinityResult::InvalidCore;
    }
    return AffinityResult::NotSupported;
}

#endif
