#pragma once
// CPU Benchmark - Platform detection header

#include <map>
#include <stdexcept>
#include <string>
#include <vector>

// CPU information structure
struct CpuInfo {
    std::string arch;           // "x86_64", "arm64", "unknown"
    unsigned logical_cores;     // Number of logical cores (total)
    unsigned physical_cores;    // Number of physical cores (total)
    unsigned socket_count;      // Number of CPU packages
    std::string vendor;         // CPU vendor (GenuineIntel, AuthenticAMD, Apple, ...)
    std::string model;          // CPU model name
    double max_mhz;             // OS-reported maximum frequency, 0 if unknown
    bool available;             // False if the OS source could not be read

    CpuInfo()
        : logical_cores(0)
        , physical_cores(0)
        , socket_count(1)
        , max_mhz(0.0)
        , available(false) {}
};

// Raised when the CPU cannot be identified
class PlatformQueryError : public std::runtime_error {
public:
    explicit PlatformQueryError(const std::string& what) : std::runtime_error(what) {}
};

// Placement of one logical CPU
struct CpuTopologyEntry {
    unsigned cpu;               // Logical CPU index
    int socket;                 // Physical package id, -1 if unknown
    int core;                   // Core id within the package, -1 if unknown
    int node;                   // NUMA node, -1 if unknown
};

// Get CPU information
// Detects architecture, core counts, vendor, model and maximum frequency
CpuInfo get_cpu_info();

// Same as get_cpu_info(), but throws PlatformQueryError if the CPU cannot be queried
CpuInfo require_cpu_info();

// Get total logical core count
// On Windows, includes all processor groups (>64 logical CPUs).
unsigned get_logical_core_count();

// Get architecture string from preprocessor macros
std::string get_arch_string();

// Get operating system name
std::string get_os_name();

// Get compiler information
std::string get_compiler_info();

// OS-reported maximum frequency of CPU 0 in MHz, 0 if unavailable
double get_cpu_max_mhz();

// Per logical CPU: socket, core id and NUMA node
std::vector<CpuTopologyEntry> get_cpu_topology();

// Map logical CPU -> NUMA node from sysfs entries of the form ".../node<M>/cpu<N>".
// Entries that do not match (cpumap, cpulist, ...) are ignored.
std::map<unsigned, int> parse_numa_node_entries(const std::vector<std::string>& entries);

// Get fallback CPU name when the model string is not exposed
// Returns string in format "{arch} {cores}C/{threads}T"
std::string get_fallback_cpu_name(const std::string& arch, unsigned physical_cores, unsigned logical_cores);

// Human-readable CPU summary and topology lines (for the debug log)
std::vector<std::string> format_cpu_report(const CpuInfo& info,
                                           const std::vector<CpuTopologyEntry>& topology);
