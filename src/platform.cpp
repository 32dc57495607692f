// CPU Benchmark - Platform detection implementation

#include "platform.hpp"
#include <thread>
#include <cstring>
#include <cstdio>
#include <cstdint>
#include <set>
#include <utility>
#include <algorithm>
#include <sstream>
#include <iomanip>
#include <stdexcept>

// Platform-specific includes
#ifdef _WIN32
    #define WIN32_LEAN_AND_MEAN
    #include <windows.h>
    #include <intrin.h>
#elif defined(__linux__)
    #include <fstream>
    #include <dirent.h>
    #include <unistd.h>
#elif defined(__APPLE__)
    #include <sys/sysctl.h>
#endif

std::string get_fallback_cpu_name(const std::string& arch, unsigned physical_cores, unsigned logical_cores) {
    return arch + " " + std::to_string(physical_cores) + "C/" + std::to_string(logical_cores) + "T";
}

std::string get_arch_string() {
#if defined(__x86_64__) || defined(_M_X64)
    return "x86_64";
#elif defined(__aarch64__) || defined(_M_ARM64)
    return "arm64";
#elif defined(__i386__) || defined(_M_IX86)
    return "x86";
#elif defined(__arm__) || defined(_M_ARM)
    return "arm";
#else
    return "unknown";
#endif
}

std::string get_os_name() {
#ifdef _WIN32
    return "Windows";
#elif defined(__linux__)
    return "Linux";
#elif defined(__APPLE__)
    return "macOS";
#else
    return "Unknown";
#endif
}

std::string get_compiler_info() {
#if defined(_MSC_VER)
    return "MSVC " + std::to_string(_MSC_VER);
#elif defined(__clang__)
    return "Clang " + std::to_string(__clang_major__) + "." +
           std::to_string(__clang_minor__) + "." +
           std::to_string(__clang_patchlevel__);
#elif defined(__GNUC__)
    return "GCC " + std::to_string(__GNUC__) + "." +
           std::to_string(__GNUC_MINOR__) + "." +
           std::to_string(__GNUC_PATCHLEVEL__);
#else
    return "Unknown compiler";
#endif
}

// Get total logical core count (handles Windows processor groups)
unsigned get_logical_core_count() {
#ifdef _WIN32
    constexpr WORD kAllGroups = 0xFFFF;
    typedef DWORD (WINAPI *GetActiveProcessorCountFunc)(WORD);
    static GetActiveProcessorCountFunc pGetActiveProcessorCount = nullptr;
    static bool initialized = false;

    if (!initialized) {
        HMODULE hKernel32 = GetModuleHandleA("kernel32.dll");
        if (hKernel32) {
            pGetActiveProcessorCount = reinterpret_cast<GetActiveProcessorCountFunc>(
                GetProcAddress(hKernel32, "GetActiveProcessorCount"));
        }
        initialized = true;
    }

    if (pGetActiveProcessorCount) {
        DWORD count = pGetActiveProcessorCount(kAllGroups);
        if (count > 0) return static_cast<unsigned>(count);
    }

    SYSTEM_INFO sysInfo;
    GetSystemInfo(&sysInfo);
    if (sysInfo.dwNumberOfProcessors > 0) {
        return static_cast<unsigned>(sysInfo.dwNumberOfProcessors);
    }
#endif

    unsigned count = std::thread::hardware_concurrency();
    return count > 0 ? count : 1;
}

// ============================================================================
// NUMA entry parsing (platform independent, used by the Linux topology scan)
// ============================================================================

namespace {
// Parses "<prefix><digits>" and nothing else
bool parse_indexed_name(const std::string& s, const char* prefix, unsigned& index) {
    size_t len = std::strlen(prefix);
    if (s.size() <= len || s.compare(0, len, prefix) != 0) {
        return false;
    }
    unsigned value = 0;
    for (size_t i = len; i < s.size(); ++i) {
        if (s[i] < '0' || s[i] > '9') {
            return false;
        }
        value = value * 10 + static_cast<unsigned>(s[i] - '0');
    }
    index = value;
    return true;
}
} // namespace

std::map<unsigned, int> parse_numa_node_entries(const std::vector<std::string>& entries) {
    std::map<unsigned, int> numa;
    for (const auto& entry : entries) {
        size_t last = entry.find_last_of('/');
        if (last == std::string::npos || last == 0) {
            continue;
        }
        size_t prev = entry.find_last_of('/', last - 1);
        std::string node_part = entry.substr(prev == std::string::npos ? 0 : prev + 1,
                                             last - (prev == std::string::npos ? 0 : prev + 1));
        std::string cpu_part = entry.substr(last + 1);

        unsigned node = 0;
        unsigned cpu = 0;
        if (!parse_indexed_name(node_part, "node", node) ||
            !parse_indexed_name(cpu_part, "cpu", cpu)) {
            continue;
        }
        numa[cpu] = static_cast<int>(node);
    }
    return numa;
}

// ============================================================================
// CPU Info Implementation
// ============================================================================

#ifdef _WIN32
// Windows implementation
static std::string get_cpu_vendor_windows() {
    int info[4];
    __cpuid(info, 0);

    char vendor[13];
    memcpy(vendor, &info[1], 4);     // EBX
    memcpy(vendor + 4, &info[3], 4); // EDX
    memcpy(vendor + 8, &info[2], 4); // ECX
    vendor[12] = '\0';

    return std::string(vendor);
}

static std::string get_cpu_model_windows() {
    int info[4];
    char brand[49];

    __cpuid(info, 0x80000000);
    unsigned max_extended = static_cast<unsigned>(info[0]);
    if (max_extended < 0x80000004) {
        return "";
    }

    __cpuid(info, 0x80000002);
    memcpy(brand, info, 16);
    __cpuid(info, 0x80000003);
    memcpy(brand + 16, info, 16);
    __cpuid(info, 0x80000004);
    memcpy(brand + 32, info, 16);
    brand[48] = '\0';

    std::string result(brand);
    size_t start = result.find_first_not_of(' ');
    return start != std::string::npos ? result.substr(start) : result;
}

template<typename Fn>
static void for_each_processor_relation(LOGICAL_PROCESSOR_RELATIONSHIP relation, Fn&& fn) {
    DWORD length = 0;
    GetLogicalProcessorInformationEx(relation, nullptr, &length);
    if (GetLastError() != ERROR_INSUFFICIENT_BUFFER || length == 0) {
        return;
    }

    std::vector<uint8_t> buffer(length);
    if (!GetLogicalProcessorInformationEx(
            relation,
            reinterpret_cast<PSYSTEM_LOGICAL_PROCESSOR_INFORMATION_EX>(buffer.data()),
            &length)) {
        return;
    }

    size_t offset = 0;
    while (offset + sizeof(DWORD) * 2 <= length) {
        auto* info = reinterpret_cast<PSYSTEM_LOGICAL_PROCESSOR_INFORMATION_EX>(buffer.data() + offset);
        if (!info || info->Size == 0 || offset + info->Size > length) {
            break;
        }
        if (info->Relationship == relation) {
            fn(*info);
        }
        offset += info->Size;
    }
}

static std::vector<unsigned> group_mask_cpus(const GROUP_AFFINITY* masks, WORD count) {
    std::vector<unsigned> cpus;
    for (WORD g = 0; g < count; ++g) {
        KAFFINITY mask = masks[g].Mask;
        for (unsigned bit = 0; bit < 64; ++bit) {
            if (mask & (static_cast<KAFFINITY>(1) << bit)) {
                cpus.push_back(static_cast<unsigned>(masks[g].Group) * 64u + bit);
            }
        }
    }
    return cpus;
}

double get_cpu_max_mhz() {
    HKEY hKey;
    double mhz_out = 0.0;
    if (RegOpenKeyExA(HKEY_LOCAL_MACHINE,
                      "HARDWARE\\DESCRIPTION\\System\\CentralProcessor\\0",
                      0, KEY_READ, &hKey) == ERROR_SUCCESS) {
        DWORD mhz = 0;
        DWORD size = sizeof(mhz);
        if (RegQueryValueExA(hKey, "~MHz", nullptr, nullptr,
                             reinterpret_cast<LPBYTE>(&mhz), &size) == ERROR_SUCCESS) {
            mhz_out = static_cast<double>(mhz);
        }
        RegCloseKey(hKey);
    }
    return mhz_out;
}

std::vector<CpuTopologyEntry> get_cpu_topology() {
    unsigned total = get_logical_core_count();
    std::vector<CpuTopologyEntry> topology(total);
    for (unsigned cpu = 0; cpu < total; ++cpu) {
        topology[cpu] = CpuTopologyEntry{cpu, -1, -1, -1};
    }

    int socket = 0;
    for_each_processor_relation(RelationProcessorPackage,
        [&](const SYSTEM_LOGICAL_PROCESSOR_INFORMATION_EX& info) {
            for (unsigned cpu : group_mask_cpus(info.Processor.GroupMask, info.Processor.GroupCount)) {
                if (cpu < total) topology[cpu].socket = socket;
            }
            ++socket;
        });

    int core = 0;
    for_each_processor_relation(RelationProcessorCore,
        [&](const SYSTEM_LOGICAL_PROCESSOR_INFORMATION_EX& info) {
            for (unsigned cpu : group_mask_cpus(info.Processor.GroupMask, info.Processor.GroupCount)) {
                if (cpu < total) topology[cpu].core = core;
            }
            ++core;
        });

    for_each_processor_relation(RelationNumaNode,
        [&](const SYSTEM_LOGICAL_PROCESSOR_INFORMATION_EX& info) {
            for (unsigned cpu : group_mask_cpus(&info.NumaNode.GroupMask, 1)) {
                if (cpu < total) topology[cpu].node = static_cast<int>(info.NumaNode.NodeNumber);
            }
        });

    return topology;
}

CpuInfo get_cpu_info() {
    CpuInfo info;
    info.arch = get_arch_string();
    info.logical_cores = get_logical_core_count();
    info.vendor = get_cpu_vendor_windows();
    info.model = get_cpu_model_windows();
    info.max_mhz = get_cpu_max_mhz();

    unsigned physical = 0;
    unsigned sockets = 0;
    for_each_processor_relation(RelationProcessorCore,
        [&](const SYSTEM_LOGICAL_PROCESSOR_INFORMATION_EX&) { ++physical; });
    for_each_processor_relation(RelationProcessorPackage,
        [&](const SYSTEM_LOGICAL_PROCESSOR_INFORMATION_EX&) { ++sockets; });
    info.physical_cores = physical > 0 ? physical : info.logical_cores;
    info.socket_count = sockets > 0 ? sockets : 1;

    if (info.model.empty()) {
        info.model = get_fallback_cpu_name(info.arch, info.physical_cores, info.logical_cores);
    }
    info.available = !info.vendor.empty();
    return info;
}

#elif defined(__linux__)
// Linux implementation

static bool read_sysfs_int(const std::string& path, int& value) {
    std::ifstream file(path);
    int parsed = 0;
    if (!file.is_open() || !(file >> parsed)) {
        return false;
    }
    value = parsed;
    return true;
}

static std::vector<std::string> list_directory(const std::string& path) {
    std::vector<std::string> names;
    DIR* dir = opendir(path.c_str());
    if (!dir) {
        return names;
    }
    while (struct dirent* entry = readdir(dir)) {
        names.emplace_back(entry->d_name);
    }
    closedir(dir);
    return names;
}

double get_cpu_max_mhz() {
    auto read_khz = [](const std::string& path) -> double {
        std::ifstream file(path);
        double khz = 0.0;
        if (file.is_open() && (file >> khz)) {
            return khz / 1000.0;
        }
        return 0.0;
    };

    double mhz = read_khz("/sys/devices/system/cpu/cpu0/cpufreq/cpuinfo_max_freq");
    if (mhz <= 0.0) {
        mhz = read_khz("/sys/devices/system/cpu/cpu0/cpufreq/scaling_max_freq");
    }
    if (mhz > 0.0) {
        return mhz;
    }

    // Fallback: /proc/cpuinfo (current frequency on x86 without cpufreq)
    std::ifstream cpuinfo("/proc/cpuinfo");
    std::string line;
    while (std::getline(cpuinfo, line)) {
        if (line.compare(0, 7, "cpu MHz") == 0) {
            size_t colon = line.find(':');
            if (colon != std::string::npos) {
                try {
                    return std::stod(line.substr(colon + 1));
                } catch (const std::exception&) {
                    return 0.0;
                }
            }
        }
    }
    return 0.0;
}

std::vector<CpuTopologyEntry> get_cpu_topology() {
    std::vector<std::string> node_entries;
    const std::string node_root = "/sys/devices/system/node/";
    for (const auto& node : list_directory(node_root)) {
        if (node.compare(0, 4, "node") != 0 || node.size() == 4 ||
            node.find_first_not_of("0123456789", 4) != std::string::npos) {
            continue;
        }
        for (const auto& cpu : list_directory(node_root + node)) {
            node_entries.push_back(node_root + node + "/" + cpu);
        }
    }
    std::map<unsigned, int> numa = parse_numa_node_entries(node_entries);

    unsigned total = get_logical_core_count();
    std::vector<CpuTopologyEntry> topology;
    topology.reserve(total);
    for (unsigned cpu = 0; cpu < total; ++cpu) {
        const std::string base = "/sys/devices/system/cpu/cpu" + std::to_string(cpu) + "/topology/";
        CpuTopologyEntry entry{cpu, -1, -1, -1};
        read_sysfs_int(base + "physical_package_id", entry.socket);
        read_sysfs_int(base + "core_id", entry.core);
        auto it = numa.find(cpu);
        if (it != numa.end()) {
            entry.node = it->second;
        }
        topology.push_back(entry);
    }
    return topology;
}

static bool read_proc_cpuinfo(std::vector<std::pair<std::string, std::string>>& fields) {
    std::ifstream cpuinfo("/proc/cpuinfo");
    if (!cpuinfo.is_open()) {
        return false;
    }
    std::string line;
    while (std::getline(cpuinfo, line)) {
        size_t colon = line.find(':');
        if (colon == std::string::npos) {
            continue;
        }
        std::string key = line.substr(0, colon);
        size_t key_end = key.find_last_not_of(" \t");
        key = key_end == std::string::npos ? "" : key.substr(0, key_end + 1);
        std::string value = line.substr(colon + 1);
        size_t start = value.find_first_not_of(" \t");
        value = start == std::string::npos ? "" : value.substr(start);
        fields.emplace_back(key, value);
    }
    return true;
}

static std::string first_field(const std::vector<std::pair<std::string, std::string>>& fields,
                               const std::string& key) {
    for (const auto& f : fields) {
        if (f.first == key && !f.second.empty()) {
            return f.second;
        }
    }
    return "";
}

CpuInfo get_cpu_info() {
    CpuInfo info;
    info.arch = get_arch_string();
    info.logical_cores = get_logical_core_count();
    info.max_mhz = get_cpu_max_mhz();

    std::vector<std::pair<std::string, std::string>> fields;
    info.available = read_proc_cpuinfo(fields);

    // Count unique (package, core) pairs for the physical core count
    std::set<std::pair<int, int>> cores;
    std::set<int> packages;
    for (const auto& entry : get_cpu_topology()) {
        if (entry.socket >= 0) packages.insert(entry.socket);
        if (entry.socket >= 0 && entry.core >= 0) cores.insert({entry.socket, entry.core});
    }
    info.physical_cores = cores.empty() ? info.logical_cores : static_cast<unsigned>(cores.size());
    info.socket_count = packages.empty() ? 1 : static_cast<unsigned>(packages.size());

    info.vendor = first_field(fields, "vendor_id");
    if (info.vendor.empty()) {
        // ARM processors use different field names
        info.vendor = first_field(fields, "CPU implementer");
    }
    if (info.vendor.empty()) {
        info.vendor = "Unknown";
    }

    info.model = first_field(fields, "model name");
    if (info.model.empty()) info.model = first_field(fields, "Hardware");
    if (info.model.empty()) info.model = first_field(fields, "Processor");
    if (info.model.empty()) {
        info.model = get_fallback_cpu_name(info.arch, info.physical_cores, info.logical_cores);
    }
    return info;
}

#elif defined(__APPLE__)
// macOS implementation

static std::string sysctl_string(const char* name) {
    char buffer[256] = {0};
    size_t len = sizeof(buffer);
    if (sysctlbyname(name, buffer, &len, nullptr, 0) == 0) {
        return std::string(buffer);
    }
    return "";
}

static int sysctl_int(const char* name, int fallback) {
    int value = 0;
    size_t len = sizeof(value);
    if (sysctlbyname(name, &value, &len, nullptr, 0) == 0) {
        return value;
    }
    return fallback;
}

double get_cpu_max_mhz() {
    uint64_t freq = 0;
    size_t len = sizeof(freq);
    if (sysctlbyname("hw.cpufrequency_max", &freq, &len, nullptr, 0) == 0 && freq > 0) {
        return static_cast<double>(freq) / 1.0e6;
    }
    return 0.0;
}

std::vector<CpuTopologyEntry> get_cpu_topology() {
    unsigned total = get_logical_core_count();
    unsigned physical = static_cast<unsigned>(sysctl_int("hw.physicalcpu", static_cast<int>(total)));
    unsigned per_core = (physical > 0 && total >= physical) ? total / physical : 1;
    std::vector<CpuTopologyEntry> topology;
    for (unsigned cpu = 0; cpu < total; ++cpu) {
        topology.push_back(CpuTopologyEntry{cpu, 0, static_cast<int>(cpu / per_core), 0});
    }
    return topology;
}

CpuInfo get_cpu_info() {
    CpuInfo info;
    info.arch = get_arch_string();
    info.logical_cores = get_logical_core_count();
    info.physical_cores = static_cast<unsigned>(sysctl_int("hw.physicalcpu", static_cast<int>(info.logical_cores)));
    info.socket_count = static_cast<unsigned>(sysctl_int("hw.packages", 1));
    info.max_mhz = get_cpu_max_mhz();

    info.model = sysctl_string("machdep.cpu.brand_string");
    size_t start = info.model.find_first_not_of(' ');
    info.model = start == std::string::npos ? "" : info.model.substr(start);
#if defined(__aarch64__)
    info.vendor = "Apple";
#else
    info.vendor = sysctl_string("machdep.cpu.vendor");
#endif
    info.available = !info.model.empty() || !info.vendor.empty();
    if (info.model.empty()) {
        info.model = get_fallback_cpu_name(info.arch, info.physical_cores, info.logical_cores);
    }
    return info;
}

#else
// Fallback implementation for other platforms

double get_cpu_max_mhz() {
    return 0.0;
}

std::vector<CpuTopologyEntry> get_cpu_topology() {
    std::vector<CpuTopologyEntry> topology;
    for (unsigned cpu = 0; cpu < get_logical_core_count(); ++cpu) {
        topology.push_back(CpuTopologyEntry{cpu, -1, -1, -1});
    }
    return topology;
}

CpuInfo get_cpu_info() {
    CpuInfo info;
    info.arch = get_arch_string();
    info.logical_cores = get_logical_core_count();
    info.physical_cores = info.logical_cores;
    info.vendor = "Unknown";
    info.model = get_fallback_cpu_name(info.arch, info.physical_cores, info.logical_cores);
    info.available = false;
    return info;
}
#endif

CpuInfo require_cpu_info() {
    CpuInfo info = get_cpu_info();
    if (!info.available) {
        throw PlatformQueryError("cannot query CPU information");
    }
    return info;
}

std::vector<std::string> format_cpu_report(const CpuInfo& info,
                                           const std::vector<CpuTopologyEntry>& topology) {
    std::vector<std::string> lines;
    std::ostringstream oss;

    lines.push_back("CPU: " + info.vendor + " / " + info.model);
    oss << "Max freq: " << std::fixed << std::setprecision(2) << info.max_mhz
        << " mhz (as reported by OS)";
    lines.push_back(oss.str());
    lines.push_back("Cores: " + std::to_string(info.physical_cores));
    lines.push_back("Threads: " + std::to_string(info.logical_cores));
    lines.push_back("Sockets: " + std::to_string(info.socket_count));

    auto field = [](int v) -> std::string {
        return v >= 0 ? std::to_string(v) : std::string("?");
    };
    for (const auto& entry : topology) {
        std::ostringstream row;
        row << "CPU:" << std::setw(3) << entry.cpu
            << " Socket:" << std::setw(3) << field(entry.socket)
            << " CoreId:" << std::setw(3) << field(entry.core)
            << " Node:" << std::setw(3) << entry.node;
        lines.push_back(row.str());
    }
    return lines;
}
