#pragma once
// CPU Benchmark - Core types and enums

#include <string>
#include <cstddef>
#include <cstdint>
#include <chrono>
#include <stdexcept>

// Command sent from the orchestrator to workers
enum class WorkerCommand : uint8_t {
    Init,       // One-time setup, answered by a readiness signal
    Step,       // One unit of synthetic work
    Exit        // Report the final count and stop
};

// Run mode selected on the command line
enum class RunMode {
    None,       // No mode selected (usage error)
    Run,        // Single benchmark iteration
    Bench,      // Repeated benchmark through subprocesses
    Freq,       // Frequency probe
    Version     // Print version and exit
};

// Defaults
constexpr unsigned DEFAULT_WORKERS_PER_THREAD = 4;
constexpr unsigned DEFAULT_DURATION_SEC = 60;
constexpr unsigned DEFAULT_ITERATIONS = 10;

// Upper bound of --workers; keeps queue capacity and batch arithmetic in range
constexpr unsigned MAX_WORKERS = 65536;
// Upper bound of --threads, so that the default worker count stays within MAX_WORKERS
constexpr unsigned MAX_THREADS = MAX_WORKERS / DEFAULT_WORKERS_PER_THREAD;

// Work queue capacity is workers * WORK_QUEUE_FANOUT
constexpr unsigned WORK_QUEUE_FANOUT = 32;
// Steps enqueued per deadline poll is workers * STEP_BATCH_FANOUT
constexpr unsigned STEP_BATCH_FANOUT = 16;

// Instructions executed by one frequency probe pass (2^32)
constexpr uint64_t DEFAULT_PROBE_INSTRUCTIONS = 4294967296ULL;

// Benchmark configuration.
// Built once from the command line and passed by const reference afterwards.
struct BenchConfig {
    RunMode mode = RunMode::None;
    unsigned workers = 0;           // 0 = DEFAULT_WORKERS_PER_THREAD * threads
    unsigned threads = 0;           // 0 = all logical cores
    unsigned duration_sec = DEFAULT_DURATION_SEC;
    unsigned iterations = DEFAULT_ITERATIONS;
    std::string result_file;        // Empty = no result file
    bool debug = false;
    uint64_t probe_instructions = DEFAULT_PROBE_INSTRUCTIONS;

    std::chrono::seconds duration() const {
        return std::chrono::seconds(duration_sec);
    }
};

// Outcome of one pool benchmark iteration
struct ThroughputResult {
    unsigned workers = 0;
    unsigned ready_signals = 0;     // Readiness signals seen at the barrier
    unsigned exit_acks = 0;         // Final counts collected at shutdown
    uint64_t total_count = 0;       // Sum of per-worker counts
    uint64_t steps_enqueued = 0;
    int64_t elapsed_ns = 0;
    double throughput = 0.0;        // Operations per second
    std::chrono::steady_clock::time_point started_at;  // Barrier release
};

// One frequency measurement
struct FrequencySample {
    uint64_t instructions = 0;      // Dependent instructions in the timed pass
    double elapsed_sec = 0.0;
    double cycles_per_iteration = 0.0;
    double ghz = 0.0;
};

// Error codes (process exit status)
enum class ErrorCode {
    Success = 0,
    InvalidArguments = 1,
    OutOfMemory = 2,
    ThreadCreationFailed = 3,
    SubprocessFailed = 4,
    PlatformQueryFailed = 5,
    UnknownError = 99
};

inline std::string mode_to_string(RunMode mode) {
    switch (mode) {
        case RunMode::None: return "none";
        case RunMode::Run: return "run";
        case RunMode::Bench: return "bench";
        case RunMode::Freq: return "freq";
        case RunMode::Version: return "version";
    }
    return "unknown";
}

inline const char* command_to_string(WorkerCommand cmd) {
    switch (cmd) {
        case WorkerCommand::Init: return "Init";
        case WorkerCommand::Step: return "Step";
        case WorkerCommand::Exit: return "Exit";
    }
    return "Unknown";
}

// Throughput in operations per second.
// Computed in double so that counts well above 1e9 do not overflow.
inline double compute_throughput(uint64_t count, int64_t elapsed_ns) {
    if (elapsed_ns <= 0) {
        return 0.0;
    }
    return static_cast<double>(count) * 1000000000.0 / static_cast<double>(elapsed_ns);
}
