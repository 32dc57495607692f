#pragma once
// CPU Benchmark - Repeated benchmark driver
//
// Each pass runs the executable again in --run mode so that every sample
// starts from a fresh process (no allocator or scheduler state carried over).
// Passes append their throughput to a temporary result file, which is read
// back at the end for statistics.

#include "types.hpp"

#include <stdexcept>
#include <string>
#include <vector>

// A pass could not be started or did not exit cleanly
class SubprocessError : public std::runtime_error {
public:
    explicit SubprocessError(const std::string& what) : std::runtime_error(what) {}
};

// Temporary result file, removed on destruction
class TempResultFile {
public:
    TempResultFile();
    ~TempResultFile();

    TempResultFile(const TempResultFile&) = delete;
    TempResultFile& operator=(const TempResultFile&) = delete;

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

// Path of the running executable (/proc/self/exe on Linux, argv0 elsewhere)
std::string get_executable_path(const char* argv0);

// Run `executable` with `args` and wait for it. stdout/stderr are inherited.
// Returns the exit status; throws SubprocessError if it cannot be started
// or is killed by a signal.
int run_child_process(const std::string& executable, const std::vector<std::string>& args);

class BenchRunner {
public:
    // config must have threads and workers resolved
    BenchRunner(const BenchConfig& config, std::string executable);

    // Single-threaded passes, multi-threaded passes, then the statistics report
    // on stdout. Throws SubprocessError on the first failing pass.
    void run();

    // Arguments of one --run pass with `workers` workers
    std::vector<std::string> pass_args(unsigned workers, const std::string& result_file) const;

private:
    void run_pass(unsigned workers, const std::string& result_file) const;

    BenchConfig config_;
    std::string executable_;
};
