// CPU Benchmark - Repeated benchmark driver

#include "bench_runner.hpp"
#include "cli.hpp"
#include "debug_log.hpp"
#include "platform.hpp"
#include "result_file.hpp"
#include "version.hpp"

#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <stdexcept>
#include <utility>
#include <vector>

#ifdef _WIN32
    #define WIN32_LEAN_AND_MEAN
    #include <windows.h>
    #include <process.h>
    #include <io.h>
#else
    #include <sys/types.h>
    #include <sys/wait.h>
    #include <unistd.h>
#endif

#ifdef __APPLE__
    #include <mach-o/dyld.h>
#endif

// ============================================================================
// Temporary result file
// ============================================================================

TempResultFile::TempResultFile() {
#ifdef _WIN32
    char dir[MAX_PATH];
    char name[MAX_PATH];
    if (GetTempPathA(MAX_PATH, dir) == 0 || GetTempFileNameA(dir, "cpb", 0, name) == 0) {
        throw std::runtime_error("Cannot create temporary result file");
    }
    path_ = name;
#else
    const char* tmpdir = std::getenv("TMPDIR");
    std::string pattern = std::string(tmpdir && tmpdir[0] ? tmpdir : "/tmp") + "/cpubench1a-XXXXXX";
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');

    int fd = mkstemp(buffer.data());
    if (fd < 0) {
        throw std::runtime_error("Cannot create temporary result file " + pattern + ": " +
                                 std::strerror(errno));
    }
    close(fd);
    path_ = buffer.data();
#endif
    debug_log("Result file: " + path_);
}

TempResultFile::~TempResultFile() {
    if (!path_.empty() && std::remove(path_.c_str()) != 0) {
        debug_log("Cannot remove temporary result file: " + path_);
    }
}

// ============================================================================
// Process helpers
// ============================================================================

std::string get_executable_path(const char* argv0) {
#if defined(__linux__)
    char buffer[4096];
    ssize_t len = readlink("/proc/self/exe", buffer, sizeof(buffer) - 1);
    if (len > 0) {
        buffer[len] = '\0';
        return std::string(buffer);
    }
#elif defined(__APPLE__)
    char buffer[4096];
    uint32_t size = sizeof(buffer);
    if (_NSGetExecutablePath(buffer, &size) == 0) {
        return std::string(buffer);
    }
#elif defined(_WIN32)
    char buffer[MAX_PATH];
    DWORD len = GetModuleFileNameA(nullptr, buffer, MAX_PATH);
    if (len > 0 && len < MAX_PATH) {
        return std::string(buffer, len);
    }
#endif
    return argv0 ? std::string(argv0) : std::string();
}

int run_child_process(const std::string& executable, const std::vector<std::string>& args) {
    std::vector<char*> argv;
    argv.push_back(const_cast<char*>(executable.c_str()));
    for (const auto& a : args) {
        argv.push_back(const_cast<char*>(a.c_str()));
    }
    argv.push_back(nullptr);

    // Children write to the same stdout; flush ours first to keep the order
    std::cout.flush();
    std::cerr.flush();

#ifdef _WIN32
    intptr_t status = _spawnv(_P_WAIT, executable.c_str(), argv.data());
    if (status == -1) {
        throw SubprocessError("Cannot start " + executable + ": " + std::strerror(errno));
    }
    return static_cast<int>(status);
#else
    pid_t pid = fork();
    if (pid < 0) {
        throw SubprocessError(std::string("fork failed: ") + std::strerror(errno));
    }
    if (pid == 0) {
        // Child process
        execv(executable.c_str(), argv.data());
        _exit(127);
    }

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            throw SubprocessError(std::string("waitpid failed: ") + std::strerror(errno));
        }
    }
    if (WIFSIGNALED(status)) {
        throw SubprocessError(executable + " killed by signal " + std::to_string(WTERMSIG(status)));
    }
    if (WIFEXITED(status)) {
        int code = WEXITSTATUS(status);
        if (code == 127) {
            throw SubprocessError("Cannot execute " + executable);
        }
        return code;
    }
    return -1;
#endif
}

// ============================================================================
// BenchRunner
// ============================================================================

BenchRunner::BenchRunner(const BenchConfig& config, std::string executable)
    : config_(config)
    , executable_(std::move(executable))
{
    if (executable_.empty()) {
        throw SubprocessError("Cannot determine executable path");
    }
}

std::vector<std::string> BenchRunner::pass_args(unsigned workers, const std::string& result_file) const {
    BenchConfig pass = config_;
    pass.mode = RunMode::Run;
    pass.workers = workers;
    pass.result_file = result_file;
    // Verbosity reaches children through the inherited environment
    pass.debug = false;
    return config_to_args(pass);
}

void BenchRunner::run_pass(unsigned workers, const std::string& result_file) const {
    int code = run_child_process(executable_, pass_args(workers, result_file));
    if (code != 0) {
        throw SubprocessError("Benchmark pass with " + std::to_string(workers) +
                                 " workers failed with exit status " + std::to_string(code));
    }
}

void BenchRunner::run() {
    debug_log(std::string("Version: ") + version::VERSION_STRING);
    debug_log("");
    if (debug_enabled()) {
        CpuInfo info = require_cpu_info();
        for (const auto& line : format_cpu_report(info, get_cpu_topology())) {
            debug_log(line);
        }
        debug_log("");
    }

    // One file per pass: with --workers=1 both passes write the same key
    TempResultFile single_results;
    TempResultFile multi_results;

    std::cout << "Single threaded performance\n";
    std::cout << "===========================\n\n";
    for (unsigned i = 0; i < config_.iterations; ++i) {
        run_pass(1, single_results.path());
    }

    std::cout << "\nMulti-threaded performance\n";
    std::cout << "==========================\n\n";
    for (unsigned i = 0; i < config_.iterations; ++i) {
        run_pass(config_.workers, multi_results.path());
    }

    std::cout << format_statistics(compute_statistics(load_results(single_results.path())),
                                   compute_statistics(load_results(multi_results.path())),
                                   config_.workers);
    std::cout.flush();
}
