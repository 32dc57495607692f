// CPU Benchmark - Main entry point

#include "types.hpp"
#include "platform.hpp"
#include "cli.hpp"
#include "debug_log.hpp"
#include "pool_benchmark.hpp"
#include "frequency_probe.hpp"
#include "bench_runner.hpp"
#include "result_file.hpp"
#include "thread_affinity.hpp"
#include "version.hpp"

#include <iostream>
#include <string>
#include <iomanip>
#include <exception>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <new>
#include <stdexcept>

#ifdef _WIN32
#include <windows.h>
#endif

namespace {

void signal_handler(int sig) {
    std::cerr << "[fatal] signal " << sig << "\n";
    std::cerr.flush();
    std::abort();
}

void terminate_handler() {
    std::cerr << "[fatal] std::terminate called\n";
    std::cerr.flush();
    std::abort();
}

#ifdef _WIN32
LONG WINAPI unhandled_exception_filter(EXCEPTION_POINTERS* info) {
    if (info && info->ExceptionRecord) {
        std::cerr << "[fatal] unhandled exception 0x"
                  << std::hex << info->ExceptionRecord->ExceptionCode
                  << std::dec << "\n";
    } else {
        std::cerr << "[fatal] unhandled exception (unknown)\n";
    }
    std::cerr.flush();
    return EXCEPTION_EXECUTE_HANDLER;
}
#endif

void install_crash_handlers() {
    std::set_terminate(terminate_handler);
    std::signal(SIGABRT, signal_handler);
    std::signal(SIGSEGV, signal_handler);
    std::signal(SIGILL, signal_handler);
    std::signal(SIGFPE, signal_handler);
#ifdef _WIN32
    SetUnhandledExceptionFilter(unhandled_exception_filter);
#endif
}

// --run: one iteration, model name and throughput on stdout
ErrorCode run_single(const BenchConfig& config) {
    debug_log("CPU benchmark with " + std::to_string(config.threads) + " threads and " +
              std::to_string(config.workers) + " workers");

    CpuInfo cpu_info = require_cpu_info();

    ThroughputResult result;
    try {
        result = PoolBenchmark(config).run();
    } catch (const std::runtime_error& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return ErrorCode::ThreadCreationFailed;
    }

    if (!debug_enabled()) {
        char line[64];
        std::snprintf(line, sizeof(line), "%.6f", result.throughput);
        std::cout << cpu_info.model << "\n" << line << std::endl;
    }

    if (!config.result_file.empty()) {
        if (!append_result(config.result_file, config.workers, result.throughput)) {
            debug_log("Cannot write result into temporary file: " + config.result_file);
        }
    }
    debug_log("");
    return ErrorCode::Success;
}

// --bench: isolated passes through child processes
void run_bench(const BenchConfig& config, const char* argv0) {
    BenchRunner runner(config, get_executable_path(argv0));
    runner.run();
}

// --freq
void run_freq(const BenchConfig& config) {
    debug_log(std::string("Version: ") + version::VERSION_STRING);
    FrequencySample sample = FrequencyProbe(config).measure();

    char line[64];
    std::snprintf(line, sizeof(line), "Frequency: %.3f GHz", sample.ghz);
    std::cout << line << std::endl;
}

} // namespace

int main(int argc, char* argv[]) {
    install_crash_handlers();
    try {
        ParseResult parse_result = parse_args(argc, argv);

        // Show help if requested
        if (parse_result.show_help) {
            print_usage(argv[0]);
            return static_cast<int>(ErrorCode::Success);
        }

        // Check for parsing errors (no mode selected included)
        if (!parse_result.success) {
            std::cerr << "Error: " << parse_result.error_message << std::endl;
            std::cerr << std::endl;
            print_usage(argv[0]);
            return static_cast<int>(ErrorCode::InvalidArguments);
        }

        if (parse_result.config.debug && !enable_debug_env()) {
            std::cerr << "Warning: cannot export " << DEBUG_ENV_VAR << " to child processes" << std::endl;
        }

        const BenchConfig config = resolve_defaults(parse_result.config, get_logical_core_count());

        // Limit the hardware threads available to this process (and its workers).
        // No-op when threads covers every allowed CPU.
        AffinityResult affinity = ThreadAffinityManager::limit_process_to_cpus(config.threads);
        if (affinity != AffinityResult::Success) {
            debug_log(std::string("Cannot restrict CPU affinity to ") + std::to_string(config.threads) +
                      " CPUs: " + affinity_result_to_string(affinity));
        }

        switch (config.mode) {
            case RunMode::Run:
                return static_cast<int>(run_single(config));
            case RunMode::Bench:
                run_bench(config, argv[0]);
                break;
            case RunMode::Freq:
                run_freq(config);
                break;
            case RunMode::Version:
                std::cout << "Version: " << version::VERSION_STRING << std::endl;
                debug_log(version::get_full_version_string());
                break;
            case RunMode::None:
                print_usage(argv[0]);
                return static_cast<int>(ErrorCode::InvalidArguments);
        }

        return static_cast<int>(ErrorCode::Success);

    } catch (const PlatformQueryError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return static_cast<int>(ErrorCode::PlatformQueryFailed);
    } catch (const SubprocessError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return static_cast<int>(ErrorCode::SubprocessFailed);
    } catch (const std::bad_alloc& e) {
        std::cerr << "Error: Out of memory - " << e.what() << std::endl;
        return static_cast<int>(ErrorCode::OutOfMemory);
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return static_cast<int>(ErrorCode::InvalidArguments);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return static_cast<int>(ErrorCode::UnknownError);
    }
}
