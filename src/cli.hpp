#pragma once
// CPU Benchmark - CLI parsing module

#include "types.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>
#include <vector>
#include <iostream>
#include <cstring>

// Print usage help
inline void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " MODE [options]\n\n";
    std::cout << "Modes (exactly one):\n";
    std::cout << "  --run             Run a single benchmark iteration\n";
    std::cout << "  --bench           Run single- and multi-threaded passes and show statistics\n";
    std::cout << "  --freq            Measure the CPU core frequency\n";
    std::cout << "  --version         Show version information\n";
    std::cout << "\nOptions:\n";
    std::cout << "  --threads=N       Number of hardware threads to use (default: all)\n";
    std::cout << "  --workers=N       Number of workers (default: " << DEFAULT_WORKERS_PER_THREAD
              << " x threads)\n";
    std::cout << "  --duration=S      Duration of one iteration in seconds (default: "
              << DEFAULT_DURATION_SEC << ")\n";
    std::cout << "  --nb=N            Iterations per pass in --bench mode (default: "
              << DEFAULT_ITERATIONS << ")\n";
    std::cout << "  --res=PATH        Append \"<workers> <throughput>\" to PATH\n";
    std::cout << "  --debug           Print diagnostics on stderr\n";
    std::cout << "  --help            Show this help message\n";
    std::cout << "\nExamples:\n";
    std::cout << "  " << program_name << " --bench\n";
    std::cout << "  " << program_name << " --run --threads=4 --duration=10\n";
    std::cout << "  " << program_name << " --freq\n";
}

// Parse result structure
struct ParseResult {
    BenchConfig config;
    bool success = true;
    bool show_help = false;
    std::string error_message;
};

// Helper to extract value from --key=value argument
inline bool extract_arg_value(const char* arg, const char* key, std::string& value) {
    size_t key_len = std::strlen(key);
    if (std::strncmp(arg, key, key_len) == 0 && arg[key_len] == '=') {
        value = arg + key_len + 1;
        return true;
    }
    return false;
}

// Strict unsigned parse: digits only, fits in unsigned
inline unsigned parse_unsigned(const std::string& value) {
    if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
        throw std::invalid_argument("expected a non-negative integer");
    }
    unsigned long v = std::stoul(value);
    if (v > 0xFFFFFFFFul) {
        throw std::out_of_range("value too large");
    }
    return static_cast<unsigned>(v);
}

// Validate config (before defaults are resolved; 0 means "default" for workers/threads)
inline bool validate_config(const BenchConfig& config, std::string& error) {
    if (config.mode == RunMode::None) {
        error = "No mode selected (use --run, --bench, --freq or --version)";
        return false;
    }

    if (config.iterations == 0) {
        error = "Number of iterations (--nb) must be greater than 0";
        return false;
    }

    return true;
}

// Parse command-line arguments
inline ParseResult parse_args(int argc, char* argv[]) {
    ParseResult result;
    result.config = BenchConfig();  // Default values

    auto set_mode = [&result](RunMode mode, const std::string& arg) {
        if (result.config.mode != RunMode::None && result.config.mode != mode) {
            result.success = false;
            result.error_message = "Conflicting mode " + arg + ": --" +
                                   mode_to_string(result.config.mode) + " already selected";
            return false;
        }
        result.config.mode = mode;
        return true;
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        std::string value;

        // Check for help
        if (arg == "--help" || arg == "-h") {
            result.show_help = true;
            return result;
        }

        try {
            if (arg == "--run") {
                if (!set_mode(RunMode::Run, arg)) return result;
            }
            else if (arg == "--bench") {
                if (!set_mode(RunMode::Bench, arg)) return result;
            }
            else if (arg == "--freq") {
                if (!set_mode(RunMode::Freq, arg)) return result;
            }
            else if (arg == "--version") {
                if (!set_mode(RunMode::Version, arg)) return result;
            }
            else if (arg == "--debug") {
                result.config.debug = true;
            }
            // --workers
            else if (extract_arg_value(argv[i], "--workers", value)) {
                result.config.workers = parse_unsigned(value);
                if (result.config.workers == 0) {
                    throw std::invalid_argument("workers must be at least 1");
                }
                if (result.config.workers > MAX_WORKERS) {
                    throw std::out_of_range("workers must not exceed " + std::to_string(MAX_WORKERS));
                }
            }
            // --threads
            else if (extract_arg_value(argv[i], "--threads", value)) {
                result.config.threads = parse_unsigned(value);
                if (result.config.threads == 0) {
                    throw std::invalid_argument("threads must be at least 1");
                }
                if (result.config.threads > MAX_THREADS) {
                    throw std::out_of_range("threads must not exceed " + std::to_string(MAX_THREADS));
                }
            }
            // --duration
            else if (extract_arg_value(argv[i], "--duration", value)) {
                result.config.duration_sec = parse_unsigned(value);
            }
            // --nb
            else if (extract_arg_value(argv[i], "--nb", value)) {
                result.config.iterations = parse_unsigned(value);
            }
            // --res
            else if (extract_arg_value(argv[i], "--res", value)) {
                if (value.empty()) {
                    throw std::invalid_argument("empty path");
                }
                result.config.result_file = value;
            }
            else {
                result.success = false;
                result.error_message = "Unknown argument: " + arg;
                return result;
            }
        } catch (const std::exception& e) {
            result.success = false;
            result.error_message = "Error parsing argument '" + arg + "': " + e.what();
            return result;
        }
    }

    // Validate the config
    std::string validation_error;
    if (!validate_config(result.config, validation_error)) {
        result.success = false;
        result.error_message = validation_error;
    }

    return result;
}

// Fill in threads (all logical CPUs) and workers (DEFAULT_WORKERS_PER_THREAD x threads)
inline BenchConfig resolve_defaults(BenchConfig config, unsigned logical_cores) {
    if (config.threads == 0) {
        config.threads = logical_cores > 0 ? std::min(logical_cores, MAX_THREADS) : 1;
    }
    if (config.workers == 0) {
        config.workers = DEFAULT_WORKERS_PER_THREAD * config.threads;
    }
    return config;
}

// Serialize config to command-line arguments (used to build child pass command lines)
inline std::vector<std::string> config_to_args(const BenchConfig& config) {
    std::vector<std::string> args;

    if (config.mode != RunMode::None) {
        args.push_back("--" + mode_to_string(config.mode));
    }
    if (config.threads != 0) {
        args.push_back("--threads=" + std::to_string(config.threads));
    }
    if (config.workers != 0) {
        args.push_back("--workers=" + std::to_string(config.workers));
    }
    args.push_back("--duration=" + std::to_string(config.duration_sec));
    args.push_back("--nb=" + std::to_string(config.iterations));
    if (!config.result_file.empty()) {
        args.push_back("--res=" + config.result_file);
    }
    if (config.debug) {
        args.push_back("--debug");
    }

    return args;
}

// Compare two configs for equality (for round-trip testing)
inline bool configs_equal(const BenchConfig& a, const BenchConfig& b) {
    return a.mode == b.mode &&
           a.workers == b.workers &&
           a.threads == b.threads &&
           a.duration_sec == b.duration_sec &&
           a.iterations == b.iterations &&
           a.result_file == b.result_file &&
           a.debug == b.debug;
}
