#pragma once
// CPU Benchmark - Core frequency probe
//
// Runs a chain of 1024 dependent single-cycle instructions per loop iteration.
// Each instruction consumes the previous result, so the core cannot overlap
// them. Elapsed time is then proportional to cycles:
//
//   GHz = instructions / 1024 * PROBE_CYCLES_PER_ITERATION / seconds / 1e9
//
// The loop is run twice: a warm-up pass to leave low-power states, then the
// timed pass.

#include "types.hpp"

#include <cstdint>

// Dependent instructions in one loop iteration
constexpr uint64_t PROBE_CHAIN_LENGTH = 1024;

// Cycles per loop iteration: the chain plus the closing decrement/branch.
// Calibration data for the x86-64 and AArch64 sequences below.
constexpr double PROBE_CYCLES_PER_ITERATION = 1025.0;

// Run `iterations` loop iterations (iterations * PROBE_CHAIN_LENGTH instructions).
// Returns the chain result so that the loop cannot be discarded.
uint64_t run_dependent_chain(uint64_t iterations, uint64_t seed);

// Name of the instruction sequence compiled into this binary
const char* dependent_chain_kind();

class FrequencyProbe {
public:
    // Uses config.probe_instructions (rounded down to a multiple of 1024)
    explicit FrequencyProbe(const BenchConfig& config);

    // Warm-up pass, then timed pass
    FrequencySample measure() const;

    uint64_t iterations() const { return iterations_; }
    uint64_t instructions() const { return iterations_ * PROBE_CHAIN_LENGTH; }

private:
    uint64_t iterations_;
};

// Measure with the default instruction count; returns GHz
double measure_frequency();
