#pragma once
// CPU Benchmark - Synthetic work unit
//
// One Step of a worker runs three CPU-bound phases on per-worker state:
//   1. integer mixing (xorshift + multiply hash) over a small buffer
//   2. sorting an array refilled from the mixed buffer
//   3. a dependent floating-point multiply-add chain
// The buffers stay in L1, so the unit measures the core rather than memory.

#include <cstddef>
#include <cstdint>
#include <vector>

class SyntheticWork {
public:
    static constexpr size_t MIX_WORDS = 512;        // 4 KB of uint64_t
    static constexpr size_t SORT_ELEMENTS = 256;
    static constexpr unsigned MIX_ROUNDS = 8;
    static constexpr unsigned FMA_CHAIN_LENGTH = 4096;

    // Seeded per worker so that workers do not run identical data
    explicit SyntheticWork(uint64_t seed);

    // Run one unit of work. Returns the running checksum.
    uint64_t step();

    uint64_t checksum() const { return checksum_; }

private:
    uint64_t mix_phase();
    uint64_t sort_phase(uint64_t salt);
    double fma_phase(double seed);

    uint64_t state_;
    uint64_t checksum_;
    double accumulator_;
    std::vector<uint64_t> mix_buffer_;
    std::vector<uint32_t> sort_buffer_;
};

// Keeps a value observable so the computation producing it is not eliminated
void publish_result(uint64_t value);

// XOR of every value published so far
uint64_t published_results();
