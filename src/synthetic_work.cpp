// CPU Benchmark - Synthetic work unit

#include "synthetic_work.hpp"

#include <algorithm>
#include <atomic>
#include <cstring>

namespace {
std::atomic<uint64_t> g_result_sink{0};

inline uint64_t xorshift64(uint64_t x) {
    x ^= x << 13;
    x ^= x >> 7;
    x ^= x << 17;
    return x;
}

// splitmix64 finalizer
inline uint64_t mix64(uint64_t z) {
    z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL;
    z = (z ^ (z >> 27)) * 0x94D049BB133111EBULL;
    return z ^ (z >> 31);
}
} // namespace

void publish_result(uint64_t value) {
    g_result_sink.fetch_xor(value, std::memory_order_relaxed);
}

uint64_t published_results() {
    return g_result_sink.load(std::memory_order_relaxed);
}

SyntheticWork::SyntheticWork(uint64_t seed)
    : state_(mix64(seed + 0x9E3779B97F4A7C15ULL) | 1)
    , checksum_(0)
    , accumulator_(1.0)
    , mix_buffer_(MIX_WORDS)
    , sort_buffer_(SORT_ELEMENTS)
{
    uint64_t x = state_;
    for (auto& w : mix_buffer_) {
        x = xorshift64(x);
        w = x;
    }
}

uint64_t SyntheticWork::step() {
    uint64_t h = mix_phase();
    h ^= sort_phase(h);

    double d = fma_phase(static_cast<double>(h & 0xFFFF) * 1e-6);
    uint64_t bits;
    std::memcpy(&bits, &d, sizeof(bits));

    checksum_ = mix64(checksum_ ^ h ^ bits);
    return checksum_;
}

uint64_t SyntheticWork::mix_phase() {
    uint64_t x = state_;
    uint64_t h = 0;
    for (unsigned round = 0; round < MIX_ROUNDS; ++round) {
        for (size_t i = 0; i < MIX_WORDS; ++i) {
            x = xorshift64(x);
            uint64_t w = mix_buffer_[i] ^ x;
            w *= 0x2545F4914F6CDD1DULL;
            mix_buffer_[i] = w;
            h += w >> (round + 1);
        }
    }
    state_ = x;
    return h;
}

uint64_t SyntheticWork::sort_phase(uint64_t salt) {
    for (size_t i = 0; i < SORT_ELEMENTS; ++i) {
        sort_buffer_[i] = static_cast<uint32_t>(mix_buffer_[(i * 7) % MIX_WORDS] >> 32) ^
                          static_cast<uint32_t>(salt);
    }
    std::sort(sort_buffer_.begin(), sort_buffer_.end());

    // Median and extremes depend on the whole sorted order
    return (static_cast<uint64_t>(sort_buffer_[SORT_ELEMENTS / 2]) << 32) ^
           sort_buffer_.front() ^ sort_buffer_.back();
}

double SyntheticWork::fma_phase(double seed) {
    // Single dependent chain converging towards 1.0
    double r = accumulator_ + seed;
    const double a1 = 0.9999999, b1 = 1e-7;
    const double a2 = 0.9999998, b2 = 2e-7;
    for (unsigned i = 0; i < FMA_CHAIN_LENGTH; ++i) {
        r = r * a1 + b1;
        r = r * a2 + b2;
    }
    accumulator_ = r;
    return r;
}
