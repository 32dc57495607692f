// CPU Benchmark - Core frequency probe

#include "frequency_probe.hpp"
#include "synthetic_work.hpp"
#include "debug_log.hpp"

#include <chrono>
#include <sstream>
#include <iomanip>
#include <stdexcept>
#include <string>

// Instruction sequence selection
#if (defined(__x86_64__) || defined(__amd64__)) && (defined(__GNUC__) || defined(__clang__))
    #define PROBE_ASM_X86_64 1
#elif defined(__aarch64__) && (defined(__GNUC__) || defined(__clang__))
    #define PROBE_ASM_AARCH64 1
#endif

#if defined(PROBE_ASM_X86_64)
    #define PROBE_C1 "addq $1, %[v]\n\t"
#elif defined(PROBE_ASM_AARCH64)
    #define PROBE_C1 "add %[v], %[v], #1\n\t"
#endif

#ifdef PROBE_C1
    #define PROBE_C2    PROBE_C1 PROBE_C1
    #define PROBE_C4    PROBE_C2 PROBE_C2
    #define PROBE_C8    PROBE_C4 PROBE_C4
    #define PROBE_C16   PROBE_C8 PROBE_C8
    #define PROBE_C32   PROBE_C16 PROBE_C16
    #define PROBE_C64   PROBE_C32 PROBE_C32
    #define PROBE_C128  PROBE_C64 PROBE_C64
    #define PROBE_C256  PROBE_C128 PROBE_C128
    #define PROBE_C512  PROBE_C256 PROBE_C256
    #define PROBE_C1024 PROBE_C512 PROBE_C512
#endif

uint64_t run_dependent_chain(uint64_t iterations, uint64_t seed) {
    uint64_t v = seed;
    if (iterations == 0) {
        return v;
    }
    uint64_t n = iterations;

#if defined(PROBE_ASM_X86_64)
    __asm__ __volatile__(
        ".p2align 4\n"
        "1:\n\t"
        PROBE_C1024
        "subq $1, %[n]\n\t"
        "jnz 1b\n\t"
        : [v] "+r"(v), [n] "+r"(n)
        :
        : "cc");
#elif defined(PROBE_ASM_AARCH64)
    __asm__ __volatile__(
        ".p2align 4\n"
        "1:\n\t"
        PROBE_C1024
        "subs %[n], %[n], #1\n\t"
        "b.ne 1b\n\t"
        : [v] "+r"(v), [n] "+r"(n)
        :
        : "cc");
#elif defined(__GNUC__) || defined(__clang__)
    // Empty asm with a register operand: the compiler has to materialize
    // every intermediate value and cannot fold the additions together
    for (; n != 0; --n) {
        for (uint64_t j = 0; j < PROBE_CHAIN_LENGTH; ++j) {
            v += 1;
            __asm__ __volatile__("" : "+r"(v));
        }
    }
#else
    volatile uint64_t chain = v;
    for (; n != 0; --n) {
        for (uint64_t j = 0; j < PROBE_CHAIN_LENGTH; ++j) {
            chain = chain + 1;
        }
    }
    v = chain;
#endif

    return v;
}

const char* dependent_chain_kind() {
#if defined(PROBE_ASM_X86_64)
    return "x86-64 add chain";
#elif defined(PROBE_ASM_AARCH64)
    return "aarch64 add chain";
#else
    return "generic (uncalibrated)";
#endif
}

FrequencyProbe::FrequencyProbe(const BenchConfig& config)
    : iterations_(config.probe_instructions / PROBE_CHAIN_LENGTH)
{
    if (iterations_ == 0) {
        throw std::invalid_argument("Frequency probe needs at least " +
                                    std::to_string(PROBE_CHAIN_LENGTH) + " instructions");
    }
}

FrequencySample FrequencyProbe::measure() const {
    // First run to warm the CPU
    debug_log("Warming-up CPU");
    uint64_t sink = run_dependent_chain(iterations_, 0);

    debug_log("Measuring ...");
    const auto begin = std::chrono::steady_clock::now();
    sink ^= run_dependent_chain(iterations_, sink);
    const auto end = std::chrono::steady_clock::now();
    publish_result(sink);

    FrequencySample sample;
    sample.instructions = instructions();
    sample.elapsed_sec = std::chrono::duration<double>(end - begin).count();
    sample.cycles_per_iteration = PROBE_CYCLES_PER_ITERATION;
    if (sample.elapsed_sec > 0.0) {
        sample.ghz = static_cast<double>(sample.instructions) / static_cast<double>(PROBE_CHAIN_LENGTH) *
                     PROBE_CYCLES_PER_ITERATION / sample.elapsed_sec / 1.0e9;
    }

    if (debug_enabled()) {
        std::ostringstream oss;
        oss << "[freq] " << dependent_chain_kind() << ": " << sample.instructions
            << " instructions in " << std::fixed << std::setprecision(6) << sample.elapsed_sec
            << "s -> " << std::setprecision(3) << sample.ghz << " GHz";
        debug_log(oss.str());
    }
    return sample;
}

double measure_frequency() {
    BenchConfig config;
    return FrequencyProbe(config).measure().ghz;
}
