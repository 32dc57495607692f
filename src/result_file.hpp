#pragma once
// CPU Benchmark - Result append file and statistics
//
// File format: one "<workers> <throughput>" record per line, appended by each
// single-iteration pass and read back by the repeated-benchmark driver.

#include <map>
#include <string>
#include <vector>

struct ResultRecord {
    unsigned workers;
    double throughput;
};

// Aggregate of all records sharing one worker count
struct GroupStatistics {
    unsigned workers = 0;
    size_t count = 0;
    double min = 0.0;
    double max = 0.0;
    double mean = 0.0;
    double median = 0.0;
    double stddev = 0.0;
};

// Append one record. Returns false if the file cannot be opened or written.
bool append_result(const std::string& path, unsigned workers, double throughput);

// Read all well-formed records. Malformed lines are skipped (debug log).
// A missing file yields an empty vector.
std::vector<ResultRecord> load_results(const std::string& path);

// Statistics keyed by worker count
std::map<unsigned, GroupStatistics> compute_statistics(const std::vector<ResultRecord>& records);

// Median of a sample (0 for an empty sample)
double compute_median(std::vector<double> values);

// Report with a single-threaded section (1 worker, taken from `single`) and a
// multi-threaded section (multi_workers, taken from `multi`). The two passes
// come from separate files, so equal worker counts never merge.
std::string format_statistics(const std::map<unsigned, GroupStatistics>& single,
                              const std::map<unsigned, GroupStatistics>& multi,
                              unsigned multi_workers);
