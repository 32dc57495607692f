// CPU Benchmark - Result append file and statistics

#include "result_file.hpp"
#include "debug_log.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <fstream>
#include <iomanip>
#include <numeric>
#include <sstream>

bool append_result(const std::string& path, unsigned workers, double throughput) {
    std::ofstream out(path, std::ios::out | std::ios::app);
    if (!out.is_open()) {
        return false;
    }

    char line[64];
    std::snprintf(line, sizeof(line), "%u %.6f\n", workers, throughput);
    out << line;
    out.flush();
    return static_cast<bool>(out);
}

std::vector<ResultRecord> load_results(const std::string& path) {
    std::vector<ResultRecord> records;
    std::ifstream in(path);
    if (!in.is_open()) {
        debug_log("Cannot open result file: " + path);
        return records;
    }

    std::string line;
    size_t line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        if (line.find_first_not_of(" \t\r") == std::string::npos) {
            continue;
        }

        std::istringstream iss(line);
        long long workers = 0;
        double throughput = 0.0;
        std::string trailing;
        if (!(iss >> workers >> throughput) || (iss >> trailing) ||
            workers <= 0 || !std::isfinite(throughput) || throughput < 0.0) {
            debug_log("Skipping malformed result line " + std::to_string(line_no) + ": " + line);
            continue;
        }
        records.push_back(ResultRecord{static_cast<unsigned>(workers), throughput});
    }
    return records;
}

double compute_median(std::vector<double> values) {
    if (values.empty()) return 0.0;
    std::sort(values.begin(), values.end());
    size_t mid = values.size() / 2;
    if (values.size() % 2 == 0) {
        return (values[mid - 1] + values[mid]) / 2.0;
    }
    return values[mid];
}

std::map<unsigned, GroupStatistics> compute_statistics(const std::vector<ResultRecord>& records) {
    std::map<unsigned, std::vector<double>> groups;
    for (const auto& r : records) {
        groups[r.workers].push_back(r.throughput);
    }

    std::map<unsigned, GroupStatistics> stats;
    for (const auto& g : groups) {
        const std::vector<double>& values = g.second;
        GroupStatistics s;
        s.workers = g.first;
        s.count = values.size();
        s.min = *std::min_element(values.begin(), values.end());
        s.max = *std::max_element(values.begin(), values.end());
        s.mean = std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
        s.median = compute_median(values);

        // Population standard deviation, 0 for a single sample
        if (values.size() >= 2) {
            double sum_sq = 0.0;
            for (double v : values) {
                double diff = v - s.mean;
                sum_sq += diff * diff;
            }
            s.stddev = std::sqrt(sum_sq / static_cast<double>(values.size()));
        }
        stats[g.first] = s;
    }
    return stats;
}

namespace {
std::string table_row(const std::string& label, const std::string& value) {
    std::ostringstream oss;
    oss << "| " << std::left << std::setw(14) << label
        << "| " << std::right << std::setw(20) << value << " |";
    return oss.str();
}

std::string fixed(double v) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << v;
    return oss.str();
}

void format_section(std::ostringstream& oss, const std::string& title,
                    const std::map<unsigned, GroupStatistics>& stats, unsigned workers) {
    const std::string h_line = "+" + std::string(15, '-') + "+" + std::string(22, '-') + "+";

    oss << title << " (" << workers << (workers == 1 ? " worker" : " workers") << ")\n";
    oss << h_line << "\n";

    auto it = stats.find(workers);
    if (it == stats.end() || it->second.count == 0) {
        oss << table_row("Samples", "0") << "\n";
        oss << h_line << "\n";
        return;
    }

    const GroupStatistics& s = it->second;
    oss << table_row("Samples", std::to_string(s.count)) << "\n";
    oss << table_row("Min", fixed(s.min)) << "\n";
    oss << table_row("Max", fixed(s.max)) << "\n";
    oss << table_row("Mean", fixed(s.mean)) << "\n";
    oss << table_row("Median", fixed(s.median)) << "\n";
    oss << table_row("Std Dev", fixed(s.stddev)) << "\n";
    oss << h_line << "\n";
}
} // namespace

std::string format_statistics(const std::map<unsigned, GroupStatistics>& single,
                              const std::map<unsigned, GroupStatistics>& multi,
                              unsigned multi_workers) {
    std::ostringstream oss;
    oss << "\n";
    format_section(oss, "Single threaded performance", single, 1);
    oss << "\n";
    format_section(oss, "Multi-threaded performance", multi, multi_workers);
    return oss.str();
}
