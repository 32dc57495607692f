// CPU Benchmark - Result file and statistics tests

#include <gtest/gtest.h>

#include "result_file.hpp"

#include <cstdio>
#include <fstream>
#include <string>

class ResultFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        path_ = ::testing::TempDir() + "cpubench_results_" +
                ::testing::UnitTest::GetInstance()->current_test_info()->name();
        std::remove(path_.c_str());
    }

    void TearDown() override {
        std::remove(path_.c_str());
    }

    std::string path_;
};

TEST_F(ResultFileTest, AppendWritesOneLinePerRecord) {
    ASSERT_TRUE(append_result(path_, 1, 1234.5));
    ASSERT_TRUE(append_result(path_, 16, 98765.4321));

    std::ifstream in(path_);
    std::string line1, line2, line3;
    ASSERT_TRUE(std::getline(in, line1));
    ASSERT_TRUE(std::getline(in, line2));
    EXPECT_FALSE(std::getline(in, line3));
    EXPECT_EQ(line1, "1 1234.500000");
    EXPECT_EQ(line2, "16 98765.432100");
}

TEST_F(ResultFileTest, AppendToUnwritablePathFails) {
    EXPECT_FALSE(append_result("/nonexistent-dir/sub/results.txt", 1, 1.0));
}

TEST_F(ResultFileTest, LoadSkipsMalformedLines) {
    {
        std::ofstream out(path_);
        out << "1 100.5\n";
        out << "garbage\n";
        out << "\n";
        out << "4 200.25\n";
        out << "0 50\n";
        out << "2 3.0 extra\n";
        out << "4 -1\n";
    }
    std::vector<ResultRecord> records = load_results(path_);
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].workers, 1u);
    EXPECT_DOUBLE_EQ(records[0].throughput, 100.5);
    EXPECT_EQ(records[1].workers, 4u);
    EXPECT_DOUBLE_EQ(records[1].throughput, 200.25);
}

TEST_F(ResultFileTest, LoadMissingFileIsEmpty) {
    EXPECT_TRUE(load_results(path_).empty());
}

TEST(StatisticsTest, GroupsByWorkerCount) {
    std::vector<ResultRecord> records = {
        {1, 10.0}, {1, 20.0}, {1, 30.0},
        {8, 100.0}, {8, 300.0},
    };
    auto stats = compute_statistics(records);
    ASSERT_EQ(stats.size(), 2u);

    const GroupStatistics& single = stats.at(1);
    EXPECT_EQ(single.count, 3u);
    EXPECT_DOUBLE_EQ(single.min, 10.0);
    EXPECT_DOUBLE_EQ(single.max, 30.0);
    EXPECT_DOUBLE_EQ(single.mean, 20.0);
    EXPECT_DOUBLE_EQ(single.median, 20.0);
    EXPECT_NEAR(single.stddev, 8.164966, 1e-6);

    const GroupStatistics& multi = stats.at(8);
    EXPECT_EQ(multi.count, 2u);
    EXPECT_DOUBLE_EQ(multi.median, 200.0);
    EXPECT_DOUBLE_EQ(multi.stddev, 100.0);
}

TEST(StatisticsTest, SingleSampleHasZeroStddev) {
    auto stats = compute_statistics({{2, 42.0}});
    EXPECT_DOUBLE_EQ(stats.at(2).stddev, 0.0);
    EXPECT_DOUBLE_EQ(stats.at(2).median, 42.0);
}

TEST(StatisticsTest, MedianOfEmptySampleIsZero) {
    EXPECT_DOUBLE_EQ(compute_median({}), 0.0);
    EXPECT_DOUBLE_EQ(compute_median({3.0, 1.0, 2.0}), 2.0);
}

TEST(StatisticsTest, ReportHasBothSections) {
    auto stats = compute_statistics({{1, 10.0}, {1, 12.0}, {16, 150.0}});
    std::string report = format_statistics(stats, stats, 16);

    EXPECT_NE(report.find("Single threaded performance (1 worker)"), std::string::npos);
    EXPECT_NE(report.find("Multi-threaded performance (16 workers)"), std::string::npos);
    EXPECT_NE(report.find("11.00"), std::string::npos);
    EXPECT_NE(report.find("150.00"), std::string::npos);
}

TEST(StatisticsTest, ReportHandlesMissingGroup) {
    auto stats = compute_statistics({{1, 10.0}});
    std::string report = format_statistics(stats, stats, 4);
    EXPECT_NE(report.find("Multi-threaded performance (4 workers)"), std::string::npos);
    EXPECT_NE(report.find("Samples"), std::string::npos);
}

TEST(StatisticsTest, EqualWorkerCountsStayInTheirOwnSection) {
    auto single = compute_statistics({{1, 100.0}, {1, 100.0}, {1, 100.0}});
    auto multi = compute_statistics({{1, 300.0}, {1, 300.0}, {1, 300.0}});
    std::string report = format_statistics(single, multi, 1);

    size_t multi_at = report.find("Multi-threaded performance (1 worker)");
    ASSERT_NE(multi_at, std::string::npos);
    std::string single_part = report.substr(0, multi_at);
    std::string multi_part = report.substr(multi_at);

    EXPECT_NE(single_part.find("100.00"), std::string::npos);
    EXPECT_EQ(single_part.find("300.00"), std::string::npos);
    EXPECT_NE(multi_part.find("300.00"), std::string::npos);
    EXPECT_EQ(multi_part.find("100.00"), std::string::npos);
    EXPECT_EQ(report.find(" 6 |"), std::string::npos);
}
