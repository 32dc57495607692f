// CPU Benchmark - Repeated benchmark driver tests

#include <gtest/gtest.h>

#include "bench_runner.hpp"
#include "cli.hpp"

#include <fstream>
#include <string>
#include <vector>

#ifndef _WIN32
#include <sys/stat.h>
#endif

namespace {
BenchConfig bench_config() {
    BenchConfig config;
    config.mode = RunMode::Bench;
    config.threads = 2;
    config.workers = 8;
    config.duration_sec = 3;
    config.iterations = 2;
    return config;
}

bool file_exists(const std::string& path) {
    std::ifstream in(path);
    return in.is_open();
}

size_t count_occurrences(const std::string& text, const std::string& needle) {
    size_t count = 0;
    for (size_t pos = text.find(needle); pos != std::string::npos; pos = text.find(needle, pos + 1)) {
        ++count;
    }
    return count;
}
} // namespace

TEST(TempResultFileTest, CreatedAndRemoved) {
    std::string path;
    {
        TempResultFile file;
        path = file.path();
        ASSERT_FALSE(path.empty());
        EXPECT_TRUE(file_exists(path));
    }
    EXPECT_FALSE(file_exists(path));
}

TEST(BenchRunnerTest, PassArgumentsDescribeARunPass) {
    BenchRunner runner(bench_config(), "/bin/true");
    std::vector<std::string> args = runner.pass_args(1, "/tmp/res");

    ParseResult parsed = [&args]() {
        std::vector<std::string> storage = args;
        storage.insert(storage.begin(), "cpubench1a");
        std::vector<char*> argv;
        for (auto& s : storage) argv.push_back(&s[0]);
        argv.push_back(nullptr);
        return parse_args(static_cast<int>(storage.size()), argv.data());
    }();

    ASSERT_TRUE(parsed.success) << parsed.error_message;
    EXPECT_EQ(parsed.config.mode, RunMode::Run);
    EXPECT_EQ(parsed.config.threads, 2u);
    EXPECT_EQ(parsed.config.workers, 1u);
    EXPECT_EQ(parsed.config.duration_sec, 3u);
    EXPECT_EQ(parsed.config.iterations, 2u);
    EXPECT_EQ(parsed.config.result_file, "/tmp/res");
}

TEST(BenchRunnerTest, EmptyExecutableIsRejected) {
    EXPECT_THROW(BenchRunner(bench_config(), ""), SubprocessError);
}

#ifndef _WIN32
TEST(ChildProcessTest, ReportsExitStatus) {
    EXPECT_EQ(run_child_process("/bin/sh", {"-c", "exit 0"}), 0);
    EXPECT_EQ(run_child_process("/bin/sh", {"-c", "exit 3"}), 3);
}

TEST(ChildProcessTest, MissingExecutableThrows) {
    EXPECT_THROW(run_child_process("/nonexistent/cpubench1a", {}), SubprocessError);
}

TEST(BenchRunnerTest, FailingPassAborts) {
    BenchRunner runner(bench_config(), "/bin/false");
    EXPECT_THROW(runner.run(), SubprocessError);
}

TEST(BenchRunnerTest, SucceedingPassesProduceReport) {
    BenchRunner runner(bench_config(), "/bin/true");
    testing::internal::CaptureStdout();
    EXPECT_NO_THROW(runner.run());
    std::string out = testing::internal::GetCapturedStdout();
    EXPECT_NE(out.find("Multi-threaded performance (8 workers)"), std::string::npos);
}

// Stand-in pass that appends one "<workers> 100.0" record to its --res file
TEST(BenchRunnerTest, OneWorkerPassesAreReportedSeparately) {
    TempResultFile script;
    {
        std::ofstream out(script.path(), std::ios::trunc);
        out << "#!/bin/sh\n"
               "for arg in \"$@\"; do\n"
               "  case \"$arg\" in\n"
               "    --workers=*) workers=\"${arg#--workers=}\" ;;\n"
               "    --res=*) res=\"${arg#--res=}\" ;;\n"
               "  esac\n"
               "done\n"
               "echo \"$workers 100.0\" >> \"$res\"\n";
    }
    ASSERT_EQ(chmod(script.path().c_str(), 0700), 0);

    BenchConfig config = bench_config();
    config.workers = 1;
    config.iterations = 3;
    BenchRunner runner(config, script.path());

    testing::internal::CaptureStdout();
    EXPECT_NO_THROW(runner.run());
    std::string out = testing::internal::GetCapturedStdout();

    EXPECT_NE(out.find("Multi-threaded performance (1 worker)"), std::string::npos);
    EXPECT_EQ(count_occurrences(out, "| Samples       |                    3 |"), 2u);
    EXPECT_EQ(out.find(" 6 |"), std::string::npos);
}
#endif

TEST(ExecutablePathTest, FallsBackToArgv0) {
    std::string path = get_executable_path("fallback-name");
    EXPECT_FALSE(path.empty());
}
