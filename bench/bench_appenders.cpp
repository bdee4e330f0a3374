#include <benchmark/benchmark.h>
#include <chrono>
#include <cstdio>
#include <sstream>
#include <string>
#include <vector>
#include "cascade_log.hpp"

#include <unistd.h>

static std::string benchPath(const std::string& suffix) {
    return "/tmp/cascade_bench_" + std::to_string(getpid()) + "_" + suffix;
}

static cascade::LogRecord benchRecord(std::chrono::system_clock::time_point when) {
    cascade::LogRecord record;
    record.timestamp = when;
    record.level = cascade::LogLevel::INFO;
    record.loggerName = "bench.appender";
    record.threadId = "1";
    record.message = "Processing request 42 with payload of moderate size";
    return record;
}

// ---------------------------------------------------------------------------
// BM_Appender_File
// One O_APPEND write per record, no rotation checks.
// ---------------------------------------------------------------------------
static void BM_Appender_File(benchmark::State& state) {
    std::string path = benchPath("file.log");
    {
        cascade::FileAppender appender(cascade::RollingPolicy::file(path));
        cascade::LogRecord record = benchRecord(std::chrono::system_clock::now());
        for (auto _ : state) {
            appender.append(record);
        }
    }
    std::remove(path.c_str());
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Appender_File);

// ---------------------------------------------------------------------------
// BM_Appender_DailyRolling_SameDay
// Daily appender on the hot path: period comparison, never rotates.
// ---------------------------------------------------------------------------
static void BM_Appender_DailyRolling_SameDay(benchmark::State& state) {
    std::string path = benchPath("daily.log");
    {
        cascade::DailyRollingFileAppender appender(path);
        cascade::LogRecord record = benchRecord(std::chrono::system_clock::now());
        for (auto _ : state) {
            appender.append(record);
        }
    }
    std::remove(path.c_str());
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Appender_DailyRolling_SameDay);

// ---------------------------------------------------------------------------
// BM_Appender_DailyRolling_Rotate
// Every record lands on the next day: rename, reopen, backup scan.
// ---------------------------------------------------------------------------
static void BM_Appender_DailyRolling_Rotate(benchmark::State& state) {
    std::string path = benchPath("rotate.log");
    std::vector<std::string> backups;
    {
        cascade::DailyRollingFileAppender appender(path, cascade::LogLevel::TRACE,
                                                   cascade::PatternLayout(), 4,
                                                   state.range(0) != 0);
        auto when = std::chrono::system_clock::now() - std::chrono::hours(24 * 365 * 10);
        for (auto _ : state) {
            when += std::chrono::hours(24);
            appender.append(benchRecord(when));
        }
        backups = appender.manager().listBackups();
    }
    for (size_t i = 0; i < backups.size(); ++i) std::remove(backups[i].c_str());
    std::remove(path.c_str());
    std::remove((path + ".lock").c_str());
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Appender_DailyRolling_Rotate)->Arg(0)->Arg(1);

// ---------------------------------------------------------------------------
// BM_Appender_Console
// Shared console lock plus stream flush, into a discarding stream.
// ---------------------------------------------------------------------------
static void BM_Appender_Console(benchmark::State& state) {
    std::ostringstream sink;
    cascade::ConsoleAppender appender(cascade::LogLevel::TRACE, cascade::PatternLayout(), sink);
    cascade::LogRecord record = benchRecord(std::chrono::system_clock::now());
    for (auto _ : state) {
        appender.append(record);
        sink.str(std::string());
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Appender_Console);
