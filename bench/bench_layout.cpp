#include <benchmark/benchmark.h>
#include <chrono>
#include <string>
#include "cascade_log.hpp"

static cascade::LogRecord benchRecord() {
    cascade::LogRecord record;
    record.timestamp = std::chrono::system_clock::now();
    record.level = cascade::LogLevel::INFO;
    record.loggerName = "com.example.service.database";
    record.threadId = "12345";
    record.message = "User alice logged in from 10.0.0.1";
    return record;
}

// ---------------------------------------------------------------------------
// BM_Layout_Default
// Default pattern: UTC date with millis, padded level, thread and logger.
// ---------------------------------------------------------------------------
static void BM_Layout_Default(benchmark::State& state) {
    cascade::PatternLayout layout;
    cascade::LogRecord record = benchRecord();

    for (auto _ : state) {
        benchmark::DoNotOptimize(layout.render(record));
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Layout_Default);

// ---------------------------------------------------------------------------
// BM_Layout_MessageOnly
// Baseline: "%m%n" has no date or padding work.
// ---------------------------------------------------------------------------
static void BM_Layout_MessageOnly(benchmark::State& state) {
    cascade::PatternLayout layout("%m%n");
    cascade::LogRecord record = benchRecord();

    for (auto _ : state) {
        benchmark::DoNotOptimize(layout.render(record));
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Layout_MessageOnly);

// ---------------------------------------------------------------------------
// BM_Layout_LocalDateAbbreviated
// Local date plus shortened logger name.
// ---------------------------------------------------------------------------
static void BM_Layout_LocalDateAbbreviated(benchmark::State& state) {
    cascade::PatternLayout layout("%D{%H:%M:%S,%Q} %-5p %c{2} - %m%n");
    cascade::LogRecord record = benchRecord();

    for (auto _ : state) {
        benchmark::DoNotOptimize(layout.render(record));
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Layout_LocalDateAbbreviated);

// ---------------------------------------------------------------------------
// BM_Layout_Compile
// Pattern parsing cost, paid once per appender at initialize().
// ---------------------------------------------------------------------------
static void BM_Layout_Compile(benchmark::State& state) {
    const std::string pattern = cascade::kDefaultLayoutPattern;

    for (auto _ : state) {
        benchmark::DoNotOptimize(cascade::detail::parsePattern(pattern));
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Layout_Compile);
