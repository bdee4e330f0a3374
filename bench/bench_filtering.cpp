#include <benchmark/benchmark.h>
#include <string>
#include "cascade_log.hpp"

static cascade::LoggingConfig nullConfig() {
    return cascade::LoggingConfig()
        .appender(cascade::AppenderConfig::makeNull())
        .logger("", cascade::LogLevel::WARN)
        .logger("app", cascade::LogLevel::INFO)
        .logger("app.db", cascade::LogLevel::ERROR)
        .logger("app.db.pool", cascade::LogLevel::DEBUG)
        .logger("vendor", cascade::LogLevel::OFF);
}

// ---------------------------------------------------------------------------
// BM_Resolve_Root
// No configured ancestor: walks all the way to the root entry.
// ---------------------------------------------------------------------------
static void BM_Resolve_Root(benchmark::State& state) {
    cascade::LoggingContext ctx("/tmp");
    (void)ctx.initialize(nullConfig());
    const std::string name = "unrelated.module.with.several.parts";

    for (auto _ : state) {
        benchmark::DoNotOptimize(ctx.resolveLevel(name));
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Resolve_Root);

// ---------------------------------------------------------------------------
// BM_Resolve_DeepMatch
// Deepest configured ancestor three segments up.
// ---------------------------------------------------------------------------
static void BM_Resolve_DeepMatch(benchmark::State& state) {
    cascade::LoggingContext ctx("/tmp");
    (void)ctx.initialize(nullConfig());
    const std::string name = "app.db.pool.conn.worker";

    for (auto _ : state) {
        benchmark::DoNotOptimize(ctx.resolveLevel(name));
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Resolve_DeepMatch);

// ---------------------------------------------------------------------------
// BM_Log_Filtered
// Record below the logger's effective level: no record is built.
// ---------------------------------------------------------------------------
static void BM_Log_Filtered(benchmark::State& state) {
    cascade::LoggingContext ctx("/tmp");
    (void)ctx.initialize(nullConfig());
    cascade::Logger log(ctx, "app.db.query");

    for (auto _ : state) {
        benchmark::DoNotOptimize(log.info("filtered out"));
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Log_Filtered);

// ---------------------------------------------------------------------------
// BM_Log_Macro_Filtered
// Same as above through the macro, which skips message construction.
// ---------------------------------------------------------------------------
static void BM_Log_Macro_Filtered(benchmark::State& state) {
    cascade::LoggingContext ctx("/tmp");
    (void)ctx.initialize(nullConfig());
    cascade::Logger log(ctx, "app.db.query");

    for (auto _ : state) {
        CASCADE_INFO(log, std::string("filtered out ") + std::to_string(42));
        benchmark::ClobberMemory();
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Log_Macro_Filtered);

// ---------------------------------------------------------------------------
// BM_Log_NullAppender
// Accepted record dispatched to a NULL appender: record construction cost.
// ---------------------------------------------------------------------------
static void BM_Log_NullAppender(benchmark::State& state) {
    cascade::LoggingContext ctx("/tmp");
    (void)ctx.initialize(nullConfig());
    cascade::Logger log(ctx, "app.web");

    for (auto _ : state) {
        benchmark::DoNotOptimize(log.warn("accepted"));
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Log_NullAppender);

// ---------------------------------------------------------------------------
// BM_Log_NullAppender_Threaded
// Concurrent callers share one published state without a context lock.
// ---------------------------------------------------------------------------
static cascade::LoggingContext* g_sharedContext = nullptr;

static void BM_Log_NullAppender_Threaded(benchmark::State& state) {
    if (state.thread_index() == 0) {
        g_sharedContext = new cascade::LoggingContext("/tmp");
        (void)g_sharedContext->initialize(nullConfig());
    }
    // Threads start the timed loop together, after thread 0's setup.
    for (auto _ : state) {
        benchmark::DoNotOptimize(g_sharedContext->log("app.web", cascade::LogLevel::WARN, "accepted"));
    }
    state.SetItemsProcessed(state.iterations());
    if (state.thread_index() == 0) {
        delete g_sharedContext;
        g_sharedContext = nullptr;
    }
}
BENCHMARK(BM_Log_NullAppender_Threaded)->Threads(1)->Threads(4);
