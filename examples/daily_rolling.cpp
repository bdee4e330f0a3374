#include "cascade_log.hpp"
#include <chrono>
#include <ctime>
#include <iostream>

// Replays records stamped on consecutive days so rotation can be observed
// without waiting for midnight.
static cascade::LogRecord onDay(int day, const std::string &message) {
    std::tm tmBuf = std::tm();
    tmBuf.tm_year = 2020 - 1900;
    tmBuf.tm_mon = 0;
    tmBuf.tm_mday = day;
    tmBuf.tm_hour = 12;
    tmBuf.tm_isdst = -1;

    cascade::LogRecord record;
    record.timestamp = std::chrono::system_clock::from_time_t(std::mktime(&tmBuf));
    record.level = cascade::LogLevel::INFO;
    record.loggerName = "rolling.demo";
    record.threadId = cascade::detail::currentThreadId();
    record.message = message;
    return record;
}

int main() {
    cascade::LoggingContext ctx;
    ctx.setErrorHandler([](const cascade::Status &st) {
        std::cerr << "logging problem: " << st.toString() << std::endl;
    });

    cascade::Status st = ctx.initialize(cascade::LoggingConfig()
        .appender(cascade::AppenderConfig::makeDailyRollingFile("log/rolling.log")
                      .maxBackupIndex(3)
                      .useLockFile(true)
                      .layout("%D{%Y-%m-%d %H:%M:%S} %-5p [%c{1}] %m%n"))
        .logger("rolling", cascade::LogLevel::INFO));
    if (!st) {
        std::cerr << st.toString() << std::endl;
        return 1;
    }

    for (int day = 1; day <= 6; ++day) {
        (void)ctx.log(onDay(day, "entry for day " + std::to_string(day)));
    }

    // Five rotations happened; only the three newest backups survive.
    std::cout << "log/rolling.log plus backups under " << ctx.baseDirectory() << "/log" << std::endl;
    ctx.shutdown();
    return 0;
}
