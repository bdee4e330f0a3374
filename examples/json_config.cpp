#include "cascade_log.hpp"
#include <iostream>

int main(int argc, char *argv[]) {
    cascade::Status st;
    if (argc > 1) {
        try {
            st = cascade::Log::initialize(cascade::LoggingConfig::fromFile(argv[1]));
        } catch (const cascade::ConfigurationError &e) {
            st = cascade::Status::fromException(e);
        }
    } else {
        st = cascade::Log::initialize(nlohmann::json::parse(R"({
            "appenders": [
                {
                    "appenderType": "CONSOLE",
                    "thresholdLevel": "WARN"
                },
                {
                    "appenderType": "DAILY_ROLLING_FILE",
                    "thresholdLevel": "DEBUG",
                    "filePath": "log/json_config.log",
                    "layout": "%d{%Y-%m-%d %H:%M:%S,%q} %-5p %-20.20c %m%n",
                    "useLockFile": true,
                    "maxBackupIndex": 7
                }
            ],
            "loggers": [
                { "name": "", "level": "INFO" },
                { "name": "service.cache", "level": "DEBUG" },
                { "name": "service.noisy", "level": "OFF" }
            ]
        })"));
    }
    if (!st) {
        std::cerr << "cannot configure logging: " << st.toString() << std::endl;
        return 1;
    }

    cascade::Logger cache = cascade::Log::logger("service.cache.lru");
    cascade::Logger noisy = cascade::Log::logger("service.noisy");
    cascade::Logger root = cascade::Log::logger();

    cache.debug("cache miss for key user:42");
    noisy.fatal("never written");
    root.warn("configuration loaded; this line also reaches the console");

    // A malformed payload is rejected and the running setup stays in place
    cascade::Status bad = cascade::Log::initialize(nlohmann::json::parse(
        R"({"appenders": [{"appenderType": "SYSLOG"}]})"));
    std::cerr << "second initialize: " << bad.toString() << std::endl;
    root.info("still logging with the first configuration");

    cascade::Log::shutdown();
    return 0;
}
