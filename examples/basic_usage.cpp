#include "cascade_log.hpp"
#include <iostream>
#include <stdexcept>

int main() {
    cascade::LoggingContext ctx;

    cascade::Status st = ctx.initialize(cascade::LoggingConfig()
        .appender(cascade::AppenderConfig::makeConsole()
                      .threshold(cascade::LogLevel::INFO)
                      .layout("%-5p %c - %m%n"))
        .appender(cascade::AppenderConfig::makeFile("basic_usage.log")
                      .threshold(cascade::LogLevel::TRACE))
        .logger("", cascade::LogLevel::INFO)
        .logger("myapp.db", cascade::LogLevel::DEBUG)
        .logger("myapp.http", cascade::LogLevel::ERROR));
    if (!st) {
        std::cerr << st.toString() << std::endl;
        return 1;
    }

    cascade::Logger app(ctx, "myapp");
    cascade::Logger db(ctx, "myapp.db.pool");
    cascade::Logger http(ctx, "myapp.http");

    app.info("Application started");
    app.debug("Suppressed: root-level INFO applies to myapp");
    db.debug("Connection pool warmed up");
    http.warn("Suppressed: myapp.http only lets ERROR through");
    http.error("Upstream returned 502");

    // Non-text messages
    app.info(nlohmann::json{{"event", "login"}, {"user", "alice"}});
    app.warn(std::runtime_error("Disk usage above 90%"));
    app.info(nullptr);

    // Macros skip building the message when the level is filtered out
    CASCADE_DEBUG(app, "never built");
    CASCADE_INFO(app, std::string("built only when enabled"));

    ctx.shutdown();
    return 0;
}
