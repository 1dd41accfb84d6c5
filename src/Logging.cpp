#include "Logging.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <vector>

namespace sqlctx {

bool configureLogging(const LoggingConfig& config) {
    auto level = spdlog::level::from_str(config.level == "warning" ? "warn" : config.level);

    try {
        std::vector<spdlog::sink_ptr> sinks;

        if (config.console) {
            auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            console_sink->set_level(level);
            sinks.push_back(console_sink);
        }

        if (!config.file.empty()) {
            auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.file, false);
            file_sink->set_level(level);
            sinks.push_back(file_sink);
        }

        auto logger = std::make_shared<spdlog::logger>("sql-context", sinks.begin(), sinks.end());
        logger->set_level(level);

        spdlog::set_default_logger(logger);
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
    } catch (const spdlog::spdlog_ex& ex) {
        spdlog::error("Log initialization failed: {}", ex.what());
        return false;
    }

    return true;
}

}  // namespace sqlctx
