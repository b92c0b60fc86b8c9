#include "qospol/util/logger.h"
#include "qospol/policy/policy_errors.h"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>
#include <utility> // For std::move
#include <vector>

namespace qospol {
namespace util {

std::shared_ptr<spdlog::logger> Logger::logger_;

namespace {

std::mutex& logger_mutex() {
    static std::mutex m;
    return m;
}

} // namespace

spdlog::level::level_enum Logger::parse_level(const std::string& name) {
    if (name == "trace") return spdlog::level::trace;
    if (name == "debug") return spdlog::level::debug;
    if (name == "info") return spdlog::level::info;
    if (name == "warn" || name == "warning") return spdlog::level::warn;
    if (name == "err" || name == "error") return spdlog::level::err;
    if (name == "critical") return spdlog::level::critical;
    if (name == "off") return spdlog::level::off;
    throw policy::ArgumentError("Logger: Unknown log level \"" + name + "\".");
}

LogConfig Logger::parse_cli_args(int argc, char* argv[]) {
    LogConfig cfg;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg != "--log-level" && arg != "--log-file") {
            continue;
        }
        if (i + 1 >= argc) {
            throw policy::ArgumentError("Logger: Missing value for " + arg + ".");
        }
        const std::string value = argv[++i];
        if (arg == "--log-level") {
            cfg.level = parse_level(value);
        } else {
            cfg.file_path = value;
        }
    }
    return cfg;
}

namespace {

std::shared_ptr<spdlog::logger> make_logger(const LogConfig& cfg) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    if (!cfg.file_path.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(cfg.file_path, true));
    }

    auto logger = std::make_shared<spdlog::logger>(cfg.logger_name, sinks.begin(), sinks.end());
    logger->set_level(cfg.level);
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
    return logger;
}

} // namespace

void Logger::init(const LogConfig& cfg) {
    auto logger = make_logger(cfg);
    std::lock_guard<std::mutex> lock(logger_mutex());
    logger_ = std::move(logger);
}

std::shared_ptr<spdlog::logger> Logger::instance() {
    // Check and default construction under one lock so a concurrent init()
    // is never overwritten by the default config.
    std::lock_guard<std::mutex> lock(logger_mutex());
    if (!logger_) {
        logger_ = make_logger(LogConfig{});
    }
    return logger_;
}

} // namespace util
} // namespace qospol
