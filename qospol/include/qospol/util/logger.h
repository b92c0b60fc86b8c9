#ifndef QOSPOL_UTIL_LOGGER_H_
#define QOSPOL_UTIL_LOGGER_H_

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace qospol {
namespace util {

/**
 * @brief Runtime logging configuration.
 *
 * file_path enables an additional file sink when non-empty.
 */
struct LogConfig {
    std::string logger_name = "qospol";
    spdlog::level::level_enum level = spdlog::level::info;
    std::string file_path;
};

/**
 * @brief Process-wide spdlog logger shared by the library.
 *
 * Call Logger::init() once at startup; library code logs through
 * Logger::instance() with the SPDLOG_LOGGER_* macros. If init() was never
 * called, instance() lazily creates a colored stderr logger at info level so
 * that library use from tests or embedding code never dereferences null.
 */
class Logger {
public:
    /**
     * @brief Converts "trace", "debug", "info", "warn", "err"/"error",
     * "critical" or "off" to a spdlog level.
     * @throws policy::ArgumentError for any other name.
     */
    static spdlog::level::level_enum parse_level(const std::string& name);

    /**
     * @brief Reads --log-level <name> and --log-file <path> from argv.
     * Unrelated arguments are ignored.
     * @throws policy::ArgumentError if a flag is missing its value or the level is unknown.
     */
    static LogConfig parse_cli_args(int argc, char* argv[]);

    // Replaces the current logger (if any) with one built from cfg.
    static void init(const LogConfig& cfg);

    static std::shared_ptr<spdlog::logger> instance();

private:
    static std::shared_ptr<spdlog::logger> logger_;
};

} // namespace util
} // namespace qospol

#endif // QOSPOL_UTIL_LOGGER_H_
