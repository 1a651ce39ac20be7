#ifndef CODELOOP_LOG_H
#define CODELOOP_LOG_H

#include <memory>
#include <string>

namespace spdlog {
class logger;
}

namespace codeloop {

/**
 * Initialize logging.
 *
 * Logs rotate once per start:
 * - the previous codeloop.log becomes codeloop.0.log
 * - older files shift up: codeloop.0.log -> codeloop.1.log -> ... -> codeloop.{max_files-1}.log
 * - the oldest file is deleted
 *
 * @param log_path log file path, defaults to ~/.config/codeloop/log/codeloop.log
 * @param max_files number of rotated files kept
 * @param level spdlog level name ("trace", "debug", "info", "warn", "err", "critical", "off")
 */
void init_log(const std::string& log_path = "", size_t max_files = 10, const std::string& level = "info");

/**
 * Default logger.
 */
std::shared_ptr<spdlog::logger> get_logger();

}  // namespace codeloop

#endif  // CODELOOP_LOG_H
