#include "log/log.h"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <iostream>

#include "core/config.hpp"

namespace codeloop {

namespace {

// name.log -> name.0.log -> ... -> name.{max_files-1}.log, oldest removed
void rotate_logs_on_startup(const std::filesystem::path& current_log, size_t max_files) {
  namespace fs = std::filesystem;

  if (!fs::exists(current_log) || max_files == 0) {
    return;
  }

  auto log_dir = current_log.parent_path();
  auto stem = current_log.stem().string();
  auto rotated = [&](size_t i) { return log_dir / (stem + "." + std::to_string(i) + ".log"); };

  std::error_code ec;
  fs::path oldest = rotated(max_files - 1);
  if (fs::exists(oldest)) {
    fs::remove(oldest, ec);
  }

  for (int i = static_cast<int>(max_files) - 2; i >= 0; --i) {
    fs::path old_name = rotated(static_cast<size_t>(i));
    if (fs::exists(old_name)) {
      fs::rename(old_name, rotated(static_cast<size_t>(i) + 1), ec);
    }
  }

  fs::rename(current_log, rotated(0), ec);
}

}  // namespace

void init_log(const std::string& log_path, size_t max_files, const std::string& level) {
  try {
    namespace fs = std::filesystem;

    fs::path actual_path = log_path.empty() ? config_paths::config_dir() / "log" / "codeloop.log" : fs::path(log_path);

    std::error_code ec;
    if (actual_path.has_parent_path()) {
      fs::create_directories(actual_path.parent_path(), ec);
      if (ec) {
        std::cerr << "Failed to create log directory: " << ec.message() << "\n";
      }
    }

    rotate_logs_on_startup(actual_path, max_files);

    // Fresh file on every start
    auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(actual_path.string(), true);

    auto logger = std::make_shared<spdlog::logger>("codeloop", file_sink);
    logger->set_level(spdlog::level::from_str(level));

    // [time] [level] [thread] message
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");

    // Flush every record
    logger->flush_on(spdlog::level::trace);

    spdlog::drop("codeloop");
    spdlog::register_logger(logger);
    spdlog::set_default_logger(logger);

    spdlog::info("=== codeloop started (log: {}) ===", actual_path.string());
  } catch (const spdlog::spdlog_ex& ex) {
    std::cerr << "Failed to init logger: " << ex.what() << "\n";
  }
}

std::shared_ptr<spdlog::logger> get_logger() {
  return spdlog::default_logger();
}

}  // namespace codeloop
