#pragma once
#include <fmt/format.h>
#include <memory>
#include <mutex>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace toolhost {

/// Centralized supervisor diagnostics with component and tool context
class SupervisorLogger {
public:
  static SupervisorLogger &instance();

  // Initialize with file and console sinks
  void init(const std::string &log_file = "toolhost.log",
            spdlog::level::level_enum level = spdlog::level::info) {
    std::lock_guard<std::mutex> lock(mutex_);

    // If already initialized, just update level
    if (logger_) {
      logger_->set_level(level);
      logger_->flush_on(level);
      return;
    }

    try {
      auto console_sink =
          std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
      console_sink->set_level(spdlog::level::info);

      auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
          log_file, 1024 * 1024 * 10, 3); // 10MB, 3 files
      file_sink->set_level(spdlog::level::trace);

      std::vector<spdlog::sink_ptr> sinks{console_sink, file_sink};
      logger_ = std::make_shared<spdlog::logger>("toolhost", sinks.begin(),
                                                 sinks.end());
      logger_->set_level(level);
      logger_->flush_on(spdlog::level::warn);

      if (!spdlog::get("toolhost")) {
        spdlog::register_logger(logger_);
      }
    } catch (const spdlog::spdlog_ex &ex) {
      fmt::print(stderr, "Log initialization failed: {}\n", ex.what());
    }
  }

  // Drop the logger so a later init() recreates the sinks (used by tests)
  void shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    spdlog::drop("toolhost");
    logger_.reset();
  }

  bool is_initialized() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return logger_ != nullptr;
  }

  template <typename... Args>
  void trace(const std::string &component, const std::string &context,
             const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::trace, component, context, fmt_str,
        std::forward<Args>(args)...);
  }

  template <typename... Args>
  void debug(const std::string &component, const std::string &context,
             const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::debug, component, context, fmt_str,
        std::forward<Args>(args)...);
  }

  template <typename... Args>
  void info(const std::string &component, const std::string &context,
            const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::info, component, context, fmt_str,
        std::forward<Args>(args)...);
  }

  template <typename... Args>
  void warn(const std::string &component, const std::string &context,
            const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::warn, component, context, fmt_str,
        std::forward<Args>(args)...);
  }

  template <typename... Args>
  void error(const std::string &component, const std::string &context,
             const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::err, component, context, fmt_str,
        std::forward<Args>(args)...);
  }

private:
  SupervisorLogger() = default;

  template <typename... Args>
  void log(spdlog::level::level_enum level, const std::string &component,
           const std::string &context, const std::string &fmt_str,
           Args &&...args) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!logger_)
      return;

    // Format:  [component] [context] message
    std::string prefix = fmt::format("[{}] [{}] ", component, context);
    std::string full_msg = prefix + fmt::format(fmt::runtime(fmt_str),
                                                std::forward<Args>(args)...);
    logger_->log(level, full_msg);
  }

  std::shared_ptr<spdlog::logger> logger_;
  mutable std::mutex mutex_;
};

// Convenience macros
#define LOG_TRACE(component, ctx, ...)                                         \
  toolhost::SupervisorLogger::instance().trace(component, ctx, __VA_ARGS__)
#define LOG_DEBUG(component, ctx, ...)                                         \
  toolhost::SupervisorLogger::instance().debug(component, ctx, __VA_ARGS__)
#define LOG_INFO(component, ctx, ...)                                          \
  toolhost::SupervisorLogger::instance().info(component, ctx, __VA_ARGS__)
#define LOG_WARN(component, ctx, ...)                                          \
  toolhost::SupervisorLogger::instance().warn(component, ctx, __VA_ARGS__)
#define LOG_ERROR(component, ctx, ...)                                         \
  toolhost::SupervisorLogger::instance().error(component, ctx, __VA_ARGS__)

} // namespace toolhost
