#include "toolhost/supervisor/OutputMonitor.hpp"
#include "toolhost/Logger.hpp"
#include "toolhost/errors.hpp"
#include "toolhost/supervisor/StatusClassifier.hpp"
#include <fstream>
#include <system_error>

namespace toolhost {

OutputMonitor::OutputMonitor(std::shared_ptr<ProcessRecord> record)
    : record_(std::move(record)) {}

OutputMonitor::~OutputMonitor() { join(); }

void OutputMonitor::start() {
  running_ = true;
  try {
    thread_ = std::thread([this]() { run(); });
  } catch (const std::system_error &) {
    running_ = false;
    throw;
  }
}

void OutputMonitor::join() {
  if (thread_.joinable()) {
    thread_.join();
  }
}

void OutputMonitor::run() {
  const std::string &tool_id = record_->tool_id();
  auto &process = record_->process();

  LOG_DEBUG("MONITOR", tool_id, "Monitoring PID={} -> {}", process.pid(),
            record_->log_file_path().string());

  std::ofstream log_file(record_->log_file_path(), std::ios::app);
  if (!log_file) {
    LOG_ERROR("MONITOR", tool_id, "Cannot open log file {}; buffering only",
              record_->log_file_path().string());
  }

  std::string raw;
  while (true) {
    process::ReadResult result = process.read_line(raw);
    if (result == process::ReadResult::EndOfStream)
      break;

    if (result == process::ReadResult::Error) {
      MonitorError err("Failed reading output of PID=" +
                       std::to_string(process.pid()));
      LOG_ERROR("MONITOR", tool_id, "{}; monitor ends, process left running",
                err.what());
      running_ = false;
      return;
    }

    LogEntry entry{std::chrono::system_clock::now(), sanitize_utf8(raw)};
    std::string formatted = entry.format();

    if (log_file) {
      log_file << formatted << '\n';
      log_file.flush();
    }

    if (!record_->log_buffer().try_push(std::move(entry))) {
      LOG_TRACE("MONITOR", tool_id, "Log buffer full, dropped line");
    }

    if (auto next = StatusClassifier::classify(raw)) {
      if (record_->apply_transition(*next)) {
        LOG_INFO("MONITOR", tool_id, "Status -> {}", status_to_string(*next));
      }
    }

    ++lines_processed_;
  }

  running_ = false;
  if (record_->mark_stopped()) {
    LOG_INFO("MONITOR", tool_id,
             "Output closed after {} lines, status -> stopped",
             lines_processed_.load());
  } else {
    LOG_DEBUG("MONITOR", tool_id, "Output closed after {} lines",
              lines_processed_.load());
  }
}

} // namespace toolhost
