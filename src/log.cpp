#include "log.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <atomic>
#include <mutex>
#include <vector>

namespace {
constexpr const char* kStampedPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";

std::shared_ptr<spdlog::logger> g_info_logger;
std::shared_ptr<spdlog::logger> g_error_logger;
std::shared_ptr<spdlog::logger> g_print_logger;
std::shared_ptr<spdlog::logger> g_print_err_logger;
std::once_flag g_create_once;
std::mutex g_file_sink_mutex;
std::string g_file_sink_path;
std::atomic<bool> g_log_passthrough{true};

void create_loggers() {
  auto info_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  info_sink->set_pattern(kStampedPattern);

  auto error_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  error_sink->set_pattern(kStampedPattern);

  auto plain_out_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  plain_out_sink->set_pattern("%v");

  auto plain_err_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  plain_err_sink->set_pattern("%v");

  g_info_logger = std::make_shared<spdlog::logger>("skrins.info", std::move(info_sink));
  g_error_logger = std::make_shared<spdlog::logger>("skrins.error", std::move(error_sink));
  g_print_logger = std::make_shared<spdlog::logger>("skrins.print", std::move(plain_out_sink));
  g_print_err_logger = std::make_shared<spdlog::logger>("skrins.print_err", std::move(plain_err_sink));

  g_info_logger->flush_on(spdlog::level::warn);
  g_error_logger->flush_on(spdlog::level::err);
  g_print_logger->flush_on(spdlog::level::info);
  g_print_err_logger->flush_on(spdlog::level::err);
}

void ensure_loggers() {
  std::call_once(g_create_once, create_loggers);
}

void attach_file_sink(const std::string& log_file) {
  std::lock_guard<std::mutex> lock(g_file_sink_mutex);
  if(log_file.empty() || log_file == g_file_sink_path) return;
  try {
    auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false);
    file_sink->set_pattern(kStampedPattern);
    g_info_logger->sinks().push_back(file_sink);
    g_error_logger->sinks().push_back(file_sink);
    g_file_sink_path = log_file;
  } catch(const spdlog::spdlog_ex& e) {
    g_error_logger->error("Unable to open log file {}: {}", log_file, e.what());
  }
}

} // namespace

void set_log_passthrough(bool enabled) {
  g_log_passthrough.store(enabled, std::memory_order_release);
}

bool log_passthrough() {
  return g_log_passthrough.load(std::memory_order_acquire);
}

Logger::Logger() = default;
Logger::Logger(std::string name) : name_(std::move(name)) {}

void Logger::set_name(std::string name) {
  name_ = std::move(name);
}

LogListenerHandle Logger::add_listener(Listener listener) {
  if(!listener) return 0;
  std::lock_guard<std::mutex> lock(listener_mutex_);
  const auto id = next_listener_id_++;
  listeners_.emplace(id, std::move(listener));
  return id;
}

void Logger::remove_listener(LogListenerHandle handle) {
  std::lock_guard<std::mutex> lock(listener_mutex_);
  listeners_.erase(handle);
}

void Logger::clear_listeners() {
  std::lock_guard<std::mutex> lock(listener_mutex_);
  listeners_.clear();
}

bool Logger::dispatch(const LogRecord& record) {
  std::vector<Listener> listeners_snapshot;
  {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    listeners_snapshot.reserve(listeners_.size());
    for(const auto& entry : listeners_) {
      listeners_snapshot.push_back(entry.second);
    }
  }
  bool handled = false;
  for(auto& callback : listeners_snapshot) {
    try {
      if(callback && callback(record)) {
        handled = true;
      }
    } catch(const std::exception& e) {
      LogRecord failure;
      failure.logger = name_;
      failure.channel = "error";
      failure.level = spdlog::level::err;
      failure.message = fmt::format("log listener threw: {}", e.what());
      detail::emit_to_default(failure);
    }
  }
  return handled;
}

void Logger::fallback(const LogRecord& record) {
  detail::emit_to_default(record);
}

void init(bool verbose, const std::string& log_file) {
  ensure_loggers();
  auto level = verbose ? spdlog::level::debug : spdlog::level::info;
  g_info_logger->set_level(level);
  g_error_logger->set_level(spdlog::level::info);
  g_print_logger->set_level(spdlog::level::info);
  g_print_err_logger->set_level(spdlog::level::info);

  attach_file_sink(log_file);

  spdlog::set_default_logger(g_info_logger);
  spdlog::set_level(level);
}

namespace detail {

void emit_to_default(const LogRecord& record) {
  ensure_loggers();
  if(!log_passthrough()) return;

  spdlog::logger* sink = g_info_logger.get();
  if(record.channel == "print") {
    sink = g_print_logger.get();
  } else if(record.channel == "print_err") {
    sink = g_print_err_logger.get();
  } else if(record.channel == "error") {
    sink = g_error_logger.get();
  }

  if(!sink) return;
  if(!record.logger.empty()) {
    sink->log(record.level, fmt::format("[{}] {}", record.logger, record.message));
  } else {
    sink->log(record.level, record.message);
  }
}

} // namespace detail
