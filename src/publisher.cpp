#include "publisher.hpp"

#include <vector>

#include "log.hpp"
#include "process_runner.hpp"
#include "relay_config.hpp"

DesktopPublisher::DesktopPublisher(const RelayConfig& config, std::shared_ptr<Logger> logger)
  : config_(config),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("publisher")) {}

void DesktopPublisher::publish(const std::string& url) {
  copy_to_clipboard(url);
  show_notification(url);
}

void DesktopPublisher::copy_to_clipboard(const std::string& text) {
  if(config_.clipboard_command.empty()) return;
  ProcessOptions options;
  options.stdin_data = text;
  options.capture_output = false;
  auto result = run_process(config_.clipboard_command, options);
  if(!result.succeeded()) {
    logger_->warn("Clipboard update failed ({}): {}",
                  config_.clipboard_command.front(),
                  result.error.empty() ? "exit " + std::to_string(result.exit_code) : result.error);
  }
}

void DesktopPublisher::show_notification(const std::string& url) {
  if(config_.notify_command.empty()) return;
  std::vector<std::string> argv = config_.notify_command;
  argv.insert(argv.end(), {"-a", config_.app_name, config_.notification_title, url});
  ProcessOptions options;
  options.capture_output = false;
  auto result = run_process(argv, options);
  if(!result.succeeded()) {
    logger_->warn("Notification failed ({}): {}",
                  argv.front(),
                  result.error.empty() ? "exit " + std::to_string(result.exit_code) : result.error);
  }
}
