#pragma once

#include <memory>
#include <string>

class Logger;
struct RelayConfig;

// Best-effort delivery of an uploaded file's URL to the user. Failures
// are logged by the implementation and never reported back.
class Publisher {
public:
  virtual ~Publisher() = default;
  virtual void publish(const std::string& url) = 0;
};

// Clipboard via the configured command reading stdin, then a desktop
// notification via `<notify_command> -a <app_name> <title> <url>`.
class DesktopPublisher : public Publisher {
public:
  DesktopPublisher(const RelayConfig& config, std::shared_ptr<Logger> logger);

  void publish(const std::string& url) override;

private:
  void copy_to_clipboard(const std::string& text);
  void show_notification(const std::string& url);

  const RelayConfig& config_;
  std::shared_ptr<Logger> logger_;
};
