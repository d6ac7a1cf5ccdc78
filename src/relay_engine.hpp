#pragma once

#include <asio.hpp>

#include <atomic>
#include <cstddef>
#include <exception>
#include <memory>
#include <string>
#include <thread>

#include "log.hpp"
#include "relay_config.hpp"
#include "remote_name.hpp"

class DirectoryScanner;
class DirectoryWatcher;
class Publisher;
class RelayPipeline;
class SettingsManager;
class Transcoder;
class TransferClient;

class RelayEngine {
public:
  struct Options {
    // Collaborators left null are built from the configuration.
    std::shared_ptr<Transcoder> transcoder;
    std::shared_ptr<TransferClient> transfer;
    std::shared_ptr<Publisher> publisher;
    TokenSource token_source;
  };

  RelayEngine(std::shared_ptr<SettingsManager> settings, Options options);
  ~RelayEngine();

  // Throws when the configuration is incomplete, the watch directory is
  // missing or unreadable, or inotify cannot be set up.
  void start();
  // Blocks until stop(). Errors from a pass (an unreadable directory)
  // propagate out of here.
  void run();
  void start_background();
  void stop();

  std::shared_ptr<SettingsManager> settings() const { return settings_; }
  std::shared_ptr<Logger> logger() const { return logger_; }
  const RelayConfig& config() const { return config_; }

  LogListenerHandle add_log_listener(Logger::Listener listener);
  void remove_log_listener(LogListenerHandle handle);

  struct Stats {
    std::size_t passes = 0;
    std::size_t uploads = 0;
    std::size_t transcodes = 0;
    std::size_t failures = 0;
    bool fatal = false;
  };

  Stats stats() const;

private:
  void ensure_watch_directory() const;
  void build_collaborators();

  Options options_;
  std::shared_ptr<SettingsManager> settings_;
  std::shared_ptr<Logger> logger_;
  RelayConfig config_;
  asio::io_context io_;
  std::thread io_thread_;
  std::unique_ptr<DirectoryScanner> scanner_;
  std::unique_ptr<RelayPipeline> pipeline_;
  std::unique_ptr<DirectoryWatcher> watcher_;
  bool started_ = false;
  std::atomic<bool> fatal_{false};
};
