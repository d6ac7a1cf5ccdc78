#include "relay_engine.hpp"

#include <unistd.h>

#include <stdexcept>

#include "directory_scanner.hpp"
#include "directory_watcher.hpp"
#include "publisher.hpp"
#include "relay_pipeline.hpp"
#include "settings_manager.hpp"
#include "transcoder.hpp"
#include "transfer_client.hpp"

RelayEngine::RelayEngine(std::shared_ptr<SettingsManager> settings, Options options)
  : options_(std::move(options)),
    settings_(settings ? std::move(settings) : std::make_shared<SettingsManager>()),
    logger_(std::make_shared<Logger>("skrins")) {}

RelayEngine::~RelayEngine() {
  stop();
}

void RelayEngine::ensure_watch_directory() const {
  std::error_code ec;
  if(!std::filesystem::is_directory(config_.watch_path, ec)) {
    logger_->error("Watch directory {} does not exist", config_.watch_path.string());
    throw std::runtime_error("Watch directory " + config_.watch_path.string() + " does not exist");
  }
  if(::access(config_.watch_path.c_str(), R_OK | X_OK) != 0) {
    logger_->error("Watch directory {} is not readable", config_.watch_path.string());
    throw std::runtime_error("Watch directory " + config_.watch_path.string() + " is not readable");
  }
}

void RelayEngine::build_collaborators() {
  if(!options_.transcoder) {
    options_.transcoder = std::make_shared<FfmpegTranscoder>(config_, logger_);
  }
  if(!options_.transfer) {
    options_.transfer = std::make_shared<SftpTransferClient>(config_, logger_);
  }
  if(!options_.publisher) {
    options_.publisher = std::make_shared<DesktopPublisher>(config_, logger_);
  }
  scanner_ = std::make_unique<DirectoryScanner>();
  pipeline_ = std::make_unique<RelayPipeline>(config_,
                                              *scanner_,
                                              *options_.transcoder,
                                              *options_.transfer,
                                              *options_.publisher,
                                              options_.token_source,
                                              logger_);
}

void RelayEngine::start() {
  if(started_) return;

  config_ = RelayConfig::from_settings(*settings_);
  init(config_.verbose, config_.log_file);
  if(config_.verbose) {
    logger_->debug("Verbose logging enabled");
  }

  ensure_watch_directory();
  build_collaborators();

  watcher_ = std::make_unique<DirectoryWatcher>(io_, config_.watch_path, logger_);
  watcher_->start([this](const WatchEvent& event){
    pipeline_->on_event(event);
  });
  started_ = true;
}

void RelayEngine::run() {
  if(!started_) start();
  io_.run();
}

void RelayEngine::start_background() {
  if(!started_) start();
  if(io_thread_.joinable()) return;
  io_thread_ = std::thread([this](){
    try {
      io_.run();
    } catch(const std::exception& e) {
      fatal_.store(true);
      logger_->error("Fatal: {}", e.what());
    }
  });
}

void RelayEngine::stop() {
  if(!started_) return;
  started_ = false;

  if(watcher_) {
    watcher_->cancel();
  }
  io_.stop();
  if(io_thread_.joinable()) {
    io_thread_.join();
  }
  watcher_.reset();
  io_.restart();
}

LogListenerHandle RelayEngine::add_log_listener(Logger::Listener listener) {
  if(!logger_) return 0;
  return logger_->add_listener(std::move(listener));
}

void RelayEngine::remove_log_listener(LogListenerHandle handle) {
  if(logger_ && handle != 0) {
    logger_->remove_listener(handle);
  }
}

RelayEngine::Stats RelayEngine::stats() const {
  Stats s;
  if(pipeline_) {
    auto p = pipeline_->stats();
    s.passes = p.passes;
    s.uploads = p.uploads;
    s.transcodes = p.transcodes;
    s.failures = p.failures;
  }
  s.fatal = fatal_.load();
  return s;
}
