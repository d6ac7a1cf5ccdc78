#include "relay_pipeline.hpp"

#include <algorithm>

#include "directory_watcher.hpp"
#include "extension_policy.hpp"
#include "log.hpp"
#include "publisher.hpp"
#include "relay_config.hpp"
#include "transcoder.hpp"
#include "transfer_client.hpp"

namespace {

class StateGuard {
public:
  StateGuard(std::atomic<RelayPipeline::State>& state, RelayPipeline::State value)
    : state_(state) { state_.store(value); }
  ~StateGuard() { state_.store(RelayPipeline::State::Idle); }
  StateGuard(const StateGuard&) = delete;
  StateGuard& operator=(const StateGuard&) = delete;

private:
  std::atomic<RelayPipeline::State>& state_;
};

} // namespace

std::size_t RelayPipeline::PassReport::count(FileOutcome outcome) const {
  return static_cast<std::size_t>(std::count_if(files.begin(), files.end(),
    [outcome](const auto& entry){ return entry.second == outcome; }));
}

RelayPipeline::RelayPipeline(const RelayConfig& config,
                             const DirectoryScanner& scanner,
                             Transcoder& transcoder,
                             TransferClient& transfer,
                             Publisher& publisher,
                             TokenSource next_token,
                             std::shared_ptr<Logger> logger)
  : config_(config),
    scanner_(scanner),
    transcoder_(transcoder),
    transfer_(transfer),
    publisher_(publisher),
    next_token_(next_token ? std::move(next_token) : TokenSource(generate_token)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("pipeline")) {}

const char* RelayPipeline::to_string(FileOutcome outcome) {
  switch(outcome) {
    case FileOutcome::Skipped: return "skipped";
    case FileOutcome::Transcoded: return "transcoded";
    case FileOutcome::TranscodeFailed: return "transcode failed";
    case FileOutcome::Uploaded: return "uploaded";
    case FileOutcome::TransferFailed: return "transfer failed";
  }
  return "unknown";
}

RelayPipeline::Stats RelayPipeline::stats() const {
  Stats s;
  s.passes = passes_.load();
  s.uploads = uploads_.load();
  s.transcodes = transcodes_.load();
  s.failures = failures_.load();
  return s;
}

bool RelayPipeline::on_event(const WatchEvent& event) {
  if(event.kind != WatchEventKind::Create && event.kind != WatchEventKind::Write) {
    return false;
  }
  run_pass();
  return true;
}

RelayPipeline::PassReport RelayPipeline::run_pass() {
  PassReport report;
  std::vector<CandidateFile> files;
  {
    StateGuard guard(state_, State::Scanning);
    files = scanner_.scan(config_.watch_path);
  }

  StateGuard guard(state_, State::Processing);
  for(const auto& file : files) {
    logger_->debug("Considering {}", file.name);
    auto outcome = process(file);
    report.files.emplace_back(file.name, outcome);
  }
  passes_++;
  return report;
}

RelayPipeline::FileOutcome RelayPipeline::process(const CandidateFile& file) {
  switch(classify(file.extension)) {
    case ExtensionClass::Rejected:
      return FileOutcome::Skipped;
    case ExtensionClass::RequiresTranscode:
      return transcode(file);
    case ExtensionClass::DirectTransfer:
      return upload(file);
  }
  return FileOutcome::Skipped;
}

RelayPipeline::FileOutcome RelayPipeline::transcode(const CandidateFile& file) {
  logger_->info("Detected .{} file {}, converting", file.extension, file.name);
  if(!transcoder_.transcode(file.full_path, config_.transcode_target_path())) {
    failures_++;
    return FileOutcome::TranscodeFailed;
  }
  transcodes_++;
  // The output shows up as its own file and is uploaded by a later pass.
  remove_local(file.full_path);
  return FileOutcome::Transcoded;
}

RelayPipeline::FileOutcome RelayPipeline::upload(const CandidateFile& file) {
  RemoteObjectName name;
  name.extension = file.extension;
  try {
    name.token = next_token_();
  } catch(const std::runtime_error& e) {
    logger_->error("Unable to name upload for {}: {}", file.name, e.what());
    failures_++;
    return FileOutcome::TransferFailed;
  }

  std::string error;
  auto session = transfer_.open(error);
  if(!session) {
    logger_->error("Upload of {} failed: {}", file.name, error);
    failures_++;
    return FileOutcome::TransferFailed;
  }
  auto result = session->send(file.full_path, name.str());
  session->close();

  if(!result.ok()) {
    logger_->error("Upload of {} failed at {}: {}", file.name, ::to_string(result.failed_stage), result.error);
    failures_++;
    return FileOutcome::TransferFailed;
  }

  auto url = public_url(config_.base_url, name);
  logger_->info("Uploaded {} ({} bytes) -> {}", file.name, result.bytes_written, url);
  try {
    publisher_.publish(url);
  } catch(const std::exception& e) {
    logger_->warn("Publishing {} failed: {}", url, e.what());
  }
  remove_local(file.full_path);
  uploads_++;
  return FileOutcome::Uploaded;
}

void RelayPipeline::remove_local(const std::filesystem::path& path) {
  std::error_code ec;
  if(!std::filesystem::remove(path, ec) && ec) {
    logger_->warn("Unable to remove {}: {}", path.string(), ec.message());
  }
}
