#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "directory_scanner.hpp"
#include "remote_name.hpp"

class Logger;
class Publisher;
class Transcoder;
class TransferClient;
struct RelayConfig;
struct WatchEvent;

// Scans the watch directory and pushes each file through
// classify -> (transcode) -> upload -> publish -> delete.
//
// Files are handled strictly one at a time, in scan order. The transcoder
// always writes the same intermediate file, so two transcodes must never
// overlap. There is no record of earlier attempts: a file that fails stays
// on disk and is tried again on the next pass, whenever that happens.
class RelayPipeline {
public:
  enum class State {
    Idle,
    Scanning,
    Processing
  };

  enum class FileOutcome {
    Skipped,          // rejected extension, file untouched
    Transcoded,       // source converted and removed, output waits for a later pass
    TranscodeFailed,  // source left in place
    Uploaded,         // published and removed
    TransferFailed    // left in place, nothing published
  };

  struct PassReport {
    std::vector<std::pair<std::string, FileOutcome>> files;

    std::size_t count(FileOutcome outcome) const;
  };

  struct Stats {
    std::size_t passes = 0;
    std::size_t uploads = 0;
    std::size_t transcodes = 0;
    std::size_t failures = 0;
  };

  RelayPipeline(const RelayConfig& config,
                const DirectoryScanner& scanner,
                Transcoder& transcoder,
                TransferClient& transfer,
                Publisher& publisher,
                TokenSource next_token,
                std::shared_ptr<Logger> logger);

  // Create and Write events start a full pass; anything else is ignored.
  // Returns true if a pass ran.
  bool on_event(const WatchEvent& event);

  // Throws DirectoryReadError if the directory cannot be listed.
  PassReport run_pass();

  FileOutcome process(const CandidateFile& file);

  State state() const { return state_.load(); }
  Stats stats() const;

  static const char* to_string(FileOutcome outcome);

private:
  FileOutcome transcode(const CandidateFile& file);
  FileOutcome upload(const CandidateFile& file);
  void remove_local(const std::filesystem::path& path);

  const RelayConfig& config_;
  const DirectoryScanner& scanner_;
  Transcoder& transcoder_;
  TransferClient& transfer_;
  Publisher& publisher_;
  TokenSource next_token_;
  std::shared_ptr<Logger> logger_;

  std::atomic<State> state_{State::Idle};
  std::atomic<std::size_t> passes_{0};
  std::atomic<std::size_t> uploads_{0};
  std::atomic<std::size_t> transcodes_{0};
  std::atomic<std::size_t> failures_{0};
};
