#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>

class Logger;
struct RelayConfig;

enum class UploadStage {
  None,
  OpenDestination,
  OpenSource,
  Copy
};

const char* to_string(UploadStage stage);

struct UploadResult {
  uint64_t bytes_written = 0;
  UploadStage failed_stage = UploadStage::None;
  std::string error;

  bool ok() const { return failed_stage == UploadStage::None; }

  static UploadResult success(uint64_t bytes) {
    UploadResult r;
    r.bytes_written = bytes;
    return r;
  }
  static UploadResult failure(UploadStage stage, std::string message) {
    UploadResult r;
    r.failed_stage = stage;
    r.error = std::move(message);
    return r;
  }
};

// One connection, used for exactly one file.
class TransferSession {
public:
  virtual ~TransferSession() = default;

  // Creates or truncates <remote root>/<remote_name> and streams local_path into it.
  virtual UploadResult send(const std::filesystem::path& local_path,
                            const std::string& remote_name) = 0;
  virtual void close() = 0;
};

class TransferClient {
public:
  virtual ~TransferClient() = default;

  // Returns nullptr and fills error when the connection or login fails.
  virtual std::unique_ptr<TransferSession> open(std::string& error) = 0;
};

class SftpTransferClient : public TransferClient {
public:
  SftpTransferClient(const RelayConfig& config, std::shared_ptr<Logger> logger);

  std::unique_ptr<TransferSession> open(std::string& error) override;

private:
  const RelayConfig& config_;
  std::shared_ptr<Logger> logger_;
};
