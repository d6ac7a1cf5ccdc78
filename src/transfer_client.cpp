#include "transfer_client.hpp"

#include <libssh/libssh.h>
#include <libssh/sftp.h>

#include <fcntl.h>
#include <sys/stat.h>

#include <array>
#include <fstream>

#include "log.hpp"
#include "relay_config.hpp"

namespace {

constexpr std::size_t kCopyBlockSize = 32 * 1024;
constexpr mode_t kRemoteFileMode = S_IRUSR | S_IWUSR | S_IRGRP | S_IROTH;

struct SshSessionDeleter {
  void operator()(ssh_session session) const {
    if(ssh_is_connected(session)) ssh_disconnect(session);
    ssh_free(session);
  }
};

struct SshKeyDeleter {
  void operator()(ssh_key key) const { ssh_key_free(key); }
};

struct SftpSessionDeleter {
  void operator()(sftp_session sftp) const { sftp_free(sftp); }
};

// Only reached on error paths, where the copy has already failed.
struct SftpFileDeleter {
  void operator()(sftp_file file) const { static_cast<void>(sftp_close(file)); }
};

using SshSessionPtr = std::unique_ptr<ssh_session_struct, SshSessionDeleter>;
using SshKeyPtr = std::unique_ptr<ssh_key_struct, SshKeyDeleter>;
using SftpSessionPtr = std::unique_ptr<sftp_session_struct, SftpSessionDeleter>;
using SftpFilePtr = std::unique_ptr<sftp_file_struct, SftpFileDeleter>;

std::string sftp_error_text(sftp_session sftp, ssh_session session) {
  return "sftp error " + std::to_string(sftp_get_error(sftp)) + ": " + ssh_get_error(session);
}

class SftpSession : public TransferSession {
public:
  SftpSession(SshSessionPtr ssh, SftpSessionPtr sftp, std::string remote_root,
              std::shared_ptr<Logger> logger)
    : ssh_(std::move(ssh)),
      sftp_(std::move(sftp)),
      remote_root_(std::move(remote_root)),
      logger_(std::move(logger)) {}

  ~SftpSession() override { close(); }

  UploadResult send(const std::filesystem::path& local_path,
                    const std::string& remote_name) override {
    if(!sftp_) {
      return UploadResult::failure(UploadStage::OpenDestination, "session already closed");
    }

    const std::string remote_file = remote_root_ + remote_name;
    SftpFilePtr destination(sftp_open(sftp_.get(), remote_file.c_str(),
                                      O_WRONLY | O_CREAT | O_TRUNC, kRemoteFileMode));
    if(!destination) {
      return UploadResult::failure(UploadStage::OpenDestination,
                                   remote_file + ": " + sftp_error_text(sftp_.get(), ssh_.get()));
    }

    std::ifstream source(local_path, std::ios::binary);
    if(!source) {
      return UploadResult::failure(UploadStage::OpenSource,
                                   "cannot open " + local_path.string());
    }

    std::array<char, kCopyBlockSize> buffer{};
    uint64_t total = 0;
    while(source) {
      source.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
      auto got = static_cast<std::size_t>(source.gcount());
      std::size_t offset = 0;
      while(offset < got) {
        ssize_t written = sftp_write(destination.get(), buffer.data() + offset, got - offset);
        if(written < 0) {
          return UploadResult::failure(UploadStage::Copy,
                                       remote_file + ": " + sftp_error_text(sftp_.get(), ssh_.get()));
        }
        offset += static_cast<std::size_t>(written);
      }
      total += got;
    }
    if(source.bad()) {
      return UploadResult::failure(UploadStage::Copy, "read error on " + local_path.string());
    }

    // The server may only report a failed write when the handle is closed.
    if(sftp_close(destination.release()) != SSH_OK) {
      return UploadResult::failure(UploadStage::Copy,
                                   remote_file + ": close failed: " + sftp_error_text(sftp_.get(), ssh_.get()));
    }

    logger_->info("Total of {} bytes copied", total);
    return UploadResult::success(total);
  }

  void close() override {
    sftp_.reset();
    ssh_.reset();
  }

private:
  SshSessionPtr ssh_;
  SftpSessionPtr sftp_;
  std::string remote_root_;
  std::shared_ptr<Logger> logger_;
};

bool verify_known_host(ssh_session session, std::string& error) {
  auto state = ssh_session_is_known_server(session);
  switch(state) {
    case SSH_KNOWN_HOSTS_OK:
      return true;
    case SSH_KNOWN_HOSTS_CHANGED:
      error = "host key for server changed";
      return false;
    case SSH_KNOWN_HOSTS_OTHER:
      error = "server presented a key of a different type than known_hosts";
      return false;
    case SSH_KNOWN_HOSTS_NOT_FOUND:
    case SSH_KNOWN_HOSTS_UNKNOWN:
      error = "server is not listed in known_hosts";
      return false;
    case SSH_KNOWN_HOSTS_ERROR:
    default:
      error = std::string("known_hosts check failed: ") + ssh_get_error(session);
      return false;
  }
}

} // namespace

const char* to_string(UploadStage stage) {
  switch(stage) {
    case UploadStage::None: return "none";
    case UploadStage::OpenDestination: return "open destination";
    case UploadStage::OpenSource: return "open source";
    case UploadStage::Copy: return "copy";
  }
  return "unknown";
}

SftpTransferClient::SftpTransferClient(const RelayConfig& config, std::shared_ptr<Logger> logger)
  : config_(config),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("sftp")) {}

std::unique_ptr<TransferSession> SftpTransferClient::open(std::string& error) {
  ssh_key raw_key = nullptr;
  if(ssh_pki_import_privkey_file(config_.private_key.c_str(), nullptr, nullptr, nullptr, &raw_key) != SSH_OK) {
    error = "cannot load private key " + config_.private_key.string();
    return nullptr;
  }
  SshKeyPtr key(raw_key);

  SshSessionPtr session(ssh_new());
  if(!session) {
    error = "ssh_new failed";
    return nullptr;
  }

  unsigned int port = config_.remote_port;
  ssh_options_set(session.get(), SSH_OPTIONS_HOST, config_.remote_host.c_str());
  ssh_options_set(session.get(), SSH_OPTIONS_PORT, &port);
  ssh_options_set(session.get(), SSH_OPTIONS_USER, config_.remote_user.c_str());

  logger_->debug("Connecting to {}@{}:{}", config_.remote_user, config_.remote_host, port);
  if(ssh_connect(session.get()) != SSH_OK) {
    error = "connect to " + config_.remote_host + ": " + ssh_get_error(session.get());
    return nullptr;
  }

  if(config_.strict_host_key && !verify_known_host(session.get(), error)) {
    return nullptr;
  }

  if(ssh_userauth_publickey(session.get(), nullptr, key.get()) != SSH_AUTH_SUCCESS) {
    error = "public key authentication failed: " + std::string(ssh_get_error(session.get()));
    return nullptr;
  }

  SftpSessionPtr sftp(sftp_new(session.get()));
  if(!sftp) {
    error = std::string("sftp_new failed: ") + ssh_get_error(session.get());
    return nullptr;
  }
  if(sftp_init(sftp.get()) != SSH_OK) {
    error = sftp_error_text(sftp.get(), session.get());
    return nullptr;
  }

  return std::make_unique<SftpSession>(std::move(session), std::move(sftp),
                                       config_.remote_path, logger_);
}
