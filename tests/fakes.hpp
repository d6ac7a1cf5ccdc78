#pragma once

#include "publisher.hpp"
#include "remote_name.hpp"
#include "transcoder.hpp"
#include "transfer_client.hpp"

#include <filesystem>
#include <fstream>
#include <functional>
#include <iterator>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace skrins::test {

// Copies source to target when told to succeed; never touches source.
class FakeTranscoder : public Transcoder {
public:
  bool transcode(const std::filesystem::path& source,
                 const std::filesystem::path& target) override {
    std::lock_guard<std::mutex> lock(mutex_);
    calls_.push_back(source.filename().string());
    if(!succeed) return false;
    std::error_code ec;
    std::filesystem::copy_file(source, target,
                               std::filesystem::copy_options::overwrite_existing, ec);
    return !ec;
  }

  std::vector<std::string> calls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return calls_;
  }

  bool succeed = true;

private:
  mutable std::mutex mutex_;
  std::vector<std::string> calls_;
};

// In-memory remote store recording every upload in order.
class FakeTransferClient : public TransferClient {
public:
  struct Upload {
    std::string local_name;
    std::string remote_name;
    std::string content;
  };

  std::unique_ptr<TransferSession> open(std::string& error) override {
    std::lock_guard<std::mutex> lock(mutex_);
    ++opens_;
    if(fail_open) {
      error = "connection refused";
      return nullptr;
    }
    return std::make_unique<Session>(*this);
  }

  std::vector<Upload> uploads() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return uploads_;
  }

  std::size_t opens() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return opens_;
  }

  std::size_t closes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closes_;
  }

  std::size_t send_attempts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return attempted_names_.size();
  }

  std::vector<std::string> attempted_names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return attempted_names_;
  }

  bool fail_open = false;
  UploadStage fail_stage = UploadStage::None;

private:
  class Session : public TransferSession {
  public:
    explicit Session(FakeTransferClient& owner) : owner_(owner) {}
    ~Session() override { close(); }

    UploadResult send(const std::filesystem::path& local_path,
                      const std::string& remote_name) override {
      std::lock_guard<std::mutex> lock(owner_.mutex_);
      owner_.attempted_names_.push_back(remote_name);
      if(owner_.fail_stage != UploadStage::None) {
        return UploadResult::failure(owner_.fail_stage, "simulated network error");
      }
      std::ifstream in(local_path, std::ios::binary);
      if(!in) {
        return UploadResult::failure(UploadStage::OpenSource, "cannot open " + local_path.string());
      }
      Upload upload;
      upload.local_name = local_path.filename().string();
      upload.remote_name = remote_name;
      upload.content.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
      auto size = upload.content.size();
      owner_.uploads_.push_back(std::move(upload));
      return UploadResult::success(size);
    }

    void close() override {
      if(closed_) return;
      closed_ = true;
      std::lock_guard<std::mutex> lock(owner_.mutex_);
      ++owner_.closes_;
    }

  private:
    FakeTransferClient& owner_;
    bool closed_ = false;
  };

  mutable std::mutex mutex_;
  std::vector<Upload> uploads_;
  std::vector<std::string> attempted_names_;
  std::size_t opens_ = 0;
  std::size_t closes_ = 0;
};

class FakePublisher : public Publisher {
public:
  void publish(const std::string& url) override {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      urls_.push_back(url);
    }
    if(on_publish) on_publish(url);
    if(throw_on_publish) throw std::runtime_error("clipboard unavailable");
  }

  std::vector<std::string> urls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return urls_;
  }

  std::function<void(const std::string&)> on_publish;
  bool throw_on_publish = false;

private:
  mutable std::mutex mutex_;
  std::vector<std::string> urls_;
};

// Deterministic tokens: "tok0", "tok1", ...
inline TokenSource counting_tokens() {
  auto counter = std::make_shared<int>(0);
  return [counter]{ return "tok" + std::to_string((*counter)++); };
}

} // namespace skrins::test
