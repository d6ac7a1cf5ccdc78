#pragma once

#include <asio.hpp>

#include <array>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>

class Logger;

enum class WatchEventKind {
  Create,
  Write,
  Other
};

struct WatchEvent {
  WatchEventKind kind = WatchEventKind::Other;
  std::filesystem::path path;
};

// inotify watch on a single directory, driven by an asio io_context. The
// handler runs on the io thread and the next read is only issued after it
// returns, so events that arrive meanwhile wait in the kernel queue. If
// that queue overflows they are lost. Losing the watch itself or a failed
// read throws DirectoryReadError out of io_context::run().
class DirectoryWatcher {
public:
  using Handler = std::function<void(const WatchEvent&)>;

  // Throws std::system_error if inotify cannot be set up for dir.
  DirectoryWatcher(asio::io_context& io,
                   const std::filesystem::path& dir,
                   std::shared_ptr<Logger> logger);
  ~DirectoryWatcher();

  void start(Handler handler);
  void cancel();

  static WatchEventKind classify_mask(uint32_t mask);

private:
  void do_read();
  void dispatch(std::size_t bytes);

  asio::posix::stream_descriptor descriptor_;
  std::filesystem::path dir_;
  std::shared_ptr<Logger> logger_;
  Handler handler_;
  int watch_descriptor_ = -1;
  alignas(8) std::array<char, 64 * 1024> buffer_{};
};
