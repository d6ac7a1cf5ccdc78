#include "directory_watcher.hpp"

#include <sys/inotify.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <system_error>

#include "directory_scanner.hpp"
#include "log.hpp"

namespace {

constexpr uint32_t kWatchMask = IN_CREATE | IN_MOVED_TO | IN_MODIFY | IN_CLOSE_WRITE |
                                IN_DELETE | IN_MOVED_FROM | IN_ATTRIB;

int open_inotify() {
  int fd = ::inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
  if(fd < 0) {
    throw std::system_error(errno, std::generic_category(), "inotify_init1");
  }
  return fd;
}

} // namespace

DirectoryWatcher::DirectoryWatcher(asio::io_context& io,
                                   const std::filesystem::path& dir,
                                   std::shared_ptr<Logger> logger)
  : descriptor_(io, open_inotify()),
    dir_(dir),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("watcher")) {
  watch_descriptor_ = ::inotify_add_watch(descriptor_.native_handle(), dir_.c_str(), kWatchMask);
  if(watch_descriptor_ < 0) {
    throw std::system_error(errno, std::generic_category(),
                            "inotify_add_watch " + dir_.string());
  }
}

DirectoryWatcher::~DirectoryWatcher() {
  cancel();
}

WatchEventKind DirectoryWatcher::classify_mask(uint32_t mask) {
  if(mask & (IN_CREATE | IN_MOVED_TO)) return WatchEventKind::Create;
  if(mask & (IN_MODIFY | IN_CLOSE_WRITE)) return WatchEventKind::Write;
  return WatchEventKind::Other;
}

void DirectoryWatcher::start(Handler handler) {
  handler_ = std::move(handler);
  logger_->info("Watching {}", dir_.string());
  do_read();
}

void DirectoryWatcher::cancel() {
  if(!descriptor_.is_open()) return;
  std::error_code ec;
  descriptor_.cancel(ec);
  descriptor_.close(ec);
}

void DirectoryWatcher::do_read() {
  if(!descriptor_.is_open()) return;
  descriptor_.async_read_some(asio::buffer(buffer_),
    [this](std::error_code ec, std::size_t bytes){
      if(ec == asio::error::operation_aborted) return;
      if(ec) {
        logger_->error("Watcher read error: {}", ec.message());
        throw DirectoryReadError("Unable to read notifications for " + dir_.string() + ": " + ec.message());
      }
      dispatch(bytes);
      do_read();
    });
}

void DirectoryWatcher::dispatch(std::size_t bytes) {
  std::size_t offset = 0;
  while(offset + sizeof(inotify_event) <= bytes) {
    inotify_event header;
    std::memcpy(&header, buffer_.data() + offset, sizeof(header));
    const char* name = buffer_.data() + offset + sizeof(inotify_event);
    offset += sizeof(inotify_event) + header.len;

    if(header.mask & IN_Q_OVERFLOW) {
      logger_->warn("Watcher queue overflowed; some notifications were dropped");
      continue;
    }
    if(header.mask & IN_IGNORED) {
      // Directory deleted or unmounted; no further events will arrive.
      logger_->error("Watch on {} was removed by the kernel", dir_.string());
      throw DirectoryReadError("Watch directory " + dir_.string() + " is no longer available");
    }

    WatchEvent event;
    event.kind = classify_mask(header.mask);
    event.path = header.len > 0 ? dir_ / std::string(name) : dir_;
    logger_->debug("event mask=0x{:x} {}", header.mask, event.path.string());
    if(handler_) handler_(event);
  }
}
