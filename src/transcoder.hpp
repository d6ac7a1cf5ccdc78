#pragma once

#include <filesystem>
#include <memory>

class Logger;
struct RelayConfig;

class Transcoder {
public:
  virtual ~Transcoder() = default;

  // Converts source into target. Never deletes source; the caller does
  // that on success. Diagnostics go to the log only.
  virtual bool transcode(const std::filesystem::path& source,
                         const std::filesystem::path& target) = 0;
};

// Runs `<ffmpeg_path> -i <source> <target>`; success is exit status 0.
class FfmpegTranscoder : public Transcoder {
public:
  FfmpegTranscoder(const RelayConfig& config, std::shared_ptr<Logger> logger);

  bool transcode(const std::filesystem::path& source,
                 const std::filesystem::path& target) override;

private:
  const RelayConfig& config_;
  std::shared_ptr<Logger> logger_;
};
