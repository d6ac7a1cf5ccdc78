#include "transcoder.hpp"

#include "log.hpp"
#include "process_runner.hpp"
#include "relay_config.hpp"

FfmpegTranscoder::FfmpegTranscoder(const RelayConfig& config, std::shared_ptr<Logger> logger)
  : config_(config),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("transcoder")) {}

bool FfmpegTranscoder::transcode(const std::filesystem::path& source,
                                 const std::filesystem::path& target) {
  logger_->info("Converting {} to {}", source.string(), target.string());
  auto result = run_process({config_.ffmpeg_path.string(), "-i", source.string(), target.string()});

  if(!result.started) {
    logger_->error("Unable to start {}: {}", config_.ffmpeg_path.string(), result.error);
    return false;
  }
  logger_->debug("[ffmpeg stdout] {}", result.stdout_text);
  logger_->debug("[ffmpeg stderr] {}", result.stderr_text);
  if(!result.succeeded()) {
    logger_->error("Transcode of {} failed (exit {}{}{}): {}",
                   source.string(),
                   result.exit_code,
                   result.error.empty() ? "" : ", ",
                   result.error,
                   result.stderr_text);
    return false;
  }
  return true;
}
