#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

class SettingsManager;

// Immutable snapshot of everything the pipeline needs. Built once at
// startup and handed to each component by const reference.
struct RelayConfig {
  std::filesystem::path watch_path;

  std::string remote_host;
  uint16_t remote_port = 22;
  std::string remote_user;
  std::filesystem::path private_key;
  std::string remote_path = "/";   // always ends with exactly one '/'
  bool strict_host_key = false;

  std::string base_url = "/";      // always ends with exactly one '/'

  std::filesystem::path ffmpeg_path = "/usr/local/bin/ffmpeg";
  std::string transcode_target = "out.mp4";

  std::string app_name = "Skrins";
  std::string notification_title = "Screenshot uploaded!";
  std::vector<std::string> clipboard_command{"xclip", "-selection", "clipboard"};
  std::vector<std::string> notify_command{"notify-send"};

  bool verbose = false;
  std::string log_file;

  std::filesystem::path transcode_target_path() const { return watch_path / transcode_target; }

  // Throws std::runtime_error when a required setting is missing or malformed.
  static RelayConfig from_settings(const SettingsManager& settings);
};

std::string with_single_trailing_slash(const std::string& value);

// "example.com:2003" -> {"example.com", 2003}; the port defaults to 22.
// Throws std::runtime_error on an empty host or an invalid port.
void split_host_port(const std::string& spec, std::string& host, uint16_t& port);
