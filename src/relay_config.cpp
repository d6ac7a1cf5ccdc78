#include "relay_config.hpp"

#include <stdexcept>

#include "process_runner.hpp"
#include "settings_manager.hpp"

namespace {

std::string require(const SettingsManager& settings, const std::string& key) {
  auto value = settings.get<std::string>(key);
  if(value.empty()) {
    throw std::runtime_error("Missing required setting '" + key + "'");
  }
  return value;
}

} // namespace

std::string with_single_trailing_slash(const std::string& value) {
  auto end = value.find_last_not_of('/');
  if(end == std::string::npos) return "/";
  return value.substr(0, end + 1) + "/";
}

void split_host_port(const std::string& spec, std::string& host, uint16_t& port) {
  port = 22;
  host = spec;
  auto pos = spec.rfind(':');
  if(pos != std::string::npos) {
    host = spec.substr(0, pos);
    std::string port_text = spec.substr(pos + 1);
    int value = 0;
    try {
      std::size_t consumed = 0;
      value = std::stoi(port_text, &consumed);
      if(consumed != port_text.size()) value = -1;
    } catch(const std::exception&) {
      value = -1;
    }
    if(value <= 0 || value > 65535) {
      throw std::runtime_error("Invalid port in remote host '" + spec + "'");
    }
    port = static_cast<uint16_t>(value);
  }
  if(host.empty()) {
    throw std::runtime_error("Remote host must not be empty (got '" + spec + "')");
  }
}

RelayConfig RelayConfig::from_settings(const SettingsManager& settings) {
  RelayConfig config;
  config.watch_path = require(settings, "watch_path");
  split_host_port(require(settings, "remote_host"), config.remote_host, config.remote_port);
  config.remote_user = require(settings, "remote_user");
  config.private_key = require(settings, "private_key");
  config.remote_path = with_single_trailing_slash(settings.get<std::string>("remote_path"));
  config.strict_host_key = settings.get<bool>("strict_host_key");
  config.base_url = with_single_trailing_slash(require(settings, "base_url"));

  config.ffmpeg_path = require(settings, "ffmpeg_path");
  config.transcode_target = require(settings, "transcode_target");
  if(config.transcode_target.find('/') != std::string::npos) {
    throw std::runtime_error("transcode_target must be a plain file name");
  }

  config.app_name = settings.get<std::string>("app_name");
  config.notification_title = settings.get<std::string>("notification_title");
  config.clipboard_command = split_command(settings.get<std::string>("clipboard_command"));
  config.notify_command = split_command(settings.get<std::string>("notify_command"));

  config.verbose = settings.get<bool>("verbose");
  config.log_file = settings.get<std::string>("log_file");
  return config;
}
