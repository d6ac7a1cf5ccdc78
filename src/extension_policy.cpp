#include "extension_policy.hpp"

#include <algorithm>
#include <array>
#include <cctype>

namespace {

constexpr std::array<const char*, 10> kDirectTransfer = {
  "jpg", "jpeg", "png", "gif", "webm", "mp4", "zip", "tar", "tar.gz", "tar.bz2"
};

constexpr const char* kTranscodeSource = "mov";

bool is_word_char(unsigned char ch) {
  return std::isalnum(ch) || ch == '_';
}

} // namespace

const char* to_string(ExtensionClass value) {
  switch(value) {
    case ExtensionClass::Rejected: return "rejected";
    case ExtensionClass::DirectTransfer: return "direct";
    case ExtensionClass::RequiresTranscode: return "transcode";
  }
  return "unknown";
}

ExtensionClass classify(const std::string& extension) {
  if(extension == kTranscodeSource) return ExtensionClass::RequiresTranscode;
  auto match = std::find_if(kDirectTransfer.begin(), kDirectTransfer.end(),
                            [&](const char* allowed){ return extension == allowed; });
  return match != kDirectTransfer.end() ? ExtensionClass::DirectTransfer
                                        : ExtensionClass::Rejected;
}

std::string extension_of(const std::string& filename) {
  auto dot = filename.rfind('.');
  if(dot == std::string::npos || dot + 1 == filename.size()) return "";
  std::string suffix = filename.substr(dot + 1);
  if(!std::all_of(suffix.begin(), suffix.end(), [](unsigned char ch){ return is_word_char(ch); })) {
    return "";
  }
  return suffix;
}
