#include "remote_name.hpp"

#include <openssl/err.h>
#include <openssl/rand.h>

#include <stdexcept>

namespace {
constexpr char kAlphabet[] = "23456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";
constexpr unsigned kBase = sizeof(kAlphabet) - 1;
static_assert(kBase == 57, "alphabet must have 57 symbols");
}

std::string encode_base57(const std::array<uint8_t, 16>& bytes) {
  // Long division of the big-endian 128-bit value, least significant digit first.
  std::array<uint8_t, 16> value = bytes;
  std::string out(kTokenLength, kAlphabet[0]);
  for(std::size_t digit = 0; digit < kTokenLength; ++digit) {
    unsigned remainder = 0;
    for(auto& byte : value) {
      unsigned acc = (remainder << 8) | byte;
      byte = static_cast<uint8_t>(acc / kBase);
      remainder = acc % kBase;
    }
    out[kTokenLength - 1 - digit] = kAlphabet[remainder];
  }
  return out;
}

std::string generate_token() {
  std::array<uint8_t, 16> bytes{};
  if(RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
    char reason[256] = {0};
    ERR_error_string_n(ERR_get_error(), reason, sizeof(reason));
    throw std::runtime_error(std::string("RAND_bytes failed: ") + reason);
  }
  return encode_base57(bytes);
}

std::string public_url(const std::string& base_url, const RemoteObjectName& name) {
  return base_url + name.str();
}
