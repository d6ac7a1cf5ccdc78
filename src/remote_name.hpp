#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

inline constexpr std::size_t kTokenLength = 22;

// Produces a fresh collision-resistant token on every call.
using TokenSource = std::function<std::string()>;

// 128 bits from the OpenSSL CSPRNG, base57 encoded to kTokenLength chars.
// Throws std::runtime_error when the RNG cannot be seeded.
std::string generate_token();

std::string encode_base57(const std::array<uint8_t, 16>& bytes);

struct RemoteObjectName {
  std::string token;
  std::string extension;

  std::string str() const { return token + "." + extension; }
};

// base_url is expected to carry its trailing '/'.
std::string public_url(const std::string& base_url, const RemoteObjectName& name);
