#pragma once

#include "gitpane/consts.hpp"

#include <openssl/evp.h>

#include <array>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>

namespace gitpane {

// Raw 20-byte SHA-1 object id (binary, not hex)
using oid = std::array<std::uint8_t, consts::kOidRawLen>;

// Incremental SHA-1 over OpenSSL's EVP digest API.
class Sha1 {
public:
  Sha1();
  Sha1(const Sha1 &) = delete;
  Sha1 &operator=(const Sha1 &) = delete;

  void update(std::span<const std::uint8_t> data);
  void update(std::string_view text);
  // Finish the digest; the object must not be updated afterwards.
  oid finish();

private:
  std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx_;
  bool finished_ = false;
};

oid sha1(std::span<const std::uint8_t> data);

inline oid sha1(std::string_view s) {
  return sha1(
      std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t *>(s.data()), s.size()));
}

/** Convert binary oid to 40-char lowercase hex. */
std::string to_hex(const oid &id);

/**
 * Parse 40-char hex into binary oid.
 * Returns false if length/characters are invalid.
 */
bool from_hex(std::string_view hex, oid &out);

/**
 * Build the object header used for hashing and storage:
 *   "<type> <size>\\0"
 */
inline std::string object_header(std::string_view type, std::size_t size) {
  std::string s;
  s.reserve(type.size() + 1 + 20 + 1);
  s.append(type);
  s.push_back(' ');
  s.append(std::to_string(size));
  s.push_back('\0');
  return s;
}

} // namespace gitpane
