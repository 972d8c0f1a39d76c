#include "gitpane/hash.hpp"
#include "gitpane/consts.hpp"

#include <openssl/evp.h>
#include <stdexcept>

namespace gitpane {

Sha1::Sha1() : ctx_(EVP_MD_CTX_new(), &EVP_MD_CTX_free) {
  if (!ctx_) {
    throw std::runtime_error("sha1: EVP_MD_CTX_new failed");
  }
  if (EVP_DigestInit_ex(ctx_.get(), EVP_sha1(), nullptr) != 1) {
    throw std::runtime_error("sha1: EVP_DigestInit_ex failed");
  }
}

void Sha1::update(std::span<const std::uint8_t> data) {
  if (finished_) {
    throw std::logic_error("sha1: update after finish");
  }
  if (!data.empty() && EVP_DigestUpdate(ctx_.get(), data.data(), data.size()) != 1) {
    throw std::runtime_error("sha1: EVP_DigestUpdate failed");
  }
}

void Sha1::update(std::string_view text) {
  update(std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t *>(text.data()),
                                       text.size()));
}

oid Sha1::finish() {
  if (finished_) {
    throw std::logic_error("sha1: finish called twice");
  }
  finished_ = true;
  oid out{};
  unsigned int len = 0;
  if (EVP_DigestFinal_ex(ctx_.get(), out.data(), &len) != 1 || len != out.size()) {
    throw std::runtime_error("sha1: EVP_DigestFinal_ex failed");
  }
  return out;
}

oid sha1(std::span<const std::uint8_t> data) {
  Sha1 h;
  h.update(data);
  return h.finish();
}

std::string to_hex(const oid &id) {
  static constexpr std::string_view kHex = "0123456789abcdef";
  std::string s;
  s.reserve(consts::kOidHexLen);
  for (const std::uint8_t b : id) {
    s.push_back(kHex[(b >> 4U) & 0xFU]);
    s.push_back(kHex[b & 0xFU]);
  }
  return s;
}

bool from_hex(std::string_view hex, oid &out) {
  if (hex.size() != consts::kOidHexLen) {
    return false;
  }
  auto nibble = [](char c) -> int {
    if (c >= '0' && c <= '9') {
      return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
      return 10 + (c - 'a');
    }
    if (c >= 'A' && c <= 'F') {
      return 10 + (c - 'A');
    }
    return -1;
  };
  for (std::size_t i = 0; i < out.size(); ++i) {
    const int hi = nibble(hex[2 * i]);
    const int lo = nibble(hex[(2 * i) + 1]);
    if (hi < 0 || lo < 0) {
      return false;
    }
    out[i] = static_cast<std::uint8_t>((hi << 4) | lo);
  }
  return true;
}

} // namespace gitpane
