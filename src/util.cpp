// Utility helpers for hex, content ids and line arrays
#include "gitpane/util.hpp"

#include "gitpane/consts.hpp"
#include "gitpane/hash.hpp"

#include <algorithm>
#include <cctype>

namespace gitpane {

bool looks_hex40(std::string_view str) {
  if (str.size() != consts::kOidHexLen) {
    return false;
  }
  return std::ranges::all_of(str,
                             [](char c) { return std::isxdigit(static_cast<unsigned char>(c)); });
}

std::string compute_blob_hex_oid(std::span<const std::uint8_t> bytes) {
  Sha1 h;
  h.update(object_header(consts::kTypeBlob, bytes.size()));
  h.update(bytes);
  return to_hex(h.finish());
}

std::string compute_blob_hex_oid(std::string_view text) {
  return compute_blob_hex_oid(strutil::as_bytes(text));
}

namespace strutil {

void rstrip_newlines(std::string &s) {
  while (!s.empty() && (s.back() == '\n' || s.back() == '\r')) {
    s.pop_back();
  }
}

std::string trim(std::string_view sv) {
  while (!sv.empty() && (sv.front() == ' ' || sv.front() == '\t'))
    sv.remove_prefix(1);
  while (!sv.empty() && (sv.back() == ' ' || sv.back() == '\t' || sv.back() == '\r'))
    sv.remove_suffix(1);
  return std::string(sv);
}

std::vector<std::string> split_text_lines(std::string_view text) {
  std::vector<std::string> out;
  std::size_t pos = 0;
  for (;;) {
    const std::size_t nl = text.find(consts::kLF, pos);
    if (nl == std::string_view::npos) {
      out.emplace_back(text.substr(pos));
      return out;
    }
    out.emplace_back(text.substr(pos, nl - pos));
    pos = nl + 1;
  }
}

std::string join_lines(const std::vector<std::string> &lines) {
  std::string out;
  for (std::size_t i = 0; i < lines.size(); ++i) {
    if (i)
      out.push_back(consts::kLF);
    out += lines[i];
  }
  return out;
}

std::string_view as_text(std::span<const std::uint8_t> bytes) {
  return {reinterpret_cast<const char *>(bytes.data()), bytes.size()};
}

std::span<const std::uint8_t> as_bytes(std::string_view text) {
  return {reinterpret_cast<const std::uint8_t *>(text.data()), text.size()};
}

} // namespace strutil

} // namespace gitpane
