#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <span>
#include <vector>

namespace gitpane {

// Validate 40-char lowercase/uppercase hex
auto looks_hex40(std::string_view str) -> bool;

// Content id of raw bytes as a stored blob ("blob <size>\0" + data), 40-hex.
auto compute_blob_hex_oid(std::span<const std::uint8_t> bytes) -> std::string;
auto compute_blob_hex_oid(std::string_view text) -> std::string;

// String helpers
namespace strutil {
  // Strip trailing CR/LF characters in place
  void rstrip_newlines(std::string& str);

  // Trim spaces, tabs and CR from both ends
  auto trim(std::string_view sv) -> std::string;

  // Split on '\n' exactly like a line-array view of the file: "a\nb\n" -> {"a", "b", ""}.
  // join_lines() is its inverse, so split/join round-trips byte for byte.
  auto split_text_lines(std::string_view text) -> std::vector<std::string>;
  auto join_lines(const std::vector<std::string>& lines) -> std::string;

  auto as_text(std::span<const std::uint8_t> bytes) -> std::string_view;
  auto as_bytes(std::string_view text) -> std::span<const std::uint8_t>;
}

}
