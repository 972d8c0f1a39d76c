#pragma once
#include "gitpane/hash.hpp"

#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace gitpane {

struct Object {
  std::string type;               // "blob"
  std::vector<std::uint8_t> data; // payload bytes (no header)
};

// Content-addressed store under <state_dir>/objects: each object is "<type> <size>\0" +
// payload, zlib-compressed, at objects/<2 hex>/<38 hex> of its SHA-1.
class ObjectStore {
public:
  explicit ObjectStore(std::filesystem::path state_dir) : state_dir_(std::move(state_dir)) {}

  // Read and decompress object identified by 40-hex; returns type and payload.
  Object read(std::string_view hex_oid) const;

  // Write object with given type/payload (no-op if already stored). Returns 40-hex id.
  std::string write(std::string_view type, std::span<const std::uint8_t> payload) const;

  std::string write_blob(std::string_view text) const;
  std::string read_blob(std::string_view hex_oid) const;

  bool contains(std::string_view hex_oid) const;

  std::filesystem::path path_for_oid(const oid& object_id) const;

private:
  std::filesystem::path state_dir_;
};

} // namespace gitpane
