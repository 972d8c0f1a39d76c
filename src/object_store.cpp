#include "gitpane/object_store.hpp"

#include "gitpane/consts.hpp"
#include "gitpane/fs.hpp"
#include "gitpane/util.hpp"

#include <algorithm>
#include <stdexcept>

namespace gitpane {

std::filesystem::path ObjectStore::path_for_oid(const oid &object_id) const {
  const std::string hex = to_hex(object_id);
  return state_dir_ / consts::kObjectsDir / hex.substr(0, consts::kFanoutDirHexLen) /
         hex.substr(consts::kFanoutDirHexLen);
}

bool ObjectStore::contains(std::string_view hex_oid) const {
  oid id{};
  return from_hex(hex_oid, id) && fs::exists(path_for_oid(id));
}

Object ObjectStore::read(std::string_view hex_oid) const {
  oid id{};
  if (!from_hex(hex_oid, id)) {
    throw std::runtime_error("object_store: bad oid hex '" + std::string(hex_oid) + "'");
  }
  const auto path = path_for_oid(id);
  if (!fs::exists(path)) {
    throw std::runtime_error("object_store: missing object " + std::string(hex_oid));
  }
  auto stored = fs::z_decompress(fs::read_file(path));

  const auto it_space = std::ranges::find(stored, static_cast<std::uint8_t>(consts::kSpace));
  if (it_space == stored.end()) {
    throw std::runtime_error("object_store: invalid header in " + std::string(hex_oid));
  }
  const auto it_nul = std::find(it_space + 1, stored.end(), static_cast<std::uint8_t>(consts::kNul));
  if (it_nul == stored.end()) {
    throw std::runtime_error("object_store: invalid header in " + std::string(hex_oid));
  }
  return Object{.type = std::string(stored.begin(), it_space), .data = {it_nul + 1, stored.end()}};
}

std::string ObjectStore::write(std::string_view type, std::span<const std::uint8_t> payload) const {
  const std::string hdr = object_header(type, payload.size());
  std::vector<std::uint8_t> stored;
  stored.reserve(hdr.size() + payload.size());
  const auto hdr_bytes = strutil::as_bytes(hdr);
  stored.insert(stored.end(), hdr_bytes.begin(), hdr_bytes.end());
  stored.insert(stored.end(), payload.begin(), payload.end());

  const oid id = sha1(stored);
  const auto path = path_for_oid(id);
  if (!fs::exists(path)) {
    fs::write_file_atomic(path, fs::z_compress(stored));
  }
  return to_hex(id);
}

std::string ObjectStore::write_blob(std::string_view text) const {
  return write(consts::kTypeBlob, strutil::as_bytes(text));
}

std::string ObjectStore::read_blob(std::string_view hex_oid) const {
  const auto obj = read(hex_oid);
  if (obj.type != consts::kTypeBlob) {
    throw std::runtime_error("object_store: " + std::string(hex_oid) + " is not a blob");
  }
  return std::string(strutil::as_text(obj.data));
}

} // namespace gitpane
