#include "gitpane/diff_cache.hpp"

#include "gitpane/log.hpp"

#include <stdexcept>

namespace gitpane {

ParsedDiff parse_diff(std::string raw) {
  ParsedDiff out;
  out.lines = diff::parse_unified(raw);
  out.rows = diff::pair_side_by_side(raw);
  out.raw = std::move(raw);
  return out;
}

DiffLoader::Ticket DiffLoader::begin(DiffKey key) {
  ++generation_;
  key_ = std::move(key);
  parsed_.reset();
  pending_ = true;
  return generation_;
}

bool DiffLoader::complete(Ticket ticket, std::string text) {
  if (ticket != generation_ || !pending_) {
    log::debug("diff_cache: dropping stale result for generation " + std::to_string(ticket));
    return false;
  }
  parsed_ = parse_diff(std::move(text));
  pending_ = false;
  return true;
}

const ParsedDiff &DiffLoader::load(DiffProvider &provider, const DiffKey &key) {
  if (key_ && *key_ == key && parsed_ && !pending_) {
    return *parsed_;
  }
  const Ticket t = begin(key);
  log::debug("diff_cache: loading " + key.path + " (" + std::string(diff_mode_name(key.mode)) +
             ")");
  std::string text = provider.get_diff(key.path, key.mode, key.compare_target);
  if (!complete(t, std::move(text))) {
    throw std::logic_error("diff_cache: request superseded during synchronous load");
  }
  return *parsed_;
}

void DiffLoader::invalidate() {
  parsed_.reset();
  pending_ = false;
}

const ParsedDiff *DiffLoader::current() const {
  return parsed_ && !pending_ ? &*parsed_ : nullptr;
}

} // namespace gitpane
