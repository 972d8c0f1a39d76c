#include "gitpane/config.hpp"

#include "gitpane/fs.hpp"
#include "gitpane/util.hpp"

#include <charconv>
#include <sstream>
#include <string_view>

namespace {

template <typename T>
bool parse_number(std::string_view text, T &out) {
  T v{};
  const auto *end = text.data() + text.size();
  auto [ptr, ec] = std::from_chars(text.data(), end, v);
  if (ec != std::errc{} || ptr != end)
    return false;
  out = v;
  return true;
}

} // namespace

namespace gitpane {

std::filesystem::path config_path(const std::filesystem::path &root) {
  return root / consts::kStateDir / consts::kConfigFile;
}

std::string_view diff_view_name(DiffView view) {
  return view == DiffView::Unified ? "unified" : "split";
}

std::optional<DiffView> parse_diff_view(std::string_view name) {
  if (name == "unified")
    return DiffView::Unified;
  if (name == "split" || name == "side-by-side")
    return DiffView::Split;
  return std::nullopt;
}

auto load_settings(const std::filesystem::path &root) -> Settings {
  Settings out{};
  const auto path = config_path(root);
  if (!fs::exists(path))
    return out;

  std::istringstream iss(fs::read_text(path));

  constexpr std::string_view k_rows = "max_visible_rows:";
  constexpr std::string_view k_context = "context_lines:";
  constexpr std::string_view k_cache = "token_cache_capacity:";
  constexpr std::string_view k_view = "diff_view:";
  constexpr std::string_view k_log = "log_level:";

  auto bad_value = [](std::string_view key, std::string_view value) {
    log::warn("config: ignoring bad value for " + std::string(key) + " '" + std::string(value) +
              "'");
  };

  std::string line;
  while (std::getline(iss, line)) {
    std::string_view sv{line};
    if (sv.empty() || sv[0] == '#')
      continue; // allow comments
    if (sv.starts_with(k_rows)) {
      const auto v = strutil::trim(sv.substr(k_rows.size()));
      int n = 0;
      if (parse_number(v, n) && n > 0)
        out.max_visible_rows = n;
      else
        bad_value(k_rows, v);
    } else if (sv.starts_with(k_context)) {
      const auto v = strutil::trim(sv.substr(k_context.size()));
      int n = 0;
      if (parse_number(v, n) && n >= 0)
        out.context_lines = n;
      else
        bad_value(k_context, v);
    } else if (sv.starts_with(k_cache)) {
      const auto v = strutil::trim(sv.substr(k_cache.size()));
      std::size_t n = 0;
      if (parse_number(v, n) && n > 0)
        out.token_cache_capacity = n;
      else
        bad_value(k_cache, v);
    } else if (sv.starts_with(k_view)) {
      const auto v = strutil::trim(sv.substr(k_view.size()));
      if (auto view = parse_diff_view(v))
        out.diff_view = *view;
      else
        bad_value(k_view, v);
    } else if (sv.starts_with(k_log)) {
      const auto v = strutil::trim(sv.substr(k_log.size()));
      if (auto lvl = log::parse_level(v))
        out.log_level = lvl;
      else
        bad_value(k_log, v);
    }
  }
  return out;
}

void save_settings(const std::filesystem::path &root, const Settings &s) {
  std::ostringstream os;
  os << "max_visible_rows: " << s.max_visible_rows << '\n'
     << "context_lines: " << s.context_lines << '\n'
     << "token_cache_capacity: " << s.token_cache_capacity << '\n'
     << "diff_view: " << diff_view_name(s.diff_view) << '\n';
  if (s.log_level) {
    static constexpr std::string_view kNames[] = {"debug", "info", "warn", "error", "silent"};
    os << "log_level: " << kNames[static_cast<std::size_t>(*s.log_level)] << '\n';
  }
  fs::write_text_atomic(config_path(root), os.str());
}

} // namespace gitpane
