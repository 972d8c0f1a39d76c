#pragma once
#include "gitpane/consts.hpp"
#include "gitpane/log.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

namespace gitpane {

enum class DiffView : std::uint8_t { Unified, Split };

struct Settings {
  int max_visible_rows = consts::kDefaultMaxVisibleRows;
  int context_lines = consts::kDefaultContextLines;
  std::size_t token_cache_capacity = consts::kDefaultTokenCacheCapacity;
  DiffView diff_view = DiffView::Split;
  std::optional<log::Level> log_level; // unset: leave it to GITPANE_LOG_LEVEL / silent
};

// ".gitpane/config" under the workspace root
std::filesystem::path config_path(const std::filesystem::path& root);

// Read settings (defaults for anything missing; unknown keys ignored)
Settings load_settings(const std::filesystem::path& root);

// Overwrite .gitpane/config with the given settings
void save_settings(const std::filesystem::path& root, const Settings& settings);

auto diff_view_name(DiffView view) -> std::string_view;
auto parse_diff_view(std::string_view name) -> std::optional<DiffView>;

} // namespace gitpane
