#pragma once
#include <cstdint>
#include <optional>
#include <string_view>

namespace gitpane::log {

enum class Level : std::uint8_t { Debug, Info, Warn, Error, Silent };

// Parse "debug" | "info" | "warn" | "error" | "silent" (case-insensitive).
auto parse_level(std::string_view name) -> std::optional<Level>;

void set_level(Level level);
auto level() -> Level;

// Apply GITPANE_LOG_LEVEL if set; otherwise fall back to `configured`.
void init_from_env(std::optional<Level> configured = std::nullopt);

auto enabled(Level level) -> bool;

void debug(std::string_view msg);
void info(std::string_view msg);
void warn(std::string_view msg);
void error(std::string_view msg);

} // namespace gitpane::log
