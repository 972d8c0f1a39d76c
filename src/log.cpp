#include "gitpane/log.hpp"

#include <cctype>
#include <cstdlib>
#include <iostream>
#include <string>

namespace gitpane::log {

namespace {

Level &current() {
  static Level lvl = Level::Silent;
  return lvl;
}

void emit(Level lvl, std::string_view tag, std::string_view msg) {
  if (!enabled(lvl))
    return;
  std::cerr << '[' << tag << "] " << msg << '\n';
}

} // namespace

std::optional<Level> parse_level(std::string_view name) {
  std::string lower;
  lower.reserve(name.size());
  for (const char c : name)
    lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  if (lower == "debug")
    return Level::Debug;
  if (lower == "info")
    return Level::Info;
  if (lower == "warn")
    return Level::Warn;
  if (lower == "error")
    return Level::Error;
  if (lower == "silent")
    return Level::Silent;
  return std::nullopt;
}

void set_level(Level level) { current() = level; }

Level level() { return current(); }

void init_from_env(std::optional<Level> configured) {
  if (const char *env = std::getenv("GITPANE_LOG_LEVEL")) {
    if (auto lvl = parse_level(env)) {
      set_level(*lvl);
      return;
    }
  }
  set_level(configured.value_or(Level::Silent));
}

bool enabled(Level lvl) { return lvl != Level::Silent && lvl >= current(); }

void debug(std::string_view msg) { emit(Level::Debug, "DEBUG", msg); }
void info(std::string_view msg) { emit(Level::Info, "INFO", msg); }
void warn(std::string_view msg) { emit(Level::Warn, "WARN", msg); }
void error(std::string_view msg) { emit(Level::Error, "ERROR", msg); }

} // namespace gitpane::log
