#pragma once
#include <cstddef>

namespace gitpane {

// Half-open range [start, end) of a list that is currently on screen.
struct Window {
  std::size_t start = 0;
  std::size_t end = 0;

  [[nodiscard]] std::size_t size() const { return end - start; }
  [[nodiscard]] bool contains(std::size_t i) const { return i >= start && i < end; }
  bool operator==(const Window &) const = default;
};

// Visible window of at most `max_visible` items that keeps `selection` on screen, centered
// when possible and clamped at both ends. Lists no longer than `max_visible` are returned
// whole. Every scrollable list (tree, unified rows, side-by-side rows) goes through here.
Window visible_window(std::size_t total, std::size_t selection, std::size_t max_visible);

} // namespace gitpane
