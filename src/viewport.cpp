#include "gitpane/viewport.hpp"

#include <algorithm>

namespace gitpane {

Window visible_window(std::size_t total, std::size_t selection, std::size_t max_visible) {
  if (total <= max_visible) {
    return {.start = 0, .end = total};
  }
  if (max_visible == 0) {
    return {};
  }
  selection = std::min(selection, total - 1);

  const std::size_t half = max_visible / 2;
  std::size_t start = selection > half ? selection - half : 0;
  std::size_t end = start + max_visible;
  if (end > total) {
    end = total;
    start = end - max_visible;
  }
  return {.start = start, .end = end};
}

} // namespace gitpane
