#include "gitpane/viewport.hpp"

#include <algorithm>
#include <iostream>
#include <string>

using gitpane::visible_window;
using gitpane::Window;

int main() {
  for (std::size_t total = 0; total <= 40; ++total) {
    for (std::size_t max = 0; max <= 12; ++max) {
      for (std::size_t sel = 0; sel <= total + 2; ++sel) {
        const Window w = visible_window(total, sel, max);
        const std::string tag = "total=" + std::to_string(total) + " max=" + std::to_string(max) +
                                " sel=" + std::to_string(sel);
        if (w.start > w.end || w.end > total) {
          std::cerr << tag << ": window out of range\n";
          return 1;
        }
        if (w.size() != std::min(total, max) && total > max) {
          std::cerr << tag << ": wrong window size\n";
          return 1;
        }
        if (total <= max && (w.start != 0 || w.end != total)) {
          std::cerr << tag << ": short list must be shown whole\n";
          return 1;
        }
        if (total > 0 && max > 0 && !w.contains(std::min(sel, total - 1))) {
          std::cerr << tag << ": selection not visible\n";
          return 1;
        }
      }
    }
  }

  if (visible_window(100, 50, 30) != Window{35, 65}) {
    std::cerr << "centered window\n";
    return 1;
  }
  if (visible_window(100, 0, 30) != Window{0, 30}) {
    std::cerr << "window at top\n";
    return 1;
  }
  if (visible_window(100, 99, 30) != Window{70, 100}) {
    std::cerr << "window at bottom\n";
    return 1;
  }
  std::cout << "OK\n";
  return 0;
}
