#include "gitpane/highlight.hpp"

#include <iostream>
#include <stdexcept>
#include <string>

namespace {

class CountingHighlighter final : public gitpane::Highlighter {
public:
  std::vector<gitpane::Token> highlight(std::string_view code, std::string_view) override {
    ++calls;
    return {{.text = std::string(code), .color = "#FF0000"}};
  }
  int calls = 0;
};

} // namespace

int main() {
  CountingHighlighter hl;
  gitpane::TokenCache cache{4};

  for (int i = 0; i < 4; ++i)
    cache.tokens(hl, "line" + std::to_string(i), "cpp");
  cache.tokens(hl, "line0", "cpp");
  if (hl.calls != 4 || cache.size() != 4) {
    std::cerr << "cache hit must not call the highlighter\n";
    return 1;
  }
  if (cache.contains("line0", "python")) {
    std::cerr << "language is part of the key\n";
    return 1;
  }

  // full: the two oldest entries go before the fifth is added
  cache.tokens(hl, "line4", "cpp");
  if (cache.size() != 3 || cache.contains("line0", "cpp") || cache.contains("line1", "cpp") ||
      !cache.contains("line2", "cpp") || !cache.contains("line4", "cpp")) {
    std::cerr << "older half not evicted, size=" << cache.size() << "\n";
    return 1;
  }

  const auto empty = cache.tokens(hl, "", "cpp");
  if (empty.size() != 1 || empty[0].color != gitpane::kPlainTokenColor || cache.size() != 3) {
    std::cerr << "empty line must yield one plain token without caching\n";
    return 1;
  }

  cache.clear();
  if (cache.size() != 0) {
    std::cerr << "clear\n";
    return 1;
  }

  bool threw = false;
  try {
    gitpane::TokenCache bad{0};
  } catch (const std::invalid_argument &) {
    threw = true;
  }
  if (!threw) {
    std::cerr << "zero capacity accepted\n";
    return 1;
  }

  if (gitpane::language_from_path("src/tool.PY") != "python" ||
      gitpane::language_from_path("Makefile") != "javascript" ||
      gitpane::language_from_path("a.b/c.hpp") != "cpp") {
    std::cerr << "language_from_path\n";
    return 1;
  }
  std::cout << "OK\n";
  return 0;
}
