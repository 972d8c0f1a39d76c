#include "gitpane/diff_cache.hpp"

#include <iostream>
#include <string>

namespace {

class CountingProvider final : public gitpane::DiffProvider {
public:
  std::string get_diff(std::string_view path, gitpane::DiffMode, std::string_view) override {
    ++calls;
    return "--- a/" + std::string(path) + "\n+++ b/" + std::string(path) +
           "\n@@ -1 +1 @@\n-x\n+y\n";
  }
  int calls = 0;
};

} // namespace

int main() {
  using gitpane::DiffKey;
  using gitpane::DiffLoader;
  using gitpane::DiffMode;

  CountingProvider provider;
  DiffLoader loader;
  const DiffKey a{.path = "a.txt"};
  const DiffKey b{.path = "b.txt", .mode = DiffMode::Staged};

  const auto &first = loader.load(provider, a);
  if (first.rows.size() != 1 || first.lines.size() != 5) {
    std::cerr << "parsed views wrong\n";
    return 1;
  }
  loader.load(provider, a);
  if (provider.calls != 1) {
    std::cerr << "same key must reuse the parse\n";
    return 1;
  }
  loader.invalidate();
  loader.load(provider, a);
  loader.load(provider, b);
  if (provider.calls != 3) {
    std::cerr << "invalidate or key change must refetch, calls=" << provider.calls << "\n";
    return 1;
  }

  // last request wins
  const auto t1 = loader.begin(a);
  const auto t2 = loader.begin(b);
  if (loader.current() != nullptr || !loader.pending()) {
    std::cerr << "pending load must hide the old parse\n";
    return 1;
  }
  if (loader.complete(t1, "@@ -1 +1 @@\n-old\n+stale\n")) {
    std::cerr << "stale ticket accepted\n";
    return 1;
  }
  if (!loader.complete(t2, "@@ -1 +1 @@\n-old\n+fresh\n")) {
    std::cerr << "current ticket rejected\n";
    return 1;
  }
  if (loader.complete(t2, "@@ -1 +1 @@\n-old\n+again\n")) {
    std::cerr << "ticket completed twice\n";
    return 1;
  }
  const auto *cur = loader.current();
  if (!cur || cur->rows.size() != 1 || cur->rows[0].right != "fresh" || loader.key() != b) {
    std::cerr << "current parse should come from the newest request\n";
    return 1;
  }
  if (loader.generation() != t2) {
    std::cerr << "generation mismatch\n";
    return 1;
  }
  std::cout << "OK\n";
  return 0;
}
