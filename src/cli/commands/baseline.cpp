#include "gitpane/workspace.hpp"

#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

int cmd_baseline(int argc, char **argv) {
  try {
    const std::filesystem::path root = std::filesystem::current_path();
    if (!std::filesystem::exists(root / gitpane::consts::kStateDir)) {
      std::cerr << "baseline: not a gitpane workspace (run `gitpane init`)\n";
      return 1;
    }
    std::vector<std::string> paths;
    for (int i = 1; i < argc; ++i)
      paths.emplace_back(argv[i]);

    gitpane::BaselineStore store{root};
    const std::size_t n = store.record(paths);
    std::cout << "Recorded " << n << " file(s) as baseline\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "baseline: " << e.what() << "\n";
    return 1;
  }
}
