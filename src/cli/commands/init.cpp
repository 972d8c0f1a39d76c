#include "gitpane/config.hpp"
#include "gitpane/fs.hpp"

#include <filesystem>
#include <iostream>

int cmd_init(int /*argc*/, char ** /*argv*/) {
  try {
    const std::filesystem::path root = std::filesystem::current_path();
    const auto state = root / gitpane::consts::kStateDir;
    if (gitpane::fs::exists(gitpane::config_path(root))) {
      std::cout << "Already initialized in " << state << "\n";
      return 0;
    }
    std::filesystem::create_directories(state / gitpane::consts::kObjectsDir);
    gitpane::save_settings(root, gitpane::Settings{});
    std::cout << "Initialized gitpane workspace in " << state << "\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "init: " << e.what() << "\n";
    return 1;
  }
}
