#include "cli/registry.hpp"

#include "gitpane/config.hpp"
#include "gitpane/log.hpp"

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>

int main(int argc, char **argv) {
  gitpane::cli::register_all_commands(); // defined in register_commands.cpp

  std::optional<gitpane::log::Level> configured;
  try {
    configured = gitpane::load_settings(std::filesystem::current_path()).log_level;
  } catch (const std::exception &e) {
    std::cerr << "gitpane: cannot read settings: " << e.what() << "\n";
  }
  gitpane::log::init_from_env(configured);

  if (argc < 2) {
    gitpane::cli::print_usage();
    return 2;
  }
  const std::string cmd = argv[1];

  const auto fn = gitpane::cli::find_command(cmd);
  if (!fn) {
    std::cerr << "unknown command: " << cmd << "\n";
    gitpane::cli::print_usage();
    return 2;
  }
  // Pass everything after the subcommand to the handler
  return fn(argc - 1, argv + 1);
}
