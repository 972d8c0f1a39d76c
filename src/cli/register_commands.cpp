#include "cli/registry.hpp"

int cmd_init(int argc, char **argv);
int cmd_baseline(int argc, char **argv);
int cmd_status(int, char **);
int cmd_diff(int, char **);
int cmd_edit(int, char **);

namespace gitpane::cli {

void register_all_commands() {
  register_command("init", ::cmd_init, "Create .gitpane with default settings");
  register_command("baseline", ::cmd_baseline,
                   "Record the current content as baseline: gitpane baseline [path...]");
  register_command("status", ::cmd_status, "Show the change tree: gitpane status [--collapse <dir>]...");
  register_command("diff", ::cmd_diff,
                   "Show a file's diff: gitpane diff <path> [--unified|--split] [--row N]");
  register_command("edit", ::cmd_edit,
                   "Replace one line through the diff: gitpane edit <path> <row> <text> [--unified]");
}

} // namespace gitpane::cli
