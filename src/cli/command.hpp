#pragma once

namespace gitpane::cli {

using command_fn = int (*)(int argc, char **argv);

} // namespace gitpane::cli
