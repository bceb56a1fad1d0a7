#pragma once

#include <string>
#include <vector>

namespace klm::cli {

[[nodiscard]] std::string version_string();

/// Removes `name` from `args`; true when it was present.
bool take_flag(std::vector<std::string> &args, const std::string &name);

/// Consumes `--config <path>` and `--config=<path>`.
[[nodiscard]] bool apply_global_options(std::vector<std::string> &args, std::string &error);

/// Entry point of the launcher. Arguments it does not recognise are left for
/// the bootstrap to log, since the host may pass its own.
int run_cli(int argc, char **argv);

} // namespace klm::cli
