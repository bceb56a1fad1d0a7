#include "klm/cli/commands.hpp"

int main(int argc, char **argv) { return klm::cli::run_cli(argc, argv); }
