#include "cmdvec/cli/commands.hpp"

int main(int argc, char **argv) { return cmdvec::cli::run_cli(argc, argv); }
