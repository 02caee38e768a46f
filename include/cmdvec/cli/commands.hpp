#pragma once

namespace cmdvec::cli {

void print_help();

[[nodiscard]] int run_cli(int argc, char **argv);

} // namespace cmdvec::cli
