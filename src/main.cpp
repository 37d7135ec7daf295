#include "noti/cli/commands.hpp"

int main(int argc, char **argv) { return noti::cli::run_cli(argc, argv); }
