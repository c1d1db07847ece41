#include "snotes/core/version.h"

#include "commands/mint.h"
#include "commands/paste.h"
#include <iostream>
#include <string>

namespace {

void print_usage() {
  std::cerr << "snotes_cli v" << snotes::core::kBuildVersion << "\n\n"
            << "Usage: snotes_cli <command> [options]\n\n"
            << "Commands:\n"
            << "  mint  [--worker-id N] [--count K]          Mint tokens and show their ids\n"
            << "  put   --db PATH --worker-id N [--ttl S] TEXT\n"
            << "                                              Store a paste (TEXT '-' reads stdin);\n"
            << "                                              N must differ from the server's\n"
            << "  get   --db PATH TOKEN                       Print a stored paste\n"
            << "  sweep --db PATH                             Delete expired pastes\n";
}

}  // namespace

int main(int argc, char* argv[]) {
  if (argc < 2) {
    print_usage();
    return 1;
  }

  const std::string subcommand = argv[1];
  if (subcommand == "mint") {
    return cmd_mint(argc, argv);
  }
  if (subcommand == "put") {
    return cmd_put(argc, argv);
  }
  if (subcommand == "get") {
    return cmd_get(argc, argv);
  }
  if (subcommand == "sweep") {
    return cmd_sweep(argc, argv);
  }
  if (subcommand == "--help" || subcommand == "help") {
    print_usage();
    return 0;
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_usage();
  return 1;
}
