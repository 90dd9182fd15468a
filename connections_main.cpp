#include <iostream>

#include "connections_cli.h"

int main(int argc, char *argv[]) {
  std::ios_base::sync_with_stdio(false);
  return run_connections_cli(argc, argv, std::cout, std::cerr);
}
