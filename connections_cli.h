#pragma once

#include <ostream>

// Parses the command line, runs the search and reports the verdict on `out`.
// Returns the process exit status: 0 for either verdict, 1 on bad arguments
// or when the search gives up.
int run_connections_cli(int argc, const char *const argv[], std::ostream &out,
                        std::ostream &err);
