#include "connections_cli.h"

#include <cstdint>
#include <new>
#include <stdexcept>
#include <string>

#include "belief_state.h"
#include "connections_errors.h"
#include "connections_types.h"
#include "strategy_printer.h"
#include "strategy_search.h"

namespace {

void print_usage(std::ostream &out, const char *prog_name) {
  out
      << "Usage:\n"
      << "  " << prog_name << " [-s SLOTS] [-t TRIES] [options]\n\n"
      << "Checks whether there is a winning strategy for a game of "
         "\"Connections\".\n\n"
      << "Flags:\n"
      << "  -s, --slots N     Number of slots, a multiple of "
      << kDefaultGroupSize << " (default: " << kDefaultSlotCount << ").\n"
      << "  -t, --tries N     Mistake budget; the game is lost once it runs "
         "out (default: "
      << kDefaultErrorBudget << ").\n"
      << "  --threads N       Worker threads, 0 for all cores (default: 1).\n"
      << "  --no-memo         Disable the transposition memo.\n"
      << "  --max-nodes N     Give up after visiting N states (default: no "
         "limit).\n"
      << "  --show-strategy   Print the winning strategy as a tree.\n"
      << "  --dump-json       Print the winning strategy as JSON.\n"
      << "  --debug           Search statistics and timings on stderr.\n"
      << "  -h, --help        Show this summary.\n";
}

bool parse_int(std::ostream &err, const std::string &flag,
               const std::string &text, long long &out) {
  std::size_t consumed = 0;
  try {
    out = std::stoll(text, &consumed);
  } catch (const std::invalid_argument &) {
    consumed = 0;
  } catch (const std::out_of_range &) {
    err << flag << " value '" << text << "' is out of range.\n";
    return false;
  }
  if (consumed == 0 || consumed != text.size()) {
    err << flag << " requires an integer, got '" << text << "'.\n";
    return false;
  }
  return true;
}

} // namespace

int run_connections_cli(int argc, const char *const argv[], std::ostream &out,
                        std::ostream &err) {
  long long slot_count = kDefaultSlotCount;
  long long tries = kDefaultErrorBudget;
  long long threads = 1;
  long long max_nodes = 0;
  bool show_strategy = false;
  bool dump_json = false;
  SearchOptions options;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      print_usage(out, argv[0]);
      return 0;
    }
    if (arg == "--no-memo") {
      options.use_memo = false;
      continue;
    }
    if (arg == "--show-strategy") {
      show_strategy = true;
      continue;
    }
    if (arg == "--dump-json") {
      dump_json = true;
      continue;
    }
    if (arg == "--debug") {
      options.debug = true;
      continue;
    }
    long long *target = nullptr;
    if (arg == "-s" || arg == "--slots") {
      target = &slot_count;
    } else if (arg == "-t" || arg == "--tries") {
      target = &tries;
    } else if (arg == "--threads") {
      target = &threads;
    } else if (arg == "--max-nodes") {
      target = &max_nodes;
    }
    if (!target) {
      err << "Unknown argument: " << arg << "\n";
      print_usage(out, argv[0]);
      return 1;
    }
    if (i + 1 >= argc) {
      err << arg << " requires a value.\n";
      return 1;
    }
    if (!parse_int(err, arg, argv[++i], *target)) {
      return 1;
    }
  }

  if (slot_count <= 0 || slot_count > kMaxSlots) {
    err << "Invalid configuration: slot count must be between 1 and "
              << kMaxSlots << ", got " << slot_count << ".\n";
    return 1;
  }
  if (tries < 0 || tries > 1000) {
    err << "Invalid configuration: tries must be between 0 and 1000, "
                 "got "
              << tries << ".\n";
    return 1;
  }
  if (threads < 0 || threads > 1024) {
    err << "--threads must be between 0 and 1024.\n";
    return 1;
  }
  if (max_nodes < 0) {
    err << "--max-nodes must not be negative.\n";
    return 1;
  }
  options.threads = static_cast<unsigned int>(threads);
  options.max_nodes = static_cast<uint64_t>(max_nodes);

  StrategyPtr strategy;
  try {
    const GameParams params =
        make_game_params(static_cast<int>(slot_count), kDefaultGroupSize);
    std::string error;
    if (!validate_game_params(params, &error)) {
      err << "Invalid configuration: " << error << ".\n";
      return 1;
    }
    const BeliefState start_state(params);
    StrategySearch search(options);
    strategy = search.find_winning_strategy(start_state, static_cast<int>(tries));
  } catch (const InvalidConfiguration &e) {
    err << "Invalid configuration: " << e.what() << ".\n";
    return 1;
  } catch (const SearchExhausted &e) {
    err << "Search gave up: " << e.what() << ".\n";
    return 1;
  } catch (const std::bad_alloc &) {
    err << "Search gave up: out of memory.\n";
    return 1;
  }

  if (strategy) {
    out << "There is a winning strategy! 🥳\n";
    if (show_strategy)
      print_strategy(out, *strategy);
    if (dump_json)
      out << strategy_to_json(*strategy) << "\n";
  } else {
    out << "There is no winning strategy. 🫤\n";
  }
  return 0;
}
