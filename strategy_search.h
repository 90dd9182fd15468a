#pragma once

#include <cstdint>
#include <memory>
#include <utility>
#include <vector>

#include "belief_state.h"
#include "connections_types.h"

struct SearchOptions {
  bool use_memo = true;
  // 0 picks std::thread::hardware_concurrency(); 1 searches serially.
  unsigned int threads = 1;
  // Abort with SearchExhausted after this many visited states; 0 = no limit.
  uint64_t max_nodes = 0;
  bool debug = false;
};

struct SearchStats {
  uint64_t nodes = 0;
  uint64_t memo_hits = 0;
  uint64_t selections_tried = 0;
};

// A winning plan: the selection to play and, for every feedback nature can
// still give, the plan to follow next. A solved node has no selection.
struct StrategyNode {
  bool solved = false;
  slot_mask selection = 0;
  std::vector<std::pair<FeedbackKind, std::shared_ptr<const StrategyNode>>>
      branches;
};

using StrategyPtr = std::shared_ptr<const StrategyNode>;

class StrategySearch {
public:
  explicit StrategySearch(SearchOptions options = {});

  // True iff some sequence of selections identifies every group no matter
  // which consistent answer key is hidden. Each non-exact result spends one
  // unit of `error_budget`; an unsolved state with no budget left is lost,
  // so at most `error_budget - 1` mistakes are survivable. Throws InvalidConfiguration for a negative budget and
  // SearchExhausted when a resource limit is hit.
  bool has_winning_strategy(const BeliefState &state, int error_budget);

  // Same search, returning the witness; nullptr when there is none.
  StrategyPtr find_winning_strategy(const BeliefState &state,
                                    int error_budget);

  bool is_winning_move(const BeliefState &state, slot_mask selection,
                       int error_budget);

  const SearchStats &stats() const { return stats_; }

private:
  StrategyPtr search_serial(const BeliefState &state, int error_budget);
  StrategyPtr search_parallel(const BeliefState &state, int error_budget,
                              unsigned int threads);

  SearchOptions options_;
  SearchStats stats_;
};

bool has_winning_strategy(const BeliefState &state, int error_budget,
                          const SearchOptions &options = {});
