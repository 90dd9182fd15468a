#include "strategy_search.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <iostream>
#include <limits>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>

#include "connections_errors.h"
#include "partition_enumerator.h"

namespace {

constexpr size_t kNoWinner = std::numeric_limits<size_t>::max();

// The move set in canonical order plus the remaining budget. Everything the
// search derives from a state depends only on this.
struct MemoKey {
  std::vector<uint64_t> moves;
  int budget = 0;

  bool operator==(const MemoKey &other) const noexcept {
    return budget == other.budget && moves == other.moves;
  }
};

struct MemoKeyHash {
  size_t operator()(const MemoKey &key) const noexcept {
    size_t h = static_cast<size_t>(key.budget);
    for (const uint64_t word : key.moves) {
      h ^= std::hash<uint64_t>{}(word) + 0x9e3779b97f4a7c15ULL + (h << 6) +
           (h >> 2);
    }
    return h;
  }
};

MemoKey make_memo_key(const BeliefState &state, int budget) {
  std::vector<Move> moves = state.moves();
  std::sort(moves.begin(), moves.end(), [](const Move &a, const Move &b) {
    return std::make_pair(a.selection, a.result) <
           std::make_pair(b.selection, b.result);
  });
  MemoKey key;
  key.budget = budget;
  key.moves.reserve(moves.size() * 2);
  for (const auto &move : moves) {
    key.moves.push_back(move.selection);
    key.moves.push_back(feedback_index(move.result));
  }
  return key;
}

class SearchMemo {
public:
  std::optional<StrategyPtr> find(const MemoKey &key) const {
    const auto it = cache_.find(key);
    if (it == cache_.end()) {
      return std::nullopt;
    }
    return it->second;
  }

  void store(MemoKey key, StrategyPtr result) {
    cache_.emplace(std::move(key), std::move(result));
  }

private:
  std::unordered_map<MemoKey, StrategyPtr, MemoKeyHash> cache_;
};

const StrategyPtr &solved_leaf() {
  static const StrategyPtr leaf =
      std::make_shared<const StrategyNode>(StrategyNode{true, 0, {}});
  return leaf;
}

// One search thread: owns its memo and statistics, shares the node counter.
class SearchWorker {
public:
  SearchWorker(const SearchOptions &options,
               std::atomic<uint64_t> &node_counter, int depth_limit)
      : options_(options), node_counter_(node_counter),
        depth_limit_(depth_limit) {}

  // Stops work on root selection `current` once a lower-numbered root is
  // known to win.
  void watch(const std::atomic<size_t> *best_root, size_t current) {
    best_root_ = best_root;
    current_root_ = current;
  }

  bool aborted() const { return aborted_; }
  const SearchStats &stats() const { return stats_; }

  StrategyPtr solve(const BeliefState &state, int budget, int depth) {
    if (state.solved())
      return solved_leaf();
    if (budget == 0)
      return nullptr;
    if (depth >= depth_limit_) {
      throw SearchExhausted("search depth exceeded " +
                            std::to_string(depth_limit_) + " moves");
    }
    count_node();

    MemoKey key;
    if (options_.use_memo) {
      key = make_memo_key(state, budget);
      if (const auto cached = memo_.find(key)) {
        ++stats_.memo_hits;
        return *cached;
      }
    }

    StrategyPtr result;
    SelectionGenerator selections = state.possible_selections();
    slot_mask selection = 0;
    while (selections.next(selection)) {
      if (cancelled())
        return nullptr;
      ++stats_.selections_tried;
      result = try_selection(state, selection, budget, depth);
      if (result || aborted_)
        break;
    }

    if (aborted_)
      return nullptr;
    if (options_.use_memo)
      memo_.store(std::move(key), result);
    return result;
  }

  // A selection wins when every feedback still possible leads to a win.
  // Called only with a positive budget.
  StrategyPtr try_selection(const BeliefState &state, slot_mask selection,
                            int budget, int depth) {
    auto node = std::make_shared<StrategyNode>();
    node->selection = selection;
    for (const FeedbackKind kind : state.possible_results(selection)) {
      const int next_budget = kind == FeedbackKind::kExact ? budget : budget - 1;
      StrategyPtr child =
          solve(state.with_move({selection, kind}), next_budget, depth + 1);
      if (!child)
        return nullptr;
      node->branches.emplace_back(kind, std::move(child));
    }
    return node;
  }

private:
  void count_node() {
    ++stats_.nodes;
    const uint64_t visited = ++node_counter_;
    if (options_.max_nodes != 0 && visited > options_.max_nodes) {
      throw SearchExhausted("search visited more than " +
                            std::to_string(options_.max_nodes) + " states");
    }
  }

  bool cancelled() {
    if (best_root_ && best_root_->load() < current_root_)
      aborted_ = true;
    return aborted_;
  }

  const SearchOptions &options_;
  std::atomic<uint64_t> &node_counter_;
  int depth_limit_;
  SearchMemo memo_;
  SearchStats stats_;
  const std::atomic<size_t> *best_root_ = nullptr;
  size_t current_root_ = 0;
  bool aborted_ = false;
};

void merge_stats(SearchStats &into, const SearchStats &from) {
  into.nodes += from.nodes;
  into.memo_hits += from.memo_hits;
  into.selections_tried += from.selections_tried;
}

void check_budget(int error_budget) {
  if (error_budget < 0) {
    throw InvalidConfiguration("error budget must not be negative, got " +
                               std::to_string(error_budget));
  }
}

int depth_limit_for(const BeliefState &state, int error_budget) {
  return error_budget + state.params().group_count();
}

} // namespace

StrategySearch::StrategySearch(SearchOptions options)
    : options_(std::move(options)) {}

bool StrategySearch::has_winning_strategy(const BeliefState &state,
                                          int error_budget) {
  return find_winning_strategy(state, error_budget) != nullptr;
}

StrategyPtr StrategySearch::find_winning_strategy(const BeliefState &state,
                                                  int error_budget) {
  check_budget(error_budget);
  stats_ = SearchStats{};
  if (state.solved())
    return solved_leaf();
  if (error_budget == 0)
    return nullptr;

  unsigned int threads = options_.threads;
  if (threads == 0)
    threads = std::thread::hardware_concurrency();
  if (threads == 0)
    threads = 4;

  const auto start_time = std::chrono::high_resolution_clock::now();
  StrategyPtr result = threads > 1
                           ? search_parallel(state, error_budget, threads)
                           : search_serial(state, error_budget);
  if (options_.debug) {
    const auto end_time = std::chrono::high_resolution_clock::now();
    const auto ms =
        std::chrono::duration<double, std::milli>(end_time - start_time)
            .count();
    std::cerr << "[search] verdict=" << (result ? "win" : "loss")
              << " nodes=" << stats_.nodes << " memo_hits=" << stats_.memo_hits
              << " selections=" << stats_.selections_tried << "\n";
    std::cerr << "[timer] search " << ms << " ms\n";
  }
  return result;
}

bool StrategySearch::is_winning_move(const BeliefState &state,
                                     slot_mask selection, int error_budget) {
  check_budget(error_budget);
  stats_ = SearchStats{};
  if (state.solved())
    return true;
  if (error_budget == 0)
    return false;
  std::atomic<uint64_t> node_counter{0};
  SearchWorker worker(options_, node_counter,
                      depth_limit_for(state, error_budget));
  const bool wins =
      worker.try_selection(state, selection, error_budget, 0) != nullptr;
  merge_stats(stats_, worker.stats());
  return wins;
}

StrategyPtr StrategySearch::search_serial(const BeliefState &state,
                                          int error_budget) {
  if (options_.debug) {
    std::cerr << "[search] partitions="
              << count_partitions(state.params().slot_count(),
                                  uniform_group_sizes(state.params()))
              << " moves=" << state.move_count() << " budget=" << error_budget
              << "\n";
  }

  std::atomic<uint64_t> node_counter{0};
  SearchWorker worker(options_, node_counter,
                      depth_limit_for(state, error_budget));
  StrategyPtr result = worker.solve(state, error_budget, 0);
  merge_stats(stats_, worker.stats());
  return result;
}

// Root selections are dealt round-robin to the workers. The winner reported
// is the first winning selection in serial order, so the witness does not
// depend on thread timing.
StrategyPtr StrategySearch::search_parallel(const BeliefState &state,
                                            int error_budget,
                                            unsigned int threads) {
  const std::vector<slot_mask> roots =
      collect_selections(state.possible_selections());
  if (options_.debug) {
    std::cerr << "[search] partitions="
              << count_partitions(state.params().slot_count(),
                                  uniform_group_sizes(state.params()))
              << " moves=" << state.move_count() << " budget=" << error_budget
              << " roots=" << roots.size()
              << " threads=" << threads << "\n";
  }

  std::atomic<uint64_t> node_counter{1};
  std::atomic<size_t> best_root{kNoWinner};
  const int depth_limit = depth_limit_for(state, error_budget);
  ++stats_.nodes;

  struct WorkerResult {
    size_t root = kNoWinner;
    StrategyPtr strategy;
    SearchStats stats;
    uint64_t roots_tried = 0;
  };

  auto run_worker = [&](unsigned int worker_idx) {
    WorkerResult out;
    SearchWorker worker(options_, node_counter, depth_limit);
    for (size_t i = worker_idx; i < roots.size(); i += threads) {
      if (best_root.load() < i)
        break;
      worker.watch(&best_root, i);
      ++out.roots_tried;
      StrategyPtr strategy =
          worker.try_selection(state, roots[i], error_budget, 0);
      if (worker.aborted())
        break;
      if (strategy) {
        size_t current = best_root.load();
        while (i < current && !best_root.compare_exchange_weak(current, i)) {
        }
        out.root = i;
        out.strategy = std::move(strategy);
        break;
      }
    }
    out.stats = worker.stats();
    return out;
  };

  std::vector<std::future<WorkerResult>> futures;
  futures.reserve(threads);
  for (unsigned int t = 0; t < threads && t < roots.size(); ++t)
    futures.push_back(std::async(std::launch::async, run_worker, t));

  WorkerResult best;
  for (auto &fut : futures) {
    WorkerResult result = fut.get();
    merge_stats(stats_, result.stats);
    stats_.selections_tried += result.roots_tried;
    if (result.strategy && result.root < best.root)
      best = std::move(result);
  }
  return best.strategy;
}

bool has_winning_strategy(const BeliefState &state, int error_budget,
                          const SearchOptions &options) {
  StrategySearch search(options);
  return search.has_winning_strategy(state, error_budget);
}
