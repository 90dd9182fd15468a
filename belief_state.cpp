#include "belief_state.h"

#include <algorithm>
#include <array>
#include <utility>

#include "connections_errors.h"
#include "equivalence_reducer.h"
#include "feedback_model.h"

namespace {

std::shared_ptr<const GameParams> checked_params(GameParams params) {
  std::string error;
  if (!validate_game_params(params, &error))
    throw InvalidConfiguration(error);
  return std::make_shared<const GameParams>(std::move(params));
}

} // namespace

ConsistentPartitionStream::ConsistentPartitionStream(const GameParams &params,
                                                     std::vector<Move> moves)
    : enumerator_(params.universe(), uniform_group_sizes(params)),
      moves_(std::move(moves)), group_size_(params.group_size) {}

bool ConsistentPartitionStream::next(Partition &out) {
  while (enumerator_.next(out)) {
    const bool consistent =
        std::all_of(moves_.begin(), moves_.end(), [&](const Move &move) {
          return is_consistent(out, move, group_size_);
        });
    if (consistent)
      return true;
  }
  return false;
}

BeliefState::BeliefState(GameParams params)
    : params_(checked_params(std::move(params))) {}

BeliefState::BeliefState(GameParams params, const std::vector<Move> &moves)
    : BeliefState(std::move(params)) {
  for (const auto &move : moves)
    *this = with_move(move);
}

BeliefState::BeliefState(std::shared_ptr<const GameParams> params,
                         std::shared_ptr<const MoveNode> last_move,
                         size_t move_count, int exact_count)
    : params_(std::move(params)), last_move_(std::move(last_move)),
      move_count_(move_count), exact_count_(exact_count) {}

BeliefState BeliefState::with_move(const Move &move) const {
  auto node = std::make_shared<const MoveNode>(MoveNode{move, last_move_});
  const int exact = exact_count_ + (move.result == FeedbackKind::kExact ? 1 : 0);
  return BeliefState(params_, std::move(node), move_count_ + 1, exact);
}

std::vector<Move> BeliefState::moves() const {
  std::vector<Move> result;
  result.reserve(move_count_);
  for (const MoveNode *node = last_move_.get(); node;
       node = node->parent.get()) {
    result.push_back(node->move);
  }
  std::reverse(result.begin(), result.end());
  return result;
}

std::vector<slot_mask> BeliefState::previous_selections() const {
  std::vector<slot_mask> selections;
  selections.reserve(move_count_);
  for (const auto &move : moves())
    selections.push_back(move.selection);
  return selections;
}

bool BeliefState::was_selected(slot_mask selection) const {
  for (const MoveNode *node = last_move_.get(); node;
       node = node->parent.get()) {
    if (node->move.selection == selection)
      return true;
  }
  return false;
}

std::vector<slot_mask> BeliefState::equivalence_classes() const {
  std::vector<slot_mask> selections = previous_selections();
  selections.push_back(params_->universe());
  return ::equivalence_classes(selections, params_->universe());
}

SelectionGenerator BeliefState::possible_selections() const {
  std::vector<slot_mask> excluded = previous_selections();
  excluded.push_back(params_->universe());
  return SelectionGenerator(equivalence_classes(), params_->group_size,
                            std::move(excluded));
}

ConsistentPartitionStream BeliefState::possible_partitions() const {
  return ConsistentPartitionStream(*params_, moves());
}

size_t BeliefState::count_possible_partitions() const {
  ConsistentPartitionStream stream = possible_partitions();
  Partition partition;
  size_t count = 0;
  while (stream.next(partition))
    ++count;
  return count;
}

std::vector<FeedbackKind>
BeliefState::possible_results(slot_mask selection) const {
  std::array<bool, kFeedbackKindCount> seen{};
  size_t distinct = 0;
  ConsistentPartitionStream stream = possible_partitions();
  Partition partition;
  while (distinct < kFeedbackKindCount && stream.next(partition)) {
    const FeedbackKind kind =
        score_selection(partition, selection, params_->group_size);
    if (!seen[feedback_index(kind)]) {
      seen[feedback_index(kind)] = true;
      ++distinct;
    }
  }

  std::vector<FeedbackKind> results;
  for (const FeedbackKind kind :
       {FeedbackKind::kFar, FeedbackKind::kNear, FeedbackKind::kExact}) {
    if (seen[feedback_index(kind)])
      results.push_back(kind);
  }
  return results;
}
