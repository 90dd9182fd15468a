#pragma once

#include <cstddef>
#include <memory>
#include <vector>

#include "connections_types.h"
#include "partition_enumerator.h"
#include "selection_generator.h"

// Partitions of the full slot set that agree with every recorded move.
class ConsistentPartitionStream {
public:
  ConsistentPartitionStream(const GameParams &params, std::vector<Move> moves);

  bool next(Partition &out);

private:
  PartitionEnumerator enumerator_;
  std::vector<Move> moves_;
  int group_size_ = 0;
};

// Game parameters plus the moves played so far. Immutable: with_move()
// returns a new state that shares this state's history.
class BeliefState {
public:
  // Throws InvalidConfiguration when `params` are unusable.
  explicit BeliefState(GameParams params);
  BeliefState(GameParams params, const std::vector<Move> &moves);

  BeliefState with_move(const Move &move) const;

  const GameParams &params() const { return *params_; }
  size_t move_count() const { return move_count_; }
  int exact_count() const { return exact_count_; }
  bool solved() const { return exact_count_ == params_->group_count(); }

  // Oldest first.
  std::vector<Move> moves() const;
  std::vector<slot_mask> previous_selections() const;
  bool was_selected(slot_mask selection) const;

  // Classes of slots no previous selection tells apart.
  std::vector<slot_mask> equivalence_classes() const;

  // Candidate next selections, excluding ones already played and the full
  // slot set.
  SelectionGenerator possible_selections() const;

  ConsistentPartitionStream possible_partitions() const;
  size_t count_possible_partitions() const;

  // Feedback values some consistent partition would give, in kind order.
  std::vector<FeedbackKind> possible_results(slot_mask selection) const;

private:
  struct MoveNode {
    Move move;
    std::shared_ptr<const MoveNode> parent;
  };

  BeliefState(std::shared_ptr<const GameParams> params,
              std::shared_ptr<const MoveNode> last_move, size_t move_count,
              int exact_count);

  std::shared_ptr<const GameParams> params_;
  std::shared_ptr<const MoveNode> last_move_;
  size_t move_count_ = 0;
  int exact_count_ = 0;
};
