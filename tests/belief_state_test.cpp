#include <gtest/gtest.h>

#include <algorithm>

#include "belief_state.h"
#include "connections_errors.h"
#include "feedback_model.h"

namespace {

size_t count_selections(const BeliefState &state) {
  return collect_selections(state.possible_selections()).size();
}

} // namespace

TEST(BeliefState, RejectsInvalidParams) {
  EXPECT_THROW(BeliefState(make_game_params(0)), InvalidConfiguration);
  EXPECT_THROW(BeliefState(make_game_params(6)), InvalidConfiguration);
  EXPECT_THROW(BeliefState(make_game_params(8, 0)), InvalidConfiguration);
  EXPECT_THROW(BeliefState(make_game_params(68)), InvalidConfiguration);
  EXPECT_NO_THROW(BeliefState(make_game_params(8)));
}

TEST(BeliefState, PossibleSelectionsFollowHistory) {
  const BeliefState start(make_game_params(8));
  const auto first = collect_selections(start.possible_selections());
  ASSERT_EQ(first.size(), 1u);
  EXPECT_EQ(mask_size(first.front()), 4);

  // Five ways to take four from two classes of four; one was played.
  const BeliefState after = start.with_move({0x0F, FeedbackKind::kFar});
  const auto second = collect_selections(after.possible_selections());
  EXPECT_EQ(second.size(), 4u);
  for (const slot_mask selection : second) {
    EXPECT_EQ(mask_size(selection), 4);
    EXPECT_NE(selection, 0x0Fu);
  }
}

TEST(BeliefState, NeverOffersTheFullSlotSet) {
  EXPECT_EQ(count_selections(BeliefState(make_game_params(4))), 0u);

  const BeliefState one_left = BeliefState(make_game_params(8))
                                   .with_move({0x0F, FeedbackKind::kExact});
  const auto selections = collect_selections(one_left.possible_selections());
  EXPECT_EQ(selections.size(), 4u);
  EXPECT_EQ(selections.front(), 0xF0u);
}

TEST(BeliefState, NeverReplaysASelection) {
  const BeliefState start(make_game_params(12));
  const BeliefState once = start.with_move({0x0F, FeedbackKind::kNear});
  const BeliefState twice = once.with_move({0x33, FeedbackKind::kFar});
  for (const BeliefState *state : {&once, &twice}) {
    for (const slot_mask selection :
         collect_selections(state->possible_selections())) {
      EXPECT_FALSE(state->was_selected(selection));
    }
  }
  EXPECT_GT(count_selections(twice), 0u);
}

TEST(BeliefState, WithMoveSharesHistoryWithoutMutating) {
  const BeliefState start(make_game_params(8));
  const BeliefState a = start.with_move({0x0F, FeedbackKind::kNear});
  const BeliefState b = a.with_move({0x33, FeedbackKind::kFar});
  const BeliefState c = a.with_move({0x17, FeedbackKind::kExact});

  EXPECT_EQ(start.move_count(), 0u);
  EXPECT_EQ(a.move_count(), 1u);
  EXPECT_EQ(b.moves(), (std::vector<Move>{{0x0F, FeedbackKind::kNear},
                                           {0x33, FeedbackKind::kFar}}));
  EXPECT_EQ(c.moves(), (std::vector<Move>{{0x0F, FeedbackKind::kNear},
                                           {0x17, FeedbackKind::kExact}}));
  EXPECT_EQ(c.exact_count(), 1);
  EXPECT_EQ(b.exact_count(), 0);
}

TEST(BeliefState, ConstructFromMoveList) {
  const std::vector<Move> moves = {{0x0F, FeedbackKind::kExact}};
  const BeliefState state(make_game_params(8), moves);
  EXPECT_EQ(state.moves(), moves);
  EXPECT_EQ(state.equivalence_classes(),
            (std::vector<slot_mask>{0x0F, 0xF0}));
}

TEST(BeliefState, SolvedOnceEveryGroupIsExact) {
  const BeliefState start(make_game_params(4));
  EXPECT_FALSE(start.solved());
  EXPECT_TRUE(start.with_move({0x0F, FeedbackKind::kExact}).solved());
}

TEST(BeliefState, ConsistentPartitionCounts) {
  const BeliefState start(make_game_params(8));
  EXPECT_EQ(start.count_possible_partitions(), 35u);
  EXPECT_EQ(start.with_move({0x0F, FeedbackKind::kFar})
                .count_possible_partitions(),
            18u);
  EXPECT_EQ(start.with_move({0x0F, FeedbackKind::kNear})
                .count_possible_partitions(),
            16u);
  EXPECT_EQ(start.with_move({0x0F, FeedbackKind::kExact})
                .count_possible_partitions(),
            1u);
}

TEST(BeliefState, StreamOnlyYieldsConsistentPartitions) {
  const BeliefState state = BeliefState(make_game_params(12))
                                .with_move({0x0F, FeedbackKind::kNear})
                                .with_move({0xF0, FeedbackKind::kFar});
  ConsistentPartitionStream stream = state.possible_partitions();
  Partition partition;
  size_t seen = 0;
  while (stream.next(partition)) {
    ++seen;
    for (const auto &move : state.moves())
      EXPECT_TRUE(is_consistent(partition, move, 4));
  }
  EXPECT_EQ(seen, state.count_possible_partitions());
  EXPECT_GT(seen, 0u);
}

TEST(BeliefState, PossibleResults) {
  const BeliefState start(make_game_params(8));
  EXPECT_EQ(start.possible_results(0x0F),
            (std::vector<FeedbackKind>{FeedbackKind::kFar, FeedbackKind::kNear,
                                       FeedbackKind::kExact}));

  const BeliefState known = start.with_move({0x0F, FeedbackKind::kExact});
  EXPECT_EQ(known.possible_results(0xF0),
            (std::vector<FeedbackKind>{FeedbackKind::kExact}));
  EXPECT_EQ(known.possible_results(0x33),
            (std::vector<FeedbackKind>{FeedbackKind::kFar}));
}

TEST(BeliefState, AppendingAMoveNeverGrowsTheBelief) {
  const BeliefState start = BeliefState(make_game_params(12))
                                .with_move({0x0F, FeedbackKind::kFar});
  const size_t before = start.count_possible_partitions();
  for (const slot_mask selection :
       collect_selections(start.possible_selections())) {
    size_t total = 0;
    for (const FeedbackKind result : start.possible_results(selection)) {
      const size_t after =
          start.with_move({selection, result}).count_possible_partitions();
      EXPECT_LE(after, before);
      EXPECT_GT(after, 0u);
      total += after;
    }
    EXPECT_EQ(total, before);
  }
}
