#pragma once

#include "connections_types.h"
#include "partition_enumerator.h"

// Largest overlap between `selection` and any single group of `partition`.
int max_group_overlap(const Partition &partition, slot_mask selection);

// EXACT when some group is fully selected, NEAR when one member short,
// FAR otherwise. Only the maximum overlap matters, never the sum.
FeedbackKind score_selection(const Partition &partition, slot_mask selection,
                             int group_size);

inline bool is_consistent(const Partition &partition, const Move &move,
                          int group_size) {
  return score_selection(partition, move.selection, group_size) == move.result;
}
