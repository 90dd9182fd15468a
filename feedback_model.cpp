#include "feedback_model.h"

#include <algorithm>

int max_group_overlap(const Partition &partition, slot_mask selection) {
  int best = 0;
  for (const slot_mask group : partition.groups) {
    best = std::max(best, mask_size(group & selection));
  }
  return best;
}

FeedbackKind score_selection(const Partition &partition, slot_mask selection,
                             int group_size) {
  const int overlap = max_group_overlap(partition, selection);
  if (overlap == group_size)
    return FeedbackKind::kExact;
  if (overlap == group_size - 1)
    return FeedbackKind::kNear;
  return FeedbackKind::kFar;
}
