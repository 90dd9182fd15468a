#pragma once

#include <vector>

#include "connections_types.h"

// Lazily yields every selection of `selection_size` slots that can be formed
// by taking some count of members from each equivalence class. Within a
// class the lowest slot ids are taken first, so each distribution of counts
// appears once. Selections listed in `excluded` are skipped.
//
// Order is lexicographic in the per-class counts, first class slowest.
class SelectionGenerator {
public:
  SelectionGenerator(std::vector<slot_mask> classes, int selection_size,
                     std::vector<slot_mask> excluded = {});

  bool next(slot_mask &out);

private:
  bool first_composition();
  bool next_composition();
  void fill_lowest(size_t from, int remaining);
  slot_mask build() const;
  bool is_excluded(slot_mask selection) const;

  std::vector<slot_mask> classes_;
  std::vector<int> capacity_;
  std::vector<int> suffix_capacity_;
  std::vector<int> counts_;
  std::vector<slot_mask> excluded_;
  int selection_size_ = 0;
  bool started_ = false;
  bool exhausted_ = false;
};

// Convenience: drains a generator into a vector.
std::vector<slot_mask> collect_selections(SelectionGenerator generator);
