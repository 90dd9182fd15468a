#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "connections_types.h"

// One candidate answer key: disjoint groups covering every slot once.
struct Partition {
  std::vector<slot_mask> groups;

  bool operator==(const Partition &other) const {
    return groups == other.groups;
  }
};

// Lazily yields every split of `universe` into unlabeled groups with the
// given sizes. Groups of equal size are never emitted in permuted orders.
// Single pass: once next() returns false the enumerator stays exhausted.
class PartitionEnumerator {
public:
  PartitionEnumerator(slot_mask universe, std::vector<int> group_sizes);
  PartitionEnumerator(int item_count, std::vector<int> group_sizes);

  bool next(Partition &out);

private:
  struct Frame {
    slot_mask remaining = 0;
    std::vector<int> sizes; // ascending
    std::vector<int> pool;  // candidate partners of the representative
    slot_mask representative = 0;
    size_t size_index = 0;
    std::vector<size_t> combination;
    bool has_combination = false;
    slot_mask group = 0;

    Frame(slot_mask remaining_slots, std::vector<int> group_sizes);
    bool advance();
    int chosen_size() const { return sizes[size_index]; }
  };

  void emit(Partition &out) const;

  std::vector<Frame> stack_;
  bool started_ = false;
  bool exhausted_ = false;
  bool pending_empty_ = false;
};

uint64_t binomial(int n, int k);

// Number of partitions PartitionEnumerator yields for these sizes.
uint64_t count_partitions(int item_count, std::vector<int> group_sizes);

std::vector<int> uniform_group_sizes(const GameParams &params);
