#include "partition_enumerator.h"

#include <algorithm>
#include <limits>
#include <numeric>
#include <string>

#include "connections_errors.h"

namespace {

constexpr uint64_t kSaturated = std::numeric_limits<uint64_t>::max();

uint64_t saturating_mul(uint64_t a, uint64_t b) {
  if (a != 0 && b > kSaturated / a)
    return kSaturated;
  return a * b;
}

uint64_t saturating_add(uint64_t a, uint64_t b) {
  return b > kSaturated - a ? kSaturated : a + b;
}

slot_mask first_n_slots(int item_count) {
  if (item_count < 0 || item_count > kMaxSlots) {
    throw InvalidConfiguration("item count " + std::to_string(item_count) +
                               " is outside [0, " + std::to_string(kMaxSlots) +
                               "]");
  }
  if (item_count == kMaxSlots)
    return ~slot_mask{0};
  return (slot_mask{1} << item_count) - 1;
}

void check_group_sizes(const std::vector<int> &group_sizes) {
  for (const int size : group_sizes) {
    if (size <= 0) {
      throw InvalidConfiguration("group sizes must be positive, got " +
                                 std::to_string(size));
    }
  }
}

} // namespace

PartitionEnumerator::Frame::Frame(slot_mask remaining_slots,
                                  std::vector<int> group_sizes)
    : remaining(remaining_slots), sizes(std::move(group_sizes)) {
  std::sort(sizes.begin(), sizes.end());
  representative = remaining & (~remaining + 1);
  slot_mask rest = remaining & ~representative;
  pool.reserve(static_cast<size_t>(mask_size(rest)));
  while (rest) {
    pool.push_back(lowest_slot_id(rest));
    rest &= rest - 1;
  }
}

// Steps to the next group containing the representative: all partner
// combinations for the smallest size first, then the next distinct size.
bool PartitionEnumerator::Frame::advance() {
  while (size_index < sizes.size()) {
    const size_t want = static_cast<size_t>(sizes[size_index] - 1);
    bool found = false;
    if (!has_combination) {
      if (want <= pool.size()) {
        combination.resize(want);
        std::iota(combination.begin(), combination.end(), size_t{0});
        has_combination = true;
        found = true;
      }
    } else {
      const size_t k = combination.size();
      const size_t n = pool.size();
      size_t i = k;
      while (i > 0 && combination[i - 1] == n - k + i - 1)
        --i;
      if (i > 0) {
        ++combination[i - 1];
        for (size_t j = i; j < k; ++j)
          combination[j] = combination[j - 1] + 1;
        found = true;
      }
    }

    if (found) {
      group = representative;
      for (const size_t idx : combination)
        group |= slot_mask{1} << pool[idx];
      return true;
    }

    has_combination = false;
    const int current = sizes[size_index];
    while (size_index < sizes.size() && sizes[size_index] == current)
      ++size_index;
  }
  return false;
}

PartitionEnumerator::PartitionEnumerator(slot_mask universe,
                                         std::vector<int> group_sizes) {
  check_group_sizes(group_sizes);
  if (universe == 0 && group_sizes.empty()) {
    pending_empty_ = true;
    return;
  }
  const int total = std::accumulate(group_sizes.begin(), group_sizes.end(), 0);
  if (universe == 0 || group_sizes.empty() || total != mask_size(universe))
    return;
  stack_.emplace_back(universe, std::move(group_sizes));
}

PartitionEnumerator::PartitionEnumerator(int item_count,
                                         std::vector<int> group_sizes)
    : PartitionEnumerator(first_n_slots(item_count), std::move(group_sizes)) {}

bool PartitionEnumerator::next(Partition &out) {
  if (pending_empty_) {
    pending_empty_ = false;
    out.groups.clear();
    return true;
  }

  while (!stack_.empty()) {
    Frame &frame = stack_.back();
    if (!frame.advance()) {
      stack_.pop_back();
      continue;
    }
    const slot_mask rest = frame.remaining & ~frame.group;
    std::vector<int> rest_sizes = frame.sizes;
    rest_sizes.erase(rest_sizes.begin() +
                     static_cast<std::ptrdiff_t>(frame.size_index));
    if (rest == 0 && rest_sizes.empty()) {
      emit(out);
      return true;
    }
    if (rest == 0 || rest_sizes.empty())
      continue;
    stack_.emplace_back(rest, std::move(rest_sizes));
  }
  return false;
}

void PartitionEnumerator::emit(Partition &out) const {
  out.groups.clear();
  out.groups.reserve(stack_.size());
  for (const auto &frame : stack_)
    out.groups.push_back(frame.group);
}

uint64_t binomial(int n, int k) {
  if (k < 0 || n < 0 || k > n)
    return 0;
  k = std::min(k, n - k);
  unsigned __int128 result = 1;
  for (int i = 0; i < k; ++i) {
    result = result * static_cast<unsigned>(n - i) / static_cast<unsigned>(i + 1);
    if (result > kSaturated)
      return kSaturated;
  }
  return static_cast<uint64_t>(result);
}

uint64_t count_partitions(int item_count, std::vector<int> group_sizes) {
  if (item_count == 0)
    return group_sizes.empty() ? 1 : 0;
  if (group_sizes.empty() ||
      std::accumulate(group_sizes.begin(), group_sizes.end(), 0) != item_count)
    return 0;

  // Mirrors the enumerator: pick the size of the group holding the lowest
  // item, then its partners.
  std::sort(group_sizes.begin(), group_sizes.end());
  uint64_t total = 0;
  for (size_t i = 0; i < group_sizes.size(); ++i) {
    if (i > 0 && group_sizes[i] == group_sizes[i - 1])
      continue;
    const int size = group_sizes[i];
    if (size <= 0 || size > item_count)
      continue;
    std::vector<int> rest = group_sizes;
    rest.erase(rest.begin() + static_cast<std::ptrdiff_t>(i));
    total = saturating_add(
        total, saturating_mul(binomial(item_count - 1, size - 1),
                              count_partitions(item_count - size, rest)));
  }
  return total;
}

std::vector<int> uniform_group_sizes(const GameParams &params) {
  return std::vector<int>(static_cast<size_t>(params.group_count()),
                          params.group_size);
}
