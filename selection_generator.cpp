#include "selection_generator.h"

#include <algorithm>

SelectionGenerator::SelectionGenerator(std::vector<slot_mask> classes,
                                       int selection_size,
                                       std::vector<slot_mask> excluded)
    : classes_(std::move(classes)), excluded_(std::move(excluded)),
      selection_size_(selection_size) {
  capacity_.reserve(classes_.size());
  for (const slot_mask cls : classes_)
    capacity_.push_back(mask_size(cls));
  suffix_capacity_.assign(classes_.size() + 1, 0);
  for (size_t i = classes_.size(); i > 0; --i)
    suffix_capacity_[i - 1] = suffix_capacity_[i] + capacity_[i - 1];
  counts_.assign(classes_.size(), 0);
  std::sort(excluded_.begin(), excluded_.end());
  excluded_.erase(std::unique(excluded_.begin(), excluded_.end()),
                  excluded_.end());
}

bool SelectionGenerator::next(slot_mask &out) {
  while (!exhausted_) {
    bool ok = false;
    if (!started_) {
      started_ = true;
      ok = first_composition();
    } else {
      ok = next_composition();
    }
    if (!ok) {
      exhausted_ = true;
      break;
    }
    const slot_mask selection = build();
    if (!is_excluded(selection)) {
      out = selection;
      return true;
    }
  }
  return false;
}

bool SelectionGenerator::first_composition() {
  if (selection_size_ < 0 || selection_size_ > suffix_capacity_[0])
    return false;
  fill_lowest(0, selection_size_);
  return true;
}

bool SelectionGenerator::next_composition() {
  if (counts_.size() < 2)
    return false;
  int suffix = 0;
  for (size_t j = counts_.size() - 1; j > 0; --j) {
    suffix += counts_[j];
    const size_t i = j - 1;
    if (counts_[i] < capacity_[i] && suffix >= 1) {
      ++counts_[i];
      fill_lowest(i + 1, suffix - 1);
      return true;
    }
  }
  return false;
}

// Gives each class from `from` onward the smallest count that still lets
// the later classes absorb the rest.
void SelectionGenerator::fill_lowest(size_t from, int remaining) {
  for (size_t j = from; j < counts_.size(); ++j) {
    counts_[j] = std::max(0, remaining - suffix_capacity_[j + 1]);
    remaining -= counts_[j];
  }
}

slot_mask SelectionGenerator::build() const {
  slot_mask selection = 0;
  for (size_t j = 0; j < classes_.size(); ++j) {
    slot_mask members = classes_[j];
    for (int taken = 0; taken < counts_[j]; ++taken) {
      const slot_mask lowest = members & (~members + 1);
      selection |= lowest;
      members &= ~lowest;
    }
  }
  return selection;
}

bool SelectionGenerator::is_excluded(slot_mask selection) const {
  return std::binary_search(excluded_.begin(), excluded_.end(), selection);
}

std::vector<slot_mask> collect_selections(SelectionGenerator generator) {
  std::vector<slot_mask> selections;
  slot_mask selection = 0;
  while (generator.next(selection))
    selections.push_back(selection);
  return selections;
}
