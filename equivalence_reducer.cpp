#include "equivalence_reducer.h"

#include <algorithm>
#include <cstdint>
#include <functional>
#include <unordered_map>

namespace {

// Which of the given selections a slot participates in, one bit each.
struct Signature {
  std::vector<uint64_t> bits;

  bool operator==(const Signature &other) const noexcept {
    return bits == other.bits;
  }
};

struct SignatureHash {
  size_t operator()(const Signature &key) const noexcept {
    size_t h = key.bits.size();
    for (const uint64_t word : key.bits) {
      h ^= std::hash<uint64_t>{}(word) + 0x9e3779b97f4a7c15ULL + (h << 6) +
           (h >> 2);
    }
    return h;
  }
};

Signature signature_of(int slot_id, const std::vector<slot_mask> &selections) {
  Signature sig;
  sig.bits.assign((selections.size() + 63) / 64, 0);
  const slot_mask bit = slot_mask{1} << slot_id;
  for (size_t i = 0; i < selections.size(); ++i) {
    if (selections[i] & bit)
      sig.bits[i / 64] |= uint64_t{1} << (i % 64);
  }
  return sig;
}

} // namespace

std::vector<slot_mask>
equivalence_classes(const std::vector<slot_mask> &selections,
                    slot_mask universe) {
  std::unordered_map<Signature, slot_mask, SignatureHash> by_signature;
  slot_mask rest = universe;
  while (rest) {
    const int id = lowest_slot_id(rest);
    rest &= rest - 1;
    by_signature[signature_of(id, selections)] |= slot_mask{1} << id;
  }

  std::vector<slot_mask> classes;
  classes.reserve(by_signature.size());
  for (const auto &entry : by_signature)
    classes.push_back(entry.second);
  std::sort(classes.begin(), classes.end(), [](slot_mask a, slot_mask b) {
    return lowest_slot_id(a) < lowest_slot_id(b);
  });
  return classes;
}
