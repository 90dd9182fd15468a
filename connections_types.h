#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

// A set of slots, one bit per slot id.
using slot_mask = uint64_t;

inline constexpr int kMaxSlots = 64;
inline constexpr int kDefaultGroupSize = 4;
inline constexpr int kDefaultSlotCount = 8;
inline constexpr int kDefaultErrorBudget = 4;

struct Slot {
  uint8_t id = 0;

  constexpr bool operator==(Slot other) const { return id == other.id; }
  constexpr bool operator!=(Slot other) const { return id != other.id; }
  constexpr bool operator<(Slot other) const { return id < other.id; }
};

constexpr Slot make_slot(int id) { return Slot{static_cast<uint8_t>(id)}; }

constexpr slot_mask slot_bit(Slot slot) { return slot_mask{1} << slot.id; }

inline int mask_size(slot_mask mask) { return __builtin_popcountll(mask); }

inline int lowest_slot_id(slot_mask mask) { return __builtin_ctzll(mask); }

inline bool mask_contains(slot_mask mask, Slot slot) {
  return (mask & slot_bit(slot)) != 0;
}

slot_mask mask_of(const std::vector<Slot> &slots);
std::vector<Slot> slots_in(slot_mask mask);

// The three feedback categories, ordered by strength.
enum class FeedbackKind : uint8_t { kFar = 0, kNear = 1, kExact = 2 };

inline constexpr size_t kFeedbackKindCount = 3;

constexpr size_t feedback_index(FeedbackKind kind) {
  return static_cast<size_t>(kind);
}

const char *feedback_name(FeedbackKind kind);

struct Move {
  slot_mask selection = 0;
  FeedbackKind result = FeedbackKind::kFar;

  bool operator==(const Move &other) const {
    return selection == other.selection && result == other.result;
  }
};

struct GameParams {
  std::vector<Slot> slots;
  int group_size = kDefaultGroupSize;

  slot_mask universe() const { return mask_of(slots); }
  int slot_count() const { return static_cast<int>(slots.size()); }
  int group_count() const {
    return group_size > 0 ? slot_count() / group_size : 0;
  }
};

// Slots 0..slot_count-1. Throws InvalidConfiguration when `slot_count` is
// negative or above kMaxSlots; other shape errors are left to validation.
GameParams make_game_params(int slot_count,
                            int group_size = kDefaultGroupSize);

// Non-throwing check; fills `error` with a description when invalid.
bool validate_game_params(const GameParams &params, std::string *error);
