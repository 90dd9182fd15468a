#include "connections_types.h"

#include "connections_errors.h"

slot_mask mask_of(const std::vector<Slot> &slots) {
  slot_mask mask = 0;
  for (const Slot slot : slots) {
    mask |= slot_bit(slot);
  }
  return mask;
}

std::vector<Slot> slots_in(slot_mask mask) {
  std::vector<Slot> slots;
  slots.reserve(static_cast<size_t>(mask_size(mask)));
  while (mask) {
    slots.push_back(make_slot(lowest_slot_id(mask)));
    mask &= mask - 1;
  }
  return slots;
}

const char *feedback_name(FeedbackKind kind) {
  switch (kind) {
  case FeedbackKind::kExact:
    return "exact";
  case FeedbackKind::kNear:
    return "near";
  case FeedbackKind::kFar:
    return "far";
  }
  return "unknown";
}

GameParams make_game_params(int slot_count, int group_size) {
  if (slot_count < 0 || slot_count > kMaxSlots) {
    throw InvalidConfiguration("slot count " + std::to_string(slot_count) +
                               " must be between 0 and the limit of " +
                               std::to_string(kMaxSlots));
  }
  GameParams params;
  params.group_size = group_size;
  params.slots.reserve(static_cast<size_t>(slot_count));
  for (int i = 0; i < slot_count; ++i) {
    params.slots.push_back(make_slot(i));
  }
  return params;
}

bool validate_game_params(const GameParams &params, std::string *error) {
  auto fail = [&](const std::string &message) {
    if (error) {
      *error = message;
    }
    return false;
  };

  if (params.group_size <= 0) {
    return fail("group size must be positive, got " +
                std::to_string(params.group_size));
  }
  if (params.slots.empty()) {
    return fail("slot count must be positive");
  }
  if (params.slot_count() > kMaxSlots) {
    return fail("slot count " + std::to_string(params.slot_count()) +
                " exceeds the limit of " + std::to_string(kMaxSlots));
  }
  if (params.slot_count() % params.group_size != 0) {
    return fail("slot count " + std::to_string(params.slot_count()) +
                " is not a multiple of the group size " +
                std::to_string(params.group_size));
  }
  slot_mask seen = 0;
  for (const Slot slot : params.slots) {
    if (slot.id >= kMaxSlots) {
      return fail("slot id " + std::to_string(slot.id) + " is out of range");
    }
    if (mask_contains(seen, slot)) {
      return fail("slot id " + std::to_string(slot.id) + " appears twice");
    }
    seen |= slot_bit(slot);
  }
  return true;
}
