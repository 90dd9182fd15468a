#pragma once

#include <vector>

#include "connections_types.h"

// Splits `universe` into the coarsest classes of slots that belong to
// exactly the same subset of `selections`. Classes are disjoint, cover the
// universe and are ordered by their lowest slot id.
std::vector<slot_mask>
equivalence_classes(const std::vector<slot_mask> &selections,
                    slot_mask universe);
