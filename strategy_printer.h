#pragma once

#include <ostream>
#include <string>

#include "connections_types.h"
#include "strategy_search.h"

// "{0, 1, 2, 3}"
std::string describe_selection(slot_mask selection);

// Indented, one line per decision or outcome.
void print_strategy(std::ostream &out, const StrategyNode &node);

// {"select":[0,1,2,3],"then":{"far":{...},"exact":{"solved":true}}}
std::string strategy_to_json(const StrategyNode &node);
