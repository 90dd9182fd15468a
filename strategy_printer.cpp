#include "strategy_printer.h"

#include <sstream>

namespace {

void print_node(std::ostream &out, const StrategyNode &node, int indent) {
  const std::string pad(static_cast<size_t>(indent) * 2, ' ');
  if (node.solved) {
    out << pad << "solved\n";
    return;
  }
  out << pad << "select " << describe_selection(node.selection) << "\n";
  if (node.branches.empty()) {
    out << pad << "  (no answer key is consistent with this line)\n";
    return;
  }
  for (const auto &branch : node.branches) {
    out << pad << "  " << feedback_name(branch.first) << ":\n";
    print_node(out, *branch.second, indent + 2);
  }
}

void write_json(std::ostream &out, const StrategyNode &node) {
  if (node.solved) {
    out << "{\"solved\":true}";
    return;
  }
  out << "{\"select\":[";
  const auto slots = slots_in(node.selection);
  for (size_t i = 0; i < slots.size(); ++i) {
    out << static_cast<int>(slots[i].id);
    if (i + 1 < slots.size())
      out << ",";
  }
  out << "],\"then\":{";
  for (size_t i = 0; i < node.branches.size(); ++i) {
    const auto &branch = node.branches[i];
    out << "\"" << feedback_name(branch.first) << "\":";
    write_json(out, *branch.second);
    if (i + 1 < node.branches.size())
      out << ",";
  }
  out << "}}";
}

} // namespace

std::string describe_selection(slot_mask selection) {
  std::string text = "{";
  const auto slots = slots_in(selection);
  for (size_t i = 0; i < slots.size(); ++i) {
    if (i > 0)
      text += ", ";
    text += std::to_string(slots[i].id);
  }
  text += "}";
  return text;
}

void print_strategy(std::ostream &out, const StrategyNode &node) {
  print_node(out, node, 0);
}

std::string strategy_to_json(const StrategyNode &node) {
  std::ostringstream out;
  write_json(out, node);
  return out.str();
}
