#pragma once

#include <boost/dynamic_bitset.hpp>

#include <cstdint>

namespace ismcts {

using seat_index_t = int8_t;
using action_t = int32_t;
using hidden_value_t = int32_t;

// Bit h is set iff hidden value h is legal. The size of the bitset is the number of hidden values.
using hidden_value_mask_t = boost::dynamic_bitset<>;

// Column index into an IntervalArray
enum bound_t : int8_t { kLower = 0, kUpper = 1 };

enum expansion_state_t : int8_t { kUnexpanded, kExpanded };

// Matches the alternative index of Node's variant
enum node_kind_t : int8_t { kDecisionNode = 0, kSamplingNode = 1 };

// See DecisionNode::select()
enum selection_case_t : int8_t { kNoSelection, kPure, kMixed };

}  // namespace ismcts
